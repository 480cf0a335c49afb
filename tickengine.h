#ifndef _HPN_TICKENGINE_H
#define _HPN_TICKENGINE_H

#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>

using namespace std;

typedef function<void()> Work;

// A queue based engine with one dedicated worker thread. Work items run one
// at a time in the order they were added, so a work item can re-post itself
// to yield between batches.
class TickEngine
{
    queue<Work> _q;
    mutex _q_mutex;
    condition_variable _q_cvar;
    condition_variable _idle_cvar;
    bool _busy = false;
    bool _quit = false;
    thread* _thread = nullptr;

    void dowork()
    {
        while(true)
        {
            Work work;
            {
                unique_lock<mutex> ulockq(_q_mutex);
                _q_cvar.wait(ulockq, [this]{ return _quit or not _q.empty(); });
                if( _q.empty() ) break;
                work = _q.front();
                _q.pop();
                _busy = true;
            }
            work();
            {
                const lock_guard<mutex> lockq(_q_mutex);
                _busy = false;
            }
            _idle_cvar.notify_all();
        }
        _idle_cvar.notify_all();
    }
public:
    void addwork(Work work)
    {
        {
            const lock_guard<mutex> lockq(_q_mutex);
            _q.push(work);
        }
        _q_cvar.notify_one();
    }

    // Blocks until the queue is empty and no work is running. Must not be
    // called from a work item.
    void drain()
    {
        unique_lock<mutex> ulockq(_q_mutex);
        _idle_cvar.wait(ulockq, [this]{ return _q.empty() and not _busy; });
    }

    // Set to quit when the queue is found empty
    void quit()
    {
        {
            const lock_guard<mutex> lockq(_q_mutex);
            _quit = true;
        }
        _q_cvar.notify_all();
    }

    // quit and join the worker
    void wait()
    {
        quit();
        if ( _thread )
        {
            _thread->join();
            delete _thread;
            _thread = nullptr;
        }
    }

    bool onWorkerThread() const { return _thread and this_thread::get_id() == _thread->get_id(); }

    TickEngine(bool verbose = false)
    {
        _thread = new thread(&TickEngine::dowork,this);
        if ( verbose ) cout << "TickEngine : worker thread started" << endl;
    }
    TickEngine(const TickEngine&) = delete;
    TickEngine& operator=(const TickEngine&) = delete;
    ~TickEngine() { wait(); }
};

#endif
