#ifndef _HPN_SIMRUNNER_H
#define _HPN_SIMRUNNER_H

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include "hpnerror.h"
#include "simcontroller.h"
#include "tickengine.h"

using namespace std;

// Drives a SimulationController from a TickEngine worker. Every tick runs a
// batch of steps holding the step mutex and then re-posts itself, so other
// threads get the mutex (through inspect()) between batches. stop() is
// honoured between steps.
class SimulationRunner
{
    SimulationController& _controller;
    mutex _stepmutex;
    unsigned _stepsPerTick = 1;
    optional<unsigned> _fixedStepsPerTick;
    mutex _donemutex;
    condition_variable _donecvar;
    bool _done = true;
    // bumped by start(); a tick only finishes the run it was posted for
    unsigned long _generation = 0;
    exception_ptr _error;
    // last member: the worker is joined before anything above goes away
    TickEngine _engine;

    void finish(unsigned long generation, exception_ptr error)
    {
        {
            const lock_guard<mutex> lock(_donemutex);
            if ( generation != _generation ) return;
            _done = true;
            _error = error;
        }
        _donecvar.notify_all();
    }
    void tickwork(unsigned long generation)
    {
        exception_ptr error;
        bool more = false;
        try
        {
            const lock_guard<mutex> lock(_stepmutex);
            more = _controller.tick(_stepsPerTick);
        }
        catch(const exception& e)
        {
            cerr << "SimulationRunner : step failed: " << e.what() << endl;
            error = current_exception();
            _controller.endRun();
        }
        if ( more ) _engine.addwork(bind(&SimulationRunner::tickwork,this,generation));
        else finish(generation,error);
    }
public:
    static constexpr unsigned MAX_STEPS_PER_TICK = 1000;

    // Model time covered per 100ms tick is 0.1 * time scale
    static unsigned stepsPerTick(const SimulationSettings& settings, double dt)
    {
        char *stepsvar = getenv("HPN_STEPS_PER_TICK");
        if ( stepsvar )
        {
            try
            {
                int n = stoi(stepsvar);
                if ( n < 1 ) throw HPNConfigError("HPN_STEPS_PER_TICK must be positive");
                return min((unsigned)n, MAX_STEPS_PER_TICK);
            }
            catch(const logic_error&)
            {
                throw HPNConfigError(string("HPN_STEPS_PER_TICK: not a number: ") + stepsvar);
            }
        }
        double n = 0.1 * settings.timeScale() / dt;
        if ( not ( n >= 1 ) ) return 1;
        return n > MAX_STEPS_PER_TICK ? MAX_STEPS_PER_TICK : (unsigned)n;
    }

    // Returns false if the controller is already running
    bool start(optional<double> timeStep = nullopt, optional<unsigned long> maxSteps = nullopt)
    {
        const lock_guard<mutex> lock(_stepmutex);
        double dt = timeStep ? *timeStep : _controller.effectiveDt();
        unsigned batch = _fixedStepsPerTick ? *_fixedStepsPerTick : stepsPerTick(_controller.settings(), dt);
        if ( not _controller.beginRun(timeStep, maxSteps) ) return false;
        _stepsPerTick = batch;
        unsigned long generation;
        {
            const lock_guard<mutex> dlock(_donemutex);
            generation = ++_generation;
            _done = false;
            _error = nullptr;
        }
        _engine.addwork(bind(&SimulationRunner::tickwork,this,generation));
        return true;
    }
    void stop() { _controller.stop(); }
    bool isRunning() { return _controller.isRunning(); }
    unsigned currentStepsPerTick() const { return _stepsPerTick; }

    // Blocks until the current run ends, rethrows what a step threw
    void wait()
    {
        unique_lock<mutex> lock(_donemutex);
        _donecvar.wait(lock, [this]{ return _done; });
        if ( _error )
        {
            auto e = _error;
            _error = nullptr;
            rethrow_exception(e);
        }
    }
    // Runs f with no step in progress
    void inspect(function<void(SimulationController&)> f)
    {
        const lock_guard<mutex> lock(_stepmutex);
        f(_controller);
    }

    SimulationRunner(SimulationController& controller, optional<unsigned> stepsPerTick = nullopt) :
        _controller(controller), _fixedStepsPerTick(stepsPerTick)
    {
        if ( stepsPerTick and *stepsPerTick == 0 ) throw HPNConfigError("steps per tick must be positive");
    }
    ~SimulationRunner()
    {
        stop();
        unique_lock<mutex> lock(_donemutex);
        _donecvar.wait(lock, [this]{ return _done; });
    }
};

#endif
