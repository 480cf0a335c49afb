#ifndef _HPN_SIMCONTROLLER_H
#define _HPN_SIMCONTROLLER_H

// Hybrid step: enablement bookkeeping, continuous candidates are snapshotted
// on the marking at the start of the step, at most one discrete transition
// fires, then every snapshotted continuous transition integrates once over
// its captured arcs, and time advances.
//
// The controller is not thread safe. A host driving it from several threads
// must treat every call as a critical section (see SimulationRunner).

#include <atomic>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "behavior.h"
#include "conflict.h"
#include "hpnerror.h"
#include "petrinet.h"
#include "sampler.h"
#include "simevents.h"
#include "simsettings.h"

using namespace std;

class SimulationController
{
    HPetriNet* _pn;
    SimulationSettings _settings;
    SimClock _clock;
    Sampler _sampler;
    BehaviorFactory _factory;
    ConflictResolver _resolver;
    vector<TransitionBehavior*> _behaviors;
    vector<DiscreteBehavior*> _discrete;
    vector<ContinuousBehavior*> _continuous;
    map<string,TransitionBehavior*> _byname;
    Observers _observers;
    unsigned long _stepcount = 0;
    atomic<bool> _running {false};
    atomic<bool> _stopRequested {false};
    // current run
    optional<double> _runDt;
    optional<unsigned long> _runMaxSteps;
    unsigned long _runSteps = 0;

    void createBehaviors()
    {
        try
        {
            for(auto t:_pn->transitions())
            {
                auto b = _factory.create(t);
                _behaviors.push_back(b);
                _byname.emplace(t->_name, b);
                if ( t->isDiscrete() ) _discrete.push_back((DiscreteBehavior*)b);
                else _continuous.push_back((ContinuousBehavior*)b);
            }
        }
        catch(...)
        {
            deleteBehaviors();
            throw;
        }
    }
    void deleteBehaviors()
    {
        for(auto b:_behaviors) delete b;
        _behaviors.clear();
        _discrete.clear();
        _continuous.clear();
        _byname.clear();
    }
    // Newly enabled transitions start their clock, newly disabled ones drop it
    void updateEnablementStates()
    {
        for(auto b:_behaviors)
        {
            bool enabled = b->isStructurallyEnabled().ok;
            if ( enabled and not b->enablementTime() ) b->setEnablementTime(_clock.now());
            else if ( not enabled and b->enablementTime() ) b->clearEnablement();
        }
    }
    // A discrete transition that is enabled now or will be once its clock runs
    bool discretePending() const
    {
        for(auto b:_discrete)
        {
            if ( b->canFire().ok ) return true;
            if ( auto tb = dynamic_cast<TimedBehavior*>(b) )
            {
                auto info = tb->timingInfo();
                if ( info.elapsed and *info.elapsed + HPN_TIME_EPS < info.earliest ) return true;
            }
            else if ( auto sb = dynamic_cast<StochasticBehavior*>(b) )
            {
                auto at = sb->scheduledFireTime();
                if ( at and *at > _clock.now() + HPN_TIME_EPS ) return true;
            }
        }
        return false;
    }
    void notifyStep(const StepEvent& ev)
    {
        for(auto o:_observers)
        {
            for(auto const& r:ev.records) o->onFiring(r);
            o->onStep(ev);
        }
    }
public:
    HPetriNet& net() { return *_pn; }
    const SimulationSettings& settings() const { return _settings; }
    double time() const { return _clock.now(); }
    const SimClock& clock() const { return _clock; }
    double progress() const { return _settings.progress(_clock.now()); }
    bool isComplete() const { return _settings.isComplete(_clock.now()); }
    double effectiveDt() const { return _settings.effectiveDt(); }
    unsigned long stepCount() const { return _stepcount; }
    bool isRunning() const { return _running; }
    bool stopRequested() const { return _stopRequested; }
    Sampler& sampler() { return _sampler; }
    ConflictPolicy conflictPolicy() const { return _resolver.policy(); }
    const vector<TransitionBehavior*>& behaviors() const { return _behaviors; }

    TransitionBehavior* behavior(const string& name) const
    {
        auto it = _byname.find(name);
        if ( it == _byname.end() ) throw HPNConfigError("no transition named " + name);
        return it->second;
    }
    // nullptr when the transition is of another kind
    template<typename B> B* behaviorAs(const string& name) const { return dynamic_cast<B*>(behavior(name)); }

    void addObserver(SimulationObserver* o) { _observers.push_back(o); }
    void removeObserver(SimulationObserver* o) { _observers.remove(o); }

    void setSettings(const SimulationSettings& settings)
    {
        auto oldseed = _settings.seed();
        _settings = settings;
        _resolver.setPolicy(settings.conflictPolicy());
        if ( settings.seed() and settings.seed() != oldseed ) _sampler.reseed(*settings.seed());
        HPNLOG("settings:" << _settings.str())
        for(auto o:_observers) o->onSettingsChanged(_settings);
    }
    void setConflictPolicy(ConflictPolicy policy)
    {
        auto s = _settings;
        s.setConflictPolicy(policy);
        setSettings(s);
    }

    // Executes one hybrid step of dt (effective dt when not given). Returns
    // false when the duration is reached or the net is deadlocked. Throws
    // HPNConfigError for a non-positive dt.
    bool step(optional<double> dt = nullopt)
    {
        double h = dt ? *dt : _settings.effectiveDt();
        if ( not ( h > 0 ) or not isfinite(h) ) throw HPNConfigError("time step must be positive");

        StepEvent ev;
        ev.step = ++_stepcount;
        ev.dt = h;

        updateEnablementStates();

        vector<pair<ContinuousBehavior*,Locality>> pending;
        for(auto b:_continuous)
            if ( b->canFire().ok ) pending.push_back({b, b->locality()});

        vector<DiscreteBehavior*> enabled;
        for(auto b:_discrete) if ( b->canFire().ok ) enabled.push_back(b);
        bool fired = false;
        if ( auto chosen = _resolver.select(enabled) )
        {
            auto result = chosen->fire(chosen->inputArcs(), chosen->outputArcs());
            if ( auto details = get_if<FireDetails>(&result) )
            {
                fired = true;
                ev.fired = details->transition;
                ev.records.push_back(FiringRecord::from(ev.step, *details));
            }
            else
            {
                auto& err = get<FireError>(result);
                HPNLOG("fireerror:" << err.transition << ":" << err.reason)
                ev.errors.push_back({err.transition, err.reason});
            }
        }

        bool flowed = false;
        for(auto& p:pending)
        {
            auto result = p.first->integrateStep(h, p.second.inputs, p.second.outputs);
            if ( auto details = get_if<FlowDetails>(&result) )
            {
                flowed = true;
                ev.records.push_back(FiringRecord::from(ev.step, *details));
            }
            else
            {
                auto& err = get<FlowError>(result);
                ev.errors.push_back({err.transition, err.reason});
            }
        }

        for(auto b:_discrete)
            if ( auto tb = dynamic_cast<TimedBehavior*>(b) )
                if ( tb->isUrgent(h) ) ev.urgent.push_back(tb->name());

        _clock.advance(h);

        for(auto b:_discrete)
            if ( auto tb = dynamic_cast<TimedBehavior*>(b) )
                if ( tb->isOverdue() ) ev.deadlineMisses.push_back(tb->name());

        ev.time = _clock.now();
        ev.completed = _settings.isComplete(_clock.now());
        ev.deadlocked = not ev.completed and not fired and not flowed and not discretePending();
        HPNLOG("step:" << ev.step << ":" << ev.time << ":" << ev.fired << (ev.deadlocked ? ":deadlock" : ""))
        notifyStep(ev);
        return not ev.completed and not ev.deadlocked;
    }

    // Starts a run without executing any step; returns false if one is
    // already in progress. Without maxSteps only stop(), completion or
    // deadlock end the run.
    bool beginRun(optional<double> timeStep = nullopt, optional<unsigned long> maxSteps = nullopt)
    {
        if ( _running.exchange(true) ) return false;
        _stopRequested = false;
        _runDt = timeStep;
        _runMaxSteps = maxSteps;
        _runSteps = 0;
        return true;
    }
    // Executes up to batch steps of the current run. Returns false once the
    // run has ended (stop, step limit, completion or deadlock).
    bool tick(unsigned batch = 1)
    {
        if ( not _running ) return false;
        for(unsigned i=0; i<batch; i++)
        {
            if ( _stopRequested or ( _runMaxSteps and _runSteps >= *_runMaxSteps ) )
            {
                endRun();
                return false;
            }
            bool more = step(_runDt);
            _runSteps++;
            if ( not more )
            {
                endRun();
                return false;
            }
        }
        return true;
    }
    void endRun() { _running = false; }
    unsigned long runSteps() const { return _runSteps; }

    // Synchronous run on the calling thread, returns the number of steps
    // executed
    unsigned long run(optional<double> timeStep = nullopt, optional<unsigned long> maxSteps = nullopt)
    {
        if ( not beginRun(timeStep, maxSteps) ) return 0;
        while ( tick(1) ) {}
        return _runSteps;
    }
    // Takes effect between steps
    void stop() { _stopRequested = true; }

    void reset()
    {
        _clock.reset();
        for(auto b:_behaviors) b->clearEnablement();
        _pn->restoreInitialMarking();
        _resolver.reset();
        _sampler.reseed();
        _stepcount = 0;
        _runSteps = 0;
        _stopRequested = false;
        HPNLOG("reset")
        for(auto o:_observers) o->onReset();
    }

    // Throws HPNConfigError when a transition's parameters are invalid
    SimulationController(HPetriNet& net, SimulationSettings settings = SimulationSettings(), Observers observers = {}) :
        _pn(&net), _settings(settings), _sampler(settings.seed()), _factory(_clock, _sampler),
        _resolver(net.transitions(), settings.conflictPolicy(), _sampler), _observers(observers)
    {
        createBehaviors();
    }
    SimulationController(const SimulationController&) = delete;
    SimulationController& operator=(const SimulationController&) = delete;
    ~SimulationController() { deleteBehaviors(); }
};

#endif
