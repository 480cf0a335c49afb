#ifndef _HPN_SIMEVENTS_H
#define _HPN_SIMEVENTS_H

#include <list>
#include <map>
#include <string>
#include <vector>
#include "behavior.h"

using namespace std;

class SimulationSettings;

// One discrete firing or one continuous integration, flattened for observers
struct FiringRecord
{
    unsigned long step;
    double time;
    string transition;
    TransitionKind kind;
    map<string,double> consumed;
    map<string,double> produced;
    unsigned burst = 1;      // discrete only
    double rate = 0.0;       // continuous only
    double actualRate = 0.0; // continuous only
    double dt = 0.0;         // continuous only
    string method;           // "rk4" for continuous
    bool clamped = false;

    static FiringRecord from(unsigned long step, const FireDetails& d)
    {
        FiringRecord r{step, d.time, d.transition, d.kind, d.consumed, d.produced};
        r.burst = d.burst;
        return r;
    }
    static FiringRecord from(unsigned long step, const FlowDetails& d)
    {
        FiringRecord r{step, d.time, d.transition, TransitionKind::Continuous, d.consumed, d.produced};
        r.rate = d.rate;
        r.actualRate = d.actualRate;
        r.dt = d.dt;
        r.method = d.method;
        r.clamped = d.clamped;
        return r;
    }
};

struct StepError
{
    string transition;
    string reason;
};

// Emitted once at the end of every step. time is the time after the step.
struct StepEvent
{
    unsigned long step = 0;
    double time = 0.0;
    double dt = 0.0;
    string fired;                 // discrete transition fired this step, empty if none
    vector<FiringRecord> records; // the discrete firing first, then flows
    vector<StepError> errors;
    vector<string> urgent;        // timed transitions whose deadline falls within this step
    vector<string> deadlineMisses;
    bool completed = false;       // duration reached
    bool deadlocked = false;
};

// Notifications are synchronous, on the thread running the step
class SimulationObserver
{
public:
    virtual void onStep(const StepEvent&) {}
    virtual void onFiring(const FiringRecord&) {}
    virtual void onReset() {}
    virtual void onSettingsChanged(const SimulationSettings&) {}
    virtual ~SimulationObserver() {}
};

typedef list<SimulationObserver*> Observers;

#endif
