using namespace std;

#include <iostream>
#include <string>
#include "petrinet.h"
#include "simcontroller.h"
#include "tracerecorder.h"

// Three transitions compete for one shared pool. Each policy gets the same
// net and seed; the firing counts show how it splits the pool.
static void buildNet(HPetriNet& pn)
{
    auto pool = pn.createPlace("Pool", 30);
    const struct { const char* name; int priority; TransitionParams params; } competitors[] = {
        {"Fast", 1, ImmediateParams{}},
        {"Urgent", 5, ImmediateParams{}},
        {"Lazy", 0, TimedParams{0.5, 100.0}},
    };
    for(auto const& c:competitors)
    {
        auto t = pn.createTransition(c.name, c.params, c.priority);
        auto sink = pn.createPlace(string(c.name) + "_out");
        pn.createArc(pool,t);
        pn.createArc(t,sink);
    }
}

int main()
{
    for(auto policy:{ConflictPolicy::Random, ConflictPolicy::Priority, ConflictPolicy::RoundRobin, ConflictPolicy::TypeBased})
    {
        HPetriNet pn("conflict_" + policyName(policy));
        buildNet(pn);
        SimulationSettings settings;
        settings.setDtAuto(false);
        settings.setDtManual(0.25);
        settings.setConflictPolicy(policy);
        settings.setSeed(2024);
        TraceRecorder trace;
        SimulationController sim(pn, settings, {&trace});
        sim.run();
        cout << policyName(policy) << ":";
        for(auto name:{"Fast", "Urgent", "Lazy"}) cout << " " << name << "=" << trace.count(name);
        cout << " (" << sim.stepCount() << " steps)" << endl;
    }
    return 0;
}
