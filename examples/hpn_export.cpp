using namespace std;

#include <iostream>
#include "petrinet.h"
#include "simcontroller.h"
#include "simrunner.h"
#include "tracerecorder.h"

// Builds a small producer / consumer net, writes its structure as DOT, PNML
// and JSON, runs it on the tick engine and writes the trace as JSON and CSV.
int main()
{
    HPetriNet pn("export");
    HPNPlace
        *buffer = pn.createPlace("Buffer", 0.0, 5.0),
        *consumed = pn.createPlace("Consumed"),
        *stopflag = pn.createPlace("Stop");

    ContinuousParams production;
    production.rate = RateFunction::expression("pulse(t, 0, 2) * 3 + 0.5");
    HPNTransition
        *produce = pn.createTransition("Produce", production),
        *consume = pn.createTransition("Consume", StochasticParams{1.5, 2}),
        *halt    = pn.createTransition("Halt", TimedParams{8.0, 8.0});

    pn.createArc(produce,buffer);
    pn.createArc(buffer,consume);
    pn.createArc(consume,consumed);
    pn.createArc(stopflag,consume,1,ArcKind::Inhibitor);
    pn.createArc(halt,stopflag);
    // stop halting once the flag is up
    pn.createArc(stopflag,halt,1,ArcKind::Inhibitor);

    pn.printdot("export.dot");
    pn.printpnml("export.pnml");
    pn.printjson("export.json");

    SimulationSettings settings;
    settings.setDuration(10.0);
    settings.setSeed(7);
    TraceRecorder trace(&pn);
    SimulationController sim(pn, SimulationSettings::fromEnv(settings), {&trace});
    SimulationRunner runner(sim);
    if ( not runner.start() )
    {
        cerr << "simulation already running" << endl;
        return 1;
    }
    runner.wait();

    trace.printjson("export_trace.json");
    trace.printcsv("export_trace.csv");
    cout << trace.records().size() << " records over " << trace.steps() << " steps" << endl;
    pn.printMarkings();
    return 0;
}
