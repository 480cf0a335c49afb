using namespace std;

#include <algorithm>
#include <iostream>
#include <random>
#include "petrinet.h"
#include "simcontroller.h"
#include "simsettings.h"
#include "tracerecorder.h"

// Glycolysis entry: glucose is taken up continuously, phosphorylated by a
// Michaelis-Menten flux while ATP lasts, and ATP is regenerated in stochastic
// bursts. A timed transition exports G6P once it has been available for a
// while. Override the run with HPN_DURATION, HPN_DT, HPN_SEED...
int main()
{
    HPetriNet pn("pathway");
    HPNPlace
        *glucose_ext = pn.createPlace("Glucose_ext", 50.0),
        *glucose     = pn.createPlace("Glucose", 5.0),
        *atp         = pn.createPlace("ATP", 10.0),
        *adp         = pn.createPlace("ADP", 0.0),
        *g6p         = pn.createPlace("G6P", 0.0, 40.0),
        *exported    = pn.createPlace("Exported"),
        *hk          = pn.createPlace("Hexokinase", 1.0);

    ContinuousParams uptake;
    uptake.rate = RateFunction::expression("kup * Glucose_ext / (1 + Glucose)");
    uptake.parameters = {{"kup", 0.4}};
    ContinuousParams phosphorylation;
    phosphorylation.rate = RateFunction::expression("michaelis_menten(Glucose, vmax, km) * (ATP > 0)");
    phosphorylation.parameters = {{"vmax", 2.0}, {"km", 1.5}};
    phosphorylation.maxRate = 1.8;

    // ATP comes back in geometric batches
    StochasticParams regeneration{0.8, 4, [](Sampler& s)
        {
            geometric_distribution<unsigned> batches(0.5);
            return min(1 + batches(s.engine()), 4u);
        }};

    HPNTransition
        *t_uptake = pn.createTransition("Uptake", uptake),
        *t_hk     = pn.createTransition("Phosphorylation", phosphorylation),
        *t_regen  = pn.createTransition("Regeneration", regeneration),
        *t_export = pn.createTransition("Export", TimedParams{1.0, 3.0}, 0, "G6P >= 2");

    pn.createArc(glucose_ext,t_uptake);
    pn.createArc(t_uptake,glucose);
    pn.createArc(glucose,t_hk);
    pn.createArc(atp,t_hk);
    pn.createArc(hk,t_hk,1,ArcKind::Test);
    pn.createArc(t_hk,g6p);
    pn.createArc(t_hk,adp);
    pn.createArc(adp,t_regen);
    pn.createArc(t_regen,atp);
    pn.createArc(g6p,t_export,2);
    pn.createArc(t_export,exported,2);

    SimulationSettings defaults;
    defaults.setDuration(20.0, TimeUnits::Minutes);
    defaults.setConflictPolicy(ConflictPolicy::TypeBased);
    auto settings = SimulationSettings::fromEnv(defaults);
    if ( auto warning = settings.stepCountWarning() ) cerr << "warning: " << *warning << endl;

    TraceRecorder trace(&pn);
    SimulationController sim(pn, settings, {&trace});
    cout << "settings: " << settings.str() << endl;
    auto steps = sim.run();
    cout << "steps=" << steps << " time=" << sim.time() << " " << unitsAbbreviation(settings.timeUnits())
         << " progress=" << sim.progress() << endl;
    cout << "Regeneration fired " << trace.count("Regeneration") << " times, Export "
         << trace.count("Export") << " times, " << trace.errors() << " errors" << endl;
    pn.printMarkings();
    return 0;
}
