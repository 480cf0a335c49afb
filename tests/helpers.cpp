#include "helpers.h"

HPNTransition* addImmediatePath(HPetriNet& net, const std::string& in, const std::string& t,
    const std::string& out, double marking, double wt)
{
    auto pin = net.createPlace(in, marking);
    auto pout = net.createPlace(out);
    auto tr = net.createTransition(t);
    net.createArc(pin, tr, wt);
    net.createArc(tr, pout, wt);
    return tr;
}

HPNTransition* addContinuousPath(HPetriNet& net, const std::string& in, const std::string& t,
    const std::string& out, double marking, double rate)
{
    auto pin = net.createPlace(in, marking);
    auto pout = net.createPlace(out);
    ContinuousParams params;
    params.rate = RateFunction::constant(rate);
    auto tr = net.createTransition(t, params);
    net.createArc(pin, tr);
    net.createArc(tr, pout);
    return tr;
}

SimulationSettings manualSettings(double dt, ConflictPolicy policy, std::optional<uint64_t> seed)
{
    SimulationSettings s;
    s.setDtAuto(false);
    s.setDtManual(dt);
    s.setConflictPolicy(policy);
    s.setSeed(seed);
    return s;
}

double totalTokens(const HPetriNet& net, const std::vector<std::string>& places)
{
    double sum = 0;
    for(auto const& p:places) sum += net.place(p)->tokens();
    return sum;
}
