#ifndef _HPN_BEHAVIOR_H
#define _HPN_BEHAVIOR_H

// Firing semantics, one behavior object per transition.
//
// Discrete kinds (immediate, timed, stochastic) fire atomically: every
// precondition is checked over the whole locality first and markings are only
// touched once all of them hold. The continuous kind advances its flow over a
// time step with RK4 and clamps the flow instead of failing.
//
// canFire() is a pure query and never throws. fire() / integrateStep() report
// failures as FireError / FlowError and leave the marking untouched.

#include <algorithm>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include "petrinet.h"
#include "rateexpr.h"
#include "sampler.h"

using namespace std;

// Tolerance for comparing simulation times
const double HPN_TIME_EPS = 1e-9;
// Flows below this amount are treated as no flow
const double HPN_FLOW_EPS = 1e-12;

class SimClock
{
    double _time = 0.0;
public:
    double now() const { return _time; }
    void advance(double dt) { _time += dt; }
    void reset() { _time = 0.0; }
};

struct Enablement
{
    bool ok;
    string reason;
};

// Arcs adjacent to a transition. Inputs include test and inhibitor arcs.
struct Locality
{
    Arcs inputs;
    Arcs outputs;
};

struct FireDetails
{
    string transition;
    TransitionKind kind;
    double time = 0.0;
    map<string,double> consumed;
    map<string,double> produced;
    unsigned burst = 1;
    double elapsed = 0.0; // since enablement, timed and stochastic only
};

struct FireError
{
    string transition;
    string reason;
};

typedef variant<FireDetails, FireError> FireResult;

struct FlowDetails
{
    string transition;
    double time = 0.0;
    double rate = 0.0;       // clamped rate at the start of the step
    double actualRate = 0.0; // flow / dt after clamping to available tokens
    double dt = 0.0;
    map<string,double> consumed;
    map<string,double> produced;
    string method = "rk4";
    bool clamped = false;
};

struct FlowError
{
    string transition;
    string reason;
};

typedef variant<FlowDetails, FlowError> FlowResult;

// Resolves names in rate and guard expressions against the current marking.
// Place names and P<id> read a place (shifted by an optional offset, never
// below 0), everything else falls back to the transition's parameters.
class NetScope : public RateScope
{
    const HPetriNet& _net;
    const double _time;
    const map<string,double>* _params;
    const map<const HPNPlace*,double>* _offsets;
    static bool isPlaceId(const string& name)
    {
        if ( name.size() < 2 or name.size() > 10 or name[0] != 'P' ) return false;
        for(size_t i=1; i<name.size(); i++) if ( not isdigit((unsigned char)name[i]) ) return false;
        return true;
    }
public:
    double value(const string& name) const
    {
        const HPNPlace* p = _net.findPlace(name);
        if ( p == nullptr and isPlaceId(name) ) p = _net.findPlace(unsigned(stoul(name.substr(1))));
        if ( p )
        {
            double v = p->tokens();
            if ( _offsets )
            {
                auto it = _offsets->find(p);
                if ( it != _offsets->end() ) v += it->second;
            }
            return v < 0 ? 0.0 : v;
        }
        if ( _params )
        {
            auto it = _params->find(name);
            if ( it != _params->end() ) return it->second;
        }
        throw RateError("unknown-identifier-" + name);
    }
    double time() const { return _time; }
    NetScope(const HPetriNet& net, double time, const map<string,double>* params = nullptr,
        const map<const HPNPlace*,double>* offsets = nullptr) :
        _net(net), _time(time), _params(params), _offsets(offsets) {}
};

class TransitionBehavior
{
    static Locality buildLocality(HPNTransition* t) { return Locality{t->_iarcs, t->_oarcs}; }
protected:
    HPetriNet* _pn;
    HPNTransition* const _transition;
    const SimClock& _clock;
    const Locality _locality;
    optional<double> _enablementTime;

    static string fmt3(double v)
    {
        ostringstream os;
        os << fixed << setprecision(3) << v;
        return os.str();
    }
    virtual const map<string,double>* scopeParams() const { return nullptr; }
    Enablement checkGuard() const
    {
        if ( not _transition->hasGuard() ) return {true, "enabled"};
        try
        {
            NetScope scope(*_pn, _clock.now(), scopeParams());
            if ( _transition->guard().evaluate(scope) != 0.0 ) return {true, "enabled"};
        }
        catch(const RateError& e)
        {
            HPNLOG("guard:" << _transition->idlabel() << ":" << e.what())
        }
        return {false, "guard-fails"};
    }
    // Normal input arcs need mult * weight tokens, test arcs weight,
    // inhibitor arcs less than weight. Requirements of parallel arcs from the
    // same place add up.
    Enablement checkInputs(const Arcs& inputs, double mult, const string& prefix) const
    {
        map<HPNPlace*,double> required;
        for(auto ia:inputs)
        {
            auto p = ia->_place;
            switch(ia->_kind)
            {
                case ArcKind::Normal: required[p] += ia->_wt * mult; break;
                case ArcKind::Test:
                    if ( p->tokens() < ia->_wt ) return {false, prefix + p->_name};
                    break;
                case ArcKind::Inhibitor:
                    if ( p->tokens() >= ia->_wt ) return {false, "inhibited-" + p->_name};
                    break;
            }
        }
        for(auto const& r:required)
            if ( r.first->tokens() + HPN_FLOW_EPS < r.second ) return {false, prefix + r.first->_name};
        return {true, "enabled"};
    }
    // Net marking change of every bounded output must stay within capacity
    Enablement checkCapacity(const Arcs& inputs, const Arcs& outputs, double mult) const
    {
        map<HPNPlace*,double> delta;
        for(auto oa:outputs) delta[oa->_place] += oa->_wt * mult;
        for(auto ia:inputs) if ( ia->consumes() and delta.count(ia->_place) ) delta[ia->_place] -= ia->_wt * mult;
        for(auto const& d:delta)
            if ( d.first->bounded() and d.first->tokens() + d.second > d.first->capacity() + HPN_FLOW_EPS )
                return {false, "capacity-exceeded-" + d.first->_name};
        return {true, "enabled"};
    }
public:
    HPNTransition* transition() const { return _transition; }
    const string& name() const { return _transition->_name; }
    TransitionKind kind() const { return _transition->kind(); }
    virtual string typeName() const = 0;
    const Arcs& inputArcs() const { return _locality.inputs; }
    const Arcs& outputArcs() const { return _locality.outputs; }
    const Locality& locality() const { return _locality; }

    virtual Enablement canFire() const = 0;
    // Guard and marking conditions only, ignoring any clock
    virtual Enablement isStructurallyEnabled() const
    {
        auto g = checkGuard();
        if ( not g.ok ) return g;
        auto in = checkInputs(_locality.inputs, 1, "insufficient-tokens-");
        if ( not in.ok ) return in;
        auto cap = checkCapacity(_locality.inputs, _locality.outputs, 1);
        if ( not cap.ok ) return cap;
        return {true, _locality.inputs.empty() ? "enabled-no-inputs" : "enabled"};
    }
    optional<double> enablementTime() const { return _enablementTime; }
    virtual void setEnablementTime(double t)
    {
        _enablementTime = t;
        HPNLOG("enabled:" << _transition->idlabel() << ":" << t)
    }
    virtual void clearEnablement()
    {
        if ( _enablementTime )
        {
            HPNLOG("disabled:" << _transition->idlabel() << ":" << _clock.now())
        }
        _enablementTime.reset();
    }
    TransitionBehavior(HPNTransition* t, const SimClock& clock) :
        _pn(t->net()), _transition(t), _clock(clock), _locality(buildLocality(t)) {}
    TransitionBehavior(const TransitionBehavior&) = delete;
    TransitionBehavior& operator=(const TransitionBehavior&) = delete;
    virtual ~TransitionBehavior() {}
};

class DiscreteBehavior : public TransitionBehavior
{
protected:
    virtual unsigned burst() const { return 1; }
    // Moves mult * weight along every normal arc, or nothing at all
    FireResult transfer(const Arcs& inputs, const Arcs& outputs, double mult)
    {
        auto in = checkInputs(inputs, mult, burst() > 1 ? "insufficient-tokens-for-burst-" : "insufficient-tokens-");
        if ( not in.ok ) return FireError{name(), in.reason};
        auto cap = checkCapacity(inputs, outputs, mult);
        if ( not cap.ok ) return FireError{name(), cap.reason};

        FireDetails details;
        details.transition = name();
        details.kind = kind();
        details.time = _clock.now();
        details.burst = burst();
        if ( _enablementTime ) details.elapsed = _clock.now() - *_enablementTime;
        for(auto ia:inputs) if ( ia->consumes() )
        {
            ia->_place->deducttokens(ia->_wt * mult);
            details.consumed[ia->_place->_name] += ia->_wt * mult;
        }
        for(auto oa:outputs)
        {
            oa->_place->addtokens(oa->_wt * mult);
            details.produced[oa->_place->_name] += oa->_wt * mult;
        }
        HPNLOG("t:" << _transition->idlabel() << ":" << kindName(kind()) << ":" << details.time << ":x" << details.burst)
        clearEnablement();
        return details;
    }
public:
    // inputs / outputs are the locality captured by the caller
    virtual FireResult fire(const Arcs& inputs, const Arcs& outputs)
    {
        auto e = canFire();
        if ( not e.ok ) return FireError{name(), e.reason};
        return transfer(inputs, outputs, burst());
    }
    FireResult fire() { return fire(_locality.inputs, _locality.outputs); }
    DiscreteBehavior(HPNTransition* t, const SimClock& clock) : TransitionBehavior(t, clock) {}
};

class ImmediateBehavior : public DiscreteBehavior
{
public:
    string typeName() const { return "Immediate"; }
    Enablement canFire() const { return isStructurallyEnabled(); }
    ImmediateBehavior(HPNTransition* t, const SimClock& clock) : DiscreteBehavior(t, clock) {}
};

struct TimingInfo
{
    double earliest;
    double latest;
    optional<double> enablementTime;
    optional<double> elapsed;
    optional<double> remaining; // until latest, never negative
    bool inWindow = false;
};

// Fires within [earliest, latest] time units after becoming enabled
class TimedBehavior : public DiscreteBehavior
{
    const TimedParams _params;
public:
    string typeName() const { return "Timed"; }
    double earliest() const { return _params.earliest; }
    double latest() const { return _params.latest; }
    Enablement canFire() const
    {
        auto e = isStructurallyEnabled();
        if ( not e.ok ) return e;
        if ( not _enablementTime ) return {false, "not-enabled-yet"};
        double elapsed = _clock.now() - *_enablementTime;
        if ( elapsed + HPN_TIME_EPS < _params.earliest )
            return {false, "too-early (elapsed=" + fmt3(elapsed) + ")"};
        if ( elapsed > _params.latest + HPN_TIME_EPS )
            return {false, "too-late (elapsed=" + fmt3(elapsed) + ")"};
        return {true, "enabled-in-window"};
    }
    // Inside the window with the deadline no further than one step away
    bool isUrgent(double step) const
    {
        if ( not _enablementTime or isinf(_params.latest) ) return false;
        double elapsed = _clock.now() - *_enablementTime;
        double left = _params.latest - elapsed;
        return elapsed + HPN_TIME_EPS >= _params.earliest and left >= -HPN_TIME_EPS and left <= step + HPN_TIME_EPS;
    }
    bool isOverdue() const
    {
        if ( not _enablementTime ) return false;
        return _clock.now() - *_enablementTime > _params.latest + HPN_TIME_EPS;
    }
    TimingInfo timingInfo() const
    {
        TimingInfo info{_params.earliest, _params.latest, _enablementTime};
        if ( _enablementTime )
        {
            double elapsed = _clock.now() - *_enablementTime;
            info.elapsed = elapsed;
            info.remaining = max(0.0, _params.latest - elapsed);
            info.inWindow = elapsed + HPN_TIME_EPS >= _params.earliest and elapsed <= _params.latest + HPN_TIME_EPS;
        }
        return info;
    }
    TimedBehavior(HPNTransition* t, const SimClock& clock, const TimedParams& params) :
        DiscreteBehavior(t, clock), _params(params) {}
};

struct StochasticInfo
{
    double rate;
    unsigned maxBurst;
    double meanDelay;
    optional<double> scheduledFireTime;
    optional<unsigned> sampledBurst;
};

// Exponential race: delay and burst are sampled once per enablement
class StochasticBehavior : public DiscreteBehavior
{
    const StochasticParams _params;
    Sampler& _sampler;
    optional<double> _scheduledFireTime;
    optional<unsigned> _sampledBurst;

    unsigned sampleBurst()
    {
        if ( not _params.burst ) return _sampler.uniformInt(1, _params.maxBurst);
        unsigned b = _params.burst(_sampler);
        return b < 1 ? 1 : b;
    }
protected:
    unsigned burst() const { return _sampledBurst ? *_sampledBurst : 1; }
public:
    string typeName() const { return "Stochastic"; }
    double rate() const { return _params.rate; }
    unsigned maxBurst() const { return _params.maxBurst; }
    optional<double> scheduledFireTime() const { return _scheduledFireTime; }
    optional<unsigned> sampledBurst() const { return _sampledBurst; }
    void setEnablementTime(double t)
    {
        DiscreteBehavior::setEnablementTime(t);
        _scheduledFireTime = t + _sampler.exponential(_params.rate);
        _sampledBurst = sampleBurst();
        HPNLOG("sampled:" << _transition->idlabel() << ":" << *_scheduledFireTime << ":x" << *_sampledBurst)
    }
    void clearEnablement()
    {
        DiscreteBehavior::clearEnablement();
        _scheduledFireTime.reset();
        _sampledBurst.reset();
    }
    // Keeps the scheduled time
    void resampleBurst() { _sampledBurst = sampleBurst(); }
    Enablement canFire() const
    {
        auto e = isStructurallyEnabled();
        if ( not e.ok ) return e;
        if ( not _scheduledFireTime ) return {false, "not-scheduled"};
        double remaining = *_scheduledFireTime - _clock.now();
        if ( remaining > HPN_TIME_EPS ) return {false, "too-early (remaining=" + fmt3(remaining) + ")"};
        auto in = checkInputs(_locality.inputs, burst(), "insufficient-tokens-for-burst-");
        if ( not in.ok ) return in;
        auto cap = checkCapacity(_locality.inputs, _locality.outputs, burst());
        if ( not cap.ok ) return cap;
        return {true, "enabled-stochastic (burst=" + to_string(burst()) + ")"};
    }
    // Tokens needed per input place for the sampled burst (max burst when
    // nothing is sampled)
    map<string,double> requiredTokensForBurst() const
    {
        double b = _sampledBurst ? *_sampledBurst : _params.maxBurst;
        map<string,double> required;
        for(auto ia:_locality.inputs) if ( ia->consumes() ) required[ia->_place->_name] += ia->_wt * b;
        return required;
    }
    StochasticInfo stochasticInfo() const
    {
        return StochasticInfo{_params.rate, _params.maxBurst, 1.0 / _params.rate, _scheduledFireTime, _sampledBurst};
    }
    StochasticBehavior(HPNTransition* t, const SimClock& clock, const StochasticParams& params, Sampler& sampler) :
        DiscreteBehavior(t, clock), _params(params), _sampler(sampler) {}
};

// Continuous flow: dF/dt = rate(marking shifted by the flow so far)
class ContinuousBehavior : public TransitionBehavior
{
    const ContinuousParams _params;

    double clampRate(double r) const { return r < _params.minRate ? _params.minRate : (r > _params.maxRate ? _params.maxRate : r); }
    // Rate with every normal arc's place shifted as if flow F had already happened
    double rateAt(double flow, const Arcs& inputs, const Arcs& outputs) const
    {
        map<const HPNPlace*,double> offsets;
        if ( flow != 0.0 )
        {
            for(auto ia:inputs) if ( ia->consumes() ) offsets[ia->_place] -= ia->_wt * flow;
            for(auto oa:outputs) offsets[oa->_place] += oa->_wt * flow;
        }
        NetScope scope(*_pn, _clock.now(), &_params.parameters, &offsets);
        return clampRate(_params.rate.evaluate(scope));
    }
    // Computes the clamped flow amount without touching the marking
    FlowResult computeFlow(double dt, const Arcs& inputs, const Arcs& outputs) const
    {
        FlowDetails details;
        details.transition = name();
        details.time = _clock.now();
        details.dt = dt;
        if ( dt < 0 or not isfinite(dt) ) return FlowError{name(), "invalid-dt"};
        double flow;
        try
        {
            double k1 = rateAt(0.0, inputs, outputs);
            details.rate = k1;
            if ( dt == 0.0 ) return details;
            double k2 = rateAt(0.5 * dt * k1, inputs, outputs);
            double k3 = rateAt(0.5 * dt * k2, inputs, outputs);
            double k4 = rateAt(dt * k3, inputs, outputs);
            flow = dt / 6.0 * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
        }
        catch(const RateError& e)
        {
            return FlowError{name(), e.what()};
        }
        catch(const exception& e)
        {
            // from a user supplied rate callable
            return FlowError{name(), string("rate-function-error: ") + e.what()};
        }
        if ( not isfinite(flow) ) return FlowError{name(), "non-finite-flow"};
        if ( flow < 0 ) flow = 0.0;

        // Per unit of flow, how much each place changes
        map<HPNPlace*,double> delta;
        for(auto ia:inputs) if ( ia->consumes() ) delta[ia->_place] -= ia->_wt;
        for(auto oa:outputs) delta[oa->_place] += oa->_wt;
        double limit = flow;
        for(auto const& d:delta)
        {
            if ( d.second < 0 ) limit = min(limit, d.first->tokens() / -d.second);
            else if ( d.second > 0 and d.first->bounded() ) limit = min(limit, max(0.0, d.first->headroom()) / d.second);
        }
        if ( limit < flow )
        {
            details.clamped = true;
            flow = limit;
        }
        if ( flow < HPN_FLOW_EPS ) flow = 0.0;
        details.actualRate = dt > 0 ? flow / dt : 0.0;

        for(auto ia:inputs) if ( ia->consumes() ) details.consumed[ia->_place->_name] += ia->_wt * flow;
        for(auto oa:outputs) details.produced[oa->_place->_name] += oa->_wt * flow;
        return details;
    }
    const map<string,double>* scopeParams() const { return &_params.parameters; }
public:
    string typeName() const { return "Continuous"; }
    const RateFunction& rateFunction() const { return _params.rate; }
    // Every consuming input place holds a positive amount
    Enablement canFire() const
    {
        auto g = checkGuard();
        if ( not g.ok ) return g;
        bool consuming = false;
        for(auto ia:_locality.inputs)
        {
            auto p = ia->_place;
            switch(ia->_kind)
            {
                case ArcKind::Normal:
                    consuming = true;
                    if ( p->tokens() <= 0.0 ) return {false, "insufficient-tokens-" + p->_name};
                    break;
                case ArcKind::Test:
                    if ( p->tokens() < ia->_wt ) return {false, "insufficient-tokens-" + p->_name};
                    break;
                case ArcKind::Inhibitor:
                    if ( p->tokens() >= ia->_wt ) return {false, "inhibited-" + p->_name};
                    break;
            }
        }
        return {true, consuming ? "enabled" : "enabled-no-inputs"};
    }
    Enablement isStructurallyEnabled() const { return canFire(); }
    // Throws RateError
    double evaluateCurrentRate() const { return rateAt(0.0, _locality.inputs, _locality.outputs); }
    FlowResult predictFlow(double dt) const { return computeFlow(dt, _locality.inputs, _locality.outputs); }
    // Does not re-check enablement: the controller decided that on its
    // snapshot at the start of the step
    FlowResult integrateStep(double dt, const Arcs& inputs, const Arcs& outputs)
    {
        auto result = computeFlow(dt, inputs, outputs);
        if ( auto err = get_if<FlowError>(&result) )
        {
            HPNLOG("flowerror:" << _transition->idlabel() << ":" << err->reason)
            return result;
        }
        auto& details = get<FlowDetails>(result);
        for(auto const& c:details.consumed) _pn->place(c.first)->deducttokens(c.second);
        for(auto const& p:details.produced) _pn->place(p.first)->addtokens(p.second);
        HPNLOG("c:" << _transition->idlabel() << ":" << details.time << ":" << details.actualRate << (details.clamped ? ":clamped" : ""))
        return result;
    }
    FlowResult integrateStep(double dt) { return integrateStep(dt, _locality.inputs, _locality.outputs); }
    ContinuousBehavior(HPNTransition* t, const SimClock& clock, const ContinuousParams& params) :
        TransitionBehavior(t, clock), _params(params) {}
};

// Builds the behavior matching a transition's parameters, validating them.
// Throws HPNConfigError.
class BehaviorFactory
{
    const SimClock& _clock;
    Sampler& _sampler;

    struct Builder
    {
        HPNTransition* t;
        const SimClock& clock;
        Sampler& sampler;
        TransitionBehavior* operator()(const ImmediateParams&) const { return new ImmediateBehavior(t, clock); }
        TransitionBehavior* operator()(const TimedParams& p) const
        {
            if ( p.earliest < 0 or p.latest < 0 )
                throw HPNConfigError("timed transition " + t->_name + ": negative time window");
            if ( p.earliest > p.latest )
                throw HPNConfigError("timed transition " + t->_name + ": earliest > latest");
            return new TimedBehavior(t, clock, p);
        }
        TransitionBehavior* operator()(const StochasticParams& p) const
        {
            if ( not ( p.rate > 0 ) or not isfinite(p.rate) )
                throw HPNConfigError("stochastic transition " + t->_name + ": rate must be positive");
            if ( p.maxBurst < 1 )
                throw HPNConfigError("stochastic transition " + t->_name + ": max burst must be >= 1");
            return new StochasticBehavior(t, clock, p, sampler);
        }
        TransitionBehavior* operator()(const ContinuousParams& p) const
        {
            if ( p.minRate < 0 )
                throw HPNConfigError("continuous transition " + t->_name + ": negative min rate");
            if ( p.maxRate < p.minRate )
                throw HPNConfigError("continuous transition " + t->_name + ": max rate < min rate");
            return new ContinuousBehavior(t, clock, p);
        }
    };
public:
    // Caller owns the returned behavior
    TransitionBehavior* create(HPNTransition* t) const
    {
        if ( t == nullptr ) throw HPNConfigError("behavior factory: null transition");
        return visit(Builder{t, _clock, _sampler}, t->params());
    }
    BehaviorFactory(const SimClock& clock, Sampler& sampler) : _clock(clock), _sampler(sampler) {}
};

#endif
