#ifndef _HPN_CONFLICT_H
#define _HPN_CONFLICT_H

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "behavior.h"
#include "hpnerror.h"
#include "sampler.h"

using namespace std;

// Random      : uniform among the enabled transitions
// Priority    : highest HPNTransition::priority() wins
// RoundRobin  : next enabled transition after the one picked last, wrapping
// TypeBased   : immediate before timed before stochastic
//
// Priority and TypeBased break ties by the order in which transitions were
// added to the net.
enum class ConflictPolicy { Random, Priority, RoundRobin, TypeBased };

inline string policyName(ConflictPolicy p)
{
    switch(p)
    {
        case ConflictPolicy::Random: return "random";
        case ConflictPolicy::Priority: return "priority";
        case ConflictPolicy::RoundRobin: return "round_robin";
        case ConflictPolicy::TypeBased: return "type_based";
    }
    return "unknown";
}

inline ConflictPolicy parsePolicy(const string& name)
{
    for(auto p:{ConflictPolicy::Random, ConflictPolicy::Priority, ConflictPolicy::RoundRobin, ConflictPolicy::TypeBased})
        if ( policyName(p) == name ) return p;
    throw HPNConfigError("unknown conflict policy: " + name);
}

class ConflictResolver
{
    ConflictPolicy _policy;
    Sampler& _sampler;
    map<const HPNTransition*,size_t> _order;
    optional<size_t> _last; // round robin position

    size_t orderOf(const DiscreteBehavior* b) const
    {
        auto it = _order.find(b->transition());
        return it == _order.end() ? _order.size() : it->second;
    }
    static int typeRank(TransitionKind k)
    {
        switch(k)
        {
            case TransitionKind::Immediate: return 0;
            case TransitionKind::Timed: return 1;
            case TransitionKind::Stochastic: return 2;
            default: return 3;
        }
    }
    DiscreteBehavior* byOrder(const vector<DiscreteBehavior*>& enabled, function<bool(DiscreteBehavior*,DiscreteBehavior*)> better) const
    {
        DiscreteBehavior* best = nullptr;
        for(auto b:enabled)
            if ( best == nullptr or better(b, best) or ( not better(best, b) and orderOf(b) < orderOf(best) ) )
                best = b;
        return best;
    }
    DiscreteBehavior* roundRobin(const vector<DiscreteBehavior*>& enabled)
    {
        DiscreteBehavior *next = nullptr, *first = nullptr;
        for(auto b:enabled)
        {
            size_t i = orderOf(b);
            if ( first == nullptr or i < orderOf(first) ) first = b;
            if ( _last and i > *_last and ( next == nullptr or i < orderOf(next) ) ) next = b;
        }
        auto picked = next ? next : first;
        _last = orderOf(picked);
        return picked;
    }
public:
    ConflictPolicy policy() const { return _policy; }
    void setPolicy(ConflictPolicy policy)
    {
        _policy = policy;
        _last.reset();
    }
    void reset() { _last.reset(); }
    // nullptr when nothing is enabled
    DiscreteBehavior* select(const vector<DiscreteBehavior*>& enabled)
    {
        if ( enabled.empty() ) return nullptr;
        if ( enabled.size() == 1 and _policy != ConflictPolicy::RoundRobin ) return enabled.front();
        switch(_policy)
        {
            case ConflictPolicy::Random:
                return enabled[_sampler.pick(enabled.size())];
            case ConflictPolicy::Priority:
                return byOrder(enabled, [](DiscreteBehavior* a, DiscreteBehavior* b)
                    { return a->transition()->priority() > b->transition()->priority(); });
            case ConflictPolicy::RoundRobin:
                return roundRobin(enabled);
            case ConflictPolicy::TypeBased:
                return byOrder(enabled, [](DiscreteBehavior* a, DiscreteBehavior* b)
                    { return typeRank(a->kind()) < typeRank(b->kind()); });
        }
        return nullptr;
    }
    // order: every transition of the net in insertion order
    ConflictResolver(const Transitions& order, ConflictPolicy policy, Sampler& sampler) :
        _policy(policy), _sampler(sampler)
    {
        for(auto t:order) _order.emplace(t, _order.size());
    }
};

#endif
