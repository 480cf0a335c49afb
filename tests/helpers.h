#ifndef _HPN_TESTS_HELPERS_H
#define _HPN_TESTS_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "conflict.h"
#include "petrinet.h"
#include "simsettings.h"

// in -> t (immediate) -> out
HPNTransition* addImmediatePath(HPetriNet& net, const std::string& in, const std::string& t,
    const std::string& out, double marking, double wt = 1);

// in -> t (continuous, constant rate) -> out
HPNTransition* addContinuousPath(HPetriNet& net, const std::string& in, const std::string& t,
    const std::string& out, double marking, double rate);

// Manual dt, no duration, fixed seed
SimulationSettings manualSettings(double dt, ConflictPolicy policy = ConflictPolicy::Random,
    std::optional<uint64_t> seed = 42);

double totalTokens(const HPetriNet& net, const std::vector<std::string>& places);

#endif
