#ifndef _HPN_ERROR_H
#define _HPN_ERROR_H

#include <stdexcept>
#include <string>

using namespace std;

// Raised while building a net, its behaviors or the simulation settings. The
// model has to be fixed before it can be simulated.
class HPNConfigError : public runtime_error
{
public:
    explicit HPNConfigError(const string& what) : runtime_error(what) {}
};

// Raised while evaluating a rate or guard expression (unknown place, division
// by zero, domain error). Never escapes a simulation step: behaviors turn it
// into a FlowError or a failed enablement.
class RateError : public runtime_error
{
public:
    explicit RateError(const string& what) : runtime_error(what) {}
};

#endif
