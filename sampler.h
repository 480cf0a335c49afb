#ifndef _HPN_SAMPLER_H
#define _HPN_SAMPLER_H

#include <cstdint>
#include <optional>
#include <random>
#include "hpnerror.h"

using namespace std;

typedef mt19937_64 RandomEngine;

// Seedable random source shared by stochastic behaviors and the Random
// conflict policy. Without a seed one is drawn from random_device and kept, so
// that reseed() still replays the same sequence.
class Sampler
{
    uint64_t _seed;
    RandomEngine _engine;
    static uint64_t pickSeed(optional<uint64_t> seed)
    {
        if ( seed ) return *seed;
        random_device rd;
        return (uint64_t(rd()) << 32) | rd();
    }
public:
    uint64_t seed() const { return _seed; }
    void reseed() { _engine.seed(_seed); }
    void reseed(uint64_t seed)
    {
        _seed = seed;
        _engine.seed(_seed);
    }
    double exponential(double rate)
    {
        if ( not ( rate > 0 ) ) throw HPNConfigError("exponential sample: rate must be positive");
        exponential_distribution<double> dist(rate);
        return dist(_engine);
    }
    // Inclusive range
    unsigned uniformInt(unsigned lo, unsigned hi)
    {
        uniform_int_distribution<unsigned> dist(lo, hi);
        return dist(_engine);
    }
    double uniform(double lo = 0.0, double hi = 1.0)
    {
        uniform_real_distribution<double> dist(lo, hi);
        return dist(_engine);
    }
    // Index in [0, n)
    size_t pick(size_t n)
    {
        uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(_engine);
    }
    RandomEngine& engine() { return _engine; }
    Sampler(optional<uint64_t> seed = nullopt) : _seed(pickSeed(seed)), _engine(_seed) {}
};

#endif
