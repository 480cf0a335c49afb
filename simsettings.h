#ifndef _HPN_SIMSETTINGS_H
#define _HPN_SIMSETTINGS_H

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include "conflict.h"
#include "hpnerror.h"

using namespace std;

enum class TimeUnits { Milliseconds, Seconds, Minutes, Hours, Days };

inline string unitsName(TimeUnits u)
{
    switch(u)
    {
        case TimeUnits::Milliseconds: return "milliseconds";
        case TimeUnits::Seconds: return "seconds";
        case TimeUnits::Minutes: return "minutes";
        case TimeUnits::Hours: return "hours";
        case TimeUnits::Days: return "days";
    }
    return "unknown";
}

inline string unitsAbbreviation(TimeUnits u)
{
    switch(u)
    {
        case TimeUnits::Milliseconds: return "ms";
        case TimeUnits::Seconds: return "s";
        case TimeUnits::Minutes: return "min";
        case TimeUnits::Hours: return "hr";
        case TimeUnits::Days: return "d";
    }
    return "?";
}

inline double secondsPer(TimeUnits u)
{
    switch(u)
    {
        case TimeUnits::Milliseconds: return 0.001;
        case TimeUnits::Seconds: return 1.0;
        case TimeUnits::Minutes: return 60.0;
        case TimeUnits::Hours: return 3600.0;
        case TimeUnits::Days: return 86400.0;
    }
    return 1.0;
}

// Accepts full names and abbreviations, case insensitive
inline TimeUnits parseUnits(string name)
{
    for(auto& c:name) c = tolower((unsigned char)c);
    for(auto u:{TimeUnits::Milliseconds, TimeUnits::Seconds, TimeUnits::Minutes, TimeUnits::Hours, TimeUnits::Days})
        if ( unitsName(u) == name or unitsAbbreviation(u) == name ) return u;
    throw HPNConfigError("unknown time unit: " + name);
}

// Simulation time, duration and dt are all in model time units
// (timeUnits()); durationSeconds() is only for display and comparison
// across models.
class SimulationSettings
{
    TimeUnits _timeUnits = TimeUnits::Seconds;
    optional<double> _duration;
    bool _dtAuto = true;
    double _dtManual = 0.1;
    double _timeScale = 1.0;
    ConflictPolicy _policy = ConflictPolicy::Random;
    optional<uint64_t> _seed;

    static double envDouble(const char* var, const char* val)
    {
        try
        {
            size_t used;
            double d = stod(val, &used);
            if ( used != string(val).size() ) throw invalid_argument(val);
            return d;
        }
        catch(const logic_error&)
        {
            throw HPNConfigError(string(var) + ": not a number: " + val);
        }
    }
public:
    static constexpr unsigned STEPS_TARGET = 1000;
    static constexpr unsigned FEW_STEPS = 10;
    static constexpr unsigned MANY_STEPS = 1000000;

    TimeUnits timeUnits() const { return _timeUnits; }
    optional<double> duration() const { return _duration; }
    bool dtAuto() const { return _dtAuto; }
    double dtManual() const { return _dtManual; }
    double timeScale() const { return _timeScale; }
    ConflictPolicy conflictPolicy() const { return _policy; }
    optional<uint64_t> seed() const { return _seed; }

    void setTimeUnits(TimeUnits u) { _timeUnits = u; }
    void setDuration(optional<double> duration)
    {
        if ( duration and ( not ( *duration > 0 ) or not isfinite(*duration) ) )
            throw HPNConfigError("duration must be positive");
        _duration = duration;
    }
    void setDuration(double duration, TimeUnits units)
    {
        setDuration(optional<double>(duration));
        _timeUnits = units;
    }
    void clearDuration() { _duration.reset(); }
    void setDtAuto(bool dtAuto) { _dtAuto = dtAuto; }
    void setDtManual(double dt)
    {
        if ( not ( dt > 0 ) or not isfinite(dt) ) throw HPNConfigError("time step must be positive");
        _dtManual = dt;
    }
    // Stored only; the engine never sleeps
    void setTimeScale(double scale)
    {
        if ( not ( scale > 0 ) or not isfinite(scale) ) throw HPNConfigError("time scale must be positive");
        _timeScale = scale;
    }
    void setConflictPolicy(ConflictPolicy p) { _policy = p; }
    void setSeed(optional<uint64_t> seed) { _seed = seed; }

    optional<double> durationSeconds() const
    {
        if ( not _duration ) return nullopt;
        return *_duration * secondsPer(_timeUnits);
    }
    // duration / 1000 in auto mode when a duration is set, else dtManual
    double effectiveDt() const
    {
        if ( _dtAuto and _duration ) return *_duration / STEPS_TARGET;
        return _dtManual;
    }
    double progress(double time) const
    {
        if ( not _duration ) return 0.0;
        return min(time / *_duration, 1.0);
    }
    bool isComplete(double time) const { return _duration and time + HPN_TIME_EPS >= *_duration; }
    optional<unsigned long> estimateStepCount() const
    {
        if ( not _duration ) return nullopt;
        return (unsigned long)(*_duration / effectiveDt()) + 1;
    }
    optional<string> stepCountWarning() const
    {
        auto n = estimateStepCount();
        if ( not n ) return nullopt;
        if ( *n < FEW_STEPS ) return string("very few steps, results may be inaccurate");
        if ( *n > MANY_STEPS ) return "very large step count (" + to_string(*n) + "), consider a larger time step";
        return nullopt;
    }
    string str() const
    {
        string s = "duration=";
        s += _duration ? HPNPlace::numstr(*_duration) + " " + unitsAbbreviation(_timeUnits) : string("none");
        s += " dt=" + (_dtAuto ? string("auto(") + HPNPlace::numstr(effectiveDt()) + ")" : HPNPlace::numstr(_dtManual));
        s += " scale=" + HPNPlace::numstr(_timeScale);
        s += " policy=" + policyName(_policy);
        if ( _seed ) s += " seed=" + to_string(*_seed);
        return s;
    }

    // Applies HPN_DURATION, HPN_TIME_UNITS, HPN_DT (switches to manual dt),
    // HPN_TIME_SCALE, HPN_CONFLICT_POLICY and HPN_SEED on top of base
    static SimulationSettings fromEnv() { return fromEnv(SimulationSettings()); }
    static SimulationSettings fromEnv(SimulationSettings base)
    {
        char *unitsvar = getenv("HPN_TIME_UNITS");
        if ( unitsvar ) base.setTimeUnits(parseUnits(unitsvar));

        char *durationvar = getenv("HPN_DURATION");
        if ( durationvar ) base.setDuration(envDouble("HPN_DURATION", durationvar));

        char *dtvar = getenv("HPN_DT");
        if ( dtvar )
        {
            base.setDtManual(envDouble("HPN_DT", dtvar));
            base.setDtAuto(false);
        }

        char *scalevar = getenv("HPN_TIME_SCALE");
        if ( scalevar ) base.setTimeScale(envDouble("HPN_TIME_SCALE", scalevar));

        char *policyvar = getenv("HPN_CONFLICT_POLICY");
        if ( policyvar ) base.setConflictPolicy(parsePolicy(policyvar));

        char *seedvar = getenv("HPN_SEED");
        if ( seedvar )
        {
            try
            {
                base.setSeed(stoull(seedvar));
            }
            catch(const logic_error&)
            {
                throw HPNConfigError(string("HPN_SEED: not a number: ") + seedvar);
            }
        }
        return base;
    }
};

#endif
