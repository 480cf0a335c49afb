#ifndef _HPN_TRACERECORDER_H
#define _HPN_TRACERECORDER_H

#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "jsonprinter.h"
#include "petrinet.h"
#include "simevents.h"

using namespace std;

struct MarkingSample
{
    unsigned long step;
    double time;
    map<string,double> marking;
};

// Observer keeping every firing record and, when given the net, the marking
// after every step. Cleared on reset.
class TraceRecorder : public SimulationObserver
{
    const HPetriNet* _net;
    vector<FiringRecord> _records;
    vector<MarkingSample> _samples;
    unsigned long _steps = 0;
    unsigned long _errors = 0;

    static string mapstr(const map<string,double>& m)
    {
        string s, delim;
        for(auto const& p:m)
        {
            s += delim + p.first + "=" + HPNPlace::numstr(p.second);
            delim = ";";
        }
        return s;
    }
public:
    void onFiring(const FiringRecord& r) { _records.push_back(r); }
    void onStep(const StepEvent& ev)
    {
        _steps++;
        _errors += ev.errors.size();
        if ( _net ) _samples.push_back({ev.step, ev.time, _net->markings()});
    }
    void onReset() { clear(); }
    void clear()
    {
        _records.clear();
        _samples.clear();
        _steps = 0;
        _errors = 0;
    }

    const vector<FiringRecord>& records() const { return _records; }
    const vector<MarkingSample>& samples() const { return _samples; }
    unsigned long steps() const { return _steps; }
    unsigned long errors() const { return _errors; }
    // Number of records of the named transition
    size_t count(const string& transition) const
    {
        size_t n = 0;
        for(auto const& r:_records) if ( r.transition == transition ) n++;
        return n;
    }

    void printjson(ostream& os) const
    {
        JSONSTR(records)
        JSONSTR(markings)
        JSONSTR(step)
        JSONSTR(time)
        JSONSTR(transition)
        JSONSTR(kind)
        JSONSTR(consumed)
        JSONSTR(produced)
        JSONSTR(burst)
        JSONSTR(rate)
        JSONSTR(actual_rate)
        JSONSTR(dt)
        JSONSTR(method)
        JSONSTR(clamped)
        JSONSTR(marking)

        JsonFactory jf;
        JsonList recordlist, markinglist;
        JsonMap top { {&records_key, &recordlist}, {&markings_key, &markinglist} };

        for(auto const& r:_records)
        {
            auto m = jf.createJsonMap();
            recordlist.push_back(m);
            m->push_back({&step_key, jf.createJsonAtom<unsigned long>(r.step)});
            m->push_back({&time_key, jf.createJsonAtom<double>(r.time)});
            m->push_back({&transition_key, jf.createJsonAtom<string>(r.transition)});
            m->push_back({&kind_key, jf.createJsonAtom<string>(kindName(r.kind))});
            m->push_back({&consumed_key, jf.createAtomPairMap<string,double>(r.consumed)});
            m->push_back({&produced_key, jf.createAtomPairMap<string,double>(r.produced)});
            if ( r.kind == TransitionKind::Continuous )
            {
                m->push_back({&rate_key, jf.createJsonAtom<double>(r.rate)});
                m->push_back({&actual_rate_key, jf.createJsonAtom<double>(r.actualRate)});
                m->push_back({&dt_key, jf.createJsonAtom<double>(r.dt)});
                m->push_back({&method_key, jf.createJsonAtom<string>(r.method)});
                m->push_back({&clamped_key, jf.createJsonAtom<bool>(r.clamped)});
            }
            else m->push_back({&burst_key, jf.createJsonAtom<unsigned long>(r.burst)});
        }
        for(auto const& s:_samples)
        {
            auto m = jf.createJsonMap();
            markinglist.push_back(m);
            m->push_back({&step_key, jf.createJsonAtom<unsigned long>(s.step)});
            m->push_back({&time_key, jf.createJsonAtom<double>(s.time)});
            m->push_back({&marking_key, jf.createAtomPairMap<string,double>(s.marking)});
        }
        top.print(os);
        os << endl;
    }
    void printjson(string filename) const
    {
        ofstream ofs(filename);
        printjson(ofs);
    }
    // consumed / produced columns are place=amount lists separated by ';'
    void printcsv(ostream& os) const
    {
        os << "step,time,transition,kind,burst,rate,actual_rate,dt,clamped,consumed,produced" << endl;
        for(auto const& r:_records)
        {
            bool cont = r.kind == TransitionKind::Continuous;
            os << r.step << "," << r.time << "," << r.transition << "," << kindName(r.kind) << ",";
            if ( not cont ) os << r.burst;
            os << ",";
            if ( cont ) os << r.rate << "," << r.actualRate << "," << r.dt << "," << (r.clamped ? 1 : 0);
            else os << ",,,";
            os << "," << mapstr(r.consumed) << "," << mapstr(r.produced) << endl;
        }
    }
    void printcsv(string filename) const
    {
        ofstream ofs(filename);
        printcsv(ofs);
    }

    TraceRecorder(const HPetriNet* net = nullptr) : _net(net) {}
};

#endif
