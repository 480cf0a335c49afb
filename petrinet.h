#ifndef _HPN_PETRINET_H
#define _HPN_PETRINET_H

// Structural model of a hybrid Petri net: places holding a real valued
// marking, transitions of four kinds (immediate, timed, stochastic,
// continuous) and weighted arcs between them.
//
// HPetriNet is only the collaborator the simulation engine works on. It owns
// the elements, their static topology and the initial marking. All firing
// semantics live in the behaviors (behavior.h) driven by the
// SimulationController (simcontroller.h), which mutate nothing but place
// markings.
//
// Compile with HPNDBG defined to get a trace of every marking change in
// <netname>.hpn.log.

#include <cmath>
#include <fstream>
#include <functional>
#include <iostream>
#include <list>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "dot.h"
#include "hpnerror.h"
#include "jsonprinter.h"
#include "rateexpr.h"

#ifdef HPNDBG
#   define HPNLOG(ARGS) \
    _pn->hpnlogmutex.lock(); \
    _pn->hpnlog << ARGS << endl; \
    _pn->hpnlogmutex.unlock();
#else
#   define HPNLOG(ARGS)
#endif

class HPNArc;
class HPNPlace;
class HPNTransition;
class HPNNode;
class HPetriNet;
class Sampler;
typedef vector<HPNArc*> Arcs;
typedef vector<HPNPlace*> Places;
typedef vector<HPNTransition*> Transitions;

enum class TransitionKind { Immediate, Timed, Stochastic, Continuous };

inline string kindName(TransitionKind k)
{
    switch(k)
    {
        case TransitionKind::Immediate: return "immediate";
        case TransitionKind::Timed: return "timed";
        case TransitionKind::Stochastic: return "stochastic";
        case TransitionKind::Continuous: return "continuous";
    }
    return "unknown";
}

// Kind specific parameters. The alternatives of TransitionParams are in the
// same order as TransitionKind.
struct ImmediateParams {};

struct TimedParams
{
    double earliest = 0.0;
    double latest = HUGE_VAL;
};

// Returns the burst size for one enablement, must be >= 1
typedef function<unsigned(Sampler&)> BurstDistribution;

struct StochasticParams
{
    double rate = 1.0;
    unsigned maxBurst = 8;
    BurstDistribution burst; // uniform on 1..maxBurst when empty
};

struct ContinuousParams
{
    RateFunction rate;
    double minRate = 0.0;
    double maxRate = HUGE_VAL;
    map<string,double> parameters; // extra names visible to the rate expression
};

typedef variant<ImmediateParams, TimedParams, StochasticParams, ContinuousParams> TransitionParams;

// Normal arcs move tokens. Test arcs need marking >= weight, inhibitor arcs
// need marking < weight; neither consumes. Both are input arcs only.
enum class ArcKind { Normal, Test, Inhibitor };

inline string arcKindName(ArcKind k)
{
    switch(k)
    {
        case ArcKind::Normal: return "normal";
        case ArcKind::Test: return "test";
        case ArcKind::Inhibitor: return "inhibitor";
    }
    return "unknown";
}

class HPNElement
{
public:
    typedef enum {PLACE,TRANSITION,ARC} Etyp;
    virtual Etyp typ() const =0;
    virtual ~HPNElement() {}
};

class HPNArc : public HPNElement
{
public:
    HPNPlace* const _place;
    HPNTransition* const _transition;
    const double _wt;
    const ArcKind _kind;
    virtual HPNNode* source() const =0;
    virtual HPNNode* target() const =0;
    // true for place -> transition
    virtual bool isInput() const =0;
    virtual DEdge dedge() const =0;
    bool consumes() const { return _kind == ArcKind::Normal; }
    Etyp typ() const { return ARC; }
    HPNArc(HPNPlace* p, HPNTransition* t, double wt, ArcKind kind) : _place(p), _transition(t), _wt(wt), _kind(kind) {}
};

class HPNNode : public HPNElement
{
protected:
    HPetriNet* _pn;
public:
    const unsigned _nodeid;
    const string _name;
    Arcs _iarcs;
    Arcs _oarcs;
    void addiarc(HPNArc* a) { _iarcs.push_back(a); }
    void addoarc(HPNArc* a) { _oarcs.push_back(a); }
    string idlabel() const { return idstr() + ":" + _name; }
    string idstr() const { return to_string(_nodeid); }
    HPetriNet* net() const { return _pn; }
    HPNNode(string name, unsigned nodeid, HPetriNet* pn) : _pn(pn), _nodeid(nodeid), _name(name) {}
};

class HPNPlace : public HPNNode
{
    double _tokens;
    const double _initial;
    const double _capacity;
public:
    double tokens() const { return _tokens; }
    double initialMarking() const { return _initial; }
    // 0 means the place can hold an unlimited amount
    double capacity() const { return _capacity; }
    bool bounded() const { return _capacity > 0; }
    double headroom() const { return bounded() ? _capacity - _tokens : HUGE_VAL; }
    void setTokens(double tokens)
    {
        if ( tokens < 0 or not isfinite(tokens) )
            throw HPNConfigError("place " + _name + ": invalid marking " + to_string(tokens));
        _tokens = tokens;
    }
    // Callers have checked the amount; residue below 1e-12 left by floating
    // point subtraction is flushed to 0
    void deducttokens(double amount);
    void addtokens(double amount);
    void restore() { _tokens = _initial; }
    Etyp typ() const { return PLACE; }
    DNode dnode() const
    {
        Props props(Proplist{{"shape","circle"}});
        string label = _name + " (" + numstr(_tokens);
        if ( bounded() ) label += "/" + numstr(_capacity);
        props.add("label", label + ")");
        return DNode(idstr(), props);
    }
    static string numstr(double v)
    {
        ostringstream os;
        os << v;
        return os.str();
    }
    HPNPlace(string name, unsigned nodeid, HPetriNet* pn, double marking, double capacity) :
        HPNNode(name, nodeid, pn), _tokens(marking), _initial(marking), _capacity(capacity) {}
};

class HPNTransition : public HPNNode
{
    const TransitionParams _params;
    const int _priority;
    const RateExpr _guard;
public:
    TransitionKind kind() const { return TransitionKind(_params.index()); }
    bool isDiscrete() const { return kind() != TransitionKind::Continuous; }
    const TransitionParams& params() const { return _params; }
    int priority() const { return _priority; }
    bool hasGuard() const { return not _guard.empty(); }
    const RateExpr& guard() const { return _guard; }
    Etyp typ() const { return TRANSITION; }
    DNode dnode() const
    {
        Props props(Proplist{{"shape","rectangle"},{"label",kindName(kind()).substr(0,1) + ":" + _name}});
        if ( kind() == TransitionKind::Continuous ) props.add("peripheries","2");
        else if ( kind() == TransitionKind::Immediate ) props.add("style","filled");
        return DNode(idstr(), props);
    }
    HPNTransition(string name, unsigned nodeid, HPetriNet* pn, TransitionParams params, int priority, string guard) :
        HPNNode(name, nodeid, pn), _params(params), _priority(priority), _guard(guard.empty() ? RateExpr() : RateExpr(guard)) {}
};

class HPNPTArc : public HPNArc
{
public:
    HPNNode* source() const { return _place; }
    HPNNode* target() const { return _transition; }
    bool isInput() const { return true; }
    DEdge dedge() const
    {
        Props props;
        if ( _wt != 1 ) props.add("label", HPNPlace::numstr(_wt));
        if ( _kind == ArcKind::Test ) props.add("arrowhead", "dot");
        else if ( _kind == ArcKind::Inhibitor ) props.add("arrowhead", "odot");
        return DEdge(_place->idstr(), _transition->idstr(), props);
    }
    HPNPTArc(HPNPlace* p, HPNTransition* t, double wt=1, ArcKind kind=ArcKind::Normal) : HPNArc(p,t,wt,kind)
    {
        _place->addoarc(this);
        _transition->addiarc(this);
    }
};

class HPNTPArc : public HPNArc
{
public:
    HPNNode* source() const { return _transition; }
    HPNNode* target() const { return _place; }
    bool isInput() const { return false; }
    DEdge dedge() const
    {
        Props props;
        if ( _wt != 1 ) props.add("label", HPNPlace::numstr(_wt));
        return DEdge(_transition->idstr(), _place->idstr(), props);
    }
    HPNTPArc(HPNTransition* t, HPNPlace* p, double wt=1) : HPNArc(p,t,wt,ArcKind::Normal)
    {
        _transition->addoarc(this);
        _place->addiarc(this);
    }
};

class HPetriNet
{
    map<string,HPNNode*> _byname;
    map<unsigned,HPNPlace*> _placebyid;
    Places _places;
    Transitions _transitions;
    Arcs _arcs;
    unsigned _idcntr = 0;

    void checkName(const string& name)
    {
        if ( name.empty() ) throw HPNConfigError("net " + _netname + ": empty element name");
        if ( _byname.find(name) != _byname.end() )
            throw HPNConfigError("net " + _netname + ": duplicate element name " + name);
    }
    void checkOwned(HPNNode* n)
    {
        if ( n == nullptr or n->net() != this )
            throw HPNConfigError("net " + _netname + ": node not found" + (n ? ": " + n->_name : ""));
    }
    string intermediateName(const string& name) { return name.empty() ? "_i" + to_string(_idcntr) : name; }
public:
    const string _netname;
#ifdef HPNDBG
    ofstream hpnlog;
    mutex hpnlogmutex;
#endif
    const string& name() const { return _netname; }
    const Places& places() const { return _places; }
    const Transitions& transitions() const { return _transitions; }
    const Arcs& arcs() const { return _arcs; }

    HPNPlace* createPlace(string name, double marking=0, double capacity=0)
    {
        checkName(name);
        if ( marking < 0 or not isfinite(marking) )
            throw HPNConfigError("place " + name + ": negative initial marking");
        if ( capacity < 0 )
            throw HPNConfigError("place " + name + ": negative capacity");
        if ( capacity > 0 and marking > capacity )
            throw HPNConfigError("place " + name + ": initial marking exceeds capacity");
        auto p = new HPNPlace(name, _idcntr++, this, marking, capacity);
        _places.push_back(p);
        _byname.emplace(name, p);
        _placebyid.emplace(p->_nodeid, p);
        return p;
    }
    // Throws HPNConfigError if the guard does not parse
    HPNTransition* createTransition(string name, TransitionParams params = ImmediateParams{}, int priority=0, string guard="")
    {
        checkName(name);
        auto t = new HPNTransition(name, _idcntr++, this, params, priority, guard);
        _transitions.push_back(t);
        _byname.emplace(name, t);
        return t;
    }
    // returns intermediate node if it was inserted between PP/TT else nullptr
    // For the intermediate node (if any i.e. for PP/TT arguments) optional
    // argument 'name' can be passed. 'wt' and 'kind' apply only when a single
    // PT/TP arc is created; test and inhibitor arcs must run place ->
    // transition.
    HPNNode* createArc(HPNNode *n1, HPNNode *n2, double wt=1, ArcKind kind=ArcKind::Normal, string name="")
    {
        checkOwned(n1);
        checkOwned(n2);
        if ( wt < 0 or not isfinite(wt) )
            throw HPNConfigError("arc " + n1->_name + "->" + n2->_name + ": invalid weight");
        if ( kind != ArcKind::Normal and
            ( n1->typ() != HPNElement::PLACE or n2->typ() != HPNElement::TRANSITION ) )
            throw HPNConfigError("arc " + n1->_name + "->" + n2->_name + ": " + arcKindName(kind) + " arc must run place -> transition");
        if ( n1->typ() == HPNElement::TRANSITION )
        {
            if ( n2->typ() == HPNElement::TRANSITION )
            {
                auto *dummy = createPlace(intermediateName(name));
                _arcs.push_back(new HPNTPArc((HPNTransition*)n1,dummy));
                _arcs.push_back(new HPNPTArc(dummy,(HPNTransition*)n2));
                return dummy;
            }
            else
            {
                _arcs.push_back(new HPNTPArc((HPNTransition*)n1,(HPNPlace*)n2,wt));
                return nullptr;
            }
        }
        else
        {
            if ( n2->typ() == HPNElement::TRANSITION )
            {
                _arcs.push_back(new HPNPTArc((HPNPlace*)n1,(HPNTransition*)n2,wt,kind));
                return nullptr;
            }
            else
            {
                auto *dummy = createTransition(intermediateName(name));
                _arcs.push_back(new HPNPTArc((HPNPlace*)n1,dummy));
                _arcs.push_back(new HPNTPArc(dummy,(HPNPlace*)n2));
                return dummy;
            }
        }
    }
    HPNNode* createArc(string n1, string n2, double wt=1, ArcKind kind=ArcKind::Normal, string name="")
    {
        return createArc(node(n1), node(n2), wt, kind, name);
    }
    HPNNode* node(const string& name) const
    {
        auto it = _byname.find(name);
        if ( it == _byname.end() ) throw HPNConfigError("net " + _netname + ": no element named " + name);
        return it->second;
    }
    HPNPlace* place(const string& name) const
    {
        auto n = node(name);
        if ( n->typ() != HPNElement::PLACE ) throw HPNConfigError("net " + _netname + ": " + name + " is not a place");
        return (HPNPlace*)n;
    }
    HPNTransition* transition(const string& name) const
    {
        auto n = node(name);
        if ( n->typ() != HPNElement::TRANSITION ) throw HPNConfigError("net " + _netname + ": " + name + " is not a transition");
        return (HPNTransition*)n;
    }
    // nullptr when absent, used by expression scopes which must not throw HPNConfigError
    HPNPlace* findPlace(const string& name) const
    {
        auto it = _byname.find(name);
        return it != _byname.end() and it->second->typ() == HPNElement::PLACE ? (HPNPlace*)it->second : nullptr;
    }
    HPNPlace* findPlace(unsigned nodeid) const
    {
        auto it = _placebyid.find(nodeid);
        return it == _placebyid.end() ? nullptr : it->second;
    }

    void restoreInitialMarking()
    {
        for(auto p:_places) p->restore();
    }
    map<string,double> markings() const
    {
        map<string,double> m;
        for(auto p:_places) m.emplace(p->_name, p->tokens());
        return m;
    }

    void printpnml(ostream& os) const
    {
        os << "<?xml version=\"1.0\"?>" << endl;
        os << "<pnml xmlns=\"http://www.pnml.org/version-2009/grammar/pnml\">" << endl;
        os << "<net id=\"" << _netname << "\" type=\"http://www.pnml.org/version-2009/grammar/ptnet\">" << endl;
        for(auto p:_places)
        {
            os << "<place id=\"" << p->idstr() << "\">";
            os << "<name><text>" << p->_name << "</text></name>";
            if( p->initialMarking() )
                os << "<initialMarking><text>" << p->initialMarking() << "</text></initialMarking>";
            if( p->bounded() )
                os << "<capacity><text>" << p->capacity() << "</text></capacity>";
            os << "</place>" << endl;
        }
        for(auto t:_transitions)
        {
            os << "<transition id=\"" << t->idstr() << "\">";
            os << "<name><text>" << t->_name << "</text></name>";
            os << "<toolspecific tool=\"hpnsimu\" version=\"1\"><kind>" << kindName(t->kind())
                << "</kind><priority>" << t->priority() << "</priority></toolspecific>";
            os << "</transition>" << endl;
        }
        unsigned tmparcid=0;
        for(auto e:_arcs)
        {
            os << "<arc id=\"a" << tmparcid++ << "\" source=\"" << e->source()->idstr() << "\" target=\"" << e->target()->idstr() << "\">";
            if ( e->_wt != 1 ) os << "<inscription><text>" << e->_wt << "</text></inscription>";
            if ( e->_kind != ArcKind::Normal ) os << "<type value=\"" << arcKindName(e->_kind) << "\"/>";
            os << "</arc>" << endl;
        }
        os << "</net>" << endl;
        os << "</pnml>" << endl;
    }
    void printpnml(string filename="hpn.pnml") const
    {
        ofstream ofs(filename);
        printpnml(ofs);
    }

    void printjson(ostream& os) const
    {
        JSONSTR(name)
        JSONSTR(places)
        JSONSTR(transitions)
        JSONSTR(arcs)
        JSONSTR(label)
        JSONSTR(marking)
        JSONSTR(initial)
        JSONSTR(capacity)
        JSONSTR(kind)
        JSONSTR(priority)
        JSONSTR(guard)
        JSONSTR(source)
        JSONSTR(target)
        JSONSTR(weight)
        JSONSTR(type)

        JsonFactory jf;

        JsonMap placemap, transitionmap;
        JsonList arclist;
        JsonAtom<string> netname(_netname);
        JsonMap top { {&name_key, &netname}, {&places_key, &placemap},
            {&transitions_key, &transitionmap}, {&arcs_key, &arclist} };

        for(auto p:_places)
        {
            auto thisplacemap = jf.createJsonMap();
            placemap.push_back({jf.createJsonAtom<string>(p->idstr()),thisplacemap});
            thisplacemap->push_back({&label_key,jf.createJsonAtom<string>(p->_name)});
            thisplacemap->push_back({&marking_key,jf.createJsonAtom<double>(p->tokens())});
            thisplacemap->push_back({&initial_key,jf.createJsonAtom<double>(p->initialMarking())});
            thisplacemap->push_back({&capacity_key,jf.createJsonAtom<double>(p->capacity())});
        }

        for(auto t:_transitions)
        {
            auto thistransitionmap = jf.createJsonMap();
            transitionmap.push_back({jf.createJsonAtom<string>(t->idstr()),thistransitionmap});
            thistransitionmap->push_back({&label_key,jf.createJsonAtom<string>(t->_name)});
            thistransitionmap->push_back({&kind_key,jf.createJsonAtom<string>(kindName(t->kind()))});
            thistransitionmap->push_back({&priority_key,jf.createJsonAtom<int>(t->priority())});
            thistransitionmap->push_back({&guard_key,
                t->hasGuard() ? (JsonObj*) jf.createJsonAtom<string>(t->guard().str()) : jf.null()});
            visit([&](auto const& params) { jsonParams(jf, thistransitionmap, params); }, t->params());
        }

        for(auto e:_arcs)
        {
            auto thisarcmap = jf.createJsonMap();
            arclist.push_back(thisarcmap);
            thisarcmap->push_back({&source_key,jf.createJsonAtom<string>(e->source()->idstr())});
            thisarcmap->push_back({&target_key,jf.createJsonAtom<string>(e->target()->idstr())});
            thisarcmap->push_back({&weight_key,jf.createJsonAtom<double>(e->_wt)});
            thisarcmap->push_back({&type_key,jf.createJsonAtom<string>(arcKindName(e->_kind))});
        }

        top.print(os);
        os << endl;
    }
    void printjson(string filename="hpn.json") const
    {
        ofstream ofs(filename);
        printjson(ofs);
    }
    void printdot(ostream& os) const
    {
        DNodeList nl;
        for(auto n:_places) nl.push_back(n->dnode());
        for(auto n:_transitions) nl.push_back(n->dnode());
        DEdgeList el;
        for(auto e:_arcs) el.push_back(e->dedge());
        DGraph g(_netname,nl,el,Props(Proplist{{"rankdir","LR"}}));
        g.printdot(os);
    }
    void printdot(string filename="hpn.dot") const
    {
        ofstream ofs(filename);
        printdot(ofs);
    }
    void printMarkings(ostream& os = cout) const
    {
        for(auto p:_places) if ( p->tokens() )
            os << "MARKING:" << p->idlabel() << ":" << p->tokens() << endl;
    }

    HPetriNet(string netname = "system") : _netname(netname)
    {
#ifdef HPNDBG
        hpnlog.open(netname + ".hpn.log");
#endif
    }
    HPetriNet(const HPetriNet&) = delete;
    HPetriNet& operator=(const HPetriNet&) = delete;
    ~HPetriNet()
    {
        for(auto e:_arcs) delete e;
        for(auto n:_places) delete n;
        for(auto n:_transitions) delete n;
    }
private:
    static void jsonParams(JsonFactory&, JsonMap*, const ImmediateParams&) {}
    static void jsonParams(JsonFactory& jf, JsonMap* m, const TimedParams& p)
    {
        m->push_back({jf.createJsonAtom<string>("earliest"),jf.createJsonAtom<double>(p.earliest)});
        m->push_back({jf.createJsonAtom<string>("latest"),jf.createJsonAtom<double>(p.latest)});
    }
    static void jsonParams(JsonFactory& jf, JsonMap* m, const StochasticParams& p)
    {
        m->push_back({jf.createJsonAtom<string>("rate"),jf.createJsonAtom<double>(p.rate)});
        m->push_back({jf.createJsonAtom<string>("max_burst"),jf.createJsonAtom<unsigned long>(p.maxBurst)});
    }
    static void jsonParams(JsonFactory& jf, JsonMap* m, const ContinuousParams& p)
    {
        m->push_back({jf.createJsonAtom<string>("rate"),jf.createJsonAtom<string>(p.rate.str())});
        m->push_back({jf.createJsonAtom<string>("min_rate"),jf.createJsonAtom<double>(p.minRate)});
        m->push_back({jf.createJsonAtom<string>("max_rate"),jf.createJsonAtom<double>(p.maxRate)});
        m->push_back({jf.createJsonAtom<string>("parameters"),jf.createAtomPairMap<string,double>(p.parameters)});
    }
};

inline void HPNPlace::deducttokens(double amount)
{
    _tokens -= amount;
    if ( _tokens < 1e-12 ) _tokens = 0;
    HPNLOG("p:" << idstr() << ":-" << amount << ":" << _tokens << ":" << _name)
}

inline void HPNPlace::addtokens(double amount)
{
    _tokens += amount;
    HPNLOG("p:" << idstr() << ":+" << amount << ":" << _tokens << ":" << _name)
}

#endif
