// Utility classes to dump nets and simulation traces in json format

#ifndef _HPN_JSONPRINTER_H
#define _HPN_JSONPRINTER_H

using namespace std;

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <string>
#include <type_traits>

template<typename T> struct JsonUnsupported : false_type {};

inline void jsonescape(ostream& ostr, const string& s)
{
    ostr << "\"";
    for(auto c:s)
    {
        switch(c)
        {
            case '"': ostr << "\\\""; break;
            case '\\': ostr << "\\\\"; break;
            case '\n': ostr << "\\n"; break;
            case '\t': ostr << "\\t"; break;
            case '\r': ostr << "\\r"; break;
            default: ostr << c;
        }
    }
    ostr << "\"";
}

// Base class for Json objects
class JsonObj
{
public:
    virtual void print(ostream& ostr = cout) const = 0;
    virtual ~JsonObj() {}
};

// Class to represent atomic objects of type T: string, bool, unsigned, int, double
template<typename T> class JsonAtom : public JsonObj
{
    T _val;
public:
    void print(ostream& ostr = cout) const
    {
        if constexpr ( is_same<T,string>::value )
            jsonescape(ostr, _val);
        else if constexpr ( is_same<T,bool>::value )
            ostr << (_val ? "true" : "false");
        else if constexpr ( is_floating_point<T>::value )
        {
            // json has no inf/nan
            if ( not isfinite(_val) ) ostr << "null";
            else
            {
                auto oldprec = ostr.precision(numeric_limits<T>::max_digits10);
                ostr << _val;
                ostr.precision(oldprec);
            }
        }
        else ostr << _val;
    }
    JsonAtom(T val) : _val(val) {}
};

class JsonNull : public JsonObj
{
public:
    void print(ostream& ostr = cout) const { ostr << "null"; }
};

// Class to represent json lists
class JsonList :  public JsonObj, public list<JsonObj*>
{
using list<JsonObj*>::list;
public:
    void print(ostream& ostr = cout) const
    {
        ostr << "[";
        string delim = "";
        for(auto e:*this)
        {
            ostr << delim;
            e->print(ostr);
            delim = ", ";
        }
        ostr << "]";
    }
};

// Class to represent json maps (aka dictionaries)
class JsonMap : public JsonObj, public list<pair<JsonObj*,JsonObj*>>
{
using list<pair<JsonObj*,JsonObj*>>::list;
public:
    void print(ostream& ostr = cout) const
    {
        ostr << "{";
        string delim = "";
        for(auto p:*this)
        {
            ostr << delim;
            p.first->print(ostr);
            ostr << ": ";
            p.second->print(ostr);
            delim = ", ";
        }
        ostr << "}";
    }
};

// JsonFactory provides convenience methods to create lists and maps of JsonObj
// of atomic types. Their memory management is handled by JsonFactory
// Applications can instantiate JsonObj subclasses directly also, in which case
// they have to do the memory management.
class JsonFactory
{
    list<JsonObj*> _objs;
    map<string, JsonAtom<string>*> _string_atommap;
    map<unsigned long, JsonAtom<unsigned long>*> _ulong_atommap;
    JsonNull _null;
    template<typename T> map<T,JsonAtom<T>*>& getAtomMap()
    {
        if constexpr ( is_same<T,string>::value ) return _string_atommap;
        else if constexpr ( is_same<T,unsigned long>::value ) return _ulong_atommap;
        else static_assert(JsonUnsupported<T>::value, "JsonFactory::getAtomMap not available for type");
    }
public:
    // createJsonAtom is conservative on memory for strings and unsigned longs,
    // it retains a map of values. Other atom types are created afresh.
    template<typename T> JsonAtom<T>* createJsonAtom(T val)
    {
        if constexpr ( is_same<T,string>::value or is_same<T,unsigned long>::value )
        {
            map<T,JsonAtom<T>*>& atommap = getAtomMap<T>();
            auto it = atommap.find(val);
            if ( it != atommap.end() ) return it->second;
            auto retatom = new JsonAtom<T>(val);
            _objs.push_back(retatom);
            atommap.emplace(val,retatom);
            return retatom;
        }
        else
        {
            auto retatom = new JsonAtom<T>(val);
            _objs.push_back(retatom);
            return retatom;
        }
    }
    JsonObj* null() { return &_null; }
    JsonMap* createJsonMap()
    {
        auto retmap = new JsonMap();
        _objs.push_back(retmap);
        return retmap;
    }
    template<typename T1, typename T2> JsonMap* createAtomPairMap(const map<T1,T2>& pairs)
    {
        auto retmap = createJsonMap();
        for(auto const& p:pairs)
            retmap->push_back({createJsonAtom<T1>(p.first),createJsonAtom<T2>(p.second)});
        return retmap;
    }
    JsonFactory() {}
    JsonFactory(const JsonFactory&) = delete;
    JsonFactory& operator=(const JsonFactory&) = delete;
    ~JsonFactory() { for(auto o:_objs) delete o; }
};

// Convenient type, json keys are always string atoms
typedef JsonAtom<string> JsonKey;

// Creates a local declaration of JsonKey with variable name <STR>_key and value STR
// (Do watch its scope, else use createJsonAtom!)
#define JSONSTR(STR) JsonKey STR##_key(#STR);

#endif
