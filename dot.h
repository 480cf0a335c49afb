#ifndef _HPN_DOT_H
#define _HPN_DOT_H

#include<list>
#include<fstream>
#include<iostream>
#include<tuple>
#include<string>

using namespace std;

typedef list<tuple<string,string>> Proplist;

// Quotes a dot attribute value / node id, escaping embedded quotes
inline string dotquote(const string& s)
{
    string q = "\"";
    for(auto c:s)
    {
        if ( c == '"' or c == '\\' ) q += '\\';
        q += c;
    }
    return q + "\"";
}

class Props
{
    Proplist _props;
public:
    bool empty() const { return _props.empty(); }
    void add(string key, string val) { _props.push_back({key,val}); }
    string str() const
    {
        if ( _props.empty() ) return "";
        string label = "[";
        string delim = "";
        for(auto const& pv:_props)
        {
            label += delim + get<0>(pv) + "=" + dotquote(get<1>(pv));
            delim = ",";
        }
        return label + "]";
    }
    Props(Proplist pl={}) : _props(pl) {}
};

class DNode
{
    string _id;
    Props _props;
public:
    string str() const { return dotquote(_id) + " " + _props.str(); }
    DNode(string id, Props props=Props()) : _id(id), _props(props) {}
};

class DEdge
{
    string _id1, _id2;
    Props _props;
public:
    string str() const { return dotquote(_id1) + " -> " + dotquote(_id2) + " " + _props.str(); }
    DEdge(string id1, string id2, Props props=Props()) : _id1(id1), _id2(id2), _props(props) {}
};

typedef list<DNode> DNodeList;
typedef list<DEdge> DEdgeList;

class DGraph
{
    string _name;
    Props _gprops;
    DNodeList _nodes;
    DEdgeList _edges;
public:
    void printdot(ostream& os) const
    {
        os << "digraph " << dotquote(_name) << " {" << endl;
        if ( not _gprops.empty() ) os << "graph " << _gprops.str() << endl;
        for(auto const& n:_nodes) os << n.str() << endl;
        for(auto const& e:_edges) os << e.str() << endl;
        os << "}" << endl;
    }
    void printdot(string flnm = "graph.dot") const
    {
        ofstream ofs(flnm);
        printdot(ofs);
    }
    DGraph(string name, DNodeList& nodes, DEdgeList& edges, Props props=Props()) :
        _name(name), _gprops(props), _nodes(nodes), _edges(edges) {}
};

#endif
