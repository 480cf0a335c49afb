#ifndef _HPN_RATEEXPR_H
#define _HPN_RATEEXPR_H

// Arithmetic expressions over place markings, used for continuous rate
// functions and transition guards.
//
// Grammar (lowest to highest precedence):
//
//   expr    := sum [ ( '<' | '<=' | '>' | '>=' | '==' | '!=' ) sum ]
//   sum     := product { ( '+' | '-' ) product }
//   product := unary { ( '*' | '/' | '%' ) unary }
//   unary   := ( '-' | '+' ) unary | power
//   power   := primary [ ( '^' | '**' ) unary ]
//   primary := number | name | name '(' [ expr { ',' expr } ] ')' | '(' expr ')'
//
// Comparisons yield 1 or 0. A bare name is resolved at evaluation time through
// a RateScope: t / time is the simulation time, pi and e are constants, any
// other name is looked up by the scope (place names, P<id>, parameters).
// Syntax errors and calls to unknown functions (or with the wrong number of
// arguments) are HPNConfigError at parse time. Everything that can only be
// detected with values at hand is a RateError at evaluation time.

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "hpnerror.h"

using namespace std;

class RateScope
{
public:
    // Throws RateError for names it does not know
    virtual double value(const string& name) const = 0;
    virtual double time() const = 0;
    virtual ~RateScope() {}
};

typedef function<double(const vector<double>&)> CatalogFn;

struct CatalogEntry
{
    size_t minargs;
    size_t maxargs;
    CatalogFn fn;
};

// Argument i, or the default when the caller left it out
inline double argor(const vector<double>& a, size_t i, double dflt) { return i < a.size() ? a[i] : dflt; }

inline double checkeddiv(double num, double den)
{
    if ( den == 0.0 ) throw RateError("division-by-zero");
    return num / den;
}

inline double checkedmod(double x, double period)
{
    if ( period == 0.0 ) throw RateError("division-by-zero");
    double r = fmod(x, period);
    return r < 0 ? r + fabs(period) : r;
}

inline double sigmoidfn(double x, double center, double steepness, double amplitude)
{
    return amplitude / (1.0 + exp(-steepness * (x - center)));
}

// Math and kinetics functions available to rate and guard expressions
inline const map<string, CatalogEntry>& functionCatalog()
{
    static const map<string, CatalogEntry> catalog = {
        {"min", {1, 64, [](const vector<double>& a) {
            double m = a[0];
            for(auto v:a) m = v < m ? v : m;
            return m; }}},
        {"max", {1, 64, [](const vector<double>& a) {
            double m = a[0];
            for(auto v:a) m = v > m ? v : m;
            return m; }}},
        {"abs", {1, 1, [](const vector<double>& a) { return fabs(a[0]); }}},
        {"sqrt", {1, 1, [](const vector<double>& a) {
            if ( a[0] < 0 ) throw RateError("domain-error-sqrt");
            return sqrt(a[0]); }}},
        {"exp", {1, 1, [](const vector<double>& a) { return exp(a[0]); }}},
        {"log", {1, 1, [](const vector<double>& a) {
            if ( a[0] <= 0 ) throw RateError("domain-error-log");
            return log(a[0]); }}},
        {"pow", {2, 2, [](const vector<double>& a) { return pow(a[0], a[1]); }}},
        {"floor", {1, 1, [](const vector<double>& a) { return floor(a[0]); }}},
        {"ceil", {1, 1, [](const vector<double>& a) { return ceil(a[0]); }}},

        {"sigmoid", {1, 4, [](const vector<double>& a) {
            return sigmoidfn(a[0], argor(a,1,0.0), argor(a,2,1.0), argor(a,3,1.0)); }}},
        {"tanh", {1, 4, [](const vector<double>& a) {
            return argor(a,3,1.0) * tanh(argor(a,2,1.0) * (a[0] - argor(a,1,0.0))); }}},
        {"relu", {1, 2, [](const vector<double>& a) {
            double v = a[0] - argor(a,1,0.0);
            return v > 0 ? v : 0.0; }}},
        {"leaky_relu", {1, 3, [](const vector<double>& a) {
            double v = a[0] - argor(a,1,0.0);
            return v > 0 ? v : argor(a,2,0.01) * v; }}},
        {"softplus", {1, 2, [](const vector<double>& a) {
            double beta = argor(a,1,1.0);
            return checkeddiv(1.0, beta) * log(1.0 + exp(beta * a[0])); }}},
        {"exponential_decay", {2, 2, [](const vector<double>& a) {
            return a[0] * exp(checkeddiv(-log(2.0), a[1])); }}},
        {"logistic_growth", {3, 3, [](const vector<double>& a) {
            return a[2] * a[0] * (1.0 - checkeddiv(a[0], a[1])); }}},
        {"gompertz_growth", {3, 3, [](const vector<double>& a) {
            if ( a[0] <= 0 or a[0] >= a[1] ) return 0.0;
            return a[2] * a[0] * log(a[1] / a[0]); }}},
        {"michaelis_menten", {3, 3, [](const vector<double>& a) {
            return checkeddiv(a[1] * a[0], a[2] + a[0]); }}},
        {"hill_equation", {3, 4, [](const vector<double>& a) {
            double n = argor(a,3,1.0);
            double sn = pow(a[0], n);
            return checkeddiv(a[1] * sn, pow(a[2], n) + sn); }}},
        {"competitive_inhibition", {5, 5, [](const vector<double>& a) {
            double kmapp = a[3] * (1.0 + checkeddiv(a[1], a[4]));
            return checkeddiv(a[2] * a[0], kmapp + a[0]); }}},
        {"mass_action", {1, 3, [](const vector<double>& a) {
            return argor(a,2,1.0) * a[0] * argor(a,1,1.0); }}},
        {"normal_pdf", {1, 3, [](const vector<double>& a) {
            double sd = argor(a,2,1.0);
            double z = checkeddiv(a[0] - argor(a,1,0.0), sd);
            return exp(-0.5 * z * z) / (sd * sqrt(2.0 * M_PI)); }}},
        {"exponential_pdf", {1, 2, [](const vector<double>& a) {
            double rate = argor(a,1,1.0);
            return a[0] < 0 ? 0.0 : rate * exp(-rate * a[0]); }}},
        {"step", {2, 4, [](const vector<double>& a) {
            return a[0] >= a[1] ? argor(a,3,1.0) : argor(a,2,0.0); }}},
        {"ramp", {3, 5, [](const vector<double>& a) {
            double lo = argor(a,3,0.0), hi = argor(a,4,1.0);
            if ( a[0] < a[1] ) return lo;
            if ( a[0] > a[2] ) return hi;
            return lo + checkeddiv(a[0] - a[1], a[2] - a[1]) * (hi - lo); }}},
        {"pulse", {3, 4, [](const vector<double>& a) {
            return ( a[1] <= a[0] and a[0] <= a[2] ) ? argor(a,3,1.0) : 0.0; }}},
        {"periodic_pulse", {2, 4, [](const vector<double>& a) {
            double phase = checkedmod(a[0], a[1]) / a[1];
            return phase < argor(a,2,0.5) ? argor(a,3,1.0) : 0.0; }}},
        {"triangle_wave", {2, 3, [](const vector<double>& a) {
            double phase = checkedmod(a[0], a[1]) / a[1];
            double amp = argor(a,2,1.0);
            return phase < 0.5 ? 4.0 * amp * phase : 4.0 * amp * (1.0 - phase); }}},
        {"sawtooth_wave", {2, 3, [](const vector<double>& a) {
            return argor(a,2,1.0) * checkedmod(a[0], a[1]) / a[1]; }}},
        {"bell_curve", {3, 4, [](const vector<double>& a) {
            double z = checkeddiv(a[0] - a[1], a[2]);
            return argor(a,3,1.0) * exp(-0.5 * z * z); }}},
        {"bounded_linear", {2, 5, [](const vector<double>& a) {
            double v = a[1] * a[0] + argor(a,2,0.0);
            double lo = argor(a,3,0.0), hi = argor(a,4,HUGE_VAL);
            return v < lo ? lo : (v > hi ? hi : v); }}},
        {"smooth_threshold", {3, 3, [](const vector<double>& a) {
            return sigmoidfn(a[0], a[1], checkeddiv(5.0, a[2]), 1.0); }}},
    };
    return catalog;
}

class RateNode
{
public:
    virtual double eval(const RateScope& scope) const = 0;
    virtual ~RateNode() {}
};

typedef shared_ptr<const RateNode> RateNodePtr;

class RateNumber : public RateNode
{
public:
    const double _val;
    double eval(const RateScope&) const { return _val; }
    RateNumber(double val) : _val(val) {}
};

class RateName : public RateNode
{
    string _name;
public:
    double eval(const RateScope& scope) const
    {
        if ( _name == "t" or _name == "time" ) return scope.time();
        if ( _name == "pi" ) return M_PI;
        if ( _name == "e" ) return M_E;
        return scope.value(_name);
    }
    RateName(string name) : _name(name) {}
};

class RateUnary : public RateNode
{
    char _op;
    RateNodePtr _arg;
public:
    double eval(const RateScope& scope) const
    {
        double v = _arg->eval(scope);
        return _op == '-' ? -v : v;
    }
    RateUnary(char op, RateNodePtr arg) : _op(op), _arg(arg) {}
};

class RateBinary : public RateNode
{
    string _op;
    RateNodePtr _lhs, _rhs;
public:
    double eval(const RateScope& scope) const
    {
        double l = _lhs->eval(scope);
        double r = _rhs->eval(scope);
        if ( _op == "+" ) return l + r;
        if ( _op == "-" ) return l - r;
        if ( _op == "*" ) return l * r;
        if ( _op == "/" ) return checkeddiv(l, r);
        if ( _op == "%" ) return checkedmod(l, r);
        if ( _op == "^" ) return pow(l, r);
        if ( _op == "<" ) return l < r;
        if ( _op == "<=" ) return l <= r;
        if ( _op == ">" ) return l > r;
        if ( _op == ">=" ) return l >= r;
        if ( _op == "==" ) return l == r;
        return l != r;
    }
    RateBinary(string op, RateNodePtr lhs, RateNodePtr rhs) : _op(op), _lhs(lhs), _rhs(rhs) {}
};

class RateCall : public RateNode
{
    string _name;
    const CatalogEntry* _entry;
    vector<RateNodePtr> _args;
public:
    double eval(const RateScope& scope) const
    {
        vector<double> vals;
        for(auto const& a:_args) vals.push_back(a->eval(scope));
        return _entry->fn(vals);
    }
    RateCall(string name, const CatalogEntry* entry, vector<RateNodePtr> args) :
        _name(name), _entry(entry), _args(args) {}
};

// Recursive descent parser producing a RateNode tree
class RateParser
{
    const string _src;
    size_t _pos = 0;

    [[noreturn]] void fail(const string& msg)
    {
        throw HPNConfigError("rate expression '" + _src + "': " + msg + " at offset " + to_string(_pos));
    }
    void skipws() { while ( _pos < _src.size() and isspace((unsigned char)_src[_pos]) ) _pos++; }
    bool accept(const string& tok)
    {
        skipws();
        if ( _src.compare(_pos, tok.size(), tok) == 0 )
        {
            _pos += tok.size();
            return true;
        }
        return false;
    }
    void expect(const string& tok) { if ( not accept(tok) ) fail("expected '" + tok + "'"); }
    bool peek(const string& tok)
    {
        skipws();
        return _src.compare(_pos, tok.size(), tok) == 0;
    }

    RateNodePtr expr()
    {
        auto lhs = sum();
        // two char operators first
        for(string op : {"<=", ">=", "==", "!=", "<", ">"})
            if ( accept(op) ) return make_shared<RateBinary>(op, lhs, sum());
        return lhs;
    }
    RateNodePtr sum()
    {
        auto lhs = product();
        while ( true )
        {
            if ( accept("+") ) lhs = make_shared<RateBinary>("+", lhs, product());
            else if ( accept("-") ) lhs = make_shared<RateBinary>("-", lhs, product());
            else return lhs;
        }
    }
    RateNodePtr product()
    {
        auto lhs = unary();
        while ( true )
        {
            if ( peek("**") ) return lhs;
            if ( accept("*") ) lhs = make_shared<RateBinary>("*", lhs, unary());
            else if ( accept("/") ) lhs = make_shared<RateBinary>("/", lhs, unary());
            else if ( accept("%") ) lhs = make_shared<RateBinary>("%", lhs, unary());
            else return lhs;
        }
    }
    RateNodePtr unary()
    {
        if ( accept("-") ) return make_shared<RateUnary>('-', unary());
        if ( accept("+") ) return unary();
        return power();
    }
    RateNodePtr power()
    {
        auto base = primary();
        if ( accept("**") or accept("^") ) return make_shared<RateBinary>("^", base, unary());
        return base;
    }
    RateNodePtr primary()
    {
        skipws();
        if ( _pos >= _src.size() ) fail("unexpected end of expression");
        char c = _src[_pos];
        if ( accept("(") )
        {
            auto e = expr();
            expect(")");
            return e;
        }
        if ( isdigit((unsigned char)c) or c == '.' ) return number();
        if ( isalpha((unsigned char)c) or c == '_' )
        {
            size_t start = _pos;
            while ( _pos < _src.size() and ( isalnum((unsigned char)_src[_pos]) or _src[_pos] == '_' ) ) _pos++;
            string name = _src.substr(start, _pos - start);
            if ( accept("(") ) return call(name);
            return make_shared<RateName>(name);
        }
        fail(string("unexpected character '") + c + "'");
    }
    RateNodePtr number()
    {
        const char* begin = _src.c_str() + _pos;
        char* end = nullptr;
        double val = strtod(begin, &end);
        if ( end == begin ) fail("malformed number");
        _pos += end - begin;
        return make_shared<RateNumber>(val);
    }
    RateNodePtr call(const string& name)
    {
        auto const& catalog = functionCatalog();
        auto it = catalog.find(name);
        if ( it == catalog.end() ) fail("unknown function '" + name + "'");
        vector<RateNodePtr> args;
        if ( not accept(")") )
        {
            do args.push_back(expr()); while ( accept(",") );
            expect(")");
        }
        if ( args.size() < it->second.minargs or args.size() > it->second.maxargs )
            fail("wrong number of arguments to '" + name + "'");
        return make_shared<RateCall>(name, &it->second, args);
    }
public:
    RateNodePtr parse()
    {
        auto root = expr();
        skipws();
        if ( _pos != _src.size() ) fail("trailing input");
        return root;
    }
    RateParser(const string& src) : _src(src) {}
};

// A parsed expression. Copies share the (immutable) tree.
class RateExpr
{
    string _src;
    RateNodePtr _root;
public:
    const string& str() const { return _src; }
    bool empty() const { return _root == nullptr; }
    // Throws RateError; a non-finite result is an error too
    double evaluate(const RateScope& scope) const
    {
        if ( not _root ) throw RateError("empty-expression");
        double v = _root->eval(scope);
        if ( not isfinite(v) ) throw RateError("non-finite-result");
        return v;
    }
    // Set when the whole expression is a literal number
    bool isLiteral(double& val) const
    {
        auto num = dynamic_cast<const RateNumber*>(_root.get());
        if ( num ) val = num->_val;
        return num != nullptr;
    }
    RateExpr() {}
    RateExpr(const string& src) : _src(src), _root(RateParser(src).parse()) {}
};

// Rate of a continuous transition: a constant, a parsed expression or a
// user supplied function of the scope.
class RateFunction
{
public:
    typedef function<double(const RateScope&)> Callable;
    typedef enum {CONSTANT, EXPRESSION, CALLABLE} Form;
private:
    Form _form = CONSTANT;
    double _constant = 1.0;
    RateExpr _expr;
    Callable _fn;
    string _label;
public:
    static RateFunction constant(double val)
    {
        RateFunction rf;
        rf._constant = val;
        rf._label = to_string(val);
        return rf;
    }
    // A numeric literal collapses to a constant
    static RateFunction expression(const string& src)
    {
        RateFunction rf;
        rf._expr = RateExpr(src);
        rf._label = src;
        if ( not rf._expr.isLiteral(rf._constant) ) rf._form = EXPRESSION;
        return rf;
    }
    static RateFunction callable(Callable fn, string label = "<function>")
    {
        if ( not fn ) throw HPNConfigError("rate function: empty callable");
        RateFunction rf;
        rf._form = CALLABLE;
        rf._fn = fn;
        rf._label = label;
        return rf;
    }
    Form form() const { return _form; }
    bool isConstant() const { return _form == CONSTANT; }
    const string& str() const { return _label; }
    double evaluate(const RateScope& scope) const
    {
        switch(_form)
        {
            case CONSTANT: return _constant;
            case EXPRESSION: return _expr.evaluate(scope);
            case CALLABLE:
            {
                double v = _fn(scope);
                if ( not isfinite(v) ) throw RateError("non-finite-result");
                return v;
            }
        }
        return _constant;
    }
    RateFunction() : _label("1.0") {}
};

#endif
