#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"
#include "value.hpp"

namespace fixlog {

// Read-only view of the variables bound so far in a rule body. Slots are
// numbered in binding order, so the first `bound` names are the live ones.
class env {
  public:
    env(const std::vector<std::string> &names, const value *frame,
        size_t bound)
        : names_(&names), frame_(frame), bound_(bound) {}

    bool has(std::string_view name) const { return find(name) < bound_; }

    const value &operator[](std::string_view name) const {
        size_t i = find(name);
        if (i >= bound_)
            throw evaluation_error("variable '" + std::string(name) +
                                   "' is not bound here");
        return frame_[i];
    }

    int64_t integer(std::string_view name) const {
        return (*this)[name].as_int();
    }
    double real(std::string_view name) const {
        return (*this)[name].to_real();
    }
    const std::string &string(std::string_view name) const {
        return (*this)[name].as_string();
    }
    const value::list_t &list(std::string_view name) const {
        return (*this)[name].as_list();
    }

  private:
    size_t find(std::string_view name) const {
        for (size_t i = 0; i < bound_; ++i)
            if ((*names_)[i] == name)
                return i;
        return bound_;
    }

    const std::vector<std::string> *names_;
    const value *frame_;
    size_t bound_;
};

using expr_fn = std::function<value(const env &)>;
using pred_fn = std::function<bool(const env &)>;
using join_fn = std::function<value(const value &, const value &)>;
using aggregator =
    std::function<std::vector<tuple>(const std::vector<tuple> &group)>;

struct term {
    enum class kind { wildcard, variable, constant, expression };

    kind k = kind::wildcard;
    std::string name;
    value constant;
    expr_fn fn;

    term() = default;
    term(const char *n) : term(std::string(n)) {}
    term(std::string n) {
        if (n != "_") {
            k = kind::variable;
            name = std::move(n);
        }
    }
    term(bool b) : k(kind::constant), constant(b) {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    term(T i) : k(kind::constant), constant(i) {}
    template <std::floating_point T>
    term(T d) : k(kind::constant), constant(d) {}

    bool is_variable() const { return k == kind::variable; }
    bool is_wildcard() const { return k == kind::wildcard; }
};

inline term var(std::string name) { return term(std::move(name)); }

inline term lit(value v) {
    term t;
    t.k = term::kind::constant;
    t.constant = std::move(v);
    return t;
}

inline term fn(expr_fn f) {
    term t;
    t.k = term::kind::expression;
    t.fn = std::move(f);
    return t;
}

// Positive match against a relation, or against a lattice's key columns with
// the last term applied to the stored value.
struct match {
    std::string rel;
    std::vector<term> args;
};

struct negation {
    std::string rel;
    std::vector<term> args;
};

struct aggregation {
    std::vector<std::string> result;
    aggregator agg;
    std::vector<std::string> over;
    std::string rel;
    std::vector<term> args;
};

// Binds `vars` once per element of a list-valued source.
struct generate {
    std::vector<std::string> vars;
    term source;
};

struct filter {
    pred_fn pred;
};

struct let {
    std::string var;
    expr_fn fn;
};

using clause = std::variant<match, negation, aggregation, generate, filter, let>;

struct head {
    std::string rel;
    std::vector<term> args;
};

struct rule {
    std::vector<head> heads;
    std::vector<clause> body;
    std::string name;

    rule(head h, std::vector<clause> b, std::string n = {})
        : heads{std::move(h)}, body(std::move(b)), name(std::move(n)) {}
    rule(std::vector<head> hs, std::vector<clause> b, std::string n = {})
        : heads(std::move(hs)), body(std::move(b)), name(std::move(n)) {}
};

struct relation_decl {
    std::string name;
    std::vector<value_kind> columns;
    join_fn join;

    bool is_lattice() const { return static_cast<bool>(join); }
    size_t arity() const { return columns.size(); }
};

} // namespace fixlog
