#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"
#include "rule.hpp"
#include "store.hpp"
#include "value.hpp"

namespace fixlog {

inline constexpr size_t no_slot = static_cast<size_t>(-1);

// A value computable from the bindings in place before a step runs.
struct operand {
    enum class kind { slot, constant, expression };

    kind k = kind::constant;
    size_t slot = 0;
    value constant;
    expr_fn fn;
};

// How a body clause reads one relation. Key columns go through an index;
// checked columns (a lattice's value) are compared per row; bound columns
// write into the frame; repeats enforce equality between two columns of the
// same row for a variable introduced twice in one pattern.
struct pattern {
    size_t rel = 0;
    std::vector<size_t> key_cols;
    std::vector<operand> key;
    std::vector<size_t> check_cols;
    std::vector<operand> checks;
    std::vector<std::pair<size_t, size_t>> binds;
    std::vector<std::pair<size_t, size_t>> repeats;
};

struct match_step {
    pattern pat;
};

struct negation_step {
    pattern pat;
};

struct aggregation_step {
    pattern pat;
    std::vector<size_t> over_cols;
    std::vector<size_t> result_slots;
    aggregator agg;
};

struct generate_step {
    operand source;
    std::vector<size_t> slots;
};

struct filter_step {
    pred_fn pred;
};

struct let_step {
    expr_fn fn;
    size_t slot;
};

using step = std::variant<match_step, negation_step, aggregation_step,
                          generate_step, filter_step, let_step>;

struct compiled_head {
    size_t rel;
    std::vector<operand> args;
};

struct compiled_rule {
    size_t index = 0;
    std::string name;
    std::vector<step> steps;
    std::vector<size_t> bound_before;
    std::vector<compiled_head> heads;
    std::vector<std::string> slot_names;
};

namespace detail {

class rule_compiler {
  public:
    rule_compiler(const rule &r, size_t index, const database &db)
        : r_(r), db_(db) {
        out_.index = index;
        out_.name = r.name.empty() ? "rule#" + std::to_string(index) : r.name;
    }

    compiled_rule compile() {
        if (r_.heads.empty())
            fail("has no head");
        for (auto &c : r_.body) {
            out_.bound_before.push_back(out_.slot_names.size());
            std::visit([&](auto &cl) { add(cl); }, c);
        }
        for (auto &h : r_.heads) {
            compiled_head ch;
            ch.rel = db_.id(h.rel);
            check_arity(h.rel, ch.rel, h.args.size());
            for (auto &t : h.args) {
                if (t.is_wildcard())
                    fail("uses a wildcard in the head of '" + h.rel + "'");
                if (t.is_variable() && slot_of(t.name) == npos)
                    fail("head variable '" + t.name + "' is never bound");
                ch.args.push_back(known(t));
            }
            out_.heads.push_back(std::move(ch));
        }
        return std::move(out_);
    }

  private:
    static constexpr size_t npos = static_cast<size_t>(-1);

    [[noreturn]] void fail(const std::string &what) const {
        throw definition_error(out_.name + " " + what);
    }

    size_t slot_of(const std::string &name) const {
        for (size_t i = 0; i < out_.slot_names.size(); ++i)
            if (out_.slot_names[i] == name)
                return i;
        return npos;
    }

    size_t fresh(const std::string &name) {
        if (slot_of(name) != npos)
            fail("binds variable '" + name + "' twice");
        out_.slot_names.push_back(name);
        return out_.slot_names.size() - 1;
    }

    void check_arity(const std::string &rel, size_t id, size_t n) const {
        if (db_[id].arity() != n)
            fail("uses '" + rel + "' with " + std::to_string(n) +
                 " columns, declared with " +
                 std::to_string(db_[id].arity()));
    }

    operand known(const term &t) const {
        operand o;
        switch (t.k) {
        case term::kind::variable:
            o.k = operand::kind::slot;
            o.slot = slot_of(t.name);
            break;
        case term::kind::constant:
            o.k = operand::kind::constant;
            o.constant = t.constant;
            break;
        case term::kind::expression:
            o.k = operand::kind::expression;
            o.fn = t.fn;
            break;
        case term::kind::wildcard:
            fail("uses a wildcard where a value is required");
        }
        return o;
    }

    // Splits a pattern's terms into key, check, bind and repeat columns.
    // `on_new` sees every variable the pattern introduces and returns true
    // to bind it from the row.
    template <typename OnNew>
    pattern split(const std::string &rel, const std::vector<term> &args,
                  OnNew &&on_new) {
        pattern p;
        p.rel = db_.id(rel);
        check_arity(rel, p.rel, args.size());
        bool lattice = db_[p.rel].is_lattice();
        size_t bound = out_.slot_names.size();
        std::unordered_map<std::string, size_t> first;
        std::vector<std::pair<size_t, std::string>> pending;
        for (size_t c = 0; c < args.size(); ++c) {
            auto &t = args[c];
            if (t.is_wildcard())
                continue;
            if (t.is_variable()) {
                size_t s = slot_of(t.name);
                if (s == npos || s >= bound) {
                    auto it = first.find(t.name);
                    if (it != first.end()) {
                        p.repeats.push_back({c, it->second});
                        continue;
                    }
                    first.emplace(t.name, c);
                    if (on_new(t.name, c))
                        pending.push_back({c, t.name});
                    continue;
                }
            }
            if (lattice && c + 1 == args.size()) {
                p.check_cols.push_back(c);
                p.checks.push_back(known(t));
            } else {
                p.key_cols.push_back(c);
                p.key.push_back(known(t));
            }
        }
        for (auto &[c, name] : pending)
            p.binds.push_back({c, fresh(name)});
        return p;
    }

    void add(const match &m) {
        auto pat = split(m.rel, m.args,
                         [](const std::string &, size_t) { return true; });
        out_.steps.push_back(match_step{std::move(pat)});
    }

    void add(const negation &n) {
        auto pat = split(n.rel, n.args, [&](const std::string &v, size_t) {
            fail("negates '" + n.rel + "' over unbound variable '" + v + "'");
            return false;
        });
        out_.steps.push_back(negation_step{std::move(pat)});
    }

    void add(const aggregation &a) {
        if (!a.agg)
            fail("aggregates '" + a.rel + "' without an aggregator");
        std::unordered_map<std::string, size_t> over_col;
        for (auto &v : a.over) {
            if (slot_of(v) != npos)
                fail("aggregates over already bound variable '" + v + "'");
            over_col.emplace(v, npos);
        }
        auto pat = split(a.rel, a.args, [&](const std::string &v, size_t c) {
            auto it = over_col.find(v);
            if (it == over_col.end())
                return true;
            it->second = c;
            return false;
        });
        aggregation_step st;
        for (auto &v : a.over) {
            size_t c = over_col[v];
            if (c == npos)
                fail("aggregates over '" + v + "' which '" + a.rel +
                     "' does not mention");
            st.over_cols.push_back(c);
        }
        for (auto &v : a.result)
            st.result_slots.push_back(fresh(v));
        st.pat = std::move(pat);
        st.agg = a.agg;
        out_.steps.push_back(std::move(st));
    }

    void add(const generate &g) {
        if (g.vars.empty())
            fail("generates without target variables");
        if (g.source.is_variable() && slot_of(g.source.name) == npos)
            fail("generates from unbound variable '" + g.source.name + "'");
        generate_step st;
        st.source = known(g.source);
        for (auto &v : g.vars)
            st.slots.push_back(v == "_" ? no_slot : fresh(v));
        out_.steps.push_back(std::move(st));
    }

    void add(const filter &f) {
        if (!f.pred)
            fail("has an empty filter");
        out_.steps.push_back(filter_step{f.pred});
    }

    void add(const let &l) {
        if (!l.fn)
            fail("binds '" + l.var + "' to an empty expression");
        size_t s = fresh(l.var);
        out_.steps.push_back(let_step{l.fn, s});
    }

    const rule &r_;
    const database &db_;
    compiled_rule out_;
};

} // namespace detail

inline compiled_rule compile(const rule &r, size_t index, const database &db) {
    return detail::rule_compiler(r, index, db).compile();
}

// Runs one rule body as nested loops over a single binding frame, staging
// the instantiated heads into their stores. At most one match step (the
// delta step) reads the previous iteration's delta; every other read sees
// the full committed state.
class clause_evaluator {
  public:
    static constexpr size_t no_delta = static_cast<size_t>(-1);

    clause_evaluator(database &db, const compiled_rule &r,
                     const std::vector<size_t> &heads,
                     size_t delta_step = no_delta)
        : db_(db), r_(r), heads_(heads), delta_step_(delta_step),
          frame_(r.slot_names.size()) {}

    // Returns the number of head facts staged.
    size_t fire() {
        staged_ = 0;
        run(0);
        return staged_;
    }

  private:
    env at(size_t bound) const {
        return env(r_.slot_names, frame_.data(), bound);
    }

    value eval(const operand &o, const env &e) const {
        switch (o.k) {
        case operand::kind::slot:
            return frame_[o.slot];
        case operand::kind::constant:
            return o.constant;
        case operand::kind::expression:
            return o.fn(e);
        }
        return value();
    }

    tuple eval_all(const std::vector<operand> &ops, const env &e) const {
        tuple t;
        t.reserve(ops.size());
        for (auto &o : ops)
            t.push_back(eval(o, e));
        return t;
    }

    static bool row_fits(const pattern &p, const tuple &checks,
                         const tuple &row) {
        for (size_t i = 0; i < p.check_cols.size(); ++i)
            if (row[p.check_cols[i]] != checks[i])
                return false;
        for (auto [c, other] : p.repeats)
            if (row[c] != row[other])
                return false;
        return true;
    }

    void run(size_t i) {
        if (i == r_.steps.size()) {
            emit();
            return;
        }
        std::visit([&](auto &st) { exec(i, st); }, r_.steps[i]);
    }

    void exec(size_t i, const match_step &st) {
        auto e = at(r_.bound_before[i]);
        auto &p = st.pat;
        tuple key = eval_all(p.key, e);
        tuple checks = eval_all(p.checks, e);
        scope s = i == delta_step_ ? scope::delta : scope::full;
        db_[p.rel].lookup(p.key_cols, key, s,
                          [&](size_t, const tuple &row) {
                              if (!row_fits(p, checks, row))
                                  return;
                              for (auto [c, slot] : p.binds)
                                  frame_[slot] = row[c];
                              run(i + 1);
                          });
    }

    void exec(size_t i, const negation_step &st) {
        auto e = at(r_.bound_before[i]);
        auto &p = st.pat;
        tuple key = eval_all(p.key, e);
        tuple checks = eval_all(p.checks, e);
        bool found = false;
        db_[p.rel].lookup(p.key_cols, key, scope::full,
                          [&](size_t, const tuple &row) {
                              if (!found && row_fits(p, checks, row))
                                  found = true;
                          });
        if (!found)
            run(i + 1);
    }

    void exec(size_t i, const aggregation_step &st) {
        auto e = at(r_.bound_before[i]);
        auto &p = st.pat;
        tuple key = eval_all(p.key, e);
        tuple checks = eval_all(p.checks, e);
        std::map<tuple, std::vector<tuple>> groups;
        db_[p.rel].lookup(p.key_cols, key, scope::full,
                          [&](size_t, const tuple &row) {
                              if (!row_fits(p, checks, row))
                                  return;
                              tuple g, item;
                              g.reserve(p.binds.size());
                              for (auto [c, slot] : p.binds)
                                  g.push_back(row[c]);
                              item.reserve(st.over_cols.size());
                              for (size_t c : st.over_cols)
                                  item.push_back(row[c]);
                              groups[std::move(g)].push_back(std::move(item));
                          });
        if (p.binds.empty() && groups.empty())
            groups[tuple{}];
        for (auto &[g, items] : groups) {
            auto results = st.agg(items);
            for (auto &res : results) {
                if (res.size() != st.result_slots.size())
                    throw evaluation_error(
                        r_.name + ": aggregator returned " +
                        std::to_string(res.size()) + " values for " +
                        std::to_string(st.result_slots.size()) +
                        " result variables");
                for (size_t k = 0; k < p.binds.size(); ++k)
                    frame_[p.binds[k].second] = g[k];
                for (size_t k = 0; k < res.size(); ++k)
                    frame_[st.result_slots[k]] = res[k];
                run(i + 1);
            }
        }
    }

    void exec(size_t i, const generate_step &st) {
        auto e = at(r_.bound_before[i]);
        value src = eval(st.source, e);
        if (!src.is_list())
            throw evaluation_error(r_.name + ": cannot iterate over " +
                                   src.to_string());
        for (auto &el : src.as_list()) {
            if (st.slots.size() == 1) {
                if (st.slots[0] != no_slot)
                    frame_[st.slots[0]] = el;
            } else {
                if (!el.is_list() || el.as_list().size() != st.slots.size())
                    throw evaluation_error(
                        r_.name + ": cannot destructure " + el.to_string() +
                        " into " + std::to_string(st.slots.size()) +
                        " variables");
                for (size_t k = 0; k < st.slots.size(); ++k)
                    if (st.slots[k] != no_slot)
                        frame_[st.slots[k]] = el.as_list()[k];
            }
            run(i + 1);
        }
    }

    void exec(size_t i, const filter_step &st) {
        if (st.pred(at(r_.bound_before[i])))
            run(i + 1);
    }

    void exec(size_t i, const let_step &st) {
        frame_[st.slot] = st.fn(at(r_.bound_before[i]));
        run(i + 1);
    }

    void emit() {
        auto e = at(frame_.size());
        for (size_t h : heads_) {
            auto &ch = r_.heads[h];
            db_[ch.rel].stage(eval_all(ch.args, e));
            ++staged_;
        }
    }

    database &db_;
    const compiled_rule &r_;
    const std::vector<size_t> &heads_;
    size_t delta_step_;
    std::vector<value> frame_;
    size_t staged_ = 0;
};

} // namespace fixlog
