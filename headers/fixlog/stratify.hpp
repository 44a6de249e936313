#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "graph.hpp"
#include "store.hpp"

namespace fixlog {

// A negated or aggregated dependency that closes a cycle.
class stratification_error : public error {
  public:
    stratification_error(std::string source, std::string target, polarity kind,
                         std::vector<std::string> cycle)
        : error(describe(source, target, kind, cycle)),
          source_(std::move(source)), target_(std::move(target)), kind_(kind),
          cycle_(std::move(cycle)) {}

    const std::string &source() const { return source_; }
    const std::string &target() const { return target_; }
    polarity kind() const { return kind_; }
    const std::vector<std::string> &cycle() const { return cycle_; }

  private:
    static std::string describe(const std::string &source,
                                const std::string &target, polarity kind,
                                const std::vector<std::string> &cycle) {
        std::string rels;
        for (auto &r : cycle)
            rels += (rels.empty() ? "" : ",") + r;
        return "unable to stratify relation(s) {" + rels + "}: '" + target +
               "' has cyclic " + std::string(polarity_name(kind)) + " on '" +
               source + "'";
    }

    std::string source_;
    std::string target_;
    polarity kind_;
    std::vector<std::string> cycle_;
};

struct stratum {
    std::vector<size_t> relations;
    bool recursive = false;
};

// Strongly connected components of the dependency graph, in an order where
// every edge points forward or stays inside a component. Negated and
// aggregated edges must point strictly forward.
class stratifier {
  public:
    explicit stratifier(const dependency_graph &g) : g_(g) {}

    std::vector<stratum> run(const database &db) {
        size_t n = g_.size();
        index_.assign(n, npos);
        low_.assign(n, 0);
        on_stack_.assign(n, false);
        stack_.clear();
        comps_.clear();
        next_ = 0;
        for (size_t v = 0; v < n; ++v)
            if (index_[v] == npos)
                connect(v);

        std::vector<size_t> comp_of(n);
        for (size_t c = 0; c < comps_.size(); ++c)
            for (size_t v : comps_[c])
                comp_of[v] = c;

        auto order = topological(comp_of);
        std::vector<size_t> rank(comps_.size());
        std::vector<stratum> strata;
        strata.reserve(order.size());
        for (size_t i = 0; i < order.size(); ++i) {
            rank[order[i]] = i;
            stratum s;
            s.relations = comps_[order[i]];
            std::sort(s.relations.begin(), s.relations.end());
            s.recursive = s.relations.size() > 1;
            strata.push_back(std::move(s));
        }
        for (auto &e : g_.edges()) {
            size_t src = rank[comp_of[e.source]];
            size_t dst = rank[comp_of[e.target]];
            if (e.kind == polarity::positive) {
                if (src == dst && e.source == e.target)
                    strata[src].recursive = true;
                continue;
            }
            if (src >= dst) {
                std::vector<std::string> cycle;
                for (size_t v : strata[dst].relations)
                    cycle.push_back(db[v].name());
                if (src != dst)
                    for (size_t v : strata[src].relations)
                        cycle.push_back(db[v].name());
                std::sort(cycle.begin(), cycle.end());
                throw stratification_error(db[e.source].name(),
                                           db[e.target].name(), e.kind,
                                           std::move(cycle));
            }
        }
        return strata;
    }

  private:
    static constexpr size_t npos = static_cast<size_t>(-1);

    // Tarjan's algorithm; components come out sinks first.
    void connect(size_t v) {
        index_[v] = low_[v] = next_++;
        stack_.push_back(v);
        on_stack_[v] = true;
        for (size_t w : g_.successors(v)) {
            if (index_[w] == npos) {
                connect(w);
                low_[v] = std::min(low_[v], low_[w]);
            } else if (on_stack_[w]) {
                low_[v] = std::min(low_[v], index_[w]);
            }
        }
        if (low_[v] != index_[v])
            return;
        std::vector<size_t> comp;
        size_t w;
        do {
            w = stack_.back();
            stack_.pop_back();
            on_stack_[w] = false;
            comp.push_back(w);
        } while (w != v);
        comps_.push_back(std::move(comp));
    }

    // Kahn's algorithm over the condensation. Among ready components the one
    // holding the earliest declared relation goes first.
    std::vector<size_t> topological(const std::vector<size_t> &comp_of) const {
        size_t nc = comps_.size();
        std::vector<std::vector<size_t>> succ(nc);
        std::vector<size_t> indeg(nc, 0);
        for (auto &e : g_.edges()) {
            size_t a = comp_of[e.source], b = comp_of[e.target];
            if (a == b)
                continue;
            succ[a].push_back(b);
            ++indeg[b];
        }
        std::vector<size_t> first(nc);
        for (size_t c = 0; c < nc; ++c)
            first[c] = *std::min_element(comps_[c].begin(), comps_[c].end());

        using item = std::pair<size_t, size_t>;
        std::priority_queue<item, std::vector<item>, std::greater<item>> ready;
        for (size_t c = 0; c < nc; ++c)
            if (!indeg[c])
                ready.push({first[c], c});
        std::vector<size_t> order;
        order.reserve(nc);
        while (!ready.empty()) {
            size_t c = ready.top().second;
            ready.pop();
            order.push_back(c);
            for (size_t d : succ[c])
                if (!--indeg[d])
                    ready.push({first[d], d});
        }
        return order;
    }

    const dependency_graph &g_;
    std::vector<size_t> index_;
    std::vector<size_t> low_;
    std::vector<bool> on_stack_;
    std::vector<size_t> stack_;
    std::vector<std::vector<size_t>> comps_;
    size_t next_ = 0;
};

inline std::vector<stratum> stratify(const dependency_graph &g,
                                     const database &db) {
    return stratifier(g).run(db);
}

} // namespace fixlog
