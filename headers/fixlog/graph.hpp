#pragma once

#include <cstddef>
#include <string_view>
#include <variant>
#include <vector>

#include "rule.hpp"
#include "store.hpp"

namespace fixlog {

enum class polarity { positive, negative, aggregated };

inline std::string_view polarity_name(polarity p) {
    switch (p) {
    case polarity::positive:
        return "positive";
    case polarity::negative:
        return "negation";
    case polarity::aggregated:
        return "aggregation";
    }
    return "?";
}

// Body relation -> head relation, one per relation-referencing body clause.
struct dependency {
    size_t source;
    size_t target;
    polarity kind;
    size_t rule;
};

class dependency_graph {
  public:
    explicit dependency_graph(size_t nodes) : adj_(nodes) {}

    void add(dependency d) {
        adj_[d.source].push_back(d.target);
        edges_.push_back(d);
    }

    size_t size() const { return adj_.size(); }
    const std::vector<dependency> &edges() const { return edges_; }
    const std::vector<size_t> &successors(size_t n) const { return adj_[n]; }

    static dependency_graph build(const std::vector<rule> &rules,
                                  const database &db) {
        dependency_graph g(db.size());
        for (size_t ri = 0; ri < rules.size(); ++ri) {
            auto &r = rules[ri];
            for (auto &c : r.body) {
                const std::string *rel = nullptr;
                polarity p = polarity::positive;
                if (auto *m = std::get_if<match>(&c)) {
                    rel = &m->rel;
                } else if (auto *n = std::get_if<negation>(&c)) {
                    rel = &n->rel;
                    p = polarity::negative;
                } else if (auto *a = std::get_if<aggregation>(&c)) {
                    rel = &a->rel;
                    p = polarity::aggregated;
                }
                if (!rel)
                    continue;
                size_t src = db.id(*rel);
                for (auto &h : r.heads)
                    g.add({src, db.id(h.rel), p, ri});
            }
        }
        return g;
    }

  private:
    std::vector<std::vector<size_t>> adj_;
    std::vector<dependency> edges_;
};

} // namespace fixlog
