#pragma once

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include "error.hpp"
#include "rule.hpp"
#include "value.hpp"

// Ready-made join operations for lattice relations. Every join here is
// associative, commutative and idempotent; custom joins must be too, the
// engine does not check.
namespace fixlog::lattices {

// Larger value wins under the total order of `value`.
inline join_fn max() {
    return [](const value &a, const value &b) { return a < b ? b : a; };
}

// Dual order: the smaller value is "higher". Shortest-path style lattices.
inline join_fn min() {
    return [](const value &a, const value &b) { return b < a ? b : a; };
}

inline join_fn bool_or() {
    return [](const value &a, const value &b) {
        return value(a.as_bool() || b.as_bool());
    };
}

// Union of sorted, duplicate-free lists.
inline join_fn set_union() {
    return [](const value &a, const value &b) {
        auto &l = a.as_list();
        auto &r = b.as_list();
        value::list_t out;
        out.reserve(l.size() + r.size());
        std::set_union(l.begin(), l.end(), r.begin(), r.end(),
                       std::back_inserter(out));
        if (out.size() == l.size())
            return a;
        return value(std::move(out));
    };
}

// Componentwise join over list values of equal width.
inline join_fn product(std::vector<join_fn> parts) {
    return [parts = std::move(parts)](const value &a, const value &b) {
        auto &l = a.as_list();
        auto &r = b.as_list();
        if (l.size() != parts.size() || r.size() != parts.size())
            throw evaluation_error("product lattice expects lists of width " +
                                   std::to_string(parts.size()));
        value::list_t out;
        out.reserve(parts.size());
        for (size_t i = 0; i < parts.size(); ++i)
            out.push_back(parts[i](l[i], r[i]));
        return value(std::move(out));
    };
}

inline value make_set(std::vector<value> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    return value(std::move(items));
}

} // namespace fixlog::lattices
