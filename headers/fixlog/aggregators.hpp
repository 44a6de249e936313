#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "error.hpp"
#include "rule.hpp"
#include "value.hpp"

// Built-in aggregators. Each receives one tuple per matching row holding the
// aggregated variables (in `over` order) and returns zero or more result
// tuples, one per continuation of the rule.
namespace fixlog::aggregators {

namespace detail {

inline const value &first(const tuple &t) {
    if (t.empty())
        throw evaluation_error("aggregator needs at least one aggregated "
                               "variable");
    return t.front();
}

inline std::vector<tuple> one(value v) { return {tuple{std::move(v)}}; }

} // namespace detail

inline aggregator count() {
    return [](const std::vector<tuple> &group) {
        return detail::one(static_cast<int64_t>(group.size()));
    };
}

inline aggregator sum() {
    return [](const std::vector<tuple> &group) {
        bool integral = true;
        int64_t isum = 0;
        double rsum = 0;
        for (auto &t : group) {
            auto &v = detail::first(t);
            int64_t next;
            // An integer sum that would overflow continues as a real sum.
            if (v.is_int() && integral &&
                !__builtin_add_overflow(isum, v.as_int(), &next)) {
                isum = next;
            } else {
                if (integral) {
                    rsum = static_cast<double>(isum);
                    integral = false;
                }
                rsum += v.to_real();
            }
        }
        return integral ? detail::one(isum) : detail::one(rsum);
    };
}

inline aggregator min() {
    return [](const std::vector<tuple> &group) -> std::vector<tuple> {
        if (group.empty())
            return {};
        const value *best = &detail::first(group.front());
        for (auto &t : group)
            if (detail::first(t) < *best)
                best = &detail::first(t);
        return detail::one(*best);
    };
}

inline aggregator max() {
    return [](const std::vector<tuple> &group) -> std::vector<tuple> {
        if (group.empty())
            return {};
        const value *best = &detail::first(group.front());
        for (auto &t : group)
            if (*best < detail::first(t))
                best = &detail::first(t);
        return detail::one(*best);
    };
}

inline aggregator mean() {
    return [](const std::vector<tuple> &group) -> std::vector<tuple> {
        if (group.empty())
            return {};
        double r = 0;
        for (auto &t : group)
            r += detail::first(t).to_real();
        return detail::one(r / static_cast<double>(group.size()));
    };
}

// Nearest-rank percentile, p in [0, 100].
inline aggregator percentile(double p) {
    if (!(p >= 0.0 && p <= 100.0))
        throw definition_error("percentile must be within [0, 100], got " +
                               std::to_string(p));
    return [p](const std::vector<tuple> &group) -> std::vector<tuple> {
        if (group.empty())
            return {};
        std::vector<value> vals;
        vals.reserve(group.size());
        for (auto &t : group)
            vals.push_back(detail::first(t));
        std::sort(vals.begin(), vals.end());
        auto idx = static_cast<size_t>(
            std::lround(p / 100.0 * static_cast<double>(vals.size() - 1)));
        return detail::one(vals[std::min(idx, vals.size() - 1)]);
    };
}

// Succeeds once, binding nothing, when the group is empty.
inline aggregator absent() {
    return [](const std::vector<tuple> &group) -> std::vector<tuple> {
        if (group.empty())
            return {tuple{}};
        return {};
    };
}

} // namespace fixlog::aggregators
