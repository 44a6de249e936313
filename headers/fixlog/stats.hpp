#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace fixlog {

using steady_clock = std::chrono::steady_clock;

struct stratum_stats {
    std::vector<std::string> relations;
    bool recursive = false;
    size_t iterations = 0;
    steady_clock::duration time{};
};

struct rule_stats {
    std::string name;
    size_t stratum = 0;
    size_t evaluations = 0;
    size_t candidates = 0;
    steady_clock::duration time{};
};

// Cumulative over every run of a program. Counts are always kept; times only
// when the program measures time.
struct run_stats {
    std::vector<stratum_stats> strata;
    std::vector<rule_stats> rules;
    size_t runs = 0;
    bool timed = false;

    std::string summary() const {
        auto ms = [](steady_clock::duration d) {
            return std::chrono::duration<double, std::milli>(d).count();
        };
        steady_clock::duration total{};
        for (auto &s : strata)
            total += s.time;
        std::string out;
        if (timed)
            out += fmt::format("{} run(s), {:.3f} ms in strata\n", runs,
                               ms(total));
        else
            out += fmt::format("{} run(s), timing disabled\n", runs);
        for (size_t i = 0; i < strata.size(); ++i) {
            auto &s = strata[i];
            out += fmt::format("stratum {} [{}]{} iterations: {}", i,
                               fmt::join(s.relations, ", "),
                               s.recursive ? " recursive" : "", s.iterations);
            if (timed)
                out += fmt::format(" time: {:.3f} ms", ms(s.time));
            out += '\n';
            for (auto &r : rules) {
                if (r.stratum != i)
                    continue;
                out += fmt::format("  {}: evaluations: {} candidates: {}",
                                   r.name, r.evaluations, r.candidates);
                if (timed)
                    out += fmt::format(" time: {:.3f} ms", ms(r.time));
                out += '\n';
            }
        }
        return out;
    }
};

} // namespace fixlog
