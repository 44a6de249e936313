#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "clause.hpp"
#include "engine.hpp"
#include "graph.hpp"
#include "options.hpp"
#include "rule.hpp"
#include "stats.hpp"
#include "store.hpp"
#include "stratify.hpp"
#include "value.hpp"

namespace fixlog {

class program {
  public:
    explicit program(options opts = {}) : opts_(std::move(opts)) {
        if (!opts_.logger)
            opts_.logger = spdlog::default_logger();
        stats_.timed = opts_.measure_time;
    }

    size_t add_relation(std::string name, std::vector<value_kind> columns) {
        prepared_ = false;
        return db_.add({std::move(name), std::move(columns), {}});
    }

    // The last column holds the lattice value; `join` merges two of them.
    size_t add_lattice(std::string name, std::vector<value_kind> columns,
                       join_fn join) {
        if (!join)
            throw definition_error("lattice '" + name + "' needs a join");
        prepared_ = false;
        return db_.add({std::move(name), std::move(columns), std::move(join)});
    }

    void add_rule(rule r) {
        prepared_ = false;
        rules_.push_back(std::move(r));
    }

    bool insert(std::string_view rel, tuple t) {
        return db_.at(rel).insert(std::move(t));
    }

    size_t insert_all(std::string_view rel, const std::vector<tuple> &ts) {
        auto &st = db_.at(rel);
        size_t n = 0;
        for (auto &t : ts)
            n += st.insert(t);
        return n;
    }

    // Compiles the rules and stratifies the program. Throws
    // stratification_error before any fact is computed.
    void prepare() {
        if (prepared_)
            return;
        auto &log = *opts_.logger;

        auto graph = dependency_graph::build(rules_, db_);
        auto layers = stratify(graph, db_);

        std::vector<compiled_rule> compiled;
        compiled.reserve(rules_.size());
        for (size_t i = 0; i < rules_.size(); ++i)
            compiled.push_back(compile(rules_[i], i, db_));
        auto plan = plan_strata(std::move(layers), compiled, db_.size());

        run_stats stats;
        stats.timed = opts_.measure_time;
        for (size_t s = 0; s < plan.size(); ++s) {
            stratum_stats ss;
            for (size_t r : plan[s].layer.relations)
                ss.relations.push_back(db_[r].name());
            ss.recursive = plan[s].layer.recursive;
            log.debug("stratum {}: [{}]{}", s, fmt::join(ss.relations, ", "),
                      ss.recursive ? " recursive" : "");
            stats.strata.push_back(std::move(ss));
            for (auto &rp : plan[s].rules) {
                auto &cr = compiled[rp.rule];
                log.trace("  {}: {} step(s), {} delta variant(s)", cr.name,
                          cr.steps.size(), rp.delta_steps.size());
                stats.rules.push_back({cr.name, s, 0, 0, {}});
            }
        }

        compiled_ = std::move(compiled);
        plan_ = std::move(plan);
        stats_ = std::move(stats);
        prepared_ = true;
    }

    void run() { execute(std::nullopt); }

    // Stops at an iteration boundary once `limit` has elapsed, leaving every
    // relation as it was after the last completed iteration. Returns whether
    // the fixpoint was reached.
    template <typename Rep, typename Period>
    bool run_with_timeout(std::chrono::duration<Rep, Period> limit) {
        using seconds = std::chrono::duration<double>;
        auto now = steady_clock::now();
        // Limits past the clock's range mean no deadline at all.
        if (seconds(limit) >= seconds(steady_clock::time_point::max() - now))
            return execute(std::nullopt);
        if (limit <= limit.zero())
            return execute(now);
        return execute(now +
                       std::chrono::duration_cast<steady_clock::duration>(limit));
    }

    const relation_store &relation(std::string_view name) const {
        return db_.at(name);
    }

    bool contains(std::string_view rel, const tuple &t) const {
        return db_.at(rel).contains(t);
    }

    std::vector<tuple> facts(std::string_view rel) const {
        auto &st = db_.at(rel);
        std::vector<tuple> out(st.begin(), st.end());
        std::sort(out.begin(), out.end());
        return out;
    }

    std::optional<value> lattice_value(std::string_view rel,
                                       const tuple &key) const {
        auto &st = db_.at(rel);
        if (!st.is_lattice())
            throw definition_error("'" + std::string(rel) +
                                   "' is not a lattice");
        if (auto *v = st.find_value(key))
            return *v;
        return std::nullopt;
    }

    const database &db() const { return db_; }
    const options &config() const { return opts_; }
    const run_stats &stats() const { return stats_; }

    const std::vector<stratum_stats> &strata() {
        prepare();
        return stats_.strata;
    }

    std::string summary() const { return stats_.summary(); }

    std::string relation_sizes_summary() const {
        std::string out;
        for (auto &st : db_)
            out += fmt::format("{} size: {}\n", st.name(), st.size());
        return out;
    }

  private:
    bool execute(evaluator::deadline until) {
        prepare();
        ++stats_.runs;
        evaluator ev(db_, compiled_, plan_, opts_, stats_);
        bool done = ev.run(until);
        size_t facts = 0, iterations = 0;
        for (auto &st : db_)
            facts += st.size();
        for (auto &s : stats_.strata)
            iterations += s.iterations;
        if (done)
            opts_.logger->info(
                "fixpoint reached: {} strata, {} iteration(s), {} facts",
                plan_.size(), iterations, facts);
        else
            opts_.logger->warn("stopped before fixpoint: {} facts", facts);
        return done;
    }

    options opts_;
    database db_;
    std::vector<rule> rules_;
    std::vector<compiled_rule> compiled_;
    std::vector<stratum_plan> plan_;
    run_stats stats_;
    bool prepared_ = false;
};

} // namespace fixlog
