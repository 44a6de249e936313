#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/logger.h>

#include "clause.hpp"
#include "options.hpp"
#include "stats.hpp"
#include "store.hpp"
#include "stratify.hpp"

namespace fixlog {

// One rule as seen from one stratum: the heads it derives there and the
// match steps that read relations of that stratum.
struct rule_plan {
    size_t rule;
    std::vector<size_t> heads;
    std::vector<size_t> delta_steps;
};

struct stratum_plan {
    stratum layer;
    std::vector<rule_plan> rules;
};

inline std::vector<stratum_plan>
plan_strata(std::vector<stratum> strata,
            const std::vector<compiled_rule> &rules, size_t relations) {
    std::vector<size_t> rank(relations);
    for (size_t s = 0; s < strata.size(); ++s)
        for (size_t r : strata[s].relations)
            rank[r] = s;

    std::vector<stratum_plan> plan(strata.size());
    for (size_t s = 0; s < strata.size(); ++s)
        plan[s].layer = std::move(strata[s]);

    for (size_t ri = 0; ri < rules.size(); ++ri) {
        auto &cr = rules[ri];
        std::vector<std::vector<size_t>> heads(plan.size());
        for (size_t h = 0; h < cr.heads.size(); ++h)
            heads[rank[cr.heads[h].rel]].push_back(h);
        for (size_t s = 0; s < plan.size(); ++s) {
            if (heads[s].empty())
                continue;
            rule_plan rp{ri, std::move(heads[s]), {}};
            for (size_t i = 0; i < cr.steps.size(); ++i)
                if (auto *m = std::get_if<match_step>(&cr.steps[i]))
                    if (rank[m->pat.rel] == s)
                        rp.delta_steps.push_back(i);
            plan[s].rules.push_back(std::move(rp));
        }
    }
    return plan;
}

// Evaluates strata in order, each to its fixpoint. An iteration fires the
// stratum's rules against committed state only, then commits all staged
// candidates at once, so the store always reflects whole iterations.
class evaluator {
  public:
    using deadline = std::optional<steady_clock::time_point>;

    evaluator(database &db, const std::vector<compiled_rule> &rules,
              const std::vector<stratum_plan> &plan, const options &opts,
              run_stats &stats)
        : db_(db), rules_(rules), plan_(plan), opts_(opts), stats_(stats) {}

    // False when the deadline passed before the fixpoint was reached.
    bool run(deadline until) {
        size_t first_rule = 0;
        for (size_t s = 0; s < plan_.size(); ++s) {
            if (expired(until)) {
                opts_.logger->warn("deadline reached before stratum {}", s);
                return false;
            }
            if (!eval_stratum(s, first_rule, until))
                return false;
            first_rule += plan_[s].rules.size();
        }
        return true;
    }

  private:
    static bool expired(const deadline &until) {
        return until && steady_clock::now() >= *until;
    }

    void fire(const rule_plan &rp, size_t stat, size_t delta_step) {
        auto &rs = stats_.rules[stat];
        auto t0 = opts_.measure_time ? steady_clock::now()
                                     : steady_clock::time_point{};
        clause_evaluator ev(db_, rules_[rp.rule], rp.heads, delta_step);
        rs.candidates += ev.fire();
        ++rs.evaluations;
        if (opts_.measure_time)
            rs.time += steady_clock::now() - t0;
    }

    bool eval_stratum(size_t s, size_t first_rule, const deadline &until) {
        auto &sp = plan_[s];
        auto &st = stats_.strata[s];
        auto &log = *opts_.logger;
        bool naive = opts_.mode == strategy::naive;

        for (size_t r : sp.layer.relations)
            db_[r].reset_delta_to_all();

        log.debug("stratum {} [{}]: {} rule(s)", s,
                  fmt::join(st.relations, ", "), sp.rules.size());

        bool done = true;
        size_t it = 0;
        for (;; ++it) {
            if (it > 0 && expired(until)) {
                log.warn("deadline reached in stratum {} after {} iteration(s)",
                         s, it);
                done = false;
                break;
            }
            auto t0 = opts_.measure_time ? steady_clock::now()
                                         : steady_clock::time_point{};
            for (size_t k = 0; k < sp.rules.size(); ++k) {
                auto &rp = sp.rules[k];
                if (it == 0 || naive) {
                    fire(rp, first_rule + k, clause_evaluator::no_delta);
                    continue;
                }
                for (size_t d : rp.delta_steps)
                    fire(rp, first_rule + k, d);
            }

            bool changed = false;
            size_t added = 0;
            for (size_t r : sp.layer.relations) {
                changed |= db_[r].commit();
                added += db_[r].delta_size();
            }
            ++st.iterations;
            if (opts_.measure_time)
                st.time += steady_clock::now() - t0;
            log.debug("stratum {} iteration {}: {} new or raised fact(s)", s,
                      it, added);
            if (opts_.on_iteration)
                opts_.on_iteration({s, it, added, changed}, db_);
            if (!changed || !sp.layer.recursive)
                break;
        }
        if (done)
            log.debug("stratum {} settled after {} iteration(s)", s, it + 1);

        for (size_t r : sp.layer.relations)
            db_[r].clear_delta();
        return done;
    }

    database &db_;
    const std::vector<compiled_rule> &rules_;
    const std::vector<stratum_plan> &plan_;
    const options &opts_;
    run_stats &stats_;
};

} // namespace fixlog
