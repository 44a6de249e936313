#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include <spdlog/logger.h>

namespace fixlog {

class database;

enum class strategy {
    semi_naive,
    // Every iteration re-joins full state; the reference the semi-naive
    // strategy must agree with.
    naive,
};

struct iteration_event {
    size_t stratum;
    size_t iteration;
    size_t new_facts;
    bool changed;
};

using iteration_hook =
    std::function<void(const iteration_event &, const database &)>;

struct options {
    strategy mode = strategy::semi_naive;
    bool measure_time = false;
    // Falls back to spdlog's default logger when empty.
    std::shared_ptr<spdlog::logger> logger;
    iteration_hook on_iteration;
};

} // namespace fixlog
