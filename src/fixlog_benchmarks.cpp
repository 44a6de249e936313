#include <cstdint>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "fixlog/fixlog.hpp"

using namespace fixlog;

namespace {
constexpr auto I = value_kind::integer;

options quiet(strategy mode = strategy::semi_naive) {
    options o;
    o.mode = mode;
    o.logger = std::make_shared<spdlog::logger>(
        "fixlog_bench", std::make_shared<spdlog::sinks::null_sink_mt>());
    return o;
}

std::vector<tuple> chain(int64_t n) {
    std::vector<tuple> es;
    for (int64_t i = 0; i < n; ++i)
        es.push_back({i, i + 1});
    return es;
}

std::vector<tuple> dense(int64_t n) {
    std::vector<tuple> es;
    for (int64_t i = 0; i < n; ++i)
        for (int64_t j = 0; j < n; ++j)
            if (i != j)
                es.push_back({i, j});
    return es;
}

void add_tc(program &p) {
    p.add_relation("edge", {I, I});
    p.add_relation("path", {I, I});
    p.add_rule(rule(head{"path", {"x", "y"}}, {match{"edge", {"x", "y"}}}));
    p.add_rule(rule(head{"path", {"x", "z"}},
                    {match{"edge", {"x", "y"}}, match{"path", {"y", "z"}}}));
}
}

static void BM_Fixlog_BaseCase(benchmark::State &st) {
    int64_t n = st.range(0);
    std::vector<tuple> nodes;
    for (int64_t i = 0; i < n; ++i)
        nodes.push_back({i});
    for (auto _ : st) {
        program p(quiet());
        p.add_relation("n", {I});
        p.add_relation("s", {I});
        p.add_rule(rule(head{"s", {"x"}}, {match{"n", {"x"}}}));
        p.insert_all("n", nodes);
        p.run();
        benchmark::DoNotOptimize(p.relation("s").size());
    }
    st.SetItemsProcessed(st.iterations() * n);
}
BENCHMARK(BM_Fixlog_BaseCase)->RangeMultiplier(10)->Range(1000, 100'000);

static void BM_Fixlog_ChainTC(benchmark::State &st) {
    auto edges = chain(st.range(0));
    for (auto _ : st) {
        program p(quiet());
        add_tc(p);
        p.insert_all("edge", edges);
        p.run();
        benchmark::DoNotOptimize(p.relation("path").size());
    }
}
BENCHMARK(BM_Fixlog_ChainTC)->RangeMultiplier(2)->Range(64, 512);

static void BM_Fixlog_ChainTC_Naive(benchmark::State &st) {
    auto edges = chain(st.range(0));
    for (auto _ : st) {
        program p(quiet(strategy::naive));
        add_tc(p);
        p.insert_all("edge", edges);
        p.run();
        benchmark::DoNotOptimize(p.relation("path").size());
    }
}
BENCHMARK(BM_Fixlog_ChainTC_Naive)->RangeMultiplier(2)->Range(64, 256);

static void BM_Fixlog_DenseTC(benchmark::State &st) {
    auto edges = dense(st.range(0));
    for (auto _ : st) {
        program p(quiet());
        add_tc(p);
        p.insert_all("edge", edges);
        p.run();
        benchmark::DoNotOptimize(p.relation("path").size());
    }
}
BENCHMARK(BM_Fixlog_DenseTC)->Arg(16)->Arg(32);

static void BM_Fixlog_ShortestPath(benchmark::State &st) {
    int64_t n = st.range(0);
    std::mt19937 gen(7);
    std::vector<tuple> edges;
    for (int64_t i = 0; i < n * 3; ++i)
        edges.push_back({int64_t(gen() % n), int64_t(gen() % n),
                         int64_t(1 + gen() % 20)});
    for (auto _ : st) {
        program p(quiet());
        p.add_relation("edge", {I, I, I});
        p.add_lattice("sp", {I, I, I}, lattices::min());
        p.add_rule(rule(head{"sp", {"x", "y", "w"}}, {match{"edge", {"x", "y", "w"}}}));
        p.add_rule(rule(head{"sp", {"x", "z", fn([](const env &e) {
                                         return value(e.integer("w") +
                                                      e.integer("l"));
                                     })}},
                        {match{"edge", {"x", "y", "w"}},
                         match{"sp", {"y", "z", "l"}}}));
        p.insert_all("edge", edges);
        p.run();
        benchmark::DoNotOptimize(p.relation("sp").size());
    }
}
BENCHMARK(BM_Fixlog_ShortestPath)->Arg(50)->Arg(100)->Arg(200);

static void BM_Fixlog_Negation(benchmark::State &st) {
    int64_t n = st.range(0);
    std::vector<tuple> nodes, edges;
    for (int64_t i = 0; i < n; ++i) {
        nodes.push_back({i});
        if (i % 3)
            edges.push_back({i, (i * 7 + 1) % n});
    }
    for (auto _ : st) {
        program p(quiet());
        p.add_relation("node", {I});
        p.add_relation("edge", {I, I});
        p.add_relation("has_out", {I});
        p.add_relation("sink", {I});
        p.add_rule(rule(head{"has_out", {"x"}}, {match{"edge", {"x", "_"}}}));
        p.add_rule(rule(head{"sink", {"x"}},
                        {match{"node", {"x"}}, negation{"has_out", {"x"}}}));
        p.insert_all("node", nodes);
        p.insert_all("edge", edges);
        p.run();
        benchmark::DoNotOptimize(p.relation("sink").size());
    }
}
BENCHMARK(BM_Fixlog_Negation)->RangeMultiplier(10)->Range(1000, 100'000);

static void BM_Fixlog_Aggregate(benchmark::State &st) {
    int64_t n = st.range(0);
    std::vector<tuple> grades;
    for (int64_t i = 0; i < n; ++i)
        grades.push_back({i % 100, i, (i * 37) % 101});
    for (auto _ : st) {
        program p(quiet());
        p.add_relation("grade", {I, I, I});
        p.add_relation("avg", {I, value_kind::real});
        p.add_rule(rule(head{"avg", {"s", "m"}},
                        {aggregation{{"m"}, aggregators::mean(), {"g"}, "grade",
                                     {"s", "_", "g"}}}));
        p.insert_all("grade", grades);
        p.run();
        benchmark::DoNotOptimize(p.relation("avg").size());
    }
    st.SetItemsProcessed(st.iterations() * n);
}
BENCHMARK(BM_Fixlog_Aggregate)->RangeMultiplier(10)->Range(1000, 100'000);

BENCHMARK_MAIN();
