#include <benchmark/benchmark.h>
#include "rkv/Table.hpp"
#include <string>
#include <vector>

static void BM_TablePut_SingleThread(benchmark::State& state) {
    rkv::Table table;
    int i = 0;
    for (auto _ : state) {
        table.put("key", i++);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TablePut_SingleThread);

static void BM_TableGet_SingleThread(benchmark::State& state) {
    rkv::Table table;
    table.put("key", 42.0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.get("key"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TableGet_SingleThread);

static void BM_TablePutNew_Rejected(benchmark::State& state) {
    rkv::Table table;
    table.put("key", 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.putNew("key", 2));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TablePutNew_Rejected);

static void BM_TableAll(benchmark::State& state) {
    rkv::Table table;
    for (int i = 0; i < state.range(0); ++i) {
        table.put("key_" + std::to_string(i), i);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.all());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_TableAll)->Arg(100)->Arg(10000);

// Each thread writes its own keys; shards keep them from contending.
static void BM_TablePut_Contended(benchmark::State& state) {
    static rkv::Table table;
    const std::string key = "key_" + std::to_string(state.thread_index());
    int i = 0;
    for (auto _ : state) {
        table.put(key, i++);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TablePut_Contended)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

static void BM_TableMixed_SingleShard(benchmark::State& state) {
    static rkv::Table table(rkv::TableOptions{rkv::TableKind::Set, rkv::Access::Public, 1, true, false});
    const std::string key = "key_" + std::to_string(state.thread_index());
    int i = 0;
    for (auto _ : state) {
        if (i % 4 == 0) table.put(key, i);
        else benchmark::DoNotOptimize(table.get(key));
        ++i;
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TableMixed_SingleShard)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
