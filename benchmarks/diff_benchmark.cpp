// auditdiff-cpp benchmarks — measures throughput of the diff pipeline.

#include <auditdiff-cpp/auditdiff.hpp>

#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace auditdiff_cpp;
using json = nlohmann::json;

// One pool for the entire benchmark suite.
static auto g_pool = std::make_shared<ThreadPool>(std::thread::hardware_concurrency());

// An object with n scalar fields; every tenth one differs between calls
// with different `generation`.
static auto make_flat(std::size_t n, int generation) -> json {
    auto j = json::object();
    for (std::size_t i = 0; i < n; ++i) {
        j["field" + std::to_string(i)] = (i % 10 == 0) ? static_cast<std::int64_t>(i) + generation
                                                        : static_cast<std::int64_t>(i);
    }
    return j;
}

// An order with n line items keyed by id, plus a tag list with duplicates.
static auto make_order(std::size_t n, int generation) -> json {
    auto items = json::array();
    auto tags = json::array();
    for (std::size_t i = 0; i < n; ++i) {
        auto id = static_cast<std::int64_t>(i);
        items.push_back({{"id", id}, {"sku", "SKU-" + std::to_string(i)}, {"qty", id % 5 + generation}});
        tags.push_back("tag" + std::to_string((i + static_cast<std::size_t>(generation)) % 7));
    }
    return json{{"items", items}, {"tags", tags}};
}

static auto unordered_config(std::size_t n) -> DiffConfig {
    auto config = DiffConfig{};
    config.max_elements = n * 4;
    config.ignore_collection_order.enabled = true;
    return config;
}

// =============================================================================
// Flat objects
// =============================================================================

static void bm_diff_flat(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_flat(n, 0);
    const auto after = make_flat(n, 1);
    const auto checker = DiffChecker{DiffConfig{}};
    for (auto _ : state) {
        auto changes = checker.diff(before, after);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_flat)->Range(10, 10000);

static void bm_diff_flat_pooled(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_flat(n, 0);
    const auto after = make_flat(n, 1);
    const auto checker = DiffChecker{DiffConfig{}, nullptr, g_pool};
    for (auto _ : state) {
        auto changes = checker.diff(before, after);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_flat_pooled)->Range(10, 10000);

static void bm_diff_created(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto after = make_flat(n, 0);
    const auto checker = DiffChecker{DiffConfig{}};
    for (auto _ : state) {
        auto changes = checker.diff(std::nullopt, after);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_created)->Range(10, 10000);

// =============================================================================
// Order-independent collections
// =============================================================================

static void bm_diff_unordered_collection(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_order(n, 0);
    const auto after = make_order(n, 1);
    const auto checker = DiffChecker{unordered_config(n)};
    for (auto _ : state) {
        auto changes = checker.diff(before, after, "Order");
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_unordered_collection)->Range(10, 1000);

// =============================================================================
// Duplicate reconciliation
// =============================================================================

static void bm_reconcile_duplicates(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto bucket = std::vector<Element>{};
    for (std::size_t i = 0; i < n; ++i) {
        auto e = Element{};
        e.name = "tags";
        e.metadata.fqdn = "Post.tags[]";
        if (i % 2 == 0) {
            e.previous_value = Value{ScalarValue{static_cast<std::int64_t>(i % 13)}};
        } else {
            e.updated_value = Value{ScalarValue{static_cast<std::int64_t>(i % 11)}};
        }
        bucket.push_back(std::move(e));
    }
    for (auto _ : state) {
        auto changes = reconcile_duplicates(bucket);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_reconcile_duplicates)->Range(8, 2000);
