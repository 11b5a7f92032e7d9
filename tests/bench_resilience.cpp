#include <benchmark/benchmark.h>

#include "resilience/bulkhead.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/resilience_manager.hpp"
#include "resilience/resilience_registry.hpp"

#include <memory>
#include <string>

using namespace callguard;
using namespace std::chrono_literals;

namespace {

ResilienceConfig inline_config() {
    ResilienceConfig cfg;
    cfg.timeout = 0ms;  // no worker thread: measures admission cost only
    cfg.max_concurrent = 64;
    return cfg;
}

Result<int> ok_call() {
    return Result<int>::ok(1);
}

} // anonymous namespace

// ============================================================================
// Single-threaded admission paths
// ============================================================================

static void BM_CircuitBreaker_TryAcquire_Closed(benchmark::State& state) {
    CircuitBreaker cb("bench");
    for (auto _ : state) {
        auto permit = cb.try_acquire();
        cb.on_success(permit);
        benchmark::DoNotOptimize(permit);
    }
}
BENCHMARK(BM_CircuitBreaker_TryAcquire_Closed);

static void BM_CircuitBreaker_Reject_Open(benchmark::State& state) {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.reset_timeout = std::chrono::hours(1);
    CircuitBreaker cb("bench-open", cfg);
    auto trip = cb.try_acquire();
    cb.on_failure(trip, Error::operation_failed("down"));

    for (auto _ : state) {
        auto permit = cb.try_acquire();
        benchmark::DoNotOptimize(permit);
    }
}
BENCHMARK(BM_CircuitBreaker_Reject_Open);

static void BM_Bulkhead_AcquireRelease(benchmark::State& state) {
    Bulkhead bh("bench");
    for (auto _ : state) {
        auto slot = bh.acquire();
        benchmark::DoNotOptimize(slot);
    }
}
BENCHMARK(BM_Bulkhead_AcquireRelease);

static void BM_Manager_Execute_Inline(benchmark::State& state) {
    ResilienceManager manager("bench", inline_config());
    for (auto _ : state) {
        auto r = manager.execute(ok_call);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Manager_Execute_Inline);

static void BM_Manager_Execute_WithTimeout(benchmark::State& state) {
    ResilienceConfig cfg = inline_config();
    cfg.timeout = 1000ms;
    ResilienceManager manager("bench-timeout", cfg);
    for (auto _ : state) {
        auto r = manager.execute(ok_call);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Manager_Execute_WithTimeout);

// ============================================================================
// Multi-threaded
// ============================================================================

static ResilienceRegistry& shared_registry() {
    static ResilienceRegistry registry(inline_config());
    return registry;
}

static void BM_Registry_Lookup_Throughput(benchmark::State& state) {
    auto& registry = shared_registry();
    (void)registry.get_or_create("llm");
    for (auto _ : state) {
        auto m = registry.get_or_create("llm");
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_Registry_Lookup_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

static void BM_Manager_Execute_Throughput(benchmark::State& state) {
    auto manager = shared_registry().get_or_create("throughput");
    for (auto _ : state) {
        auto r = manager->execute(ok_call);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Manager_Execute_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);
