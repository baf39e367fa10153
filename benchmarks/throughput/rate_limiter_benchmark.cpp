/**
 * @file rate_limiter_benchmark.cpp
 * @brief Overhead of the shared request limiters and slot pool
 *
 * Measures bookkeeping cost only: profiles are generous enough that no
 * acquire has to wait for a refill.
 */

#include <benchmark/benchmark.h>

#include <kcenon/resilient_transfer/core/rate_limiter.h>
#include <kcenon/resilient_transfer/transfer/resource_allocator.h>

#include <cstdint>

namespace kcenon::resilient_transfer::benchmark {

namespace {

constexpr rate_limit_profile unthrottled{1e9, 1'000'000};

auto shared_limiter() -> rate_limiter& {
    static rate_limiter limiter(unthrottled, "bench");
    return limiter;
}

auto shared_allocator() -> resource_allocator& {
    static resource_allocator allocator(resource_config{8, 4096, 0});
    return allocator;
}

}  // namespace

// ============================================================================
// Token bucket
// ============================================================================

static void BM_RateLimiterAcquire(::benchmark::State& state) {
    rate_limiter limiter(unthrottled);
    for (auto _ : state) {
        if (!limiter.acquire()) {
            state.SkipWithError("acquire failed");
            return;
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_RateLimiterTryAcquire(::benchmark::State& state) {
    rate_limiter limiter(unthrottled);
    for (auto _ : state) {
        ::benchmark::DoNotOptimize(limiter.try_acquire());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Contended acquire from several threads on one bucket
 */
static void BM_RateLimiterContended(::benchmark::State& state) {
    auto& limiter = shared_limiter();
    for (auto _ : state) {
        if (!limiter.acquire()) {
            state.SkipWithError("acquire failed");
            return;
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_RegistryLookup(::benchmark::State& state) {
    rate_limiter_registry registry;
    for (std::size_t i = 0; i < rate_limit_scope_count; ++i) {
        if (!registry.configure(static_cast<rate_limit_scope>(i), unthrottled)) {
            state.SkipWithError("configure failed");
            return;
        }
    }
    std::size_t i = 0;
    for (auto _ : state) {
        auto& limiter = registry.get(static_cast<rate_limit_scope>(i++ % rate_limit_scope_count));
        ::benchmark::DoNotOptimize(limiter.try_acquire());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Slots and allocation
// ============================================================================

static void BM_SlotAcquireRelease(::benchmark::State& state) {
    auto& slots = shared_allocator().slots();
    for (auto _ : state) {
        if (!slots.acquire()) {
            state.SkipWithError("slot acquire failed");
            return;
        }
        slot_guard guard(slots);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_AllocateComplete(::benchmark::State& state) {
    resource_allocator allocator(resource_config{8, 4096, 0});
    const auto size = static_cast<uint64_t>(state.range(0));
    for (auto _ : state) {
        auto allocation = allocator.allocate(size);
        if (!allocation) {
            state.SkipWithError("allocation failed");
            return;
        }
        allocation.value()->complete();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Registration
// ============================================================================

BENCHMARK(BM_RateLimiterAcquire);
BENCHMARK(BM_RateLimiterTryAcquire);
BENCHMARK(BM_RateLimiterContended)->Threads(1)->Threads(4)->Threads(8);
BENCHMARK(BM_RegistryLookup);
BENCHMARK(BM_SlotAcquireRelease)->Threads(1)->Threads(4);
BENCHMARK(BM_AllocateComplete)
    ->Arg(10 * 1024 * 1024)
    ->Arg(int64_t{2} * 1024 * 1024 * 1024);

}  // namespace kcenon::resilient_transfer::benchmark
