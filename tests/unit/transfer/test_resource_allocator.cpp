/**
 * @file test_resource_allocator.cpp
 * @brief Unit tests for pool sizing, slots and throughput scaling
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/transfer/resource_allocator.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::resilient_transfer::test {

namespace {

auto fixed_config(uint32_t cores, uint64_t memory_mb = 8192) -> resource_config {
    resource_config config;
    config.cpu_cores = cores;
    config.memory_mb = memory_mb;
    return config;
}

constexpr double mb = static_cast<double>(mebibyte);

}  // namespace

class ResourceAllocatorTest : public ::testing::Test {};

// ============================================================================
// Sizing
// ============================================================================

TEST_F(ResourceAllocatorTest, TotalThreadsFromCores) {
    EXPECT_EQ(compute_total_threads(fixed_config(2)), 4u);
    EXPECT_EQ(compute_total_threads(fixed_config(4)), 8u);
    EXPECT_EQ(compute_total_threads(fixed_config(64)), 16u);
}

TEST_F(ResourceAllocatorTest, TotalThreadsLimitedByMemory) {
    EXPECT_EQ(compute_total_threads(fixed_config(8, 512)), 4u);
    EXPECT_EQ(compute_total_threads(fixed_config(8, 64)), 1u);
}

TEST_F(ResourceAllocatorTest, ExplicitMaxThreads) {
    auto config = fixed_config(2);
    config.max_threads = 20;
    EXPECT_EQ(compute_total_threads(config), 20u);
    EXPECT_TRUE(config.validate());

    config.max_threads = 33;
    EXPECT_FALSE(config.validate());
}

TEST_F(ResourceAllocatorTest, SizeTiers) {
    const auto want = [](uint64_t size) {
        return desired_threads(size, transfer_priority::normal, 32, 32);
    };
    EXPECT_EQ(want(10 * mebibyte), 1u);
    EXPECT_EQ(want(499 * mebibyte), 1u);
    EXPECT_EQ(want(500 * mebibyte), 4u);
    EXPECT_EQ(want(2 * gibibyte), 8u);
    EXPECT_EQ(want(6 * gibibyte), 12u);
    EXPECT_EQ(want(20 * gibibyte), 16u);
}

TEST_F(ResourceAllocatorTest, PriorityAdjustsTier) {
    EXPECT_EQ(desired_threads(2 * gibibyte, transfer_priority::low, 32, 32), 4u);
    EXPECT_EQ(desired_threads(2 * gibibyte, transfer_priority::high, 32, 32), 12u);
    // The per-file cap still applies to high priority
    EXPECT_EQ(desired_threads(20 * gibibyte, transfer_priority::high, 32, 32), 16u);
    EXPECT_EQ(desired_threads(10 * mebibyte, transfer_priority::low, 32, 32), 1u);
}

TEST_F(ResourceAllocatorTest, DesiredCappedByShareAndCores) {
    EXPECT_EQ(desired_threads(20 * gibibyte, transfer_priority::normal, 3, 32), 3u);
    EXPECT_EQ(desired_threads(20 * gibibyte, transfer_priority::normal, 32, 2), 2u);
    EXPECT_EQ(desired_threads(20 * gibibyte, transfer_priority::normal, 0, 0), 1u);
}

// ============================================================================
// Allocation
// ============================================================================

TEST_F(ResourceAllocatorTest, AllocateAndComplete) {
    resource_allocator allocator(fixed_config(4));
    ASSERT_EQ(allocator.total_threads(), 8u);

    auto big = allocator.allocate(2 * gibibyte);
    ASSERT_TRUE(big);
    EXPECT_EQ(big.value()->threads(), 4u);  // capped by 4 cores

    auto stats = allocator.stats();
    EXPECT_EQ(stats.active_threads, 4u);
    EXPECT_EQ(stats.available_threads, 4u);
    EXPECT_EQ(stats.active_transfers, 1u);

    big.value()->complete();
    big.value()->complete();
    EXPECT_TRUE(big.value()->is_complete());
    EXPECT_EQ(allocator.stats().active_threads, 0u);
    EXPECT_EQ(allocator.stats().active_transfers, 0u);
}

TEST_F(ResourceAllocatorTest, ExhaustedPoolStillGrantsOne) {
    auto config = fixed_config(16);
    config.max_threads = 4;
    resource_allocator allocator(config);

    auto first = allocator.allocate(20 * gibibyte);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value()->threads(), 4u);

    auto second = allocator.allocate(20 * gibibyte);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value()->threads(), 1u);
}

TEST_F(ResourceAllocatorTest, DestructionReturnsThreads) {
    resource_allocator allocator(fixed_config(4));
    {
        auto allocation = allocator.allocate(6 * gibibyte);
        ASSERT_TRUE(allocation);
        EXPECT_GT(allocator.stats().active_threads, 0u);
    }
    EXPECT_EQ(allocator.stats().active_threads, 0u);
}

TEST_F(ResourceAllocatorTest, AllocateAfterShutdownFails) {
    resource_allocator allocator(fixed_config(2));
    allocator.shutdown();
    auto r = allocator.allocate(1024);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::shut_down);
}

// ============================================================================
// Slot pool
// ============================================================================

TEST_F(ResourceAllocatorTest, SlotsNeverExceedCapacity) {
    slot_pool pool(3);
    std::atomic<int> current{0};
    std::atomic<int> worst{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 10; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < 5; ++j) {
                ASSERT_TRUE(pool.acquire());
                slot_guard guard(pool);
                const int now = ++current;
                int seen = worst.load();
                while (now > seen && !worst.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                --current;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_LE(worst.load(), 3);
    EXPECT_LE(pool.peak_in_use(), 3u);
    EXPECT_EQ(pool.in_use(), 0u);
}

TEST_F(ResourceAllocatorTest, SlotAcquireHonoursCancel) {
    slot_pool pool(1);
    ASSERT_TRUE(pool.acquire());

    cancellation_token token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.cancel();
    });
    auto r = pool.acquire(&token);
    canceller.join();

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::cancelled);
    pool.release();
}

TEST_F(ResourceAllocatorTest, ClosedPoolRejects) {
    slot_pool pool(1);
    pool.close();
    auto r = pool.acquire();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::shut_down);
}

// ============================================================================
// Throughput monitor
// ============================================================================

TEST_F(ResourceAllocatorTest, ScaleUpNeedsSteadyFastSamples) {
    throughput_monitor monitor;
    monitor.record("a", 20 * mb);
    monitor.record("a", 20.5 * mb);
    EXPECT_FALSE(monitor.should_scale_up("a"));

    monitor.record("a", 19.8 * mb);
    EXPECT_TRUE(monitor.should_scale_up("a"));

    monitor.record("b", 5 * mb);
    monitor.record("b", 5 * mb);
    monitor.record("b", 5 * mb);
    EXPECT_FALSE(monitor.should_scale_up("b"));

    monitor.record("c", 12 * mb);
    monitor.record("c", 30 * mb);
    monitor.record("c", 15 * mb);
    EXPECT_FALSE(monitor.should_scale_up("c"));
}

TEST_F(ResourceAllocatorTest, ScaleDownOnDecline) {
    throughput_monitor monitor;
    for (double v : {50.0, 50.0, 50.0, 30.0, 30.0}) {
        monitor.record("f", v * mb);
    }
    EXPECT_FALSE(monitor.should_scale_down("f"));

    monitor.record("f", 30 * mb);
    EXPECT_TRUE(monitor.should_scale_down("f"));

    throughput_monitor steady;
    for (int i = 0; i < 6; ++i) {
        steady.record("s", 40 * mb);
    }
    EXPECT_FALSE(steady.should_scale_down("s"));
}

TEST_F(ResourceAllocatorTest, MonitorKeepsBoundedHistory) {
    throughput_monitor monitor;
    for (int i = 0; i < 25; ++i) {
        monitor.record("k", 1.0);
    }
    EXPECT_EQ(monitor.sample_count("k"), throughput_monitor::max_samples);

    monitor.forget("k");
    EXPECT_EQ(monitor.sample_count("k"), 0u);
    EXPECT_FALSE(monitor.should_scale_up("unknown"));
}

}  // namespace kcenon::resilient_transfer::test
