#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sandtool/resource_limits.hh>

using namespace std::chrono_literals;
using sandtool::Config;
using sandtool::LimitOverrides;
using sandtool::ResourceLimiter;

namespace {

constexpr uint64_t mib = 1 << 20;

ResourceLimiter limiter() { return ResourceLimiter{Config::defaults().sandbox}; }

} // namespace

// NOLINTNEXTLINE
TEST(resource_limits, defaults) {
    auto limits = limiter().defaults();
    EXPECT_EQ(limits.memory_limit_in_bytes(), 128 * mib);
    EXPECT_EQ(limits.cpu_time_limit(), 5s);
    EXPECT_EQ(limits.real_time_limit(), 5s);
    EXPECT_EQ(limits.kill_grace_period(), 1s);
    EXPECT_EQ(limits.output_size_limit_in_bytes(), 64U << 10);
    EXPECT_EQ(limits.max_extra_processes(), 0U);
    EXPECT_FALSE(limits.file_writes_allowed());
    EXPECT_EQ(
        limits.description(), "memory: 128 MiB, cpu: 5 s, wall: 5 s, grace: 1 s, output: 65536 B");

    auto computed = limiter().compute({});
    ASSERT_TRUE(computed.is_ok());
    EXPECT_EQ(*computed, limits);
}

// NOLINTNEXTLINE
TEST(resource_limits, overrides) {
    auto limits = limiter().compute({.memory_mb = 64, .cpu_seconds = 2, .timeout_seconds = 3});
    ASSERT_TRUE(limits.is_ok()) << limits.unwrap_err();
    EXPECT_EQ(limits->memory_limit_in_bytes(), 64 * mib);
    EXPECT_EQ(limits->cpu_time_limit(), 2s);
    EXPECT_EQ(limits->real_time_limit(), 3s);
}

// NOLINTNEXTLINE
TEST(resource_limits, timeout_alone_governs_cpu_time) {
    auto limits = limiter().compute({.timeout_seconds = 1.5});
    ASSERT_TRUE(limits.is_ok());
    EXPECT_EQ(limits->real_time_limit(), 1500ms);
    EXPECT_EQ(limits->cpu_time_limit(), 1500ms);
    EXPECT_EQ(limits->memory_limit_in_bytes(), 128 * mib);
}

// NOLINTNEXTLINE
TEST(resource_limits, oversized_overrides_are_clamped) {
    auto limits = limiter().compute({.memory_mb = 1e6, .cpu_seconds = 1e12, .timeout_seconds = 3600});
    ASSERT_TRUE(limits.is_ok());
    EXPECT_EQ(limits->memory_limit_in_bytes(), 512 * mib);
    EXPECT_EQ(limits->cpu_time_limit(), 30s);
    EXPECT_EQ(limits->real_time_limit(), 30s);
}

// NOLINTNEXTLINE
TEST(resource_limits, tiny_memory_is_raised_to_the_floor) {
    for (double memory_mb : {0.001, 1.0, 63.9}) {
        auto limits = limiter().compute({.memory_mb = memory_mb});
        ASSERT_TRUE(limits.is_ok()) << limits.unwrap_err();
        EXPECT_EQ(limits->memory_limit_in_bytes(), 64 * mib) << memory_mb;
    }

    auto config = Config::defaults().sandbox;
    config.min_memory_mb = 32;
    auto limits = ResourceLimiter{config}.compute({.memory_mb = 16});
    ASSERT_TRUE(limits.is_ok());
    EXPECT_EQ(limits->memory_limit_in_bytes(), 32 * mib);
}

// NOLINTNEXTLINE
TEST(resource_limits, invalid_overrides_are_rejected) {
    constexpr auto inf = std::numeric_limits<double>::infinity();
    constexpr auto nan = std::numeric_limits<double>::quiet_NaN();
    for (auto overrides : {
             LimitOverrides{.memory_mb = 0},
             LimitOverrides{.memory_mb = -5},
             LimitOverrides{.memory_mb = nan},
             LimitOverrides{.cpu_seconds = -1},
             LimitOverrides{.cpu_seconds = inf},
             LimitOverrides{.timeout_seconds = 0},
             LimitOverrides{.timeout_seconds = -inf},
         })
    {
        auto limits = limiter().compute(overrides);
        EXPECT_TRUE(limits.is_err());
    }
}
