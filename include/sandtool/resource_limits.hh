#pragma once

#include "sandtool/config.hh"
#include "sandtool/result.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sandtool {

// Limits applied to one isolated run; immutable once computed
class ResourceLimits {
    uint64_t memory_limit_in_bytes_;
    std::chrono::nanoseconds cpu_time_limit_;
    std::chrono::nanoseconds real_time_limit_;
    std::chrono::nanoseconds kill_grace_period_;
    uint64_t output_size_limit_in_bytes_;

public:
    ResourceLimits(
        uint64_t memory_limit_in_bytes, std::chrono::nanoseconds cpu_time_limit,
        std::chrono::nanoseconds real_time_limit, std::chrono::nanoseconds kill_grace_period,
        uint64_t output_size_limit_in_bytes) noexcept
    : memory_limit_in_bytes_{memory_limit_in_bytes}
    , cpu_time_limit_{cpu_time_limit}
    , real_time_limit_{real_time_limit}
    , kill_grace_period_{kill_grace_period}
    , output_size_limit_in_bytes_{output_size_limit_in_bytes} {}

    [[nodiscard]] uint64_t memory_limit_in_bytes() const noexcept {
        return memory_limit_in_bytes_;
    }

    [[nodiscard]] std::chrono::nanoseconds cpu_time_limit() const noexcept {
        return cpu_time_limit_;
    }

    [[nodiscard]] std::chrono::nanoseconds real_time_limit() const noexcept {
        return real_time_limit_;
    }

    [[nodiscard]] std::chrono::nanoseconds kill_grace_period() const noexcept {
        return kill_grace_period_;
    }

    [[nodiscard]] uint64_t output_size_limit_in_bytes() const noexcept {
        return output_size_limit_in_bytes_;
    }

    // Isolated units may not create any process besides themselves
    [[nodiscard]] static constexpr unsigned max_extra_processes() noexcept { return 0; }

    [[nodiscard]] static constexpr bool file_writes_allowed() noexcept { return false; }

    bool operator==(const ResourceLimits&) const = default;

    // E.g. "memory: 128 MiB, cpu: 5 s, wall: 5 s, grace: 1 s, output: 65536 B"
    [[nodiscard]] std::string description() const;
};

struct LimitOverrides {
    std::optional<double> memory_mb;
    std::optional<double> cpu_seconds;
    std::optional<double> timeout_seconds;
};

// Computes the limits of a request from the configured defaults and ceilings
class ResourceLimiter {
    Config::Sandbox config_;

public:
    explicit ResourceLimiter(const Config::Sandbox& config) noexcept
    : config_{config} {}

    [[nodiscard]] ResourceLimits defaults() const noexcept;

    // Values above the configured ceilings are clamped, memory below the configured floor is
    // raised to it; non-positive or non-finite values yield an error message
    [[nodiscard]] Result<ResourceLimits, std::string>
    compute(const LimitOverrides& overrides) const;
};

} // namespace sandtool
