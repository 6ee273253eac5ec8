#include "sandtool/concat_tostr.hh"
#include "sandtool/debug.hh"
#include "sandtool/resource_limits.hh"

#include <algorithm>
#include <cmath>

using std::chrono::duration;
using std::chrono::duration_cast;
using std::chrono::nanoseconds;

namespace {

constexpr DebugLogger<debug_logging_enabled> debuglog{};

constexpr uint64_t mib = 1 << 20;

std::string seconds_str(nanoseconds ns) {
    return concat_tostr(duration<double>{ns}.count(), " s");
}

} // namespace

namespace sandtool {

std::string ResourceLimits::description() const {
    return concat_tostr(
        "memory: ", memory_limit_in_bytes_ / mib, " MiB, cpu: ", seconds_str(cpu_time_limit_),
        ", wall: ", seconds_str(real_time_limit_), ", grace: ", seconds_str(kill_grace_period_),
        ", output: ", output_size_limit_in_bytes_, " B");
}

ResourceLimits ResourceLimiter::defaults() const noexcept {
    return {
        config_.default_memory_mb * mib,
        config_.default_cpu_time,
        config_.default_timeout,
        config_.kill_grace_period,
        config_.output_size_limit_bytes,
    };
}

Result<ResourceLimits, std::string> ResourceLimiter::compute(const LimitOverrides& overrides
) const {
    auto invalid = [](std::optional<double> val) {
        return val and (not std::isfinite(*val) or *val <= 0);
    };
    if (invalid(overrides.memory_mb)) {
        return Err{concat_tostr("memory limit has to be a positive number of MiB, got ",
            *overrides.memory_mb)};
    }
    if (invalid(overrides.cpu_seconds)) {
        return Err{concat_tostr("CPU time limit has to be a positive number of seconds, got ",
            *overrides.cpu_seconds)};
    }
    if (invalid(overrides.timeout_seconds)) {
        return Err{concat_tostr("timeout has to be a positive number of seconds, got ",
            *overrides.timeout_seconds)};
    }

    auto to_duration = [](double secs) {
        return duration_cast<nanoseconds>(duration<double>{secs});
    };

    uint64_t memory = config_.default_memory_mb * mib;
    if (overrides.memory_mb) {
        double bytes = std::clamp(*overrides.memory_mb, static_cast<double>(config_.min_memory_mb),
                           static_cast<double>(config_.max_memory_mb)) *
            static_cast<double>(mib);
        memory = static_cast<uint64_t>(bytes);
    }

    nanoseconds timeout = config_.default_timeout;
    if (overrides.timeout_seconds) {
        timeout = std::min(
            to_duration(std::min(*overrides.timeout_seconds, 1e9)), config_.max_timeout);
    }

    nanoseconds cpu_time = config_.default_cpu_time;
    if (overrides.cpu_seconds) {
        cpu_time =
            std::min(to_duration(std::min(*overrides.cpu_seconds, 1e9)), config_.max_cpu_time);
    } else if (overrides.timeout_seconds) {
        // A single timeout governs both clocks
        cpu_time = std::min(timeout, config_.max_cpu_time);
    }

    ResourceLimits limits{
        memory, cpu_time, timeout, config_.kill_grace_period, config_.output_size_limit_bytes};
    debuglog("resource limits: ", limits.description());
    return Ok{limits};
}

} // namespace sandtool
