#pragma once

#include "sandtool/admission_control.hh"
#include "sandtool/config.hh"
#include "sandtool/errors.hh"
#include "sandtool/resource_limits.hh"
#include "sandtool/validator.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sandtool {

struct TestCase {
    std::string input; // provided on stdin
    std::string expected_output;
};

struct ExecutionRequest {
    std::string code;
    std::vector<TestCase> test_cases;
    LimitOverrides limits;
};

// Sorted by decreasing priority
enum class ExecutionStatus : uint8_t {
    InternalError,
    Rejected,
    TimedOut,
    ResourceExceeded,
    Crashed,
    Completed,
};

const char* to_string(ExecutionStatus status) noexcept;

// Must not be called with ExecutionStatus::Completed
ErrorKind error_kind(ExecutionStatus status);

// Explains which safety mechanism was triggered
struct SafetyFlags {
    bool validation_rejected = false;
    bool wall_time_limit = false;
    bool cpu_time_limit = false;
    bool memory_limit = false;
    bool output_size_limit = false;
    bool file_size_limit = false;
    bool killed_after_grace_period = false;

    [[nodiscard]] bool any() const noexcept;

    void merge(const SafetyFlags& other) noexcept;

    // E.g. "WallTimeLimit, KilledAfterGracePeriod"; empty if no flag is set
    [[nodiscard]] std::string description() const;

    bool operator==(const SafetyFlags&) const = default;
};

struct TestCaseReport {
    size_t index;
    bool passed;
    ExecutionStatus status;
    std::string actual_output;
    std::string expected_output;
    std::chrono::nanoseconds runtime;
    std::string comment;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::InternalError;
    ValidationVerdict verdict;
    // Output of the last run, capped by the output size limit
    std::string stdout_data;
    std::string stderr_data;
    // repr() of the value of a source that is a single expression, from the last run
    std::optional<std::string> expression_value;
    std::vector<TestCaseReport> test_cases;
    size_t passed_count = 0;
    bool all_passed = false;
    std::chrono::nanoseconds runtime{0}; // whole request
    std::chrono::nanoseconds cpu_time{0}; // sum over runs
    uint64_t peak_memory_in_bytes = 0; // maximum over runs
    std::optional<ResourceLimits> limits;
    SafetyFlags flags;
    std::string comment;

    [[nodiscard]] ErrorKind error_kind() const { return sandtool::error_kind(status); }
};

// Runs untrusted scripts: validate -> compute limits -> admit -> run each test case in a fresh
// isolated process -> report. Safe to use concurrently.
class Executor {
    Config::Sandbox config_;
    Validator validator_;
    ResourceLimiter limiter_;
    mutable AdmissionControl admission_;

public:
    explicit Executor(const Config& config);

    Executor(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor& operator=(Executor&&) = delete;
    ~Executor() = default;

    // Infrastructure failures are reported as ExecutionStatus::InternalError
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request) const;

    [[nodiscard]] ResourceLimits default_limits() const noexcept { return limiter_.defaults(); }

    [[nodiscard]] bool is_supported() const;

    AdmissionControl& admission_control() const noexcept { return admission_; }
};

} // namespace sandtool
