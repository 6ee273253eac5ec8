#include "sandtool/concat_tostr.hh"
#include "sandtool/debug.hh"
#include "sandtool/executor.hh"
#include "sandtool/language_suite/python.hh"
#include "sandtool/logger.hh"
#include "sandtool/macros/throw.hh"

#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <string_view>

using std::chrono::steady_clock;

namespace {

constexpr DebugLogger<debug_logging_enabled> debuglog{};

constexpr uint64_t max_stack_size = 8 << 20;

// State automaton of a request:
//
// --> PENDING --> VALIDATING --> REJECTED ----------------------------------.
//                     |                                                     |
//                     v                    ,--> COMPLETED -----------------.|
//                  SPAWNING --> RUNNING ---+--> TIMED_OUT ----------------.||
//                     |            |       |--> KILLED (limit exceeded) -.|||
//                     |            |       `--> CRASHED ----------------.||||
//                     |            v                                    vvvvv
//                     `-------> FAILED (internal error) ------------> REPORTED
class Lifecycle {
public:
    enum State {
        PENDING,
        VALIDATING,
        REJECTED,
        SPAWNING,
        RUNNING,
        COMPLETED,
        TIMED_OUT,
        KILLED,
        CRASHED,
        FAILED,
        REPORTED,
    };

private:
    State state_ = PENDING;

    static bool allowed(State from, State to) noexcept {
        switch (from) {
        case PENDING: return to == VALIDATING;
        case VALIDATING: return to == REJECTED or to == SPAWNING;
        case SPAWNING: return to == RUNNING or to == FAILED;
        case RUNNING:
            return to == COMPLETED or to == TIMED_OUT or to == KILLED or to == CRASHED or
                to == FAILED;
        case REJECTED:
        case COMPLETED:
        case TIMED_OUT:
        case KILLED:
        case CRASHED:
        case FAILED: return to == REPORTED;
        case REPORTED: return false;
        }
        return false;
    }

public:
    [[nodiscard]] State state() const noexcept { return state_; }

    void to(State next) {
        if (not allowed(state_, next)) {
            throw std::logic_error{
                concat_tostr(
                    "invalid lifecycle transition: ", static_cast<int>(state_), " -> ",
                    static_cast<int>(next))};
        }
        state_ = next;
    }
};

Lifecycle::State terminal_state(sandtool::ExecutionStatus status) noexcept {
    using sandtool::ExecutionStatus;
    switch (status) {
    case ExecutionStatus::Completed: return Lifecycle::COMPLETED;
    case ExecutionStatus::TimedOut: return Lifecycle::TIMED_OUT;
    case ExecutionStatus::ResourceExceeded: return Lifecycle::KILLED;
    case ExecutionStatus::Crashed: return Lifecycle::CRASHED;
    case ExecutionStatus::Rejected:
    case ExecutionStatus::InternalError: break;
    }
    return Lifecycle::FAILED;
}

std::string_view trim(std::string_view str) noexcept {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto beg = str.find_first_not_of(whitespace);
    if (beg == std::string_view::npos) {
        return {};
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(beg, end - beg + 1);
}

std::string_view last_line(std::string_view str) noexcept {
    str = trim(str);
    auto pos = str.rfind('\n');
    return pos == std::string_view::npos ? str : str.substr(pos + 1);
}

struct RunReport {
    sandtool::ExecutionStatus status;
    sandtool::SafetyFlags flags;
    std::string comment;
    sandtool::sandbox::Result res;
};

RunReport classify(
    sandtool::sandbox::Result res, const sandtool::ResourceLimits& limits,
    const sandtool::language_suite::Suite& suite) {
    using sandtool::ExecutionStatus;
    RunReport report{
        .status = ExecutionStatus::Completed,
        .flags = {.killed_after_grace_period = res.killed_after_grace_period},
        .comment = {},
        .res = {},
    };
    if (res.real_time_limit_exceeded) {
        report.status = ExecutionStatus::TimedOut;
        report.flags.wall_time_limit = true;
        report.comment = "Time limit exceeded";
    } else if (res.output_size_limit_exceeded) {
        report.status = ExecutionStatus::ResourceExceeded;
        report.flags.output_size_limit = true;
        report.comment = "Output size limit exceeded";
    } else if (res.si.killed_by(SIGXCPU) or
               (res.si.killed_by(SIGKILL) and res.cpu_runtime >= limits.cpu_time_limit()))
    {
        report.status = ExecutionStatus::ResourceExceeded;
        report.flags.cpu_time_limit = true;
        report.comment = "CPU time limit exceeded";
    } else if (res.si.killed_by(SIGXFSZ)) {
        report.status = ExecutionStatus::ResourceExceeded;
        report.flags.file_size_limit = true;
        report.comment = "File size limit exceeded";
    } else if (suite.is_memory_exhaustion(res)) {
        report.status = ExecutionStatus::ResourceExceeded;
        report.flags.memory_limit = true;
        report.comment = "Memory limit exceeded";
    } else if (not res.si.exited_successfully()) {
        report.status = ExecutionStatus::Crashed;
        report.comment = concat_tostr("Runtime error: ", res.si.description());
        if (auto line = last_line(res.stderr_data); not line.empty()) {
            report.comment += concat_tostr(": ", line);
        }
    }
    report.res = std::move(res);
    return report;
}

} // namespace

namespace sandtool {

const char* to_string(ExecutionStatus status) noexcept {
    switch (status) {
    case ExecutionStatus::InternalError: return "InternalError";
    case ExecutionStatus::Rejected: return "Rejected";
    case ExecutionStatus::TimedOut: return "TimedOut";
    case ExecutionStatus::ResourceExceeded: return "ResourceExceeded";
    case ExecutionStatus::Crashed: return "Crashed";
    case ExecutionStatus::Completed: return "Completed";
    }
    return "unknown";
}

ErrorKind error_kind(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::InternalError: return ErrorKind::InternalError;
    case ExecutionStatus::Rejected: return ErrorKind::ValidationError;
    case ExecutionStatus::TimedOut: return ErrorKind::TimeoutError;
    case ExecutionStatus::ResourceExceeded: return ErrorKind::ResourceExceeded;
    case ExecutionStatus::Crashed: return ErrorKind::RuntimeFailure;
    case ExecutionStatus::Completed: break;
    }
    throw std::logic_error{"completed execution has no error kind"};
}

bool SafetyFlags::any() const noexcept { return *this != SafetyFlags{}; }

void SafetyFlags::merge(const SafetyFlags& other) noexcept {
    validation_rejected |= other.validation_rejected;
    wall_time_limit |= other.wall_time_limit;
    cpu_time_limit |= other.cpu_time_limit;
    memory_limit |= other.memory_limit;
    output_size_limit |= other.output_size_limit;
    file_size_limit |= other.file_size_limit;
    killed_after_grace_period |= other.killed_after_grace_period;
}

std::string SafetyFlags::description() const {
    std::string res;
    auto add = [&](bool flag, std::string_view name) {
        if (flag) {
            if (not res.empty()) {
                res += ", ";
            }
            res += name;
        }
    };
    add(validation_rejected, "ValidationRejected");
    add(wall_time_limit, "WallTimeLimit");
    add(cpu_time_limit, "CpuTimeLimit");
    add(memory_limit, "MemoryLimit");
    add(output_size_limit, "OutputSizeLimit");
    add(file_size_limit, "FileSizeLimit");
    add(killed_after_grace_period, "KilledAfterGracePeriod");
    return res;
}

Executor::Executor(const Config& config)
: config_{config.sandbox}
, validator_{ValidationProfile::for_scripts(config.validation)}
, limiter_{config.sandbox}
, admission_{config.sandbox.max_concurrent_sandboxes} {}

bool Executor::is_supported() const {
    return language_suite::Python{config_.python_executable}.is_supported();
}

namespace {

// @p time_limit is the per-run limit cut down to what remains of the request
RunReport run_once(
    const Config::Sandbox& config, std::string_view code, std::string_view input,
    const ResourceLimits& limits, std::chrono::nanoseconds time_limit) {
    language_suite::Python suite{config.python_executable};
    if (not suite.is_supported()) {
        THROW("Python interpreter is not available: ", config.python_executable);
    }
    suite.async_run(
        code,
        {
            .stdin_data = std::string{input},
            .time_limit = time_limit,
            .cpu_time_limit = limits.cpu_time_limit(),
            .kill_grace_period = limits.kill_grace_period(),
            .memory_limit_in_bytes = limits.memory_limit_in_bytes(),
            .max_stack_size_in_bytes = std::min(limits.memory_limit_in_bytes(), max_stack_size),
            .output_size_limit_in_bytes = limits.output_size_limit_in_bytes(),
            .working_directory = config.working_directory,
        });
    auto report = classify(suite.await_result(), limits, suite);
    debuglog(
        "executor: run finished: ", to_string(report.status), " (", report.res.si.description(),
        ", runtime: ", report.res.runtime.count(), " ns)");
    return report;
}

} // namespace

ExecutionResult Executor::execute(const ExecutionRequest& request) const {
    auto start = steady_clock::now();
    Lifecycle lifecycle;
    ExecutionResult result;

    auto reject = [&](ValidationVerdict verdict) {
        lifecycle.to(Lifecycle::REJECTED);
        result.status = ExecutionStatus::Rejected;
        result.verdict = std::move(verdict);
        result.flags.validation_rejected = true;
        result.comment = result.verdict.description();
        lifecycle.to(Lifecycle::REPORTED);
        result.runtime = steady_clock::now() - start;
        debuglog("executor: rejected: ", result.comment);
        return std::move(result);
    };

    lifecycle.to(Lifecycle::VALIDATING);
    if (auto verdict = validator_.validate(request.code); not verdict.is_safe()) {
        return reject(std::move(verdict));
    }
    auto limits = limiter_.compute(request.limits);
    if (limits.is_err()) {
        return reject(ValidationVerdict::unsafe(
            ValidationVerdict::Reason::InvalidResourceLimit, limits.unwrap_err()));
    }
    result.limits = *limits;
    if (request.test_cases.size() > config_.max_test_cases) {
        return reject(ValidationVerdict::unsafe(
            ValidationVerdict::Reason::InvalidArgument,
            concat_tostr("at most ", config_.max_test_cases, " test cases are allowed, got ",
                request.test_cases.size())));
    }

    lifecycle.to(Lifecycle::SPAWNING);
    try {
        auto ticket = admission_.admit(config_.admission_timeout);
        if (not ticket) {
            THROW("no sandbox slot became free within the admission timeout");
        }

        // One wall-clock budget for the whole request, counted from admission
        auto deadline = steady_clock::now() + config_.request_timeout;
        auto run_within_deadline = [&](std::string_view input) {
            auto remaining = deadline - steady_clock::now();
            if (remaining <= std::chrono::nanoseconds::zero()) {
                debuglog("executor: request deadline passed, not running");
                return RunReport{
                    .status = ExecutionStatus::TimedOut,
                    .flags = {.wall_time_limit = true},
                    .comment = "Request time limit exceeded",
                    .res = {},
                };
            }
            return run_once(config_, request.code, input, *limits,
                std::min<std::chrono::nanoseconds>(limits->real_time_limit(), remaining));
        };

        auto record = [&](RunReport& run) {
            result.status = std::min(result.status, run.status);
            result.flags.merge(run.flags);
            result.cpu_time += run.res.cpu_runtime;
            result.peak_memory_in_bytes =
                std::max(result.peak_memory_in_bytes, run.res.peak_rss);
            if (result.comment.empty() and run.status != ExecutionStatus::Completed) {
                result.comment = run.comment;
            }
            result.expression_value.reset();
            if (not run.res.result_data.empty()) {
                result.expression_value = std::move(run.res.result_data);
            }
            result.stdout_data = std::move(run.res.stdout_data);
            result.stderr_data = std::move(run.res.stderr_data);
        };

        result.status = ExecutionStatus::Completed;
        if (request.test_cases.empty()) {
            auto run = run_within_deadline({});
            if (lifecycle.state() == Lifecycle::SPAWNING) {
                lifecycle.to(Lifecycle::RUNNING);
            }
            record(run);
            result.all_passed = run.status == ExecutionStatus::Completed;
        } else {
            for (size_t i = 0; i < request.test_cases.size(); ++i) {
                const auto& test = request.test_cases[i];
                auto run = run_within_deadline(test.input);
                if (lifecycle.state() == Lifecycle::SPAWNING) {
                    lifecycle.to(Lifecycle::RUNNING);
                }
                bool passed = run.status == ExecutionStatus::Completed and
                    trim(run.res.stdout_data) == trim(test.expected_output);
                result.test_cases.push_back({
                    .index = i,
                    .passed = passed,
                    .status = run.status,
                    .actual_output = std::string{trim(run.res.stdout_data)},
                    .expected_output = std::string{trim(test.expected_output)},
                    .runtime = run.res.runtime,
                    .comment = run.status != ExecutionStatus::Completed ? run.comment
                        : passed                                        ? "Passed"
                                                                        : "Wrong answer",
                });
                result.passed_count += passed;
                record(run);
            }
            result.all_passed = result.passed_count == request.test_cases.size();
        }

        if (result.status == ExecutionStatus::Completed and result.comment.empty()) {
            result.comment = request.test_cases.empty()
                ? "Completed"
                : concat_tostr(result.passed_count, " of ", request.test_cases.size(),
                      " test cases passed");
        }
        lifecycle.to(terminal_state(result.status));
    } catch (const std::exception& e) {
        errlog("executor: internal error: ", e.what());
        lifecycle.to(Lifecycle::FAILED);
        result.status = ExecutionStatus::InternalError;
        result.all_passed = false;
        result.comment = concat_tostr("Internal error: ", e.what());
    }
    lifecycle.to(Lifecycle::REPORTED);
    result.runtime = steady_clock::now() - start;
    return result;
}

} // namespace sandtool
