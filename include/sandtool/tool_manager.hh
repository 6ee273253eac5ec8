#pragma once

#include "sandtool/calculator.hh"
#include "sandtool/config.hh"
#include "sandtool/executor.hh"
#include "sandtool/resource_limits.hh"
#include "sandtool/result.hh"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sandtool {

using ParamValue = std::variant<double, std::string, std::vector<TestCase>>;
using Params = std::map<std::string, ParamValue, std::less<>>;

using ToolOutput = std::variant<ExecutionResult, CalculationResult>;

struct ToolError {
    enum class Code : uint8_t {
        UnknownOperation,
        MissingParameter,
        InvalidParameter,
    } code;

    std::string message;
};

const char* to_string(ToolError::Code code) noexcept;

struct ParameterInfo {
    enum class Type : uint8_t {
        Number,
        String,
        TestCases,
    };

    std::string_view name;
    Type type;
    bool required;
    std::string_view description;
};

const char* to_string(ParameterInfo::Type type) noexcept;

struct OperationInfo {
    std::string_view name;
    std::string_view description;
    std::vector<ParameterInfo> parameters;
    // Applied when the caller does not override them; only for operations running scripts
    std::optional<ResourceLimits> default_limits;
    // Upper bound of the operation's own running time, without admission wait
    std::chrono::nanoseconds time_limit;
};

// Dispatches named operations to the executor and the calculator. Safe to use concurrently.
class ToolManager {
    using Handler = Result<ToolOutput, ToolError> (ToolManager::*)(const Params&) const;

    struct Operation {
        OperationInfo info;
        Handler handler;
    };

    Calculator calculator_;
    Executor executor_;
    std::vector<Operation> operations_;

    Result<ToolOutput, ToolError> run_execute(const Params& params) const;
    Result<ToolOutput, ToolError> run_calculate(const Params& params) const;
    Result<ToolOutput, ToolError> run_solve_quadratic(const Params& params) const;
    Result<ToolOutput, ToolError> run_verify_solution(const Params& params) const;

public:
    explicit ToolManager(const Config& config);

    ToolManager(const ToolManager&) = delete;
    ToolManager(ToolManager&&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;
    ToolManager& operator=(ToolManager&&) = delete;
    ~ToolManager() = default;

    // Parameters are checked against the operation's metadata before dispatch: missing required
    // parameters, parameters of a wrong type and unknown parameters are errors
    [[nodiscard]] Result<ToolOutput, ToolError>
    invoke(std::string_view operation, const Params& params) const;

    // Runs invoke() on its own thread; *this has to outlive the returned future
    [[nodiscard]] std::future<Result<ToolOutput, ToolError>>
    invoke_async(std::string operation, Params params) const;

    [[nodiscard]] std::vector<OperationInfo> capabilities() const;

    // nullptr if there is no such operation
    [[nodiscard]] const OperationInfo* find_operation(std::string_view name) const noexcept;

    [[nodiscard]] const Executor& executor() const noexcept { return executor_; }

    [[nodiscard]] const Calculator& calculator() const noexcept { return calculator_; }
};

} // namespace sandtool
