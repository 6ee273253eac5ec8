#include "sandtool/concat_tostr.hh"
#include "sandtool/debug.hh"
#include "sandtool/logger.hh"
#include "sandtool/tool_manager.hh"

#include <algorithm>
#include <exception>

using std::optional;
using std::string;
using std::string_view;

namespace {

constexpr DebugLogger<debug_logging_enabled> debuglog{};

Err<sandtool::ToolError> tool_error(sandtool::ToolError::Code code, string message) {
    return Err{sandtool::ToolError{.code = code, .message = std::move(message)}};
}

template <class T>
const T* get_param(const sandtool::Params& params, string_view name) noexcept {
    auto it = params.find(name);
    return it == params.end() ? nullptr : std::get_if<T>(&it->second);
}

optional<double> get_number(const sandtool::Params& params, string_view name) noexcept {
    if (const auto* num = get_param<double>(params, name)) {
        return *num;
    }
    return std::nullopt;
}

bool has_type(const sandtool::ParamValue& value, sandtool::ParameterInfo::Type type) noexcept {
    using Type = sandtool::ParameterInfo::Type;
    switch (type) {
    case Type::Number: return std::holds_alternative<double>(value);
    case Type::String: return std::holds_alternative<string>(value);
    case Type::TestCases: return std::holds_alternative<std::vector<sandtool::TestCase>>(value);
    }
    return false;
}

} // namespace

namespace sandtool {

const char* to_string(ToolError::Code code) noexcept {
    switch (code) {
    case ToolError::Code::UnknownOperation: return "UnknownOperation";
    case ToolError::Code::MissingParameter: return "MissingParameter";
    case ToolError::Code::InvalidParameter: return "InvalidParameter";
    }
    return "unknown";
}

const char* to_string(ParameterInfo::Type type) noexcept {
    switch (type) {
    case ParameterInfo::Type::Number: return "number";
    case ParameterInfo::Type::String: return "string";
    case ParameterInfo::Type::TestCases: return "test cases";
    }
    return "unknown";
}

ToolManager::ToolManager(const Config& config)
: calculator_{config}
, executor_{config} {
    using Type = ParameterInfo::Type;
    auto default_limits = executor_.default_limits();
    // Whole request in the worst case: the last run started just before the request deadline
    // reaches it and needs the grace period
    auto script_time_limit = config.sandbox.request_timeout + config.sandbox.kill_grace_period;

    operations_ = {
        {
            .info =
                {
                    .name = "execute",
                    .description =
                        "Runs a script in an isolated process, optionally once per test case",
                    .parameters =
                        {
                            {"code", Type::String, true, "script source"},
                            {"testCases", Type::TestCases, false,
                             "inputs fed on stdin and as input_data, with the expected outputs"},
                            {"timeoutSeconds", Type::Number, false, "wall-clock limit per run"},
                            {"memoryMb", Type::Number, false, "memory limit per run"},
                            {"cpuSeconds", Type::Number, false, "CPU time limit per run"},
                        },
                    .default_limits = default_limits,
                    .time_limit = script_time_limit,
                },
            .handler = &ToolManager::run_execute,
        },
        {
            .info =
                {
                    .name = "calculate",
                    .description = "Evaluates a restricted arithmetic expression",
                    .parameters = {{"expression", Type::String, true, "expression to evaluate"}},
                    .default_limits = std::nullopt,
                    .time_limit = config.calculator.timeout,
                },
            .handler = &ToolManager::run_calculate,
        },
        {
            .info =
                {
                    .name = "solve_quadratic",
                    .description = "Finds the roots of ax^2 + bx + c = 0",
                    .parameters =
                        {
                            {"a", Type::Number, true, "coefficient of x^2"},
                            {"b", Type::Number, true, "coefficient of x"},
                            {"c", Type::Number, true, "constant term"},
                        },
                    .default_limits = std::nullopt,
                    .time_limit = config.calculator.timeout,
                },
            .handler = &ToolManager::run_solve_quadratic,
        },
        {
            .info =
                {
                    .name = "verify_solution",
                    .description = "Checks whether a value satisfies an expression or equation",
                    .parameters =
                        {
                            {"expression", Type::String, true, "\"lhs\" or \"lhs = rhs\""},
                            {"variable", Type::String, true, "name bound to the value"},
                            {"value", Type::Number, true, "candidate solution"},
                            {"tolerance", Type::Number, false, "maximum |lhs - rhs|"},
                        },
                    .default_limits = std::nullopt,
                    .time_limit = config.calculator.timeout,
                },
            .handler = &ToolManager::run_verify_solution,
        },
    };
}

std::vector<OperationInfo> ToolManager::capabilities() const {
    std::vector<OperationInfo> res;
    res.reserve(operations_.size());
    for (const auto& op : operations_) {
        res.emplace_back(op.info);
    }
    return res;
}

const OperationInfo* ToolManager::find_operation(string_view name) const noexcept {
    auto it = std::find_if(operations_.begin(), operations_.end(), [name](const Operation& op) {
        return op.info.name == name;
    });
    return it == operations_.end() ? nullptr : &it->info;
}

Result<ToolOutput, ToolError>
ToolManager::invoke(string_view operation, const Params& params) const {
    auto it = std::find_if(operations_.begin(), operations_.end(), [&](const Operation& op) {
        return op.info.name == operation;
    });
    if (it == operations_.end()) {
        return tool_error(
            ToolError::Code::UnknownOperation, concat_tostr("unknown operation: ", operation));
    }
    const auto& info = it->info;

    for (const auto& param : info.parameters) {
        auto pit = params.find(param.name);
        if (pit == params.end()) {
            if (param.required) {
                return tool_error(
                    ToolError::Code::MissingParameter,
                    concat_tostr(info.name, ": missing parameter: ", param.name));
            }
            continue;
        }
        if (not has_type(pit->second, param.type)) {
            return tool_error(
                ToolError::Code::InvalidParameter,
                concat_tostr(
                    info.name, ": parameter ", param.name, " has to be a ",
                    to_string(param.type)));
        }
    }
    for (const auto& [name, value] : params) {
        bool known = std::any_of(
            info.parameters.begin(), info.parameters.end(),
            [&name = name](const ParameterInfo& param) { return param.name == name; });
        if (not known) {
            return tool_error(
                ToolError::Code::InvalidParameter,
                concat_tostr(info.name, ": unknown parameter: ", name));
        }
    }

    debuglog("tool manager: invoking ", info.name);
    try {
        return (this->*it->handler)(params);
    } catch (const std::exception& e) {
        errlog("tool manager: ", info.name, " failed: ", e.what());
        if (info.name == "execute") {
            return Ok{ToolOutput{ExecutionResult{
                .status = ExecutionStatus::InternalError,
                .comment = concat_tostr("Internal error: ", e.what()),
            }}};
        }
        return Ok{ToolOutput{CalculationResult{
            .status = CalculationResult::Status::InternalError,
            .comment = concat_tostr("Internal error: ", e.what()),
        }}};
    }
}

std::future<Result<ToolOutput, ToolError>>
ToolManager::invoke_async(string operation, Params params) const {
    return std::async(
        std::launch::async,
        [this, operation = std::move(operation), params = std::move(params)] {
            return invoke(operation, params);
        });
}

Result<ToolOutput, ToolError> ToolManager::run_execute(const Params& params) const {
    ExecutionRequest req{
        .code = *get_param<string>(params, "code"),
        .test_cases = {},
        .limits =
            {
                .memory_mb = get_number(params, "memoryMb"),
                .cpu_seconds = get_number(params, "cpuSeconds"),
                .timeout_seconds = get_number(params, "timeoutSeconds"),
            },
    };
    if (const auto* tests = get_param<std::vector<TestCase>>(params, "testCases")) {
        req.test_cases = *tests;
    }
    return Ok{ToolOutput{executor_.execute(req)}};
}

Result<ToolOutput, ToolError> ToolManager::run_calculate(const Params& params) const {
    return Ok{ToolOutput{calculator_.evaluate(*get_param<string>(params, "expression"))}};
}

Result<ToolOutput, ToolError> ToolManager::run_solve_quadratic(const Params& params) const {
    return Ok{ToolOutput{calculator_.solve_quadratic(
        *get_number(params, "a"), *get_number(params, "b"), *get_number(params, "c"))}};
}

Result<ToolOutput, ToolError> ToolManager::run_verify_solution(const Params& params) const {
    return Ok{ToolOutput{calculator_.verify_solution(
        *get_param<string>(params, "expression"), *get_param<string>(params, "variable"),
        *get_number(params, "value"),
        get_number(params, "tolerance").value_or(Calculator::default_tolerance))}};
}

} // namespace sandtool
