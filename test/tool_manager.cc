#include <chrono>
#include <gtest/gtest.h>
#include <sandtool/tool_manager.hh>

using namespace std::chrono_literals;
using sandtool::CalculationResult;
using sandtool::Config;
using sandtool::ExecutionResult;
using sandtool::ExecutionStatus;
using sandtool::Params;
using sandtool::ParameterInfo;
using sandtool::TestCase;
using sandtool::ToolError;
using sandtool::ToolManager;

namespace {

const ToolManager& tools() {
    static const ToolManager manager{Config::defaults()};
    return manager;
}

template <class T>
T invoke_ok(std::string_view operation, const Params& params) {
    auto res = tools().invoke(operation, params);
    if (res.is_err()) {
        ADD_FAILURE() << res.unwrap_err().message;
        return T{};
    }
    if (not std::holds_alternative<T>(*res)) {
        ADD_FAILURE() << "unexpected output type";
        return T{};
    }
    return std::get<T>(std::move(*res));
}

ToolError::Code invoke_err(std::string_view operation, const Params& params) {
    auto res = tools().invoke(operation, params);
    if (res.is_ok()) {
        ADD_FAILURE() << "expected an error";
        return ToolError::Code::UnknownOperation;
    }
    return res.unwrap_err().code;
}

} // namespace

// NOLINTNEXTLINE
TEST(tool_manager, capabilities) {
    auto caps = tools().capabilities();
    ASSERT_EQ(caps.size(), 4U);
    EXPECT_EQ(caps[0].name, "execute");
    EXPECT_EQ(caps[1].name, "calculate");
    EXPECT_EQ(caps[2].name, "solve_quadratic");
    EXPECT_EQ(caps[3].name, "verify_solution");

    const auto* execute = tools().find_operation("execute");
    ASSERT_NE(execute, nullptr);
    ASSERT_TRUE(execute->default_limits);
    EXPECT_EQ(execute->default_limits->real_time_limit(), 5s);
    EXPECT_EQ(execute->default_limits->memory_limit_in_bytes(), 128U << 20);
    ASSERT_FALSE(execute->parameters.empty());
    EXPECT_EQ(execute->parameters[0].name, "code");
    EXPECT_EQ(execute->parameters[0].type, ParameterInfo::Type::String);
    EXPECT_TRUE(execute->parameters[0].required);
    // Request deadline plus the grace period of the last run
    EXPECT_EQ(execute->time_limit, 61s);

    const auto* verify = tools().find_operation("verify_solution");
    ASSERT_NE(verify, nullptr);
    EXPECT_FALSE(verify->default_limits);
    EXPECT_EQ(verify->time_limit, 5s);
    ASSERT_EQ(verify->parameters.size(), 4U);
    EXPECT_EQ(verify->parameters[3].name, "tolerance");
    EXPECT_FALSE(verify->parameters[3].required);

    EXPECT_EQ(tools().find_operation("shell"), nullptr);
}

// NOLINTNEXTLINE
TEST(tool_manager, calculate) {
    auto res = invoke_ok<CalculationResult>("calculate", {{"expression", "6 * 7"}});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.value, 42);
}

// NOLINTNEXTLINE
TEST(tool_manager, calculate_rejection_is_a_result) {
    auto res = invoke_ok<CalculationResult>("calculate", {{"expression", "factorial(1001)"}});
    EXPECT_EQ(res.status, CalculationResult::Status::Rejected);
}

// NOLINTNEXTLINE
TEST(tool_manager, solve_quadratic) {
    auto res = invoke_ok<CalculationResult>("solve_quadratic", {{"a", 1.0}, {"b", 5.0}, {"c", 6.0}});
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.roots.size(), 2U);
    EXPECT_EQ(res.roots[0].real(), -2);
    EXPECT_EQ(res.roots[1].real(), -3);
}

// NOLINTNEXTLINE
TEST(tool_manager, verify_solution) {
    auto res = invoke_ok<CalculationResult>(
        "verify_solution", {{"expression", "x^2 + 5x + 6"}, {"variable", "x"}, {"value", -3.0}});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.verified, true);

    auto loose = invoke_ok<CalculationResult>(
        "verify_solution",
        {{"expression", "x^2 = 2"}, {"variable", "x"}, {"value", 1.41}, {"tolerance", 0.1}});
    ASSERT_TRUE(loose.ok());
    EXPECT_EQ(loose.verified, true);
}

// NOLINTNEXTLINE
TEST(tool_manager, execute_rejected_without_running) {
    auto res = invoke_ok<ExecutionResult>("execute", {{"code", "import subprocess"}});
    EXPECT_EQ(res.status, ExecutionStatus::Rejected);
}

// NOLINTNEXTLINE
TEST(tool_manager, execute) {
    if (not tools().executor().is_supported()) {
        GTEST_SKIP() << "python interpreter is not available";
    }
    auto res = invoke_ok<ExecutionResult>(
        "execute",
        {
            {"code", "print(input()[::-1])"},
            {"testCases", std::vector<TestCase>{{.input = "abc", .expected_output = "cba"}}},
            {"timeoutSeconds", 3.0},
            {"memoryMb", 1e6},
        });
    EXPECT_EQ(res.status, ExecutionStatus::Completed) << res.comment;
    EXPECT_TRUE(res.all_passed);
    ASSERT_TRUE(res.limits);
    EXPECT_EQ(res.limits->real_time_limit(), 3s);
    // Clamped to the ceiling
    EXPECT_EQ(res.limits->memory_limit_in_bytes(), 512U << 20);
}

// NOLINTNEXTLINE
TEST(tool_manager, parameter_errors) {
    EXPECT_EQ(invoke_err("format_disk", {}), ToolError::Code::UnknownOperation);
    EXPECT_EQ(invoke_err("calculate", {}), ToolError::Code::MissingParameter);
    EXPECT_EQ(invoke_err("calculate", {{"expression", 1.0}}), ToolError::Code::InvalidParameter);
    EXPECT_EQ(
        invoke_err("calculate", {{"expression", "1"}, {"precision", 3.0}}),
        ToolError::Code::InvalidParameter);
    EXPECT_EQ(invoke_err("solve_quadratic", {{"a", 1.0}, {"b", 2.0}}),
        ToolError::Code::MissingParameter);
    EXPECT_EQ(invoke_err("solve_quadratic", {{"a", "1"}, {"b", 2.0}, {"c", 3.0}}),
        ToolError::Code::InvalidParameter);
    EXPECT_EQ(invoke_err("execute", {{"code", "print(1)"}, {"testCases", "none"}}),
        ToolError::Code::InvalidParameter);
    EXPECT_EQ(invoke_err("execute", {{"timeoutSeconds", 1.0}}), ToolError::Code::MissingParameter);

    auto res = tools().invoke("calculate", {});
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.unwrap_err().message, "calculate: missing parameter: expression");
    EXPECT_STREQ(to_string(res.unwrap_err().code), "MissingParameter");
}

// NOLINTNEXTLINE
TEST(tool_manager, invoke_async) {
    auto a = tools().invoke_async("calculate", {{"expression", "2 ** 10"}});
    auto b = tools().invoke_async("solve_quadratic", {{"a", 1.0}, {"b", 2.0}, {"c", 1.0}});
    auto c = tools().invoke_async("nope", {});
    auto ra = a.get();
    ASSERT_TRUE(ra.is_ok());
    EXPECT_EQ(std::get<CalculationResult>(*ra).value, 1024);
    auto rb = b.get();
    ASSERT_TRUE(rb.is_ok());
    EXPECT_EQ(std::get<CalculationResult>(*rb).roots.size(), 1U);
    auto rc = c.get();
    ASSERT_TRUE(rc.is_err());
    EXPECT_EQ(rc.unwrap_err().code, ToolError::Code::UnknownOperation);
}
