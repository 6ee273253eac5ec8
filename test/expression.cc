#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <numbers>
#include <sandtool/expression.hh>

using namespace std::chrono_literals;
using sandtool::ValidationVerdict;
namespace expr = sandtool::expr;

namespace {

double eval(std::string_view text, const expr::Variables& vars = {}) {
    expr::ParseOptions options;
    for (const auto& [name, val] : vars) {
        options.variables.emplace_back(name);
    }
    auto tree = expr::parse(text, options);
    return expr::evaluate(
        *tree,
        {
            .max_magnitude = 1e100,
            .max_factorial_argument = 1000,
            .max_exponent = 1000,
            .deadline = std::chrono::steady_clock::now() + 5s,
        },
        vars);
}

ValidationVerdict::Reason rejection_reason(std::string_view text) {
    try {
        eval(text);
    } catch (const expr::Rejected& e) {
        return e.reason();
    }
    return ValidationVerdict::Reason::None;
}

} // namespace

// NOLINTNEXTLINE
TEST(expression, arithmetic) {
    EXPECT_EQ(eval("1 + 2 * 3"), 7);
    EXPECT_EQ(eval("(1 + 2) * 3"), 9);
    EXPECT_EQ(eval("7 / 2"), 3.5);
    EXPECT_EQ(eval("7 // 2"), 3);
    EXPECT_EQ(eval("-7 // 2"), -4);
    EXPECT_EQ(eval("-7 % 3"), 2);
    EXPECT_EQ(eval("7 % -3"), -2);
    EXPECT_EQ(eval("-3 - -3"), 0);
    EXPECT_EQ(eval("1.5e2 + .5"), 150.5);
}

// NOLINTNEXTLINE
TEST(expression, power_is_right_associative) {
    EXPECT_EQ(eval("2 ** 3 ** 2"), 512);
    EXPECT_EQ(eval("2 ^ 3 ^ 2"), 512);
    EXPECT_EQ(eval("-2 ** 2"), -4);
    EXPECT_EQ(eval("2 ** -1"), 0.5);
}

// NOLINTNEXTLINE
TEST(expression, implicit_multiplication) {
    EXPECT_EQ(eval("2x", {{"x", 3}}), 6);
    EXPECT_EQ(eval("2(3 + 1)"), 8);
    EXPECT_EQ(eval("(1 + 1)(2 + 2)"), 8);
    EXPECT_EQ(eval("3x^2", {{"x", 2}}), 12);
    EXPECT_DOUBLE_EQ(eval("2pi"), 2 * std::numbers::pi);
}

// NOLINTNEXTLINE
TEST(expression, functions_and_constants) {
    EXPECT_EQ(eval("sqrt(16)"), 4);
    EXPECT_EQ(eval("abs(-3)"), 3);
    EXPECT_EQ(eval("max(1, 5, 3)"), 5);
    EXPECT_EQ(eval("min(4, 2)"), 2);
    EXPECT_EQ(eval("factorial(5)"), 120);
    EXPECT_EQ(eval("gcd(12, 18)"), 6);
    EXPECT_EQ(eval("lcm(4, 6)"), 12);
    EXPECT_EQ(eval("pow(2, 10)"), 1024);
    EXPECT_EQ(eval("floor(2.7) + ceil(2.2)"), 5);
    EXPECT_DOUBLE_EQ(eval("cos(pi)"), -1);
    EXPECT_DOUBLE_EQ(eval("log(e)"), 1);
    EXPECT_DOUBLE_EQ(eval("log(8, 2)"), 3);
    EXPECT_DOUBLE_EQ(eval("tau / 2"), std::numbers::pi);
    EXPECT_TRUE(expr::is_function_name("sqrt"));
    EXPECT_FALSE(expr::is_function_name("x"));
    EXPECT_TRUE(expr::is_constant_name("pi"));
}

// NOLINTNEXTLINE
TEST(expression, comparisons) {
    EXPECT_EQ(eval("1 < 2"), 1);
    EXPECT_EQ(eval("1 < 2 < 3"), 1);
    EXPECT_EQ(eval("1 < 3 < 2"), 0);
    EXPECT_EQ(eval("2 == 2.0"), 1);
    EXPECT_EQ(eval("2 != 2"), 0);
}

// NOLINTNEXTLINE
TEST(expression, equation) {
    auto eq = expr::parse_equation("x^2 + 5x + 6 = 0", {.variables = {"x"}});
    ASSERT_TRUE(eq.lhs);
    ASSERT_TRUE(eq.rhs);
    auto single = expr::parse_equation("x + 1", {.variables = {"x"}});
    EXPECT_FALSE(single.rhs);
    EXPECT_THROW(expr::parse("x = 1", {.variables = {"x"}}), expr::ParseError);
}

// NOLINTNEXTLINE
TEST(expression, parse_errors) {
    EXPECT_THROW(eval(""), expr::ParseError);
    EXPECT_THROW(eval("1 +"), expr::ParseError);
    EXPECT_THROW(eval("(1 + 2"), expr::ParseError);
    EXPECT_THROW(eval("1 + 2)"), expr::ParseError);
    EXPECT_THROW(eval("1 $ 2"), expr::ParseError);
    EXPECT_THROW(eval("max(1,)"), expr::ParseError);
    try {
        eval("1 + * 2");
        FAIL() << "expected ParseError";
    } catch (const expr::ParseError& e) {
        EXPECT_EQ(e.position(), 4U);
    }
}

// NOLINTNEXTLINE
TEST(expression, rejected_constructs) {
    using Reason = ValidationVerdict::Reason;
    EXPECT_EQ(rejection_reason("factorial(1001)"), Reason::NumericLimit);
    EXPECT_EQ(rejection_reason("2 ** 1001"), Reason::NumericLimit);
    EXPECT_EQ(rejection_reason("10 ** 200"), Reason::NumericLimit);
    EXPECT_EQ(rejection_reason("1e101"), Reason::NumericLimit);
    EXPECT_EQ(rejection_reason("y + 1"), Reason::ForbiddenConstruct);
    EXPECT_EQ(rejection_reason("sqrt"), Reason::ForbiddenConstruct);
    EXPECT_EQ(rejection_reason("sqrt(1, 2)"), Reason::ForbiddenConstruct);
    EXPECT_EQ(rejection_reason(std::string(100, '(') + "1" + std::string(100, ')')),
        Reason::NestingTooDeep);
    EXPECT_EQ(rejection_reason(std::string(10, '(') + "1" + std::string(10, ')')), Reason::None);
}

// NOLINTNEXTLINE
TEST(expression, domain_errors) {
    EXPECT_THROW(eval("1 / 0"), expr::DomainError);
    EXPECT_THROW(eval("1 // 0"), expr::DomainError);
    EXPECT_THROW(eval("1 % 0"), expr::DomainError);
    EXPECT_THROW(eval("sqrt(-1)"), expr::DomainError);
    EXPECT_THROW(eval("log(0)"), expr::DomainError);
    EXPECT_THROW(eval("factorial(2.5)"), expr::DomainError);
    EXPECT_THROW(eval("factorial(-1)"), expr::DomainError);
    EXPECT_THROW(eval("0 ** -1"), expr::DomainError);
    EXPECT_THROW(eval("(-8) ** 0.5"), expr::DomainError);
}

// NOLINTNEXTLINE
TEST(expression, timeout) {
    auto tree = expr::parse("factorial(100)", {});
    EXPECT_THROW(
        expr::evaluate(
            *tree,
            {
                .max_magnitude = 1e300,
                .max_factorial_argument = 1000,
                .max_exponent = 1000,
                .deadline = std::chrono::steady_clock::now() - 1s,
            },
            {}),
        expr::Timeout);
}
