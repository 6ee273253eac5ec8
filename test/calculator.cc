#include <complex>
#include <gtest/gtest.h>
#include <sandtool/calculator.hh>

using sandtool::CalculationResult;
using sandtool::Calculator;
using sandtool::Config;
using Status = CalculationResult::Status;
using Reason = sandtool::ValidationVerdict::Reason;

namespace {

const Calculator& calculator() {
    static const Calculator calc{Config::defaults()};
    return calc;
}

} // namespace

// NOLINTNEXTLINE
TEST(calculator, evaluate) {
    auto res = calculator().evaluate("2 + 3 * 4");
    ASSERT_TRUE(res.ok()) << res.comment;
    EXPECT_EQ(res.value, 14);
    EXPECT_TRUE(res.verdict.is_safe());
    EXPECT_GE(res.runtime.count(), 0);
}

// NOLINTNEXTLINE
TEST(calculator, evaluate_factorial_ceiling) {
    auto res = calculator().evaluate("factorial(1001)");
    EXPECT_EQ(res.status, Status::Rejected);
    EXPECT_EQ(res.verdict.reason, Reason::NumericLimit);
    EXPECT_EQ(res.value, std::nullopt);
    EXPECT_EQ(res.error_kind(), sandtool::ErrorKind::ValidationError);

    auto ok = calculator().evaluate("factorial(10)");
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value, 3628800);
}

// NOLINTNEXTLINE
TEST(calculator, evaluate_blocked_input_never_runs) {
    auto res = calculator().evaluate("__import__('os').system('true')");
    EXPECT_EQ(res.status, Status::Rejected);
    EXPECT_EQ(res.verdict.reason, Reason::BlockedToken);
    EXPECT_EQ(res.value, std::nullopt);
}

// NOLINTNEXTLINE
TEST(calculator, evaluate_too_long) {
    auto res = calculator().evaluate(std::string(2000, '1'));
    EXPECT_EQ(res.status, Status::Rejected);
    EXPECT_EQ(res.verdict.reason, Reason::InputTooLong);
}

// NOLINTNEXTLINE
TEST(calculator, evaluate_errors) {
    auto syntax = calculator().evaluate("2 +");
    EXPECT_EQ(syntax.status, Status::SyntaxError);
    EXPECT_EQ(syntax.error_kind(), sandtool::ErrorKind::SyntaxError);

    auto domain = calculator().evaluate("1 / 0");
    EXPECT_EQ(domain.status, Status::RuntimeFailure);
    EXPECT_EQ(domain.comment, "division by zero");
    EXPECT_EQ(domain.error_kind(), sandtool::ErrorKind::RuntimeFailure);

    auto nested = calculator().evaluate(std::string(65, '(') + "1" + std::string(65, ')'));
    EXPECT_EQ(nested.status, Status::Rejected);
    EXPECT_EQ(nested.verdict.reason, Reason::NestingTooDeep);
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_two_real_roots) {
    auto res = calculator().solve_quadratic(1, 5, 6);
    ASSERT_TRUE(res.ok()) << res.comment;
    EXPECT_EQ(res.equation_kind, CalculationResult::EquationKind::Quadratic);
    EXPECT_EQ(res.discriminant, 1);
    EXPECT_EQ(res.discriminant_sign, CalculationResult::DiscriminantSign::Positive);
    ASSERT_EQ(res.roots.size(), 2U);
    EXPECT_EQ(res.roots[0], std::complex<double>(-2));
    EXPECT_EQ(res.roots[1], std::complex<double>(-3));
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_repeated_root) {
    auto res = calculator().solve_quadratic(1, 2, 1);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.discriminant, 0);
    EXPECT_EQ(res.discriminant_sign, CalculationResult::DiscriminantSign::Zero);
    ASSERT_EQ(res.roots.size(), 1U);
    EXPECT_EQ(res.roots[0], std::complex<double>(-1));
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_complex_roots) {
    auto res = calculator().solve_quadratic(1, 0, 1);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.discriminant, -4);
    EXPECT_EQ(res.discriminant_sign, CalculationResult::DiscriminantSign::Negative);
    ASSERT_EQ(res.roots.size(), 2U);
    EXPECT_EQ(res.roots[0], std::complex<double>(0, 1));
    EXPECT_EQ(res.roots[1], std::complex<double>(0, -1));
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_linear_fallback) {
    auto res = calculator().solve_quadratic(0, 2, -4);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.equation_kind, CalculationResult::EquationKind::Linear);
    EXPECT_EQ(res.discriminant, std::nullopt);
    ASSERT_EQ(res.roots.size(), 1U);
    EXPECT_EQ(res.roots[0], std::complex<double>(2));

    auto degenerate = calculator().solve_quadratic(0, 0, 1);
    EXPECT_EQ(degenerate.status, Status::RuntimeFailure);
    EXPECT_TRUE(degenerate.roots.empty());
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_is_numerically_stable) {
    auto res = calculator().solve_quadratic(1, -1e8, 1);
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.roots.size(), 2U);
    EXPECT_DOUBLE_EQ(res.roots[0].real(), 1e8);
    EXPECT_DOUBLE_EQ(res.roots[1].real(), 1e-8);
}

// NOLINTNEXTLINE
TEST(calculator, solve_quadratic_magnitude_limit) {
    auto res = calculator().solve_quadratic(1e101, 0, 1);
    EXPECT_EQ(res.status, Status::Rejected);
    EXPECT_EQ(res.verdict.reason, Reason::NumericLimit);

    // Fails after the discriminant was computed; nothing of the partial work is reported
    res = calculator().solve_quadratic(1e-250, 0, 1);
    EXPECT_EQ(res.status, Status::Rejected) << res.comment;
    EXPECT_EQ(res.verdict.reason, Reason::NumericLimit);
    EXPECT_FALSE(res.equation_kind);
    EXPECT_FALSE(res.discriminant);
    EXPECT_FALSE(res.discriminant_sign);
    EXPECT_TRUE(res.roots.empty());
}

// NOLINTNEXTLINE
TEST(calculator, verify_solution) {
    for (double root : {-2.0, -3.0}) {
        auto res = calculator().verify_solution("x^2 + 5x + 6", "x", root);
        ASSERT_TRUE(res.ok()) << res.comment;
        EXPECT_EQ(res.verified, true);
        EXPECT_EQ(res.residual, 0);
    }
    auto wrong = calculator().verify_solution("x^2 + 5x + 6", "x", 1);
    ASSERT_TRUE(wrong.ok());
    EXPECT_EQ(wrong.verified, false);
    EXPECT_EQ(wrong.residual, 12);
}

// NOLINTNEXTLINE
TEST(calculator, verify_solution_equation_form) {
    auto res = calculator().verify_solution("2t + 1 = 7", "t", 3);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.verified, true);

    auto approx = calculator().verify_solution("x * x = 2", "x", 1.4142, 1e-3);
    ASSERT_TRUE(approx.ok());
    EXPECT_EQ(approx.verified, true);

    auto strict = calculator().verify_solution("x * x = 2", "x", 1.4142);
    ASSERT_TRUE(strict.ok());
    EXPECT_EQ(strict.verified, false);
}

// NOLINTNEXTLINE
TEST(calculator, verify_solution_invalid_arguments) {
    for (auto variable : {"", "2x", "sqrt", "pi", "x y"}) {
        auto res = calculator().verify_solution("x + 1", variable, 1);
        EXPECT_EQ(res.status, Status::Rejected) << variable;
        EXPECT_EQ(res.verdict.reason, Reason::InvalidArgument) << variable;
    }
    auto tolerance = calculator().verify_solution("x + 1", "x", 1, -1);
    EXPECT_EQ(tolerance.status, Status::Rejected);
    EXPECT_EQ(tolerance.verdict.reason, Reason::InvalidArgument);

    auto other_variable = calculator().verify_solution("y + 1", "x", 1);
    EXPECT_EQ(other_variable.status, Status::Rejected);
    EXPECT_EQ(other_variable.verdict.reason, Reason::ForbiddenConstruct);

    auto blocked = calculator().verify_solution("eval(x)", "x", 1);
    EXPECT_EQ(blocked.status, Status::Rejected);
    EXPECT_EQ(blocked.verdict.reason, Reason::BlockedToken);
}
