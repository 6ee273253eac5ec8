#include "sandtool/calculator.hh"
#include "sandtool/concat_tostr.hh"
#include "sandtool/debug.hh"
#include "sandtool/expression.hh"
#include "sandtool/logger.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

using std::chrono::steady_clock;
using Reason = sandtool::ValidationVerdict::Reason;
using Status = sandtool::CalculationResult::Status;

namespace {

constexpr DebugLogger<debug_logging_enabled> debuglog{};

constexpr size_t max_variable_name_length = 32;

} // namespace

namespace sandtool {

ErrorKind CalculationResult::error_kind() const {
    switch (status) {
    case Status::Ok: break;
    case Status::Rejected: return ErrorKind::ValidationError;
    case Status::SyntaxError: return ErrorKind::SyntaxError;
    case Status::TimedOut: return ErrorKind::TimeoutError;
    case Status::RuntimeFailure: return ErrorKind::RuntimeFailure;
    case Status::InternalError: return ErrorKind::InternalError;
    }
    throw std::logic_error{"successful calculation has no error kind"};
}

const char* to_string(CalculationResult::Status status) noexcept {
    switch (status) {
    case Status::Ok: return "Ok";
    case Status::Rejected: return "Rejected";
    case Status::SyntaxError: return "SyntaxError";
    case Status::TimedOut: return "TimedOut";
    case Status::RuntimeFailure: return "RuntimeFailure";
    case Status::InternalError: return "InternalError";
    }
    return "unknown";
}

const char* to_string(CalculationResult::EquationKind kind) noexcept {
    switch (kind) {
    case CalculationResult::EquationKind::Linear: return "Linear";
    case CalculationResult::EquationKind::Quadratic: return "Quadratic";
    }
    return "unknown";
}

const char* to_string(CalculationResult::DiscriminantSign sign) noexcept {
    switch (sign) {
    case CalculationResult::DiscriminantSign::Positive: return "Positive";
    case CalculationResult::DiscriminantSign::Zero: return "Zero";
    case CalculationResult::DiscriminantSign::Negative: return "Negative";
    }
    return "unknown";
}

Calculator::Calculator(const Config& config)
: config_{config.calculator}
, validator_{ValidationProfile::for_expressions(config.validation)} {}

namespace {

// Runs @p func translating the evaluation exceptions into the result status
template <class Func>
void run_guarded(CalculationResult& res, steady_clock::time_point start, Func&& func) noexcept {
    try {
        std::forward<Func>(func)();
    } catch (const expr::ParseError& e) {
        res.status = Status::SyntaxError;
        res.verdict = ValidationVerdict::syntax_error(e.what(), 1, e.position() + 1);
        res.comment = res.verdict.description();
    } catch (const expr::Rejected& e) {
        res.status = Status::Rejected;
        res.verdict = ValidationVerdict::unsafe(e.reason(), e.what());
        res.comment = res.verdict.description();
    } catch (const expr::DomainError& e) {
        res.status = Status::RuntimeFailure;
        res.comment = e.what();
    } catch (const expr::Timeout& e) {
        res.status = Status::TimedOut;
        res.comment = e.what();
    } catch (const std::exception& e) {
        errlog("calculator: internal error: ", e.what());
        res.status = Status::InternalError;
        res.comment = "Internal error";
    }
    if (not res.ok()) {
        res.value = std::nullopt;
        res.roots.clear();
        res.residual = std::nullopt;
        res.verified = std::nullopt;
        res.equation_kind = std::nullopt;
        res.discriminant = std::nullopt;
        res.discriminant_sign = std::nullopt;
    }
    res.runtime = steady_clock::now() - start;
}

double check_magnitude(double val, double max_magnitude, std::string_view what) {
    if (not std::isfinite(val) or std::abs(val) > max_magnitude) {
        throw expr::Rejected{
            Reason::NumericLimit,
            concat_tostr(what, " exceeds the magnitude limit of ", max_magnitude)};
    }
    return val == 0 ? 0.0 : val;
}

bool is_valid_variable_name(std::string_view name) noexcept {
    if (name.empty() or name.size() > max_variable_name_length) {
        return false;
    }
    if (not std::isalpha(static_cast<unsigned char>(name[0])) and name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
    });
}

} // namespace

CalculationResult Calculator::evaluate(std::string_view expression) const {
    auto start = steady_clock::now();
    CalculationResult res;
    res.verdict = validator_.validate(expression);
    if (not res.verdict.is_safe()) {
        res.status = res.verdict.kind == ValidationVerdict::Kind::SyntaxError
            ? Status::SyntaxError
            : Status::Rejected;
        res.comment = res.verdict.description();
        res.runtime = steady_clock::now() - start;
        return res;
    }
    run_guarded(res, start, [&] {
        auto tree = expr::parse(
            expression,
            {.max_nesting_depth = config_.max_nesting_depth,
             .max_magnitude = config_.max_magnitude,
             .variables = {}});
        res.value = expr::evaluate(
            *tree,
            {
                .max_magnitude = config_.max_magnitude,
                .max_factorial_argument = config_.max_factorial_argument,
                .max_exponent = config_.max_exponent,
                .deadline = start + config_.timeout,
            },
            {});
    });
    debuglog("calculator: ", expression, " -> ", to_string(res.status));
    return res;
}

CalculationResult Calculator::solve_quadratic(double a, double b, double c) const {
    using DiscriminantSign = CalculationResult::DiscriminantSign;
    using EquationKind = CalculationResult::EquationKind;

    auto start = steady_clock::now();
    CalculationResult res;
    run_guarded(res, start, [&] {
        const double max = config_.max_magnitude;
        check_magnitude(a, max, "coefficient a");
        check_magnitude(b, max, "coefficient b");
        check_magnitude(c, max, "coefficient c");

        if (a == 0) {
            if (b == 0) {
                throw expr::DomainError{"not an equation: both a and b are zero"};
            }
            res.equation_kind = EquationKind::Linear;
            res.roots.emplace_back(check_magnitude(-c / b, max, "root"));
            res.comment = "Linear equation";
            return;
        }

        res.equation_kind = EquationKind::Quadratic;
        double discriminant = check_magnitude(b * b - 4 * a * c, max, "discriminant");
        res.discriminant = discriminant;
        if (discriminant > 0) {
            res.discriminant_sign = DiscriminantSign::Positive;
            // Avoids cancellation when b*b is much greater than 4ac
            double q = -0.5 * (b + std::copysign(std::sqrt(discriminant), b));
            double x1 = check_magnitude(q / a, max, "root");
            double x2 = check_magnitude(c / q, max, "root");
            res.roots.emplace_back(std::max(x1, x2));
            res.roots.emplace_back(std::min(x1, x2));
            res.comment = "Two distinct real roots";
        } else if (discriminant == 0) {
            res.discriminant_sign = DiscriminantSign::Zero;
            res.roots.emplace_back(check_magnitude(-b / (2 * a), max, "root"));
            res.comment = "One repeated real root";
        } else {
            res.discriminant_sign = DiscriminantSign::Negative;
            double re = check_magnitude(-b / (2 * a), max, "root");
            double im = check_magnitude(std::sqrt(-discriminant) / (2 * std::abs(a)), max, "root");
            res.roots.emplace_back(re, im);
            res.roots.emplace_back(re, -im);
            res.comment = "Two complex conjugate roots";
        }
    });
    return res;
}

CalculationResult Calculator::verify_solution(
    std::string_view expression, std::string_view variable, double value,
    double tolerance) const {
    auto start = steady_clock::now();
    CalculationResult res;
    res.verdict = validator_.validate(expression);
    if (not res.verdict.is_safe()) {
        res.status = res.verdict.kind == ValidationVerdict::Kind::SyntaxError
            ? Status::SyntaxError
            : Status::Rejected;
        res.comment = res.verdict.description();
        res.runtime = steady_clock::now() - start;
        return res;
    }
    run_guarded(res, start, [&] {
        if (not is_valid_variable_name(variable) or expr::is_function_name(variable) or
            expr::is_constant_name(variable))
        {
            throw expr::Rejected{
                Reason::InvalidArgument, concat_tostr("invalid variable name: ", variable)};
        }
        if (not std::isfinite(tolerance) or tolerance < 0) {
            throw expr::Rejected{
                Reason::InvalidArgument, "tolerance has to be a non-negative finite number"};
        }
        check_magnitude(value, config_.max_magnitude, "value");

        auto equation = expr::parse_equation(
            expression,
            {.max_nesting_depth = config_.max_nesting_depth,
             .max_magnitude = config_.max_magnitude,
             .variables = {std::string{variable}}});
        expr::EvalLimits limits = {
            .max_magnitude = config_.max_magnitude,
            .max_factorial_argument = config_.max_factorial_argument,
            .max_exponent = config_.max_exponent,
            .deadline = start + config_.timeout,
        };
        expr::Variables vars;
        vars.emplace(variable, value);
        double lhs = expr::evaluate(*equation.lhs, limits, vars);
        double rhs = equation.rhs ? expr::evaluate(*equation.rhs, limits, vars) : 0;
        double residual = check_magnitude(lhs - rhs, config_.max_magnitude, "residual");
        res.value = lhs;
        res.residual = residual;
        res.verified = std::abs(residual) <= tolerance;
        res.comment = *res.verified ? "Solution verified" : "Solution does not satisfy the equation";
    });
    return res;
}

} // namespace sandtool
