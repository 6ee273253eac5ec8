#pragma once

#include "sandtool/config.hh"
#include "sandtool/errors.hh"
#include "sandtool/validator.hh"

#include <chrono>
#include <complex>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandtool {

struct CalculationResult {
    enum class Status : uint8_t {
        Ok,
        Rejected,
        SyntaxError,
        TimedOut,
        RuntimeFailure,
        InternalError,
    } status = Status::Ok;

    enum class EquationKind : uint8_t {
        Linear,
        Quadratic,
    };

    enum class DiscriminantSign : uint8_t {
        Positive,
        Zero,
        Negative,
    };

    ValidationVerdict verdict;
    std::optional<double> value;
    // Real roots have zero imaginary part
    std::vector<std::complex<double>> roots;
    std::optional<EquationKind> equation_kind;
    std::optional<double> discriminant;
    std::optional<DiscriminantSign> discriminant_sign;
    std::optional<double> residual;
    std::optional<bool> verified;
    std::chrono::nanoseconds runtime{0};
    std::string comment;

    [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }

    // Must not be called on a successful result
    [[nodiscard]] ErrorKind error_kind() const;
};

const char* to_string(CalculationResult::Status status) noexcept;
const char* to_string(CalculationResult::EquationKind kind) noexcept;
const char* to_string(CalculationResult::DiscriminantSign sign) noexcept;

// Evaluates restricted arithmetic in-process. Safe to use concurrently.
class Calculator {
    Config::Calculator config_;
    Validator validator_;

public:
    explicit Calculator(const Config& config);

    [[nodiscard]] CalculationResult evaluate(std::string_view expression) const;

    // Roots of ax^2 + bx + c = 0; a == 0 falls back to the linear equation bx + c = 0
    [[nodiscard]] CalculationResult solve_quadratic(double a, double b, double c) const;

    static constexpr double default_tolerance = 1e-10;

    // @p expression is "lhs" or "lhs = rhs"; checks whether |lhs - rhs| <= tolerance with
    // @p variable bound to @p value
    [[nodiscard]] CalculationResult verify_solution(
        std::string_view expression, std::string_view variable, double value,
        double tolerance = default_tolerance) const;
};

} // namespace sandtool
