#pragma once

#include "sandtool/validator.hh"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Parser and evaluator of restricted arithmetic expressions
namespace sandtool::expr {

class ParseError : public std::runtime_error {
    size_t position_; // 0-based offset into the expression

public:
    ParseError(const std::string& msg, size_t position)
    : std::runtime_error{msg}
    , position_{position} {}

    [[nodiscard]] size_t position() const noexcept { return position_; }
};

// Construct that is well-formed but not allowed
class Rejected : public std::runtime_error {
    ValidationVerdict::Reason reason_;

public:
    Rejected(ValidationVerdict::Reason reason, const std::string& msg)
    : std::runtime_error{msg}
    , reason_{reason} {}

    [[nodiscard]] ValidationVerdict::Reason reason() const noexcept { return reason_; }
};

// Mathematically undefined operation, e.g. division by zero
class DomainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Timeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Op : uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
    Mod,
    Pow,
    Neg,
    Pos,
    Lt,
    Le,
    Gt,
    Ge,
    Eq,
    Ne,
};

struct Node {
    enum class Kind : uint8_t {
        Number,
        Constant,
        Variable,
        Unary,
        Binary,
        Comparison, // chain: children[0] ops[0] children[1] ops[1] children[2] ...
        Call,
    } kind;

    size_t position; // of the first character
    double number = 0; // Number and Constant
    std::string name; // Variable and Call
    std::vector<Op> ops; // Unary and Binary: one element
    std::vector<std::unique_ptr<Node>> children;
};

struct ParseOptions {
    size_t max_nesting_depth = 64;
    double max_magnitude = 1e100;
    // Free names that may appear in the expression
    std::vector<std::string> variables;
};

// Throws ParseError or Rejected
std::unique_ptr<Node> parse(std::string_view text, const ParseOptions& options);

// "lhs" or "lhs = rhs"; rhs is null if there is no '='. Throws ParseError or Rejected.
struct Equation {
    std::unique_ptr<Node> lhs;
    std::unique_ptr<Node> rhs;
};

Equation parse_equation(std::string_view text, const ParseOptions& options);

struct EvalLimits {
    double max_magnitude;
    uint64_t max_factorial_argument;
    double max_exponent;
    std::chrono::steady_clock::time_point deadline;
};

using Variables = std::map<std::string, double, std::less<>>;

// Throws Rejected (numeric limits), DomainError or Timeout
double evaluate(const Node& node, const EvalLimits& limits, const Variables& variables);

[[nodiscard]] bool is_function_name(std::string_view name) noexcept;

[[nodiscard]] bool is_constant_name(std::string_view name) noexcept;

} // namespace sandtool::expr
