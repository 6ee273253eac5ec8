#include "sandtool/concat_tostr.hh"
#include "sandtool/expression.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>
#include <numeric>

using std::chrono::steady_clock;
using Reason = sandtool::ValidationVerdict::Reason;

namespace sandtool::expr {

namespace {

constexpr size_t variadic = std::numeric_limits<size_t>::max();
// Largest integer exactly representable in a double
constexpr double max_exact_integer = 9007199254740992.0;

using FunctionImpl = double (*)(const std::vector<double>& args, const EvalLimits& limits);

struct Function {
    std::string_view name;
    size_t min_args;
    size_t max_args;
    FunctionImpl impl;
};

double checked(double val, const EvalLimits& limits) {
    if (std::isnan(val)) {
        throw DomainError{"result is not a number"};
    }
    if (std::isinf(val) or std::abs(val) > limits.max_magnitude) {
        throw Rejected{
            Reason::NumericLimit,
            concat_tostr("value exceeds the magnitude limit of ", limits.max_magnitude)};
    }
    return val == 0 ? 0.0 : val; // normalizes -0
}

bool is_integer(double val) noexcept { return std::isfinite(val) and std::trunc(val) == val; }

int64_t to_integer(double val, std::string_view what) {
    if (not is_integer(val)) {
        throw DomainError{concat_tostr(what, " accepts only integers")};
    }
    if (std::abs(val) > max_exact_integer) {
        throw DomainError{concat_tostr(what, ": integer argument is too large")};
    }
    return static_cast<int64_t>(val);
}

double power(double base, double exp, const EvalLimits& limits) {
    if (std::abs(exp) > limits.max_exponent) {
        throw Rejected{
            Reason::NumericLimit,
            concat_tostr("exponent exceeds the limit of ", limits.max_exponent)};
    }
    if (base == 0 and exp < 0) {
        throw DomainError{"zero cannot be raised to a negative power"};
    }
    if (base < 0 and not is_integer(exp)) {
        throw DomainError{"negative number cannot be raised to a fractional power"};
    }
    return checked(std::pow(base, exp), limits);
}

double factorial(double arg, const EvalLimits& limits) {
    if (not is_integer(arg) or arg < 0) {
        throw DomainError{"factorial() accepts only non-negative integers"};
    }
    if (arg > static_cast<double>(limits.max_factorial_argument)) {
        throw Rejected{
            Reason::NumericLimit,
            concat_tostr("factorial() argument exceeds ", limits.max_factorial_argument)};
    }
    auto n = static_cast<uint64_t>(arg);
    double res = 1;
    for (uint64_t i = 2; i <= n; ++i) {
        if (steady_clock::now() > limits.deadline) {
            throw Timeout{"evaluation timed out"};
        }
        res = checked(res * static_cast<double>(i), limits);
    }
    return res;
}

template <double (*func)(double)>
double unary_func(const std::vector<double>& args, const EvalLimits& limits) {
    return checked(func(args[0]), limits);
}

const std::array functions = {
    Function{"abs", 1, 1, [](auto& args, auto& limits) { return checked(std::abs(args[0]), limits); }},
    Function{"round", 1, 2,
        [](auto& args, auto& limits) {
            if (args.size() == 1) {
                return checked(std::nearbyint(args[0]), limits);
            }
            auto digits = to_integer(args[1], "round()");
            if (digits < -308 or digits > 308) {
                throw DomainError{"round(): number of digits is out of range"};
            }
            double factor = std::pow(10.0, static_cast<double>(digits));
            double scaled = args[0] * factor;
            if (not std::isfinite(scaled)) {
                return checked(args[0], limits);
            }
            return checked(std::nearbyint(scaled) / factor, limits);
        }},
    Function{"max", 1, variadic,
        [](auto& args, auto& /*limits*/) { return *std::max_element(args.begin(), args.end()); }},
    Function{"min", 1, variadic,
        [](auto& args, auto& /*limits*/) { return *std::min_element(args.begin(), args.end()); }},
    Function{"sum", 0, variadic,
        [](auto& args, auto& limits) {
            double res = 0;
            for (double x : args) {
                res = checked(res + x, limits);
            }
            return res;
        }},
    Function{"sqrt", 1, 1,
        [](auto& args, auto& limits) {
            if (args[0] < 0) {
                throw DomainError{"sqrt() of a negative number"};
            }
            return checked(std::sqrt(args[0]), limits);
        }},
    Function{"cbrt", 1, 1, unary_func<std::cbrt>},
    Function{"sin", 1, 1, unary_func<std::sin>},
    Function{"cos", 1, 1, unary_func<std::cos>},
    Function{"tan", 1, 1, unary_func<std::tan>},
    Function{"asin", 1, 1,
        [](auto& args, auto& limits) {
            if (args[0] < -1 or args[0] > 1) {
                throw DomainError{"asin() argument out of range [-1, 1]"};
            }
            return checked(std::asin(args[0]), limits);
        }},
    Function{"acos", 1, 1,
        [](auto& args, auto& limits) {
            if (args[0] < -1 or args[0] > 1) {
                throw DomainError{"acos() argument out of range [-1, 1]"};
            }
            return checked(std::acos(args[0]), limits);
        }},
    Function{"atan", 1, 1, unary_func<std::atan>},
    Function{"atan2", 2, 2,
        [](auto& args, auto& limits) { return checked(std::atan2(args[0], args[1]), limits); }},
    Function{"sinh", 1, 1, unary_func<std::sinh>},
    Function{"cosh", 1, 1, unary_func<std::cosh>},
    Function{"tanh", 1, 1, unary_func<std::tanh>},
    Function{"log", 1, 2,
        [](auto& args, auto& limits) {
            if (args[0] <= 0) {
                throw DomainError{"log() of a non-positive number"};
            }
            if (args.size() == 1) {
                return checked(std::log(args[0]), limits);
            }
            if (args[1] <= 0 or args[1] == 1) {
                throw DomainError{"log(): invalid base"};
            }
            return checked(std::log(args[0]) / std::log(args[1]), limits);
        }},
    Function{"log10", 1, 1,
        [](auto& args, auto& limits) {
            if (args[0] <= 0) {
                throw DomainError{"log10() of a non-positive number"};
            }
            return checked(std::log10(args[0]), limits);
        }},
    Function{"log2", 1, 1,
        [](auto& args, auto& limits) {
            if (args[0] <= 0) {
                throw DomainError{"log2() of a non-positive number"};
            }
            return checked(std::log2(args[0]), limits);
        }},
    Function{"exp", 1, 1, unary_func<std::exp>},
    Function{"ceil", 1, 1, unary_func<std::ceil>},
    Function{"floor", 1, 1, unary_func<std::floor>},
    Function{"factorial", 1, 1, [](auto& args, auto& limits) { return factorial(args[0], limits); }},
    Function{"gcd", 1, variadic,
        [](auto& args, auto& /*limits*/) {
            int64_t res = 0;
            for (double x : args) {
                res = std::gcd(res, to_integer(x, "gcd()"));
            }
            return static_cast<double>(res);
        }},
    Function{"lcm", 1, variadic,
        [](auto& args, auto& limits) {
            double res = 1;
            for (double x : args) {
                auto val = to_integer(x, "lcm()");
                if (val == 0) {
                    return 0.0;
                }
                auto r = static_cast<int64_t>(res);
                res = checked(
                    static_cast<double>(std::abs(r / std::gcd(r, val))) *
                        static_cast<double>(std::abs(val)),
                    limits);
                if (res > max_exact_integer) {
                    throw DomainError{"lcm(): result is too large"};
                }
            }
            return res;
        }},
    Function{"pow", 2, 2, [](auto& args, auto& limits) { return power(args[0], args[1], limits); }},
    Function{"hypot", 2, 2,
        [](auto& args, auto& limits) { return checked(std::hypot(args[0], args[1]), limits); }},
};

const Function* find_function(std::string_view name) noexcept {
    auto it = std::find_if(functions.begin(), functions.end(), [&](const Function& f) {
        return f.name == name;
    });
    return it == functions.end() ? nullptr : &*it;
}

struct Constant {
    std::string_view name;
    double value;
};

constexpr std::array constants = {
    Constant{"pi", std::numbers::pi},
    Constant{"e", std::numbers::e},
    Constant{"tau", 2 * std::numbers::pi},
};

const Constant* find_constant(std::string_view name) noexcept {
    auto it = std::find_if(constants.begin(), constants.end(), [&](const Constant& c) {
        return c.name == name;
    });
    return it == constants.end() ? nullptr : &*it;
}

struct Token {
    enum class Kind : uint8_t {
        Number,
        Name,
        Operator,
        LParen,
        RParen,
        Comma,
        Assign,
        End,
    } kind;

    std::string_view text;
    size_t position;
    double number = 0;
};

class Lexer {
    std::string_view text_;
    const ParseOptions& options_;
    size_t pos_ = 0;

public:
    Lexer(std::string_view text, const ParseOptions& options) noexcept
    : text_{text}
    , options_{options} {}

    std::vector<Token> run() {
        std::vector<Token> tokens;
        for (;;) {
            while (pos_ < text_.size() and std::isspace(static_cast<unsigned char>(text_[pos_])))
            {
                ++pos_;
            }
            if (pos_ == text_.size()) {
                tokens.push_back({.kind = Token::Kind::End, .text = {}, .position = pos_});
                return tokens;
            }
            tokens.emplace_back(next());
        }
    }

private:
    static bool is_digit(char c) noexcept { return std::isdigit(static_cast<unsigned char>(c)); }

    Token make(Token::Kind kind, size_t len) noexcept {
        Token tok{.kind = kind, .text = text_.substr(pos_, len), .position = pos_};
        pos_ += len;
        return tok;
    }

    Token number() {
        size_t beg = pos_;
        auto skip_digits = [&] {
            while (pos_ < text_.size() and is_digit(text_[pos_])) {
                ++pos_;
            }
        };
        skip_digits();
        if (pos_ < text_.size() and text_[pos_] == '.') {
            ++pos_;
            skip_digits();
        }
        // Exponent, only if followed by digits, otherwise 'e' is a name (e.g. "2e" == 2 * e)
        if (pos_ < text_.size() and (text_[pos_] == 'e' or text_[pos_] == 'E')) {
            size_t exp = pos_ + 1;
            if (exp < text_.size() and (text_[exp] == '+' or text_[exp] == '-')) {
                ++exp;
            }
            if (exp < text_.size() and is_digit(text_[exp])) {
                pos_ = exp;
                skip_digits();
            }
        }
        auto str = text_.substr(beg, pos_ - beg);
        if (str == ".") {
            throw ParseError{"invalid number", beg};
        }
        Token tok{.kind = Token::Kind::Number, .text = str, .position = beg};
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), tok.number);
        if (ec == std::errc::result_out_of_range or
            (ec == std::errc{} and std::abs(tok.number) > options_.max_magnitude))
        {
            throw Rejected{
                Reason::NumericLimit,
                concat_tostr("numeric literal ", str, " exceeds the magnitude limit")};
        }
        if (ec != std::errc{} or ptr != str.data() + str.size()) {
            throw ParseError{concat_tostr("invalid number: ", str), beg};
        }
        return tok;
    }

    Token next() {
        char c = text_[pos_];
        if (is_digit(c) or (c == '.' and pos_ + 1 < text_.size() and is_digit(text_[pos_ + 1])))
        {
            return number();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) or c == '_') {
            size_t len = 1;
            while (pos_ + len < text_.size() and
                   (std::isalnum(static_cast<unsigned char>(text_[pos_ + len])) or
                    text_[pos_ + len] == '_'))
            {
                ++len;
            }
            return make(Token::Kind::Name, len);
        }
        auto rest = text_.substr(pos_);
        for (std::string_view op : {"**", "//", "<=", ">=", "==", "!="}) {
            if (rest.starts_with(op)) {
                return make(Token::Kind::Operator, 2);
            }
        }
        switch (c) {
        case '(': return make(Token::Kind::LParen, 1);
        case ')': return make(Token::Kind::RParen, 1);
        case ',': return make(Token::Kind::Comma, 1);
        case '=': return make(Token::Kind::Assign, 1);
        case '+':
        case '-':
        case '*':
        case '/':
        case '%':
        case '^':
        case '<':
        case '>': return make(Token::Kind::Operator, 1);
        default: break;
        }
        throw ParseError{concat_tostr("unexpected character '", c, '\''), pos_};
    }
};

class Parser {
    std::vector<Token> tokens_;
    const ParseOptions& options_;
    size_t idx_ = 0;
    size_t depth_ = 0;

    class DepthGuard {
        Parser& parser_;

    public:
        DepthGuard(Parser& parser, size_t position)
        : parser_{parser} {
            if (++parser_.depth_ > parser_.options_.max_nesting_depth) {
                throw Rejected{
                    Reason::NestingTooDeep,
                    concat_tostr(
                        "expression is nested deeper than ", parser_.options_.max_nesting_depth,
                        " levels (at position ", position + 1, ')')};
            }
        }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard(DepthGuard&&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        DepthGuard& operator=(DepthGuard&&) = delete;

        ~DepthGuard() { --parser_.depth_; }
    };

public:
    Parser(std::vector<Token> tokens, const ParseOptions& options) noexcept
    : tokens_{std::move(tokens)}
    , options_{options} {}

    Equation equation() {
        Equation eq;
        eq.lhs = comparison();
        if (peek().kind == Token::Kind::Assign) {
            ++idx_;
            eq.rhs = comparison();
        }
        expect_end();
        return eq;
    }

    std::unique_ptr<Node> expression() {
        auto res = comparison();
        if (peek().kind == Token::Kind::Assign) {
            throw ParseError{"assignment is not allowed", peek().position};
        }
        expect_end();
        return res;
    }

private:
    [[nodiscard]] const Token& peek() const noexcept { return tokens_[idx_]; }

    [[nodiscard]] bool peek_op(std::string_view op) const noexcept {
        return peek().kind == Token::Kind::Operator and peek().text == op;
    }

    [[noreturn]] void unexpected() const {
        const auto& tok = peek();
        if (tok.kind == Token::Kind::End) {
            throw ParseError{"unexpected end of expression", tok.position};
        }
        throw ParseError{concat_tostr("unexpected '", tok.text, '\''), tok.position};
    }

    void expect_end() const {
        if (peek().kind != Token::Kind::End) {
            unexpected();
        }
    }

    static std::unique_ptr<Node>
    make_binary(Op op, size_t position, std::unique_ptr<Node> lhs, std::unique_ptr<Node> rhs) {
        auto node = std::make_unique<Node>(Node{.kind = Node::Kind::Binary, .position = position});
        node->ops.emplace_back(op);
        node->children.emplace_back(std::move(lhs));
        node->children.emplace_back(std::move(rhs));
        return node;
    }

    std::unique_ptr<Node> comparison() {
        auto first = additive();
        std::unique_ptr<Node> node;
        for (;;) {
            static constexpr std::pair<std::string_view, Op> cmp_ops[] = {
                {"<", Op::Lt},
                {"<=", Op::Le},
                {">", Op::Gt},
                {">=", Op::Ge},
                {"==", Op::Eq},
                {"!=", Op::Ne},
            };
            auto it = std::find_if(std::begin(cmp_ops), std::end(cmp_ops), [&](auto& p) {
                return peek_op(p.first);
            });
            if (it == std::end(cmp_ops)) {
                break;
            }
            ++idx_;
            if (not node) {
                node = std::make_unique<Node>(
                    Node{.kind = Node::Kind::Comparison, .position = first->position});
                node->children.emplace_back(std::move(first));
            }
            node->ops.emplace_back(it->second);
            node->children.emplace_back(additive());
        }
        return node ? std::move(node) : std::move(first);
    }

    std::unique_ptr<Node> additive() {
        auto lhs = term();
        for (;;) {
            Op op{};
            if (peek_op("+")) {
                op = Op::Add;
            } else if (peek_op("-")) {
                op = Op::Sub;
            } else {
                return lhs;
            }
            auto position = peek().position;
            ++idx_;
            lhs = make_binary(op, position, std::move(lhs), term());
        }
    }

    std::unique_ptr<Node> term() {
        auto lhs = unary();
        for (;;) {
            const auto& tok = peek();
            if (tok.kind == Token::Kind::Name or tok.kind == Token::Kind::LParen) {
                // Implicit multiplication: 5x, 2(x + 1), (x + 1)(x - 1), 2pi
                lhs = make_binary(Op::Mul, tok.position, std::move(lhs), power());
                continue;
            }
            Op op{};
            if (peek_op("*")) {
                op = Op::Mul;
            } else if (peek_op("/")) {
                op = Op::Div;
            } else if (peek_op("//")) {
                op = Op::FloorDiv;
            } else if (peek_op("%")) {
                op = Op::Mod;
            } else {
                return lhs;
            }
            auto position = tok.position;
            ++idx_;
            lhs = make_binary(op, position, std::move(lhs), unary());
        }
    }

    std::unique_ptr<Node> unary() {
        if (peek_op("-") or peek_op("+")) {
            auto position = peek().position;
            Op op = peek_op("-") ? Op::Neg : Op::Pos;
            ++idx_;
            DepthGuard guard{*this, position};
            auto node =
                std::make_unique<Node>(Node{.kind = Node::Kind::Unary, .position = position});
            node->ops.emplace_back(op);
            node->children.emplace_back(unary());
            return node;
        }
        return power();
    }

    // Exponentiation is right-associative and binds tighter than a unary minus on its left
    std::unique_ptr<Node> power() {
        auto base = primary();
        if (peek_op("**") or peek_op("^")) {
            auto position = peek().position;
            ++idx_;
            DepthGuard guard{*this, position};
            return make_binary(Op::Pow, position, std::move(base), unary());
        }
        return base;
    }

    std::unique_ptr<Node> call(const Token& name_tok, const Function& func) {
        ++idx_; // (
        auto node = std::make_unique<Node>(Node{
            .kind = Node::Kind::Call,
            .position = name_tok.position,
            .name = std::string{name_tok.text},
        });
        if (peek().kind != Token::Kind::RParen) {
            for (;;) {
                node->children.emplace_back(comparison());
                if (peek().kind != Token::Kind::Comma) {
                    break;
                }
                ++idx_;
            }
        }
        if (peek().kind != Token::Kind::RParen) {
            unexpected();
        }
        ++idx_;
        auto argc = node->children.size();
        if (argc < func.min_args or argc > func.max_args) {
            throw Rejected{
                Reason::ForbiddenConstruct,
                concat_tostr(func.name, "() does not accept ", argc, " argument(s)")};
        }
        return node;
    }

    std::unique_ptr<Node> primary() {
        const auto& tok = peek();
        switch (tok.kind) {
        case Token::Kind::Number:
            ++idx_;
            return std::make_unique<Node>(
                Node{.kind = Node::Kind::Number, .position = tok.position, .number = tok.number});
        case Token::Kind::LParen: {
            ++idx_;
            DepthGuard guard{*this, tok.position};
            auto inner = comparison();
            if (peek().kind != Token::Kind::RParen) {
                unexpected();
            }
            ++idx_;
            return inner;
        }
        case Token::Kind::Name: {
            ++idx_;
            if (const auto* func = find_function(tok.text)) {
                if (peek().kind != Token::Kind::LParen) {
                    throw Rejected{
                        Reason::ForbiddenConstruct,
                        concat_tostr("function ", tok.text, " has to be called")};
                }
                DepthGuard guard{*this, tok.position};
                return call(tok, *func);
            }
            auto& vars = options_.variables;
            if (std::find(vars.begin(), vars.end(), tok.text) != vars.end()) {
                return std::make_unique<Node>(Node{
                    .kind = Node::Kind::Variable,
                    .position = tok.position,
                    .name = std::string{tok.text},
                });
            }
            if (const auto* constant = find_constant(tok.text)) {
                return std::make_unique<Node>(Node{
                    .kind = Node::Kind::Constant,
                    .position = tok.position,
                    .number = constant->value,
                });
            }
            throw Rejected{
                Reason::ForbiddenConstruct, concat_tostr("unknown name '", tok.text, '\'')};
        }
        default: unexpected();
        }
    }
};

double python_mod(double a, double b) {
    double res = std::fmod(a, b);
    if (res != 0 and ((res < 0) != (b < 0))) {
        res += b;
    }
    return res;
}

double apply_binary(Op op, double a, double b, const EvalLimits& limits) {
    switch (op) {
    case Op::Add: return checked(a + b, limits);
    case Op::Sub: return checked(a - b, limits);
    case Op::Mul: return checked(a * b, limits);
    case Op::Div:
        if (b == 0) {
            throw DomainError{"division by zero"};
        }
        return checked(a / b, limits);
    case Op::FloorDiv:
        if (b == 0) {
            throw DomainError{"division by zero"};
        }
        return checked(std::floor(a / b), limits);
    case Op::Mod:
        if (b == 0) {
            throw DomainError{"modulo by zero"};
        }
        return checked(python_mod(a, b), limits);
    case Op::Pow: return power(a, b, limits);
    default: break;
    }
    throw std::logic_error{"invalid binary operator"};
}

bool compare(Op op, double a, double b) {
    switch (op) {
    case Op::Lt: return a < b;
    case Op::Le: return a <= b;
    case Op::Gt: return a > b;
    case Op::Ge: return a >= b;
    case Op::Eq: return a == b;
    case Op::Ne: return a != b;
    default: break;
    }
    throw std::logic_error{"invalid comparison operator"};
}

} // namespace

bool is_function_name(std::string_view name) noexcept { return find_function(name) != nullptr; }

bool is_constant_name(std::string_view name) noexcept { return find_constant(name) != nullptr; }

std::unique_ptr<Node> parse(std::string_view text, const ParseOptions& options) {
    return Parser{Lexer{text, options}.run(), options}.expression();
}

Equation parse_equation(std::string_view text, const ParseOptions& options) {
    return Parser{Lexer{text, options}.run(), options}.equation();
}

double evaluate(const Node& node, const EvalLimits& limits, const Variables& variables) {
    if (steady_clock::now() > limits.deadline) {
        throw Timeout{"evaluation timed out"};
    }
    switch (node.kind) {
    case Node::Kind::Number:
    case Node::Kind::Constant: return checked(node.number, limits);
    case Node::Kind::Variable: {
        auto it = variables.find(node.name);
        if (it == variables.end()) {
            throw std::logic_error{concat_tostr("unbound variable: ", node.name)};
        }
        return checked(it->second, limits);
    }
    case Node::Kind::Unary: {
        double val = evaluate(*node.children[0], limits, variables);
        return checked(node.ops[0] == Op::Neg ? -val : val, limits);
    }
    case Node::Kind::Binary:
        return apply_binary(
            node.ops[0], evaluate(*node.children[0], limits, variables),
            evaluate(*node.children[1], limits, variables), limits);
    case Node::Kind::Comparison: {
        // Chained like in Python: a < b < c means (a < b) and (b < c)
        double lhs = evaluate(*node.children[0], limits, variables);
        for (size_t i = 0; i < node.ops.size(); ++i) {
            double rhs = evaluate(*node.children[i + 1], limits, variables);
            if (not compare(node.ops[i], lhs, rhs)) {
                return 0;
            }
            lhs = rhs;
        }
        return 1;
    }
    case Node::Kind::Call: {
        const auto* func = find_function(node.name);
        if (func == nullptr) {
            throw std::logic_error{concat_tostr("unknown function: ", node.name)};
        }
        std::vector<double> args;
        args.reserve(node.children.size());
        for (const auto& child : node.children) {
            args.emplace_back(evaluate(*child, limits, variables));
        }
        return func->impl(args, limits);
    }
    }
    throw std::logic_error{"invalid node kind"};
}

} // namespace sandtool::expr
