#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Lightweight Python 3 tokenizer and statement tree builder. It does not parse expressions;
// it is enough to locate statements, blocks, names, attributes and string literals, and to
// reject malformed sources.
namespace sandtool::python {

struct Token {
    enum class Kind : uint8_t {
        Name,
        Number,
        String,
        Operator,
        Newline,
        Indent,
        Dedent,
        EndMarker,
    } kind;

    std::string_view text; // view into the source (empty for synthetic tokens)
    size_t line; // 1-based
    size_t column; // 1-based, in bytes

    [[nodiscard]] bool is_name(std::string_view name) const noexcept {
        return kind == Kind::Name and text == name;
    }

    [[nodiscard]] bool is_op(std::string_view op) const noexcept {
        return kind == Kind::Operator and text == op;
    }

    // String literal with an f prefix (f"...", rf'...', ...)
    [[nodiscard]] bool is_fstring() const noexcept;
};

class SyntaxError : public std::runtime_error {
    size_t line_;
    size_t column_;

public:
    SyntaxError(const std::string& msg, size_t line, size_t column)
    : std::runtime_error{msg}
    , line_{line}
    , column_{column} {}

    [[nodiscard]] size_t line() const noexcept { return line_; }

    [[nodiscard]] size_t column() const noexcept { return column_; }
};

// Throws SyntaxError
std::vector<Token> tokenize(std::string_view source);

// Logical line together with the block it introduces (if it is a compound statement header)
struct Statement {
    std::vector<Token> tokens; // without the trailing Newline
    std::vector<Statement> body;

    [[nodiscard]] size_t line() const noexcept { return tokens.empty() ? 0 : tokens[0].line; }
};

struct Module {
    std::vector<Statement> body;
};

// Throws SyntaxError
Module parse(std::string_view source);

} // namespace sandtool::python
