#include "sandtool/concat_tostr.hh"
#include "sandtool/python_syntax.hh"

#include <algorithm>
#include <array>
#include <cctype>

namespace sandtool::python {

bool Token::is_fstring() const noexcept {
    if (kind != Kind::String) {
        return false;
    }
    for (char c : text) {
        if (c == '\'' or c == '"') {
            return false;
        }
        if (c == 'f' or c == 'F') {
            return true;
        }
    }
    return false;
}

namespace {

constexpr std::array three_char_ops = {"**=", "//=", ">>=", "<<=", "..."};
constexpr std::array two_char_ops = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
};
constexpr std::string_view one_char_ops = "+-*/%@&|^~<>()[]{},:.;=";

constexpr int tab_size = 8;

bool is_name_start(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) or c == '_' or uc >= 0x80;
}

bool is_name_char(char c) noexcept {
    return is_name_start(c) or std::isdigit(static_cast<unsigned char>(c));
}

bool is_string_prefix(std::string_view word) noexcept {
    if (word.empty() or word.size() > 2) {
        return false;
    }
    std::string lower;
    for (char c : word) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (std::string_view p : {"r", "u", "f", "b", "br", "rb", "fr", "rf"}) {
        if (lower == p) {
            return true;
        }
    }
    return false;
}

class Tokenizer {
    std::string_view src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t line_start_ = 0;
    std::vector<int> indents_{0};

    struct Bracket {
        char c;
        size_t line;
        size_t column;
    };

    std::vector<Bracket> brackets_;
    std::vector<Token> tokens_;

public:
    explicit Tokenizer(std::string_view src) noexcept
    : src_{src} {}

    std::vector<Token> run() {
        bool at_line_start = true;
        while (pos_ < src_.size()) {
            if (at_line_start) {
                at_line_start = false;
                if (handle_indentation()) {
                    at_line_start = true;
                    continue;
                }
            }
            char c = src_[pos_];
            if (c == ' ' or c == '\t' or c == '\f' or c == '\r') {
                ++pos_;
            } else if (c == '#') {
                skip_comment();
            } else if (c == '\n') {
                if (brackets_.empty()) {
                    emit_newline();
                    at_line_start = true;
                }
                newline();
            } else if (c == '\\') {
                line_continuation();
            } else if (is_name_start(c)) {
                name_or_string();
            } else if (std::isdigit(static_cast<unsigned char>(c)) or
                       (c == '.' and pos_ + 1 < src_.size() and
                        std::isdigit(static_cast<unsigned char>(src_[pos_ + 1]))))
            {
                number();
            } else if (c == '\'' or c == '"') {
                string(pos_);
            } else {
                op();
            }
        }
        if (not brackets_.empty()) {
            auto& br = brackets_.back();
            throw SyntaxError{concat_tostr('\'', br.c, "' was never closed"), br.line, br.column};
        }
        emit_newline();
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(Token::Kind::Dedent, pos_, pos_);
        }
        emit(Token::Kind::EndMarker, pos_, pos_);
        return std::move(tokens_);
    }

private:
    [[nodiscard]] size_t column(size_t pos) const noexcept { return pos - line_start_ + 1; }

    [[noreturn]] void error(const std::string& msg, size_t pos) const {
        throw SyntaxError{msg, line_, column(pos)};
    }

    void emit(Token::Kind kind, size_t beg, size_t end) {
        tokens_.push_back({
            .kind = kind,
            .text = src_.substr(beg, end - beg),
            .line = line_,
            .column = column(beg),
        });
    }

    void newline() noexcept {
        ++pos_;
        ++line_;
        line_start_ = pos_;
    }

    void emit_newline() {
        if (tokens_.empty()) {
            return;
        }
        auto last = tokens_.back().kind;
        if (last == Token::Kind::Newline or last == Token::Kind::Indent or
            last == Token::Kind::Dedent)
        {
            return;
        }
        emit(Token::Kind::Newline, pos_, pos_);
    }

    void skip_comment() noexcept {
        while (pos_ < src_.size() and src_[pos_] != '\n') {
            ++pos_;
        }
    }

    // Returns true if the line is blank (it was consumed then)
    bool handle_indentation() {
        int width = 0;
        size_t beg = pos_;
        for (; pos_ < src_.size(); ++pos_) {
            char c = src_[pos_];
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / tab_size + 1) * tab_size;
            } else if (c == '\f') {
                width = 0;
            } else {
                break;
            }
        }
        if (pos_ == src_.size() or src_[pos_] == '\n' or src_[pos_] == '#' or
            src_[pos_] == '\r')
        {
            skip_comment();
            if (pos_ < src_.size()) {
                newline();
            }
            return true;
        }
        if (width > indents_.back()) {
            indents_.push_back(width);
            emit(Token::Kind::Indent, beg, pos_);
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                emit(Token::Kind::Dedent, pos_, pos_);
            }
            if (width != indents_.back()) {
                error("unindent does not match any outer indentation level", pos_);
            }
        }
        return false;
    }

    void line_continuation() {
        size_t beg = pos_++;
        if (pos_ < src_.size() and src_[pos_] == '\r') {
            ++pos_;
        }
        if (pos_ >= src_.size() or src_[pos_] != '\n') {
            error("unexpected character after line continuation character", beg);
        }
        newline();
    }

    void name_or_string() {
        size_t beg = pos_;
        while (pos_ < src_.size() and is_name_char(src_[pos_])) {
            ++pos_;
        }
        if (pos_ < src_.size() and (src_[pos_] == '\'' or src_[pos_] == '"') and
            is_string_prefix(src_.substr(beg, pos_ - beg)))
        {
            string(beg);
            return;
        }
        emit(Token::Kind::Name, beg, pos_);
    }

    void number() {
        size_t beg = pos_;
        bool hex = src_.substr(pos_, 2) == "0x" or src_.substr(pos_, 2) == "0X";
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '.') {
                ++pos_;
            } else if ((c == '+' or c == '-') and not hex and
                       (src_[pos_ - 1] == 'e' or src_[pos_ - 1] == 'E'))
            {
                ++pos_;
            } else {
                break;
            }
        }
        emit(Token::Kind::Number, beg, pos_);
    }

    // @p beg points at the prefix (or at the opening quote if there is no prefix)
    void string(size_t beg) {
        size_t start_line = line_;
        size_t start_column = column(beg);
        char quote = src_[pos_];
        bool triple = src_.substr(pos_, 3) == std::string(3, quote);
        pos_ += triple ? 3 : 1;
        for (;;) {
            if (pos_ >= src_.size()) {
                throw SyntaxError{
                    triple ? "unterminated triple-quoted string literal"
                           : "unterminated string literal",
                    start_line, start_column};
            }
            char c = src_[pos_];
            if (c == '\\') {
                ++pos_;
                if (pos_ < src_.size()) {
                    if (src_[pos_] == '\n') {
                        newline();
                    } else {
                        ++pos_;
                    }
                }
                continue;
            }
            if (c == '\n') {
                if (not triple) {
                    throw SyntaxError{"unterminated string literal", start_line, start_column};
                }
                newline();
                continue;
            }
            if (c == quote) {
                if (not triple) {
                    ++pos_;
                    break;
                }
                if (src_.substr(pos_, 3) == std::string(3, quote)) {
                    pos_ += 3;
                    break;
                }
            }
            ++pos_;
        }
        tokens_.push_back({
            .kind = Token::Kind::String,
            .text = src_.substr(beg, pos_ - beg),
            .line = start_line,
            .column = start_column,
        });
    }

    void op() {
        size_t beg = pos_;
        auto rest = src_.substr(pos_);
        for (std::string_view o : three_char_ops) {
            if (rest.starts_with(o)) {
                pos_ += 3;
                emit(Token::Kind::Operator, beg, pos_);
                return;
            }
        }
        for (std::string_view o : two_char_ops) {
            if (rest.starts_with(o)) {
                pos_ += 2;
                emit(Token::Kind::Operator, beg, pos_);
                return;
            }
        }
        char c = src_[pos_];
        if (one_char_ops.find(c) == std::string_view::npos) {
            error(concat_tostr("invalid character '", c, '\''), beg);
        }
        if (c == '(' or c == '[' or c == '{') {
            brackets_.push_back({.c = c, .line = line_, .column = column(beg)});
        } else if (c == ')' or c == ']' or c == '}') {
            if (brackets_.empty()) {
                error(concat_tostr("unmatched '", c, '\''), beg);
            }
            char open = brackets_.back().c;
            char expected = open == '(' ? ')' : open == '[' ? ']' : '}';
            if (c != expected) {
                error(
                    concat_tostr(
                        "closing parenthesis '", c, "' does not match opening parenthesis '",
                        open, '\''),
                    beg);
            }
            brackets_.pop_back();
        }
        ++pos_;
        emit(Token::Kind::Operator, beg, pos_);
    }
};

constexpr std::array compound_keywords = {
    "if", "elif", "else", "for", "while", "try", "except", "finally", "with", "def", "class",
};
// Soft keywords that start a compound statement only when the line ends with ':'
constexpr std::array soft_compound_keywords = {"async", "match", "case"};

bool is_compound_keyword(const Token& tok) noexcept {
    return std::any_of(compound_keywords.begin(), compound_keywords.end(), [&](auto kw) {
        return tok.is_name(kw);
    });
}

bool is_soft_compound_keyword(const Token& tok) noexcept {
    return std::any_of(soft_compound_keywords.begin(), soft_compound_keywords.end(), [&](auto kw) {
        return tok.is_name(kw);
    });
}

bool has_top_level_colon(const std::vector<Token>& tokens) noexcept {
    int depth = 0;
    for (const auto& tok : tokens) {
        if (tok.kind != Token::Kind::Operator) {
            continue;
        }
        if (tok.text == "(" or tok.text == "[" or tok.text == "{") {
            ++depth;
        } else if (tok.text == ")" or tok.text == "]" or tok.text == "}") {
            --depth;
        } else if (depth == 0 and tok.text == ":") {
            return true;
        }
    }
    return false;
}

class Parser {
    std::vector<Token> tokens_;
    size_t idx_ = 0;

public:
    explicit Parser(std::vector<Token> tokens) noexcept
    : tokens_{std::move(tokens)} {}

    Module run() { return {.body = parse_block(false)}; }

private:
    std::vector<Statement> parse_block(bool nested) {
        std::vector<Statement> stmts;
        for (;;) {
            const auto& tok = tokens_[idx_];
            switch (tok.kind) {
            case Token::Kind::EndMarker: return stmts;
            case Token::Kind::Dedent:
                if (nested) {
                    ++idx_;
                    return stmts;
                }
                throw SyntaxError{"unexpected unindent", tok.line, tok.column};
            case Token::Kind::Indent:
                throw SyntaxError{"unexpected indent", tok.line, tok.column};
            case Token::Kind::Newline: ++idx_; continue;
            default: break;
            }
            stmts.emplace_back(parse_statement());
        }
    }

    Statement parse_statement() {
        Statement stmt;
        while (tokens_[idx_].kind != Token::Kind::Newline and
               tokens_[idx_].kind != Token::Kind::EndMarker)
        {
            stmt.tokens.emplace_back(tokens_[idx_++]);
        }
        if (tokens_[idx_].kind == Token::Kind::Newline) {
            ++idx_;
        }

        const auto& first = stmt.tokens.front();
        const auto& last = stmt.tokens.back();
        bool header = last.is_op(":");
        if (header and not is_compound_keyword(first) and not is_soft_compound_keyword(first)) {
            throw SyntaxError{"invalid syntax", last.line, last.column};
        }
        if (is_compound_keyword(first) and not has_top_level_colon(stmt.tokens)) {
            throw SyntaxError{"expected ':'", last.line, last.column + last.text.size()};
        }
        if (header) {
            const auto& next = tokens_[idx_];
            if (next.kind != Token::Kind::Indent) {
                throw SyntaxError{
                    concat_tostr(
                        "expected an indented block after '", first.text, "' statement on line ",
                        first.line),
                    next.line, next.column};
            }
            ++idx_;
            stmt.body = parse_block(true);
        }
        return stmt;
    }
};

} // namespace

std::vector<Token> tokenize(std::string_view source) { return Tokenizer{source}.run(); }

Module parse(std::string_view source) { return Parser{tokenize(source)}.run(); }

} // namespace sandtool::python
