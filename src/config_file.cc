#include "sandtool/concat_tostr.hh"
#include "sandtool/config_file.hh"
#include "sandtool/errmsg.hh"
#include "sandtool/macros/throw.hh"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <type_traits>

ConfigFile::ParseError::ParseError(size_t line, size_t column, const std::string& msg)
: std::runtime_error{concat_tostr("line ", line, ':', column, ": ", msg)}
, line_{line}
, column_{column} {}

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<bool> ConfigFile::Variable::as_bool() const noexcept {
    if (not set_ or array_) {
        return std::nullopt;
    }
    for (auto word : {"true", "yes", "on", "1"}) {
        if (iequals(str_, word)) {
            return true;
        }
    }
    for (auto word : {"false", "no", "off", "0"}) {
        if (iequals(str_, word)) {
            return false;
        }
    }
    return std::nullopt;
}

template <class T>
std::optional<T> ConfigFile::Variable::as() const noexcept {
    static_assert(std::is_arithmetic_v<T>);
    if (not set_ or array_ or str_.empty()) {
        return std::nullopt;
    }
    T val{};
    const char* end = str_.data() + str_.size();
    auto [ptr, ec] = std::from_chars(str_.data(), end, val);
    if (ec != std::errc{} or ptr != end) {
        return std::nullopt;
    }
    return val;
}

template std::optional<int> ConfigFile::Variable::as<int>() const noexcept;
template std::optional<uint64_t> ConfigFile::Variable::as<uint64_t>() const noexcept;
template std::optional<double> ConfigFile::Variable::as<double>() const noexcept;

void ConfigFile::add_vars(std::initializer_list<std::string_view> names) {
    for (auto name : names) {
        vars_.try_emplace(std::string{name});
    }
}

void ConfigFile::reset_vars() noexcept {
    for (auto& [name, var] : vars_) {
        var.set_ = false;
        var.array_ = false;
        var.str_.clear();
        var.arr_.clear();
    }
}

const ConfigFile::Variable& ConfigFile::get_var(std::string_view name) const noexcept {
    static const Variable unset_var;
    auto it = vars_.find(name);
    return it == vars_.end() ? unset_var : it->second;
}

void ConfigFile::load_config_from_file(const std::string& path) {
    std::ifstream file{path};
    if (not file.is_open()) {
        THROW("cannot open config file \"", path, '"', errmsg());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        THROW("cannot read config file \"", path, '"');
    }
    load_config_from_string(contents.view());
}

namespace {

class Parser {
    std::string_view buff_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t line_start_ = 0;

public:
    explicit Parser(std::string_view buff) noexcept
    : buff_{buff} {}

    [[noreturn]] void error(const std::string& msg) const {
        throw ConfigFile::ParseError{line_, pos_ - line_start_ + 1, msg};
    }

    [[nodiscard]] bool eof() const noexcept { return pos_ >= buff_.size(); }

    [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : buff_[pos_]; }

    void advance() noexcept {
        if (buff_[pos_] == '\n') {
            ++line_;
            line_start_ = pos_ + 1;
        }
        ++pos_;
    }

    void skip_blanks() noexcept {
        while (peek() == ' ' or peek() == '\t' or peek() == '\r') {
            advance();
        }
    }

    void skip_comment() noexcept {
        if (peek() == '#') {
            while (not eof() and peek() != '\n') {
                advance();
            }
        }
    }

    // Skips whitespace, newlines and comments
    void skip_space() noexcept {
        for (;;) {
            skip_blanks();
            skip_comment();
            if (peek() != '\n') {
                return;
            }
            advance();
        }
    }

    static bool is_name_char(char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '-' or c == '.';
    }

    std::string_view parse_name() {
        size_t beg = pos_;
        while (is_name_char(peek())) {
            advance();
        }
        if (beg == pos_) {
            error("expected variable name");
        }
        return buff_.substr(beg, pos_ - beg);
    }

    std::string parse_single_quoted() {
        advance(); // '
        std::string res;
        for (;;) {
            if (eof() or peek() == '\n') {
                error("unterminated string");
            }
            if (peek() == '\'') {
                advance();
                return res;
            }
            res += peek();
            advance();
        }
    }

    std::string parse_double_quoted() {
        advance(); // "
        std::string res;
        for (;;) {
            if (eof() or peek() == '\n') {
                error("unterminated string");
            }
            char c = peek();
            if (c == '"') {
                advance();
                return res;
            }
            if (c == '\\') {
                advance();
                switch (peek()) {
                case 'n': res += '\n'; break;
                case 't': res += '\t'; break;
                case 'r': res += '\r'; break;
                case '0': res += '\0'; break;
                case '\\':
                case '"':
                case '\'': res += peek(); break;
                default: error(concat_tostr("invalid escape sequence: \\", peek()));
                }
                advance();
                continue;
            }
            res += c;
            advance();
        }
    }

    // Unquoted value ends at a newline, a comment or (inside an array) at ',' or ']'
    std::string parse_unquoted(bool in_array) {
        size_t beg = pos_;
        while (not eof() and peek() != '\n' and peek() != '#' and
               not(in_array and (peek() == ',' or peek() == ']')))
        {
            advance();
        }
        auto val = buff_.substr(beg, pos_ - beg);
        while (not val.empty() and std::isspace(static_cast<unsigned char>(val.back()))) {
            val.remove_suffix(1);
        }
        return std::string{val};
    }

    std::string parse_scalar(bool in_array) {
        switch (peek()) {
        case '\'': return parse_single_quoted();
        case '"': return parse_double_quoted();
        default: return parse_unquoted(in_array);
        }
    }

    std::vector<std::string> parse_array() {
        advance(); // [
        std::vector<std::string> res;
        for (;;) {
            skip_space();
            if (eof()) {
                error("unterminated array");
            }
            if (peek() == ']') {
                advance();
                return res;
            }
            if (peek() == ',') {
                error("empty array element");
            }
            res.emplace_back(parse_scalar(true));
            skip_space();
            if (peek() == ',') {
                advance();
            } else if (peek() != ']') {
                error("expected ',' or ']' after array element");
            }
        }
    }

    void expect_end_of_line() {
        skip_blanks();
        skip_comment();
        if (not eof() and peek() != '\n') {
            error(concat_tostr("unexpected character: '", peek(), '\''));
        }
    }

    template <class Func>
    void parse(Func&& on_variable) {
        for (;;) {
            skip_space();
            if (eof()) {
                return;
            }
            auto name = parse_name();
            skip_blanks();
            if (peek() != ':' and peek() != '=') {
                error("expected ':' or '=' after variable name");
            }
            advance();
            skip_blanks();
            if (peek() == '[') {
                on_variable(name, parse_array());
            } else {
                on_variable(name, parse_scalar(false));
            }
            expect_end_of_line();
        }
    }
};

} // namespace

void ConfigFile::load_config_from_string(std::string_view config) {
    Parser parser{config};
    parser.parse([&]<class Value>(std::string_view name, Value&& value) {
        auto it = vars_.find(name);
        if (it == vars_.end()) {
            return; // not registered
        }
        auto& var = it->second;
        var.set_ = true;
        if constexpr (std::is_same_v<std::decay_t<Value>, std::string>) {
            var.array_ = false;
            var.str_ = std::forward<Value>(value);
            var.arr_.clear();
        } else {
            var.array_ = true;
            var.str_.clear();
            var.arr_ = std::forward<Value>(value);
        }
    });
}
