#include "sandtool/concat_tostr.hh"
#include "sandtool/python_syntax.hh"
#include "sandtool/validator.hh"

#include <algorithm>
#include <cctype>
#include <optional>

using sandtool::python::Statement;
using sandtool::python::Token;

namespace sandtool {

const char* to_string(ValidationVerdict::Kind kind) noexcept {
    using K = ValidationVerdict::Kind;
    switch (kind) {
    case K::Safe: return "Safe";
    case K::Unsafe: return "Unsafe";
    case K::SyntaxError: return "SyntaxError";
    }
    return "unknown";
}

const char* to_string(ValidationVerdict::Reason reason) noexcept {
    using R = ValidationVerdict::Reason;
    switch (reason) {
    case R::None: return "None";
    case R::InputTooLong: return "InputTooLong";
    case R::BlockedToken: return "BlockedToken";
    case R::NonAsciiIdentifier: return "NonAsciiIdentifier";
    case R::FunctionDefinition: return "FunctionDefinition";
    case R::ClassDefinition: return "ClassDefinition";
    case R::GlobalDeclaration: return "GlobalDeclaration";
    case R::ForbiddenImport: return "ForbiddenImport";
    case R::ForbiddenName: return "ForbiddenName";
    case R::DunderAttribute: return "DunderAttribute";
    case R::PrivateAttribute: return "PrivateAttribute";
    case R::ForbiddenConstruct: return "ForbiddenConstruct";
    case R::NestingTooDeep: return "NestingTooDeep";
    case R::NumericLimit: return "NumericLimit";
    case R::InvalidArgument: return "InvalidArgument";
    case R::InvalidResourceLimit: return "InvalidResourceLimit";
    }
    return "unknown";
}

std::string ValidationVerdict::description() const {
    switch (kind) {
    case Kind::Safe: return "Safe";
    case Kind::Unsafe: return concat_tostr("Unsafe (", to_string(reason), "): ", detail);
    case Kind::SyntaxError:
        if (line == 0) {
            return concat_tostr("SyntaxError: ", detail);
        }
        return concat_tostr("SyntaxError at line ", line, ", column ", column, ": ", detail);
    }
    return "unknown";
}

ValidationProfile ValidationProfile::for_scripts(const Config::Validation& config) {
    return {
        .max_length = config.max_script_length,
        .blocked_tokens = config.blocked_tokens,
        .blocked_patterns = {},
        .forbidden_names = config.forbidden_names,
        .allowed_imports = config.allowed_imports,
        .structural_screen = true,
    };
}

ValidationProfile ValidationProfile::for_expressions(const Config::Validation& config) {
    return {
        .max_length = config.max_expression_length,
        .blocked_tokens = config.blocked_tokens,
        .blocked_patterns = config.calculator_blocked_patterns,
        .forbidden_names = {},
        .allowed_imports = {},
        .structural_screen = false,
    };
}

namespace {

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
}

std::string to_lower(std::string_view str) {
    std::string res{str};
    for (auto& c : res) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return res;
}

// Finds @p token in @p text respecting identifier boundaries
bool contains_token(std::string_view text, std::string_view token) noexcept {
    if (token.empty()) {
        return false;
    }
    bool check_front = is_ident_char(token.front());
    bool check_back = check_front and is_ident_char(token.back());
    for (size_t pos = text.find(token); pos != std::string_view::npos;
         pos = text.find(token, pos + 1))
    {
        if (check_front and pos > 0 and is_ident_char(text[pos - 1])) {
            continue;
        }
        size_t end = pos + token.size();
        if (check_back and end < text.size() and is_ident_char(text[end])) {
            continue;
        }
        return true;
    }
    return false;
}

bool is_ascii(std::string_view str) noexcept {
    return std::all_of(str.begin(), str.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

class StructureScreen {
    const ValidationProfile& profile_;

public:
    explicit StructureScreen(const ValidationProfile& profile) noexcept
    : profile_{profile} {}

    std::optional<ValidationVerdict> walk(const std::vector<Statement>& stmts) const {
        for (const auto& stmt : stmts) {
            if (auto verdict = check_statement(stmt.tokens)) {
                return verdict;
            }
            if (auto verdict = walk(stmt.body)) {
                return verdict;
            }
        }
        return std::nullopt;
    }

private:
    static ValidationVerdict at(const Token& tok, ValidationVerdict::Reason reason,
        std::string_view what) {
        return ValidationVerdict::unsafe(
            reason, concat_tostr(what, " at line ", tok.line, ", column ", tok.column));
    }

    [[nodiscard]] bool is_forbidden_name(std::string_view name) const noexcept {
        return std::find(profile_.forbidden_names.begin(), profile_.forbidden_names.end(),
                   name) != profile_.forbidden_names.end();
    }

    [[nodiscard]] bool is_allowed_module(std::string_view module) const noexcept {
        return std::find(profile_.allowed_imports.begin(), profile_.allowed_imports.end(),
                   module) != profile_.allowed_imports.end();
    }

    // Indices at which simple statements begin: 0, after each top-level ';' and after the
    // top-level ':' of a compound statement header written on a single line
    static std::vector<size_t> segment_starts(const std::vector<Token>& tokens) {
        std::vector<size_t> starts = {0};
        int depth = 0;
        bool header_colon_seen = false;
        bool compound = tokens[0].kind == Token::Kind::Name and
            (tokens[0].text == "if" or tokens[0].text == "elif" or tokens[0].text == "else" or
             tokens[0].text == "for" or tokens[0].text == "while" or tokens[0].text == "try" or
             tokens[0].text == "except" or tokens[0].text == "finally" or
             tokens[0].text == "with" or tokens[0].text == "async");
        for (size_t i = 0; i < tokens.size(); ++i) {
            const auto& tok = tokens[i];
            if (tok.kind != Token::Kind::Operator) {
                continue;
            }
            if (tok.text == "(" or tok.text == "[" or tok.text == "{") {
                ++depth;
            } else if (tok.text == ")" or tok.text == "]" or tok.text == "}") {
                --depth;
            } else if (depth == 0 and tok.text == ";") {
                starts.emplace_back(i + 1);
            } else if (depth == 0 and tok.text == ":" and compound and not header_colon_seen) {
                header_colon_seen = true;
                starts.emplace_back(i + 1);
            }
        }
        return starts;
    }

    std::optional<ValidationVerdict>
    check_import(const std::vector<Token>& tokens, size_t i) const {
        using R = ValidationVerdict::Reason;
        const auto& kw = tokens[i];
        if (kw.is_name("from")) {
            if (i + 1 >= tokens.size()) {
                return std::nullopt;
            }
            const auto& mod = tokens[i + 1];
            if (mod.is_op(".") or mod.is_op("...")) {
                return at(mod, R::ForbiddenImport, "relative import");
            }
            if (mod.kind == Token::Kind::Name and not is_allowed_module(mod.text)) {
                return at(mod, R::ForbiddenImport, concat_tostr("import of '", mod.text, '\''));
            }
            return std::nullopt;
        }
        // import a.b as c, d
        bool expect_module = true;
        for (size_t j = i + 1; j < tokens.size() and not tokens[j].is_op(";"); ++j) {
            const auto& tok = tokens[j];
            if (tok.is_op(",")) {
                expect_module = true;
            } else if (expect_module and tok.kind == Token::Kind::Name) {
                if (not is_allowed_module(tok.text)) {
                    return at(
                        tok, R::ForbiddenImport, concat_tostr("import of '", tok.text, '\''));
                }
                expect_module = false;
            }
        }
        return std::nullopt;
    }

    std::optional<ValidationVerdict> check_statement(const std::vector<Token>& tokens) const {
        using R = ValidationVerdict::Reason;
        if (tokens.empty()) {
            return std::nullopt;
        }
        for (size_t start : segment_starts(tokens)) {
            if (start < tokens.size() and
                (tokens[start].is_name("import") or tokens[start].is_name("from")))
            {
                if (auto verdict = check_import(tokens, start)) {
                    return verdict;
                }
            }
        }
        for (size_t i = 0; i < tokens.size(); ++i) {
            const auto& tok = tokens[i];
            switch (tok.kind) {
            case Token::Kind::Name:
                if (not is_ascii(tok.text)) {
                    return at(tok, R::NonAsciiIdentifier, "non-ASCII identifier");
                }
                if (tok.text == "def") {
                    return at(tok, R::FunctionDefinition, "function definition");
                }
                if (tok.text == "class") {
                    return at(tok, R::ClassDefinition, "class definition");
                }
                if (tok.text == "global" or tok.text == "nonlocal") {
                    return at(
                        tok, R::GlobalDeclaration, concat_tostr('\'', tok.text, "' declaration"));
                }
                if (is_forbidden_name(tok.text)) {
                    return at(tok, R::ForbiddenName, concat_tostr("use of '", tok.text, '\''));
                }
                break;
            case Token::Kind::Operator:
                if (tok.text == "." and i + 1 < tokens.size() and
                    tokens[i + 1].kind == Token::Kind::Name and
                    tokens[i + 1].text.starts_with('_'))
                {
                    // Modules keep private aliases of other modules, e.g. random._os
                    return at(
                        tokens[i + 1],
                        tokens[i + 1].text.starts_with("__") ? R::DunderAttribute
                                                             : R::PrivateAttribute,
                        concat_tostr("access to attribute '", tokens[i + 1].text, '\''));
                }
                break;
            case Token::Kind::String:
                if (tok.is_fstring() and tok.text.find(".__") != std::string_view::npos) {
                    return at(tok, R::DunderAttribute, "double-underscore attribute in f-string");
                }
                if (tok.is_fstring() and tok.text.find("._") != std::string_view::npos) {
                    return at(tok, R::PrivateAttribute, "private attribute in f-string");
                }
                break;
            default: break;
            }
        }
        return std::nullopt;
    }
};

} // namespace

Validator::Validator(ValidationProfile profile)
: profile_{std::move(profile)} {
    for (auto& token : profile_.blocked_tokens) {
        token = to_lower(token);
    }
}

ValidationVerdict Validator::validate(std::string_view text) const {
    if (text.size() > profile_.max_length) {
        return ValidationVerdict::unsafe(
            ValidationVerdict::Reason::InputTooLong,
            concat_tostr("input has ", text.size(), " characters, at most ",
                profile_.max_length, " are allowed"));
    }
    if (auto verdict = check_lexical(text); not verdict.is_safe()) {
        return verdict;
    }
    if (profile_.structural_screen) {
        return check_structure(text);
    }
    return ValidationVerdict::safe();
}

ValidationVerdict Validator::check_lexical(std::string_view text) const {
    auto lower = to_lower(text);
    for (const auto& token : profile_.blocked_tokens) {
        if (contains_token(lower, token)) {
            return ValidationVerdict::unsafe(
                ValidationVerdict::Reason::BlockedToken, concat_tostr("blocked token: ", token));
        }
    }
    for (const auto& pattern : profile_.blocked_patterns) {
        if (not pattern.empty() and text.find(pattern) != std::string_view::npos) {
            return ValidationVerdict::unsafe(
                ValidationVerdict::Reason::BlockedToken,
                concat_tostr("blocked pattern: ", pattern));
        }
    }
    return ValidationVerdict::safe();
}

ValidationVerdict Validator::check_structure(std::string_view text) const {
    python::Module module;
    try {
        module = python::parse(text);
    } catch (const python::SyntaxError& e) {
        return ValidationVerdict::syntax_error(e.what(), e.line(), e.column());
    }
    if (auto verdict = StructureScreen{profile_}.walk(module.body)) {
        return std::move(*verdict);
    }
    return ValidationVerdict::safe();
}

} // namespace sandtool
