#pragma once

#include "sandtool/config.hh"
#include "sandtool/errors.hh"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandtool {

struct ValidationVerdict {
    enum class Kind : uint8_t {
        Safe,
        Unsafe,
        SyntaxError,
    } kind = Kind::Safe;

    enum class Reason : uint8_t {
        None,
        InputTooLong,
        BlockedToken,
        NonAsciiIdentifier,
        FunctionDefinition,
        ClassDefinition,
        GlobalDeclaration,
        ForbiddenImport,
        ForbiddenName,
        DunderAttribute,
        PrivateAttribute,
        ForbiddenConstruct,
        NestingTooDeep,
        NumericLimit,
        InvalidArgument,
        InvalidResourceLimit,
    } reason = Reason::None;

    std::string detail;
    // Position of a syntax error, 1-based; 0 if unknown
    size_t line = 0;
    size_t column = 0;

    static ValidationVerdict safe() { return {}; }

    static ValidationVerdict unsafe(Reason reason, std::string detail) {
        return {.kind = Kind::Unsafe, .reason = reason, .detail = std::move(detail)};
    }

    static ValidationVerdict syntax_error(std::string detail, size_t line, size_t column) {
        return {
            .kind = Kind::SyntaxError,
            .detail = std::move(detail),
            .line = line,
            .column = column,
        };
    }

    [[nodiscard]] bool is_safe() const noexcept { return kind == Kind::Safe; }

    [[nodiscard]] ErrorKind error_kind() const noexcept {
        return kind == Kind::SyntaxError ? ErrorKind::SyntaxError : ErrorKind::ValidationError;
    }

    // E.g. "Unsafe (BlockedToken): os"
    [[nodiscard]] std::string description() const;
};

const char* to_string(ValidationVerdict::Kind kind) noexcept;
const char* to_string(ValidationVerdict::Reason reason) noexcept;

struct ValidationProfile {
    size_t max_length;
    // Matched in the lowercased input; a token beginning with an identifier character matches
    // only if it is not preceded by one, and if it also ends with one, not followed by one
    std::vector<std::string> blocked_tokens;
    // Matched anywhere in the input
    std::vector<std::string> blocked_patterns;
    // Used only by the structural screen
    std::vector<std::string> forbidden_names;
    std::vector<std::string> allowed_imports;
    // Parse input as Python and screen its statements
    bool structural_screen;

    static ValidationProfile for_scripts(const Config::Validation& config);
    static ValidationProfile for_expressions(const Config::Validation& config);
};

// Screens untrusted input before anything runs. Checks are applied in order: length, blocked
// tokens and patterns, structure; the first failing check determines the verdict.
class Validator {
    ValidationProfile profile_;

public:
    explicit Validator(ValidationProfile profile);

    [[nodiscard]] ValidationVerdict validate(std::string_view text) const;

    [[nodiscard]] const ValidationProfile& profile() const noexcept { return profile_; }

private:
    [[nodiscard]] ValidationVerdict check_lexical(std::string_view text) const;

    [[nodiscard]] ValidationVerdict check_structure(std::string_view text) const;
};

} // namespace sandtool
