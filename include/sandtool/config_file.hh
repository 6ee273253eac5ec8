#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Parser of simple configuration files
//
// Format:
//   # comment
//   name: value
//   name = 'single quoted, no escapes'
//   name = "double quoted with \n, \t, \\, \" and \' escapes"
//   name: [a, 'b', "c"]   # arrays may span many lines
//
// Only variables registered with add_vars() are kept, other names are ignored. A later
// occurrence of a variable overrides the earlier one.
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        size_t line_;
        size_t column_;

    public:
        ParseError(size_t line, size_t column, const std::string& msg);

        [[nodiscard]] size_t line() const noexcept { return line_; }

        [[nodiscard]] size_t column() const noexcept { return column_; }
    };

    class Variable {
        bool set_ = false;
        bool array_ = false;
        std::string str_;
        std::vector<std::string> arr_;

        friend class ConfigFile;

    public:
        [[nodiscard]] bool is_set() const noexcept { return set_; }

        [[nodiscard]] bool is_array() const noexcept { return array_; }

        // Accepts: true/false, yes/no, on/off, 1/0 (case-insensitive)
        [[nodiscard]] std::optional<bool> as_bool() const noexcept;

        // Parses an integer or a floating-point number; nullopt if the value is not a scalar of
        // type T
        template <class T>
        [[nodiscard]] std::optional<T> as() const noexcept;

        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;

public:
    void add_vars(std::initializer_list<std::string_view> names);

    // Unsets all variables, registrations are kept
    void reset_vars() noexcept;

    // Returns an unset variable if @p name was not registered
    [[nodiscard]] const Variable& get_var(std::string_view name) const noexcept;

    const Variable& operator[](std::string_view name) const noexcept { return get_var(name); }

    [[nodiscard]] const std::map<std::string, Variable, std::less<>>& get_vars() const noexcept {
        return vars_;
    }

    // Throws std::runtime_error if the file cannot be read and ParseError on invalid contents
    void load_config_from_file(const std::string& path);

    // Throws ParseError on invalid contents
    void load_config_from_string(std::string_view config);
};

extern template std::optional<int> ConfigFile::Variable::as<int>() const noexcept;
extern template std::optional<uint64_t> ConfigFile::Variable::as<uint64_t>() const noexcept;
extern template std::optional<double> ConfigFile::Variable::as<double>() const noexcept;
