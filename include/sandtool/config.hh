#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sandtool {

// Startup configuration, loaded once and passed by value to the components
struct Config {
    struct Validation {
        size_t max_script_length;
        size_t max_expression_length;
        // Matched against the lowercased input at identifier boundaries
        std::vector<std::string> blocked_tokens;
        // Names that scripts must not reference (outside of strings and comments)
        std::vector<std::string> forbidden_names;
        // Top-level modules that scripts may import
        std::vector<std::string> allowed_imports;
        // Matched anywhere in calculator input
        std::vector<std::string> calculator_blocked_patterns;
    } validation;

    struct Calculator {
        double max_magnitude;
        uint64_t max_factorial_argument;
        double max_exponent;
        std::chrono::nanoseconds timeout;
        size_t max_nesting_depth;
    } calculator;

    struct Sandbox {
        std::string python_executable;
        std::string working_directory;
        uint64_t default_memory_mb;
        // Smaller memory overrides are raised to this; the interpreter cannot start below it
        uint64_t min_memory_mb;
        std::chrono::nanoseconds default_cpu_time;
        std::chrono::nanoseconds default_timeout;
        uint64_t max_memory_mb;
        std::chrono::nanoseconds max_cpu_time;
        std::chrono::nanoseconds max_timeout;
        std::chrono::nanoseconds kill_grace_period;
        uint64_t output_size_limit_bytes;
        size_t max_test_cases;
        // Wall-clock budget shared by all test cases of a request
        std::chrono::nanoseconds request_timeout;
        size_t max_concurrent_sandboxes;
        std::chrono::nanoseconds admission_timeout;
    } sandbox;

    static Config defaults();

    // Values from the file override the defaults. Throws ConfigFile::ParseError or
    // std::runtime_error on invalid file.
    static Config load_from_file(const std::string& path);

    static Config load_from_string(std::string_view contents);

    // Throws std::runtime_error describing the first inconsistent value
    void check() const;
};

} // namespace sandtool
