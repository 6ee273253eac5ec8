#include "sandtool/config.hh"
#include "sandtool/config_file.hh"
#include "sandtool/macros/throw.hh"

#include <chrono>
#include <cmath>

using std::chrono::duration;
using std::chrono::duration_cast;
using std::chrono::nanoseconds;

namespace {

nanoseconds seconds_to_duration(double secs) {
    return duration_cast<nanoseconds>(duration<double>{secs});
}

constexpr std::string_view config_vars[] = {
    "max_script_length",
    "max_expression_length",
    "blocked_tokens",
    "forbidden_names",
    "allowed_imports",
    "calculator_blocked_patterns",
    "max_magnitude",
    "max_factorial_argument",
    "max_exponent",
    "calculator_timeout_seconds",
    "max_nesting_depth",
    "python_executable",
    "working_directory",
    "default_memory_mb",
    "min_memory_mb",
    "default_cpu_seconds",
    "default_timeout_seconds",
    "max_memory_mb",
    "max_cpu_seconds",
    "max_timeout_seconds",
    "kill_grace_period_seconds",
    "output_size_limit_bytes",
    "max_test_cases",
    "request_timeout_seconds",
    "max_concurrent_sandboxes",
    "admission_timeout_seconds",
};

class Overlay {
    const ConfigFile& cf_;

public:
    explicit Overlay(const ConfigFile& cf) noexcept
    : cf_{cf} {}

    template <class T>
    void number(std::string_view name, T& dest) const {
        const auto& var = cf_[name];
        if (not var.is_set()) {
            return;
        }
        auto val = var.as<T>();
        if (not val) {
            THROW("config: ", name, ": expected a number, got \"", var.as_string(), '"');
        }
        dest = *val;
    }

    void seconds(std::string_view name, nanoseconds& dest) const {
        const auto& var = cf_[name];
        if (not var.is_set()) {
            return;
        }
        auto val = var.as<double>();
        if (not val or not std::isfinite(*val) or *val < 0) {
            THROW("config: ", name, ": expected a non-negative number of seconds, got \"",
                var.as_string(), '"');
        }
        dest = seconds_to_duration(*val);
    }

    void string(std::string_view name, std::string& dest) const {
        const auto& var = cf_[name];
        if (not var.is_set()) {
            return;
        }
        if (var.is_array()) {
            THROW("config: ", name, ": expected a string, got an array");
        }
        dest = var.as_string();
    }

    void array(std::string_view name, std::vector<std::string>& dest) const {
        const auto& var = cf_[name];
        if (not var.is_set()) {
            return;
        }
        if (not var.is_array()) {
            THROW("config: ", name, ": expected an array");
        }
        dest = var.as_array();
    }
};

} // namespace

namespace sandtool {

Config Config::defaults() {
    using std::chrono::seconds;
    return {
        .validation =
            {
                .max_script_length = 10000,
                .max_expression_length = 1000,
                .blocked_tokens =
                    {
                        "eval(",        "exec(",          "compile(",   "open(",
                        "globals(",     "locals(",        "getattr(",   "setattr(",
                        "delattr(",     "breakpoint(",    "__import__", "importlib",
                        "__builtins__", "builtins",       "__class__",  "__bases__",
                        "__base__",     "__mro__",        "__subclasses__",
                        "__globals__",  "__code__",       "__closure__", "__dict__",
                        "__getattribute__", "__reduce__", "__loader__", "__spec__",
                        "f_globals",    "f_locals",       "f_back",     "tb_frame",
                        "gi_frame",     "os",             "sys",        "subprocess",
                        "socket",       "shutil",         "pathlib",    "ctypes",
                        "pickle",       "marshal",        "multiprocessing",
                        "threading",    "urllib",         "tempfile",   "pty",
                        "posix",        "\\x",            "\\u",
                    },
                .forbidden_names =
                    {
                        "eval",    "exec",    "compile", "open",       "__import__",
                        "globals", "locals",  "vars",    "dir",        "getattr",
                        "setattr", "delattr", "hasattr", "breakpoint", "memoryview",
                        "help",
                    },
                .allowed_imports =
                    {
                        "math",
                        "random",
                        "datetime",
                        "json",
                        "re",
                        "collections",
                        "itertools",
                        "functools",
                        "statistics",
                        "fractions",
                    },
                .calculator_blocked_patterns =
                    {
                        std::string(20, '*'),
                        "factorial(factorial(factorial(factorial(factorial(",
                        std::string(50, '+'),
                    },
            },
        .calculator =
            {
                .max_magnitude = 1e100,
                .max_factorial_argument = 1000,
                .max_exponent = 1000,
                .timeout = seconds{5},
                .max_nesting_depth = 64,
            },
        .sandbox =
            {
                .python_executable = "/usr/bin/python3",
                .working_directory = "/tmp",
                .default_memory_mb = 128,
                .min_memory_mb = 64,
                .default_cpu_time = seconds{5},
                .default_timeout = seconds{5},
                .max_memory_mb = 512,
                .max_cpu_time = seconds{30},
                .max_timeout = seconds{30},
                .kill_grace_period = seconds{1},
                .output_size_limit_bytes = 64 << 10,
                .max_test_cases = 20,
                .request_timeout = seconds{60},
                .max_concurrent_sandboxes = 4,
                .admission_timeout = seconds{30},
            },
    };
}

namespace {

ConfigFile make_config_file() {
    ConfigFile cf;
    for (auto name : config_vars) {
        cf.add_vars({name});
    }
    return cf;
}

Config overlay_defaults(const ConfigFile& cf) {
    auto config = Config::defaults();
    Overlay ov{cf};
    ov.number("max_script_length", config.validation.max_script_length);
    ov.number("max_expression_length", config.validation.max_expression_length);
    ov.array("blocked_tokens", config.validation.blocked_tokens);
    ov.array("forbidden_names", config.validation.forbidden_names);
    ov.array("allowed_imports", config.validation.allowed_imports);
    ov.array("calculator_blocked_patterns", config.validation.calculator_blocked_patterns);

    ov.number("max_magnitude", config.calculator.max_magnitude);
    ov.number("max_factorial_argument", config.calculator.max_factorial_argument);
    ov.number("max_exponent", config.calculator.max_exponent);
    ov.seconds("calculator_timeout_seconds", config.calculator.timeout);
    ov.number("max_nesting_depth", config.calculator.max_nesting_depth);

    ov.string("python_executable", config.sandbox.python_executable);
    ov.string("working_directory", config.sandbox.working_directory);
    ov.number("default_memory_mb", config.sandbox.default_memory_mb);
    ov.number("min_memory_mb", config.sandbox.min_memory_mb);
    ov.seconds("default_cpu_seconds", config.sandbox.default_cpu_time);
    ov.seconds("default_timeout_seconds", config.sandbox.default_timeout);
    ov.number("max_memory_mb", config.sandbox.max_memory_mb);
    ov.seconds("max_cpu_seconds", config.sandbox.max_cpu_time);
    ov.seconds("max_timeout_seconds", config.sandbox.max_timeout);
    ov.seconds("kill_grace_period_seconds", config.sandbox.kill_grace_period);
    ov.number("output_size_limit_bytes", config.sandbox.output_size_limit_bytes);
    ov.number("max_test_cases", config.sandbox.max_test_cases);
    ov.seconds("request_timeout_seconds", config.sandbox.request_timeout);
    ov.number("max_concurrent_sandboxes", config.sandbox.max_concurrent_sandboxes);
    ov.seconds("admission_timeout_seconds", config.sandbox.admission_timeout);

    config.check();
    return config;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    auto cf = make_config_file();
    cf.load_config_from_file(path);
    return overlay_defaults(cf);
}

Config Config::load_from_string(std::string_view contents) {
    auto cf = make_config_file();
    cf.load_config_from_string(contents);
    return overlay_defaults(cf);
}

void Config::check() const {
    if (validation.max_script_length == 0) {
        THROW("config: max_script_length has to be positive");
    }
    if (validation.max_expression_length == 0) {
        THROW("config: max_expression_length has to be positive");
    }
    if (not std::isfinite(calculator.max_magnitude) or calculator.max_magnitude <= 0) {
        THROW("config: max_magnitude has to be a positive number");
    }
    if (not std::isfinite(calculator.max_exponent) or calculator.max_exponent <= 0) {
        THROW("config: max_exponent has to be a positive number");
    }
    if (calculator.timeout <= nanoseconds::zero()) {
        THROW("config: calculator_timeout_seconds has to be positive");
    }
    if (calculator.max_nesting_depth == 0) {
        THROW("config: max_nesting_depth has to be positive");
    }
    if (sandbox.python_executable.empty()) {
        THROW("config: python_executable cannot be empty");
    }
    if (sandbox.working_directory.empty()) {
        THROW("config: working_directory cannot be empty");
    }
    if (sandbox.min_memory_mb == 0 or sandbox.min_memory_mb > sandbox.max_memory_mb) {
        THROW("config: min_memory_mb has to be in range [1, max_memory_mb]");
    }
    if (sandbox.default_memory_mb < sandbox.min_memory_mb or
        sandbox.default_memory_mb > sandbox.max_memory_mb)
    {
        THROW("config: default_memory_mb has to be in range [min_memory_mb, max_memory_mb]");
    }
    if (sandbox.default_cpu_time <= nanoseconds::zero() or
        sandbox.default_cpu_time > sandbox.max_cpu_time)
    {
        THROW("config: default_cpu_seconds has to be in range (0, max_cpu_seconds]");
    }
    if (sandbox.default_timeout <= nanoseconds::zero() or
        sandbox.default_timeout > sandbox.max_timeout)
    {
        THROW("config: default_timeout_seconds has to be in range (0, max_timeout_seconds]");
    }
    if (sandbox.output_size_limit_bytes == 0) {
        THROW("config: output_size_limit_bytes has to be positive");
    }
    if (sandbox.max_test_cases == 0) {
        THROW("config: max_test_cases has to be positive");
    }
    if (sandbox.request_timeout < sandbox.max_timeout) {
        THROW("config: request_timeout_seconds cannot be smaller than max_timeout_seconds");
    }
    if (sandbox.max_concurrent_sandboxes == 0) {
        THROW("config: max_concurrent_sandboxes has to be positive");
    }
}

} // namespace sandtool
