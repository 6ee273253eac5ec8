#pragma once

#include "sandtool/language_suite/suite.hh"

#include <string>

namespace sandtool::language_suite {

// Runs a Python 3 source with an isolated interpreter (no site packages, no user environment,
// no bytecode writing). The input comes on stdin and as the input_data variable. A source that
// is a single expression is evaluated and the repr() of its value is returned in
// sandbox::Result::result_data.
class Python final : public Suite {
    std::string interpreter_path_;

public:
    explicit Python(std::string interpreter_path);

    [[nodiscard]] bool is_supported() const final;

    void async_run(std::string_view source, const RunOptions& options) final;

    [[nodiscard]] bool is_memory_exhaustion(const sandbox::Result& res) const final;

    [[nodiscard]] const std::string& interpreter_path() const noexcept {
        return interpreter_path_;
    }
};

} // namespace sandtool::language_suite
