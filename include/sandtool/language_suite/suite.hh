#pragma once

#include "sandtool/sandbox.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandtool::language_suite {

// A language suite interface
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class Suite {
protected:
    std::optional<sandbox::future> running_;

public:
    Suite() = default;

    Suite(const Suite&) = delete;
    Suite(Suite&&) noexcept = default;
    Suite& operator=(const Suite&) = delete;
    Suite& operator=(Suite&&) = delete;

    virtual ~Suite() = default;

    [[nodiscard]] virtual bool is_supported() const = 0;

    struct RunOptions {
        std::string stdin_data;
        std::chrono::nanoseconds time_limit;
        std::chrono::nanoseconds cpu_time_limit;
        std::chrono::nanoseconds kill_grace_period;
        uint64_t memory_limit_in_bytes;
        uint64_t max_stack_size_in_bytes;
        uint64_t output_size_limit_in_bytes;
        std::string working_directory;
    };

    // Starts running @p source; throws std::runtime_error if it cannot be started
    virtual void async_run(std::string_view source, const RunOptions& options) = 0;

    // Waits for the run started by async_run()
    virtual sandbox::Result await_result();

    // Whether an unsuccessful run died because the program ran out of memory, judging by
    // diagnostics specific to the language runtime
    [[nodiscard]] virtual bool is_memory_exhaustion(const sandbox::Result& res) const = 0;
};

} // namespace sandtool::language_suite
