#pragma once

#include "sandtool/file_descriptor.hh"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace sandtool::sandbox {

struct Options {
    struct Limits {
        // Real time limit, measured from the spawn; on expiry the process group receives
        // SIGTERM and, after kill_grace_period, SIGKILL
        std::optional<std::chrono::nanoseconds> real_time;
        std::chrono::nanoseconds kill_grace_period = std::chrono::seconds{1};
        // CPU time limit, rounded up to whole seconds (RLIMIT_CPU); SIGXCPU is delivered at the
        // limit and SIGKILL one second later
        std::optional<std::chrono::nanoseconds> cpu_time;
        // Limits total virtual memory size, in bytes
        std::optional<uint64_t> memory_limit;
        std::optional<uint64_t> stack_size_limit; // in bytes
        // Total size of the captured stdout and stderr; exceeding it kills the process group
        std::optional<uint64_t> output_size_limit;
        uint64_t max_file_size = 0; // RLIMIT_FSIZE, in bytes
        // Whether to allow opening files for writing and modifying the file system
        bool allow_file_writes = false;
        // Whether to allow fork(), vfork(), clone() of processes and executing other programs
        bool allow_process_creation = false;
        bool allow_sockets = false;
    } limits;

    std::string executable; // path to the program to run, as seen in the new root
    std::vector<std::string> args; // same as argv for execve()
    std::vector<std::string> env; // "NAME=value" entries

    struct BindMount {
        std::string source; // path on the host
        std::string dest; // absolute path in the new root
    };

    // The program runs in new user, pid, mount, network and IPC namespaces. Its root is a
    // read-only tmpfs holding the read-only bind mounts listed here and the working directory
    // (created empty unless a mount provides it); nothing else of the host file system is
    // visible.
    struct Filesystem {
        uint64_t root_size = 1 << 20; // in bytes
        std::vector<BindMount> mounts;
    } fs;

    std::string working_directory = "/";
    std::string stdin_data; // provided to the program as its standard input
    // Open descriptor 3 of the program as a pipe whose contents end up in Result::result_data
    bool capture_result_fd = false;
};

// Descriptor number under which the program sees the result pipe
constexpr int result_fd_number = 3;

struct Si {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    bool operator==(const Si&) const = default;

    [[nodiscard]] bool exited_successfully() const noexcept {
        return code == CLD_EXITED and status == 0;
    }

    [[nodiscard]] bool killed_by(int signum) const noexcept {
        return (code == CLD_KILLED or code == CLD_DUMPED) and status == signum;
    }

    // Returns textual description, e.g. "exited with 1", "killed by signal KILL - Killed"
    [[nodiscard]] std::string description() const;
};

struct Result {
    Si si{};
    // Real time from the spawn to the process death
    std::chrono::nanoseconds runtime{0};
    std::chrono::nanoseconds cpu_runtime{0};
    uint64_t peak_rss = 0; // in bytes
    std::string stdout_data;
    std::string stderr_data;
    std::string result_data; // see Options::capture_result_fd
    bool real_time_limit_exceeded = false;
    bool killed_after_grace_period = false; // SIGTERM was not enough
    bool output_size_limit_exceeded = false;
};

namespace detail {

// Parent's side of a spawned unit. The spawned process is the init of the new pid namespace;
// it forks the program and waits for it.
struct Tracee {
    pid_t pid = -1; // of the init process
    FileDescriptor pidfd;
    FileDescriptor stdout_fd;
    FileDescriptor stderr_fd;
    FileDescriptor result_fd; // not open unless Options::capture_result_fd
    FileDescriptor error_fd; // holds the error message written by the unit before execve()
    FileDescriptor status_fd; // holds si_code and si_status of the program, written by init
};

} // namespace detail

class future {
    detail::Tracee tracee_;
    Options::Limits limits_;
    std::chrono::steady_clock::time_point start_;

    future(
        detail::Tracee tracee, Options::Limits limits,
        std::chrono::steady_clock::time_point start) noexcept
    : tracee_{std::move(tracee)}
    , limits_{limits}
    , start_{start} {}

public:
    future(const future&) = delete;
    future(future&&) noexcept = default;
    future& operator=(const future&) = delete;
    future& operator=(future&&) = delete;

    // Kills and reaps the process if the result was not retrieved
    ~future();

    // Supervises the process until it dies and returns the result; throws an instance of
    // std::runtime_error on error. The process is dead and reaped once this returns or throws.
    Result get();

    friend future execute(const Options& options);
};

// Spawns the process and returns immediately; throws std::runtime_error on error
future execute(const Options& options);

// Whether the kernel lets this process create the namespaces execute() needs (unprivileged
// user namespaces may be disabled or filtered out by a container runtime)
[[nodiscard]] bool is_supported() noexcept;

// Host directories a dynamically linked interpreter needs: /usr, /lib, /lib64, /bin,
// /etc/ld.so.cache and similar, those that exist
std::vector<Options::BindMount> system_mounts();

} // namespace sandtool::sandbox
