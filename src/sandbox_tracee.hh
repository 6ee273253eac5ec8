#pragma once

#include "sandtool/sandbox.hh"

#include <linux/filter.h>
#include <string>
#include <sys/capability.h>
#include <sys/types.h>
#include <vector>

namespace sandtool::sandbox::tracee {

// The program is the first process the init forks, so inside the pid namespace its pid is
// always 2
constexpr pid_t program_pid = 2;

// New root is assembled under this directory before pivot_root()
constexpr const char staging_root[] = "/proc";

struct PreparedMount {
    std::string source;
    std::string staging_dest; // staging_root + dest
    bool is_directory;
    // Flags of the source mount that cannot be changed from inside the user namespace
    unsigned long locked_flags;
};

// Everything the child needs, prepared by the parent because the child must not allocate
struct Prepared {
    const Options::Limits& limits;
    const char* executable;
    char* const* argv;
    char* const* envp;
    const char* working_directory;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int result_fd; // -1 if the program does not get the result pipe
    int error_fd;
    int status_fd;
    // Pipe the parent waits on until the child has set PR_SET_PDEATHSIG
    int sync_read_fd;
    int sync_write_fd;
    const char* uid_map;
    const char* gid_map;
    const char* root_mount_data;
    // Created in order, before the mounts; include the parents of every mount destination
    const std::vector<std::string>& staging_dirs;
    const std::vector<PreparedMount>& mounts;
    const sock_fprog* seccomp_program;
    cap_t empty_caps;
};

// Builds the syscall filter installed just before execve(). The only execve() allowed is the
// one with @p executable as the path pointer.
std::vector<sock_filter>
prepare_seccomp_filter(const Options::Limits& limits, const char* executable);

// Runs in the child: sets up the namespaces, then forks the program and waits for it; never
// returns. Errors are written to prep.error_fd and the process exits with code 42.
[[noreturn]] void execute(const Prepared& prep) noexcept;

} // namespace sandtool::sandbox::tracee
