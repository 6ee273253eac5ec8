#include "sandbox_tracee.hh"
#include "sandtool/file_descriptor.hh"
#include "sandtool/syscalls.hh"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/close_range.h>
#include <linux/sched.h>
#include <linux/seccomp.h>
#include <linux/securebits.h>
#include <string_view>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

using sandtool::sandbox::tracee::Prepared;
using sandtool::sandbox::tracee::staging_root;

// Nothing here may allocate memory: the process was created by a raw clone3() of a possibly
// multi-threaded parent
struct Tracee {
    const Prepared& prep;

    template <class... Args>
    [[noreturn]] void die(const Args&... args) noexcept {
        static_assert(sizeof...(Args) > 0, "error message cannot be empty");
        for (auto msg : {std::string_view{args}...}) {
            if (not msg.empty()) {
                (void)write_all(prep.error_fd, msg);
            }
        }
        _exit(42);
    }

    template <class... Args>
    void die_if_err(bool failed, const Args&... args) noexcept {
        static_assert(
            sizeof...(Args) > 0, "Description of the cause of an error is necessary");
        if (failed) {
            int errnum = errno;
            const char* name = strerrorname_np(errnum);
            const char* descr = strerrordesc_np(errnum);
            die(args..., " - ", name ? name : "unknown error", ": ", descr ? descr : "");
        }
    }

    void initialize() noexcept {
        // Kill us if the supervisor dies. On our death the kernel kills every process of the
        // pid namespace since we are its init.
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        // Ensure the supervisor did not die before we set PR_SET_PDEATHSIG
        die_if_err(close(prep.sync_read_fd), "close(sync_read_fd)");
        auto rc = write(prep.sync_write_fd, "", 1);
        if (rc == -1 and errno == EPIPE) {
            die("supervisor died");
        }
        die_if_err(rc != 1, "write(sync_write_fd)");
        die_if_err(close(prep.sync_write_fd), "close(sync_write_fd)");
        // New process group, so that the whole unit can be signaled at once
        die_if_err(setpgid(0, 0), "setpgid()");
    }

    void write_proc_file(const char* path, std::string_view contents) noexcept {
        FileDescriptor fd{open(path, O_WRONLY | O_CLOEXEC)};
        die_if_err(not fd.is_open(), "open(", path, ")");
        die_if_err(write_all(fd, contents) != contents.size(), "write(", path, ")");
        die_if_err(fd.close(), "close(", path, ")");
    }

    void setup_user_namespace() noexcept {
        write_proc_file("/proc/self/uid_map", prep.uid_map);
        write_proc_file("/proc/self/setgroups", "deny");
        write_proc_file("/proc/self/gid_map", prep.gid_map);
    }

    void perform_bind_mounts() noexcept {
        for (const auto& mnt : prep.mounts) {
            const char* dest = mnt.staging_dest.c_str();
            if (not mnt.is_directory) {
                // A file can only be mounted over a file
                FileDescriptor fd{open(dest, O_WRONLY | O_CREAT | O_CLOEXEC, S_IRUSR)};
                die_if_err(not fd.is_open(), "open(\"", dest, "\")");
                die_if_err(fd.close(), "close(\"", dest, "\")");
            }
            die_if_err(
                mount(mnt.source.c_str(), dest, nullptr, MS_BIND, nullptr), "mount(bind: \"",
                mnt.source, "\" -> \"", dest, "\")");
            // Bind mounts ignore flags other than MS_REC, they need a remount
            die_if_err(
                mount(nullptr, dest, nullptr,
                    MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV | mnt.locked_flags,
                    nullptr),
                "mount(bind remount: \"", dest, "\")");
        }
    }

    void setup_fs() noexcept {
        // Nothing done here may propagate to the host
        die_if_err(
            mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr),
            "mount(recursive mk_private on \"/\")");
        constexpr unsigned long root_flags = MS_NOSUID | MS_NODEV | MS_SILENT;
        die_if_err(
            mount("tmpfs", staging_root, "tmpfs", root_flags, prep.root_mount_data),
            "mount(tmpfs at \"", staging_root, "\")");
        for (const auto& dir : prep.staging_dirs) {
            die_if_err(
                mkdir(dir.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) and
                    errno != EEXIST,
                "mkdir(\"", dir, "\")");
        }
        perform_bind_mounts();
        die_if_err(
            mount(nullptr, staging_root, nullptr, root_flags | MS_REMOUNT | MS_RDONLY,
                prep.root_mount_data),
            "mount(remounting tmpfs at \"", staging_root, "\")");

        // Switch to the new root, detaching the old one
        die_if_err(chdir(staging_root), "chdir(\"", staging_root, "\")");
        die_if_err(syscalls::pivot_root(".", "."), R"(pivot_root(".", "."))");
        die_if_err(umount2(".", MNT_DETACH), R"(umount2("."))");
        die_if_err(chdir(prep.working_directory), "chdir(\"", prep.working_directory, "\")");
    }

    void drop_capabilities() noexcept {
        // We have all capabilities in the new user namespace. Set and lock securebits while we
        // still have them, so that nothing can grant them back.
        die_if_err(
            cap_set_secbits(
                SECBIT_NOROOT_LOCKED | SECBIT_NOROOT | SECBIT_NO_CAP_AMBIENT_RAISE |
                SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED),
            "cap_set_secbits()");
        die_if_err(cap_set_proc(prep.empty_caps), "cap_set_proc()");
        die_if_err(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0), "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    void block_all_signals() noexcept {
        // Before the fork, not to miss SIGCHLD
        sigset_t sigset;
        die_if_err(sigfillset(&sigset), "sigfillset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
    }

    // Program's side

    void reset_signals() noexcept {
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // Ignored signals stay ignored across execve()
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
        die_if_err(sigaction(SIGTERM, &sa, nullptr), "sigaction(SIGTERM)");
        die_if_err(sigaction(SIGXCPU, &sa, nullptr), "sigaction(SIGXCPU)");
        die_if_err(sigaction(SIGXFSZ, &sa, nullptr), "sigaction(SIGXFSZ)");
    }

    void redirect(int fd, int new_fd) noexcept {
        if (fd == new_fd) {
            // dup2() would not clear FD_CLOEXEC
            die_if_err(fcntl(fd, F_SETFD, 0), "fcntl(F_SETFD)");
            return;
        }
        die_if_err(dup2(fd, new_fd) == -1, "dup2()");
    }

    void setup_io() noexcept {
        redirect(prep.stdin_fd, STDIN_FILENO);
        redirect(prep.stdout_fd, STDOUT_FILENO);
        redirect(prep.stderr_fd, STDERR_FILENO);
        unsigned first_closed = 3;
        if (prep.result_fd >= 0) {
            redirect(prep.result_fd, sandtool::sandbox::result_fd_number);
            first_closed = sandtool::sandbox::result_fd_number + 1;
        }
        // Other descriptors are closed on execve(); error_fd is needed until then
        if (syscalls::close_range(first_closed, ~0U, CLOSE_RANGE_CLOEXEC)) {
            die_if_err(errno != EINVAL and errno != ENOSYS, "close_range()");
            // Kernel older than 5.11
            int max_fd = getdtablesize();
            for (int fd = static_cast<int>(first_closed); fd < max_fd; ++fd) {
                die_if_err(fcntl(fd, F_SETFD, FD_CLOEXEC) and errno != EBADF, "fcntl(F_SETFD)");
            }
        }
    }

    void set_limit(int resource, rlim_t soft, rlim_t hard, const char* name) noexcept {
        rlimit rl = {.rlim_cur = soft, .rlim_max = hard};
        die_if_err(setrlimit(resource, &rl), "setrlimit(", name, ")");
    }

    void set_limits() noexcept {
        const auto& limits = prep.limits;
        if (limits.memory_limit) {
            set_limit(RLIMIT_AS, *limits.memory_limit, *limits.memory_limit, "RLIMIT_AS");
        }
        if (limits.stack_size_limit) {
            set_limit(
                RLIMIT_STACK, *limits.stack_size_limit, *limits.stack_size_limit,
                "RLIMIT_STACK");
        }
        if (limits.cpu_time) {
            // Round up to whole seconds, at least one
            auto secs = static_cast<rlim_t>(
                std::chrono::ceil<std::chrono::seconds>(*limits.cpu_time).count());
            if (secs == 0) {
                secs = 1;
            }
            // SIGXCPU at the soft limit, SIGKILL at the hard limit
            set_limit(RLIMIT_CPU, secs, secs + 1, "RLIMIT_CPU");
        }
        set_limit(RLIMIT_FSIZE, limits.max_file_size, limits.max_file_size, "RLIMIT_FSIZE");
        if (not limits.allow_process_creation) {
            set_limit(RLIMIT_NPROC, 0, 0, "RLIMIT_NPROC");
        }
        set_limit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");
    }

    void install_seccomp() noexcept {
        die_if_err(
            prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, prep.seccomp_program, 0, 0),
            "prctl(PR_SET_SECCOMP)");
    }

    [[noreturn]] void run_program() noexcept {
        reset_signals();
        setup_io();
        set_limits();
        install_seccomp();
        // The path pointer has to be exactly prep.executable to pass the seccomp filter
        execve(prep.executable, prep.argv, prep.envp);
        die_if_err(true, "execve(\"", prep.executable, "\")");
        __builtin_unreachable();
    }

    // Init's side

    pid_t spawn_program() noexcept {
        clone_args cl_args = {.exit_signal = SIGCHLD};
        auto pid = syscalls::clone3(&cl_args);
        die_if_err(pid == -1, "clone3()");
        if (pid == 0) {
            run_program();
        }
        return static_cast<pid_t>(pid);
    }

    [[noreturn]] void wait_for_program(pid_t pid) noexcept {
        for (;;) {
            siginfo_t si{};
            if (syscalls::waitid(P_ALL, 0, &si, __WALL | WEXITED, nullptr)) {
                die_if_err(errno != EINTR, "waitid()");
                continue;
            }
            if (si.si_pid == pid) {
                const int status[2] = {si.si_code, si.si_status};
                die_if_err(
                    pwrite(prep.status_fd, status, sizeof(status), 0) !=
                        static_cast<ssize_t>(sizeof(status)),
                    "pwrite(status_fd)");
                // The kernel kills the rest of the namespace once we exit
                _exit(0);
            }
        }
    }
};

} // namespace

namespace sandtool::sandbox::tracee {

void execute(const Prepared& prep) noexcept {
    Tracee tra{.prep = prep};
    tra.initialize();
    tra.setup_user_namespace();
    tra.setup_fs();
    tra.drop_capabilities();
    tra.block_all_signals();
    auto pid = tra.spawn_program();
    tra.wait_for_program(pid);
}

} // namespace sandtool::sandbox::tracee
