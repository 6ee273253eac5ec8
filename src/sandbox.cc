#include "sandbox_supervisor.hh"
#include "sandbox_tracee.hh"
#include "sandtool/concat_tostr.hh"
#include "sandtool/debug.hh"
#include "sandtool/errmsg.hh"
#include "sandtool/file_descriptor.hh"
#include "sandtool/logger.hh"
#include "sandtool/macros/throw.hh"
#include "sandtool/pipe.hh"
#include "sandtool/sandbox.hh"
#include "sandtool/syscalls.hh"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <linux/sched.h>
#include <memory>
#include <optional>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <type_traits>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

constexpr DebugLogger<debug_logging_enabled> debuglog{};

constexpr uint64_t namespace_flags =
    CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC;

struct CapFree {
    void operator()(cap_t caps) const noexcept { (void)cap_free(caps); }
};

using CapsPtr = std::unique_ptr<std::remove_pointer_t<cap_t>, CapFree>;

FileDescriptor make_memfd(const char* name) {
    FileDescriptor fd{memfd_create(name, MFD_CLOEXEC | MFD_ALLOW_SEALING)};
    if (not fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    return fd;
}

FileDescriptor make_stdin(std::string_view data) {
    auto fd = make_memfd("sandbox stdin");
    if (write_all(fd, data) != data.size()) {
        THROW("write()", errmsg());
    }
    if (lseek(fd, 0, SEEK_SET)) {
        THROW("lseek()", errmsg());
    }
    // The program must not be able to modify its input
    if (fcntl(fd, F_ADD_SEALS, F_SEAL_WRITE | F_SEAL_GROW | F_SEAL_SHRINK | F_SEAL_SEAL)) {
        THROW("fcntl(F_ADD_SEALS)", errmsg());
    }
    return fd;
}

Pipe make_output_pipe() {
    auto pipe = pipe2(O_CLOEXEC);
    if (not pipe) {
        THROW("pipe2()", errmsg());
    }
    // Only the supervisor's end is non-blocking
    int flags = fcntl(pipe->readable, F_GETFL);
    if (flags == -1 or fcntl(pipe->readable, F_SETFL, flags | O_NONBLOCK)) {
        THROW("fcntl()", errmsg());
    }
    return std::move(*pipe);
}

std::vector<char*> make_null_terminated(const std::vector<std::string>& strs) {
    std::vector<char*> res;
    res.reserve(strs.size() + 1);
    for (const auto& str : strs) {
        res.emplace_back(const_cast<char*>(str.c_str()));
    }
    res.emplace_back(nullptr);
    return res;
}

bool is_valid_root_path(std::string_view path) noexcept {
    if (not path.starts_with('/')) {
        return false;
    }
    // No "." or ".." components
    size_t beg = 1;
    while (beg <= path.size()) {
        auto end = std::min(path.find('/', beg), path.size());
        auto comp = path.substr(beg, end - beg);
        if (comp == "." or comp == "..") {
            return false;
        }
        beg = end + 1;
    }
    return true;
}

// Appends @p path and all its parent directories (except the root) to @p dirs, parents first
void add_directory_with_parents(std::vector<std::string>& dirs, std::string_view path) {
    for (size_t pos = 1; pos <= path.size(); ++pos) {
        if (pos != path.size() and path[pos] != '/') {
            continue;
        }
        auto dir = concat_tostr(sandtool::sandbox::tracee::staging_root, path.substr(0, pos));
        if (dir.back() != '/' and std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
            dirs.emplace_back(std::move(dir));
        }
    }
}

// Flags a bind remount inside a user namespace has to preserve
unsigned long locked_mount_flags(const std::string& path) {
    struct statvfs st {};
    if (statvfs(path.c_str(), &st)) {
        THROW("statvfs(\"", path, "\")", errmsg());
    }
    unsigned long flags = 0;
    if (st.f_flag & ST_NODEV) {
        flags |= MS_NODEV;
    }
    if (st.f_flag & ST_NOEXEC) {
        flags |= MS_NOEXEC;
    }
    if (st.f_flag & ST_NOATIME) {
        flags |= MS_NOATIME;
    }
    if (st.f_flag & ST_NODIRATIME) {
        flags |= MS_NODIRATIME;
    }
    if (st.f_flag & ST_RELATIME) {
        flags |= MS_RELATIME;
    } else if (not(st.f_flag & ST_NOATIME)) {
        flags |= MS_STRICTATIME;
    }
    return flags;
}

struct PreparedFs {
    std::vector<std::string> staging_dirs;
    std::vector<sandtool::sandbox::tracee::PreparedMount> mounts;
    std::string root_mount_data;
};

PreparedFs prepare_fs(const sandtool::sandbox::Options& options) {
    PreparedFs res;
    for (const auto& mnt : options.fs.mounts) {
        if (not is_valid_root_path(mnt.dest) or mnt.dest == "/") {
            THROW("invalid bind mount destination: \"", mnt.dest, '"');
        }
        struct stat st {};
        if (stat(mnt.source.c_str(), &st)) {
            THROW("stat(\"", mnt.source, "\")", errmsg());
        }
        bool is_directory = S_ISDIR(st.st_mode);
        auto dest = std::string_view{mnt.dest};
        if (dest.ends_with('/')) {
            dest.remove_suffix(1);
        }
        add_directory_with_parents(
            res.staging_dirs, is_directory ? dest : dest.substr(0, dest.rfind('/')));
        res.mounts.push_back({
            .source = mnt.source,
            .staging_dest = concat_tostr(sandtool::sandbox::tracee::staging_root, dest),
            .is_directory = is_directory,
            .locked_flags = locked_mount_flags(mnt.source),
        });
    }
    if (not is_valid_root_path(options.working_directory)) {
        THROW("working directory has to be an absolute path: \"", options.working_directory,
            '"');
    }
    add_directory_with_parents(res.staging_dirs, options.working_directory);
    res.root_mount_data = concat_tostr("size=", options.fs.root_size, ",mode=0755");
    return res;
}

// Single line mapping @p id inside the namespace to @p host_id
template <class T>
std::string id_mapping(T host_id) {
    return concat_tostr("1000 ", host_id, " 1");
}

} // namespace

namespace sandtool::sandbox {

std::string Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrv = sigabbrev_np(signum);
        auto descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, ' ', abbrv, " - ", descr);
            }
            return concat_tostr(prefix, ' ', abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    case CLD_TRAPPED: return signal_description("trapped by signal", status);
    case CLD_STOPPED: return signal_description("stopped by signal", status);
    case CLD_CONTINUED: return signal_description("continued by signal", status);
    }
    return "unable to describe";
}

future execute(const Options& options) {
    if (options.args.empty()) {
        THROW("args cannot be empty, at least argv[0] is required");
    }
    if (access(options.executable.c_str(), X_OK)) {
        THROW("cannot execute \"", options.executable, '"', errmsg());
    }

    auto error_fd = make_memfd("sandbox errors");
    auto status_fd = make_memfd("sandbox status");
    auto stdin_fd = make_stdin(options.stdin_data);
    auto stdout_pipe = make_output_pipe();
    auto stderr_pipe = make_output_pipe();
    std::optional<Pipe> result_pipe;
    if (options.capture_result_fd) {
        result_pipe = make_output_pipe();
    }
    auto sync_pipe = pipe2(O_CLOEXEC);
    if (not sync_pipe) {
        THROW("pipe2()", errmsg());
    }

    auto argv = make_null_terminated(options.args);
    auto envp = make_null_terminated(options.env);
    auto fs = prepare_fs(options);
    auto uid_map = id_mapping(geteuid());
    auto gid_map = id_mapping(getegid());

    auto filter = tracee::prepare_seccomp_filter(options.limits, options.executable.c_str());
    sock_fprog seccomp_program = {
        .len = static_cast<unsigned short>(filter.size()),
        .filter = filter.data(),
    };
    CapsPtr empty_caps{cap_init()};
    if (not empty_caps) {
        THROW("cap_init()", errmsg());
    }
    if (cap_clear(empty_caps.get())) {
        THROW("cap_clear()", errmsg());
    }

    const tracee::Prepared prep = {
        .limits = options.limits,
        .executable = options.executable.c_str(),
        .argv = argv.data(),
        .envp = envp.data(),
        .working_directory = options.working_directory.c_str(),
        .stdin_fd = stdin_fd,
        .stdout_fd = stdout_pipe.writable,
        .stderr_fd = stderr_pipe.writable,
        .result_fd = result_pipe ? static_cast<int>(result_pipe->writable) : -1,
        .error_fd = error_fd,
        .status_fd = status_fd,
        .sync_read_fd = sync_pipe->readable,
        .sync_write_fd = sync_pipe->writable,
        .uid_map = uid_map.c_str(),
        .gid_map = gid_map.c_str(),
        .root_mount_data = fs.root_mount_data.c_str(),
        .staging_dirs = fs.staging_dirs,
        .mounts = fs.mounts,
        .seccomp_program = &seccomp_program,
        .empty_caps = empty_caps.get(),
    };

    auto start = steady_clock::now();
    int pidfd = -1;
    clone_args cl_args = {
        .flags = CLONE_PIDFD | namespace_flags,
        .pidfd = reinterpret_cast<uintptr_t>(&pidfd),
        .exit_signal = SIGCHLD,
    };
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        tracee::execute(prep);
        __builtin_unreachable();
    }
    debuglog("sandbox: spawned ", options.executable, " with init pid ", pid);

    detail::Tracee tracee = {
        .pid = static_cast<pid_t>(pid),
        .pidfd = FileDescriptor{pidfd},
        .stdout_fd = std::move(stdout_pipe.readable),
        .stderr_fd = std::move(stderr_pipe.readable),
        .result_fd = result_pipe ? std::move(result_pipe->readable) : FileDescriptor{},
        .error_fd = std::move(error_fd),
        .status_fd = std::move(status_fd),
    };

    // Wait until the child is killable with us; EOF means it died and left an error
    if (sync_pipe->writable.close()) {
        THROW("close()", errmsg());
    }
    char byte{};
    ssize_t rc;
    do {
        rc = read(sync_pipe->readable, &byte, 1);
    } while (rc == -1 and errno == EINTR);
    if (rc == -1) {
        supervisor::kill_and_reap(tracee);
        THROW("read(sync_pipe)", errmsg());
    }

    // The child's ends are closed here, so that EOF is seen once the unit dies
    return {std::move(tracee), options.limits, start};
}

bool is_supported() noexcept {
    static const bool supported = [] {
        int pidfd = -1;
        clone_args cl_args = {
            .flags = CLONE_PIDFD | namespace_flags,
            .pidfd = reinterpret_cast<uintptr_t>(&pidfd),
            .exit_signal = SIGCHLD,
        };
        auto pid = syscalls::clone3(&cl_args);
        if (pid == -1) {
            debuglog("sandbox: namespaces are not available", errmsg());
            return false;
        }
        if (pid == 0) {
            _exit(0);
        }
        FileDescriptor fd{pidfd};
        siginfo_t si;
        int rc;
        do {
            rc = syscalls::waitid(P_PIDFD, static_cast<id_t>(pidfd), &si, WEXITED, nullptr);
        } while (rc == -1 and errno == EINTR);
        if (rc) {
            errlog("sandbox: waitid()", errmsg());
        }
        return true;
    }();
    return supported;
}

std::vector<Options::BindMount> system_mounts() {
    std::vector<Options::BindMount> mounts;
    for (const char* path : {
             "/usr",
             "/bin",
             "/lib",
             "/lib32",
             "/lib64",
             "/libx32",
             "/etc/alternatives",
             "/etc/ld.so.cache",
         })
    {
        if (access(path, F_OK) == 0) {
            mounts.push_back({.source = path, .dest = path});
        }
    }
    return mounts;
}

Result future::get() {
    if (not tracee_.pidfd.is_open()) {
        THROW("future already retrieved");
    }
    auto res = supervisor::supervise(tracee_, limits_, start_);
    // The child writes to error_fd only if it failed before execve()
    off_t pos = lseek(tracee_.error_fd, 0, SEEK_CUR);
    if (pos == -1) {
        THROW("lseek()", errmsg());
    }
    if (pos > 0) {
        std::string msg(static_cast<size_t>(pos), '\0');
        if (pread_all(tracee_.error_fd, 0, msg.data(), msg.size()) != msg.size()) {
            THROW("read()", errmsg());
        }
        THROW("sandbox: setting up the process failed: ", msg);
    }
    (void)tracee_.error_fd.close();
    return res;
}

future::~future() { supervisor::kill_and_reap(tracee_); }

} // namespace sandtool::sandbox
