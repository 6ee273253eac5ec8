#include "sandbox_tracee.hh"
#include "sandtool/errmsg.hh"
#include "sandtool/file_descriptor.hh"
#include "sandtool/macros/throw.hh"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <initializer_list>
#include <memory>
#include <sched.h>
#include <seccomp.h>
#include <sys/mman.h>
#include <unistd.h>

namespace {

struct SeccompRelease {
    void operator()(scmp_filter_ctx ctx) const noexcept { seccomp_release(ctx); }
};

class FilterBuilder {
    std::unique_ptr<void, SeccompRelease> ctx_;

public:
    FilterBuilder()
    : ctx_{seccomp_init(SCMP_ACT_ALLOW)} {
        if (not ctx_) {
            THROW("seccomp_init() failed");
        }
    }

    void deny(int errnum, int syscall_nr, const char* name,
        std::initializer_list<scmp_arg_cmp> args = {}) {
        int rc = seccomp_rule_add_array(
            ctx_.get(), SCMP_ACT_ERRNO(errnum), syscall_nr, static_cast<unsigned>(args.size()),
            args.begin());
        if (rc < 0) {
            THROW("seccomp_rule_add(", name, ')', errmsg(-rc));
        }
    }

    // Denies the syscall if the masked argument has all bits of @p flag set
    void deny_flag(int errnum, int syscall_nr, const char* name, unsigned arg, uint64_t flag) {
        deny(errnum, syscall_nr, name,
            {scmp_arg_cmp{.arg = arg, .op = SCMP_CMP_MASKED_EQ, .datum_a = flag, .datum_b = flag}});
    }

    std::vector<sock_filter> export_bpf() {
        FileDescriptor fd{memfd_create("seccomp filter", MFD_CLOEXEC)};
        if (not fd.is_open()) {
            THROW("memfd_create()", errmsg());
        }
        int rc = seccomp_export_bpf(ctx_.get(), fd);
        if (rc < 0) {
            THROW("seccomp_export_bpf()", errmsg(-rc));
        }
        off_t size = lseek(fd, 0, SEEK_CUR);
        if (size == -1) {
            THROW("lseek()", errmsg());
        }
        if (size == 0 or static_cast<size_t>(size) % sizeof(sock_filter) != 0) {
            THROW("seccomp_export_bpf() produced a filter of invalid size: ", size);
        }
        std::vector<sock_filter> filter(static_cast<size_t>(size) / sizeof(sock_filter));
        if (pread_all(fd, 0, filter.data(), static_cast<size_t>(size)) !=
            static_cast<size_t>(size))
        {
            THROW("read()", errmsg());
        }
        return filter;
    }
};

} // namespace

namespace sandtool::sandbox::tracee {

std::vector<sock_filter>
prepare_seccomp_filter(const Options::Limits& limits, const char* executable) {
    FilterBuilder fb;
    // Signals may target only the program itself
    auto not_the_program = [](unsigned arg) {
        return scmp_arg_cmp{
            .arg = arg,
            .op = SCMP_CMP_NE,
            .datum_a = static_cast<scmp_datum_t>(program_pid),
            .datum_b = 0};
    };
    fb.deny(EPERM, SCMP_SYS(kill), "kill", {not_the_program(0)});
    fb.deny(EPERM, SCMP_SYS(tkill), "tkill", {not_the_program(0)});
    fb.deny(EPERM, SCMP_SYS(tgkill), "tgkill", {not_the_program(0)});
    fb.deny(EPERM, SCMP_SYS(rt_sigqueueinfo), "rt_sigqueueinfo", {not_the_program(0)});
    fb.deny(EPERM, SCMP_SYS(rt_tgsigqueueinfo), "rt_tgsigqueueinfo", {not_the_program(0)});
    // Nor can other processes be inspected or entered
    fb.deny(EPERM, SCMP_SYS(ptrace), "ptrace");
    fb.deny(EPERM, SCMP_SYS(process_vm_readv), "process_vm_readv");
    fb.deny(EPERM, SCMP_SYS(process_vm_writev), "process_vm_writev");
    fb.deny(EPERM, SCMP_SYS(pidfd_open), "pidfd_open");
    fb.deny(EPERM, SCMP_SYS(pidfd_send_signal), "pidfd_send_signal");
    fb.deny(EPERM, SCMP_SYS(setns), "setns");
    fb.deny(EPERM, SCMP_SYS(unshare), "unshare");
    fb.deny(EPERM, SCMP_SYS(bpf), "bpf");
    fb.deny(EPERM, SCMP_SYS(perf_event_open), "perf_event_open");
    fb.deny(EPERM, SCMP_SYS(userfaultfd), "userfaultfd");
    fb.deny(EPERM, SCMP_SYS(keyctl), "keyctl");
    fb.deny(EPERM, SCMP_SYS(add_key), "add_key");
    fb.deny(EPERM, SCMP_SYS(request_key), "request_key");

    if (not limits.allow_process_creation) {
        fb.deny(EPERM, SCMP_SYS(fork), "fork");
        fb.deny(EPERM, SCMP_SYS(vfork), "vfork");
        // Threads are still allowed (RLIMIT_NPROC bounds them for non-root users)
        fb.deny(EPERM, SCMP_SYS(clone), "clone",
            {scmp_arg_cmp{
                .arg = 0, .op = SCMP_CMP_MASKED_EQ, .datum_a = CLONE_THREAD, .datum_b = 0}});
        // glibc falls back to clone() on ENOSYS
        fb.deny(ENOSYS, SCMP_SYS(clone3), "clone3");
        fb.deny(EPERM, SCMP_SYS(execve), "execve",
            {scmp_arg_cmp{
                .arg = 0,
                .op = SCMP_CMP_NE,
                .datum_a = reinterpret_cast<uintptr_t>(executable),
                .datum_b = 0}});
        fb.deny(EPERM, SCMP_SYS(execveat), "execveat");
    }
    if (not limits.allow_file_writes) {
        for (uint64_t flag : {O_WRONLY, O_RDWR, O_CREAT, O_TRUNC, O_APPEND}) {
            fb.deny_flag(EACCES, SCMP_SYS(open), "open", 1, flag);
            fb.deny_flag(EACCES, SCMP_SYS(openat), "openat", 2, flag);
        }
        // Its flags are passed in a structure, so they cannot be inspected
        fb.deny(ENOSYS, SCMP_SYS(openat2), "openat2");
        fb.deny(EACCES, SCMP_SYS(creat), "creat");
        fb.deny(EACCES, SCMP_SYS(mkdir), "mkdir");
        fb.deny(EACCES, SCMP_SYS(mkdirat), "mkdirat");
        fb.deny(EACCES, SCMP_SYS(rmdir), "rmdir");
        fb.deny(EACCES, SCMP_SYS(unlink), "unlink");
        fb.deny(EACCES, SCMP_SYS(unlinkat), "unlinkat");
        fb.deny(EACCES, SCMP_SYS(rename), "rename");
        fb.deny(EACCES, SCMP_SYS(renameat), "renameat");
        fb.deny(EACCES, SCMP_SYS(renameat2), "renameat2");
        fb.deny(EACCES, SCMP_SYS(link), "link");
        fb.deny(EACCES, SCMP_SYS(linkat), "linkat");
        fb.deny(EACCES, SCMP_SYS(symlink), "symlink");
        fb.deny(EACCES, SCMP_SYS(symlinkat), "symlinkat");
        fb.deny(EACCES, SCMP_SYS(truncate), "truncate");
        fb.deny(EACCES, SCMP_SYS(chmod), "chmod");
        fb.deny(EACCES, SCMP_SYS(fchmodat), "fchmodat");
        fb.deny(EACCES, SCMP_SYS(chown), "chown");
        fb.deny(EACCES, SCMP_SYS(lchown), "lchown");
        fb.deny(EACCES, SCMP_SYS(fchownat), "fchownat");
        fb.deny(EACCES, SCMP_SYS(mknod), "mknod");
        fb.deny(EACCES, SCMP_SYS(mknodat), "mknodat");
        fb.deny(EACCES, SCMP_SYS(utimes), "utimes");
        fb.deny(EACCES, SCMP_SYS(utimensat), "utimensat");
        fb.deny(EACCES, SCMP_SYS(setxattr), "setxattr");
        fb.deny(EACCES, SCMP_SYS(lsetxattr), "lsetxattr");
        fb.deny(EACCES, SCMP_SYS(removexattr), "removexattr");
        fb.deny(EACCES, SCMP_SYS(lremovexattr), "lremovexattr");
    }
    if (not limits.allow_sockets) {
        fb.deny(EACCES, SCMP_SYS(socket), "socket");
    }
    return fb.export_bpf();
}

} // namespace sandtool::sandbox::tracee
