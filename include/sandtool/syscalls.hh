#pragma once

#include <csignal>
#include <linux/sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

// Thin wrappers over system calls that glibc does not expose (or exposes without all the
// arguments)
namespace syscalls {

inline long clone3(clone_args* cl_args) noexcept {
    return syscall(SYS_clone3, cl_args, sizeof(*cl_args));
}

inline int pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

// Unlike the glibc wrapper, also returns resource usage of the waited child
inline int
waitid(idtype_t idtype, id_t id, siginfo_t* infop, int options, rusage* ru) noexcept {
    return static_cast<int>(syscall(SYS_waitid, idtype, id, infop, options, ru));
}

inline int pivot_root(const char* new_root, const char* put_old) noexcept {
    return static_cast<int>(syscall(SYS_pivot_root, new_root, put_old));
}

inline int close_range(unsigned int first, unsigned int last, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first, last, flags));
}

} // namespace syscalls
