#include "sandbox_supervisor.hh"
#include "sandtool/debug.hh"
#include "sandtool/errmsg.hh"
#include "sandtool/logger.hh"
#include "sandtool/macros/throw.hh"
#include "sandtool/syscalls.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;

namespace {

constexpr DebugLogger<debug_logging_enabled, false> debuglog{};

using sandtool::sandbox::Options;
using sandtool::sandbox::Result;
using sandtool::sandbox::detail::Tracee;

// Sends @p sig to the process group of the tracee and to the tracee itself (it may not have
// created its process group yet)
void signal_tracee(const Tracee& tracee, int sig) noexcept {
    if (kill(-tracee.pid, sig) and errno != ESRCH) {
        errlog("sandbox: kill(-", tracee.pid, ')', errmsg());
    }
    if (syscalls::pidfd_send_signal(tracee.pidfd, sig, nullptr, 0) and errno != ESRCH) {
        errlog("sandbox: pidfd_send_signal(", tracee.pid, ')', errmsg());
    }
}

nanoseconds to_nanoseconds(timeval tv) noexcept {
    return seconds{tv.tv_sec} + microseconds{tv.tv_usec};
}

struct Supervisor {
    Tracee& tracee;
    const Options::Limits& limits;
    const steady_clock::time_point start;

    // State automaton:
    //                 deadline               grace period elapsed
    // --> RUNNING ---------------> TERMINATING ----------------------> KILLED
    //       | \            output size limit exceeded                  ^  |
    //       |  `---------------------------------------------------------' |
    //       |             pidfd became readable (from any state)           |
    //       `---------------------------> DEAD <---------------------------'
    //                                      |  waitid()
    //                                      `----------> WAITED
    enum State {
        RUNNING,
        TERMINATING, // SIGTERM sent
        KILLED, // SIGKILL sent
        DEAD, // dead but not waited
        WAITED,
    } state = RUNNING;

    steady_clock::time_point kill_deadline{};
    uint64_t output_size = 0;
    Result res{};

    Supervisor(Tracee& tracee, const Options::Limits& limits, steady_clock::time_point start)
    : tracee{tracee}
    , limits{limits}
    , start{start} {}

    Supervisor(const Supervisor&) = delete;
    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;
    ~Supervisor() = default;

    void kill_tracee() noexcept {
        debuglog.verbose("sandbox: SIGKILL -> ", tracee.pid);
        signal_tracee(tracee, SIGKILL);
        state = KILLED;
    }

    void terminate_tracee(steady_clock::time_point now) noexcept {
        debuglog.verbose("sandbox: SIGTERM -> ", tracee.pid);
        signal_tracee(tracee, SIGTERM);
        state = TERMINATING;
        kill_deadline = now + limits.kill_grace_period;
    }

    void handle_timers() noexcept {
        auto now = steady_clock::now();
        if (state == RUNNING and limits.real_time and now >= start + *limits.real_time) {
            res.real_time_limit_exceeded = true;
            terminate_tracee(now);
        }
        if (state == TERMINATING and now >= kill_deadline) {
            errlog("sandbox: process ", tracee.pid, " did not terminate within the grace period, "
                "sending SIGKILL");
            res.killed_after_grace_period = true;
            kill_tracee();
        }
    }

    [[nodiscard]] int poll_timeout_ms() const noexcept {
        steady_clock::time_point deadline;
        if (state == RUNNING and limits.real_time) {
            deadline = start + *limits.real_time;
        } else if (state == TERMINATING) {
            deadline = kill_deadline;
        } else {
            return -1;
        }
        auto now = steady_clock::now();
        if (deadline <= now) {
            return 0;
        }
        auto ms = std::chrono::ceil<milliseconds>(deadline - now).count();
        return ms > INT_MAX ? INT_MAX : static_cast<int>(ms);
    }

    // Reads what is available; closes @p fd on EOF
    void read_output(FileDescriptor& fd, std::string& dest) {
        char buff[1 << 14];
        for (;;) {
            auto rc = read(fd, buff, sizeof(buff));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN) {
                    return;
                }
                THROW("read()", errmsg());
            }
            if (rc == 0) {
                (void)fd.close();
                return;
            }
            auto len = static_cast<size_t>(rc);
            if (limits.output_size_limit) {
                auto remaining = *limits.output_size_limit - output_size;
                if (len > remaining) {
                    // Keep draining the pipe, discarding the excess
                    dest.append(buff, remaining);
                    output_size += remaining;
                    if (not res.output_size_limit_exceeded) {
                        res.output_size_limit_exceeded = true;
                        if (state == RUNNING or state == TERMINATING) {
                            kill_tracee();
                        }
                    }
                    continue;
                }
            }
            dest.append(buff, len);
            output_size += len;
        }
    }

    void read_ready_outputs(const pollfd (&pfds)[4]) {
        if (pfds[1].revents) {
            read_output(tracee.stdout_fd, res.stdout_data);
        }
        if (pfds[2].revents) {
            read_output(tracee.stderr_fd, res.stderr_data);
        }
        if (pfds[3].revents) {
            read_output(tracee.result_fd, res.result_data);
        }
    }

    [[nodiscard]] bool outputs_open() const noexcept {
        return tracee.stdout_fd.is_open() or tracee.stderr_fd.is_open() or
            tracee.result_fd.is_open();
    }

    void watch() {
        while (state != DEAD) {
            handle_timers();
            pollfd pfds[4] = {
                {.fd = tracee.pidfd, .events = POLLIN, .revents = 0},
                {.fd = tracee.stdout_fd, .events = POLLIN, .revents = 0},
                {.fd = tracee.stderr_fd, .events = POLLIN, .revents = 0},
                {.fd = tracee.result_fd, .events = POLLIN, .revents = 0},
            };
            int rc = poll(pfds, 4, poll_timeout_ms());
            if (rc == -1) {
                if (errno == EINTR) {
                    continue;
                }
                THROW("poll()", errmsg());
            }
            read_ready_outputs(pfds);
            if (pfds[0].revents & POLLIN) {
                res.runtime = steady_clock::now() - start;
                state = DEAD;
            }
        }
    }

    // Collects the rest of the output; pipes may still be held open by the processes of the
    // process group
    void drain_outputs() {
        signal_tracee(tracee, SIGKILL);
        auto deadline = steady_clock::now() + limits.kill_grace_period;
        while (outputs_open()) {
            auto now = steady_clock::now();
            auto timeout =
                now >= deadline ? 0 : std::chrono::ceil<milliseconds>(deadline - now).count();
            pollfd pfds[4] = {
                {.fd = -1, .events = 0, .revents = 0},
                {.fd = tracee.stdout_fd, .events = POLLIN, .revents = 0},
                {.fd = tracee.stderr_fd, .events = POLLIN, .revents = 0},
                {.fd = tracee.result_fd, .events = POLLIN, .revents = 0},
            };
            int rc = poll(pfds, 4, static_cast<int>(std::min<int64_t>(timeout, INT_MAX)));
            if (rc == -1) {
                if (errno == EINTR) {
                    continue;
                }
                THROW("poll()", errmsg());
            }
            read_ready_outputs(pfds);
            if (rc == 0) {
                errlog("sandbox: output pipes of process ", tracee.pid,
                    " were not closed in time, ignoring the rest of the output");
                break;
            }
        }
        (void)tracee.stdout_fd.close();
        (void)tracee.stderr_fd.close();
        (void)tracee.result_fd.close();
    }

    // The init of the pid namespace records how the program ended. It is missing if the unit
    // was killed before the program was reaped; init's own status is used then.
    void read_program_status(siginfo_t& si) {
        int status[2];
        ssize_t rc;
        do {
            rc = pread(tracee.status_fd, status, sizeof(status), 0);
        } while (rc == -1 and errno == EINTR);
        if (rc == -1) {
            THROW("pread(status_fd)", errmsg());
        }
        (void)tracee.status_fd.close();
        if (rc == static_cast<ssize_t>(sizeof(status))) {
            si.si_code = status[0];
            si.si_status = status[1];
        }
    }

    void wait() {
        siginfo_t si{};
        rusage ru{};
        int rc;
        do {
            rc = syscalls::waitid(P_PIDFD, static_cast<id_t>(tracee.pidfd), &si, WEXITED, &ru);
        } while (rc == -1 and errno == EINTR);
        if (rc) {
            THROW("waitid()", errmsg());
        }
        state = WAITED;
        (void)tracee.pidfd.close();
        debuglog.verbose(
            "sandbox: waitid(", tracee.pid, ") -> {code: ", si.si_code,
            ", status: ", si.si_status, '}');

        read_program_status(si);
        res.si = {.code = si.si_code, .status = si.si_status};
        res.cpu_runtime = to_nanoseconds(ru.ru_utime) + to_nanoseconds(ru.ru_stime);
        res.peak_rss = static_cast<uint64_t>(ru.ru_maxrss) << 10; // ru_maxrss is in KiB
    }
};

} // namespace

namespace sandtool::sandbox::supervisor {

Result supervise(
    detail::Tracee& tracee, const Options::Limits& limits, steady_clock::time_point start) {
    Supervisor sup{tracee, limits, start};
    try {
        sup.watch();
        sup.drain_outputs();
        sup.wait();
    } catch (const std::exception&) {
        if (sup.state != Supervisor::WAITED) {
            kill_and_reap(tracee);
        }
        throw;
    }
    return std::move(sup.res);
}

void kill_and_reap(detail::Tracee& tracee) noexcept {
    if (not tracee.pidfd.is_open()) {
        return;
    }
    signal_tracee(tracee, SIGKILL);
    siginfo_t si;
    int rc;
    do {
        rc = syscalls::waitid(P_PIDFD, static_cast<id_t>(tracee.pidfd), &si, WEXITED, nullptr);
    } while (rc == -1 and errno == EINTR);
    if (rc) {
        errlog("sandbox: waitid(", tracee.pid, ')', errmsg());
    }
    (void)tracee.pidfd.close();
}

} // namespace sandtool::sandbox::supervisor
