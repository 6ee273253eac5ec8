#pragma once

#include "sandtool/sandbox.hh"

#include <chrono>

namespace sandtool::sandbox::supervisor {

// Watches the process until it dies, enforcing the limits; the process is reaped once this
// returns or throws
Result supervise(
    detail::Tracee& tracee, const Options::Limits& limits,
    std::chrono::steady_clock::time_point start);

// Kills the process group and reaps the process
void kill_and_reap(detail::Tracee& tracee) noexcept;

} // namespace sandtool::sandbox::supervisor
