#include "sandtool/admission_control.hh"

namespace sandtool {

std::optional<AdmissionControl::Ticket> AdmissionControl::admit(std::chrono::nanoseconds timeout) {
    std::unique_lock lock{mutex_};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    if (not cv_.wait_until(lock, deadline, [this] { return running_ < max_running_; })) {
        return std::nullopt;
    }
    ++running_;
    return Ticket{this};
}

size_t AdmissionControl::running() noexcept {
    std::lock_guard lock{mutex_};
    return running_;
}

void AdmissionControl::release() noexcept {
    {
        std::lock_guard lock{mutex_};
        --running_;
    }
    cv_.notify_one();
}

} // namespace sandtool
