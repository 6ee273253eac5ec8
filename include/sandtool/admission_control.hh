#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace sandtool {

// Counting gate bounding the number of simultaneously running isolated units
class AdmissionControl {
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t running_ = 0;
    const size_t max_running_;

    void release() noexcept;

public:
    // Holds one slot until destroyed
    class Ticket {
        AdmissionControl* ac_;

        explicit Ticket(AdmissionControl* ac) noexcept
        : ac_{ac} {}

        friend class AdmissionControl;

    public:
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        Ticket(Ticket&& other) noexcept
        : ac_{std::exchange(other.ac_, nullptr)} {}

        Ticket& operator=(Ticket&&) = delete;

        ~Ticket() {
            if (ac_) {
                ac_->release();
            }
        }
    };

    explicit AdmissionControl(size_t max_running) noexcept
    : max_running_{max_running} {}

    AdmissionControl(const AdmissionControl&) = delete;
    AdmissionControl(AdmissionControl&&) = delete;
    AdmissionControl& operator=(const AdmissionControl&) = delete;
    AdmissionControl& operator=(AdmissionControl&&) = delete;
    ~AdmissionControl() = default;

    // Waits at most @p timeout for a free slot; nullopt if none became free
    [[nodiscard]] std::optional<Ticket> admit(std::chrono::nanoseconds timeout);

    [[nodiscard]] size_t running() noexcept;

    [[nodiscard]] size_t max_running() const noexcept { return max_running_; }
};

} // namespace sandtool
