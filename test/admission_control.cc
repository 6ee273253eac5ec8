#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <sandtool/admission_control.hh>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using sandtool::AdmissionControl;

// NOLINTNEXTLINE
TEST(admission_control, admits_up_to_max) {
    AdmissionControl ac{2};
    auto a = ac.admit(0s);
    auto b = ac.admit(0s);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(ac.running(), 2U);
    EXPECT_FALSE(ac.admit(10ms));
    EXPECT_EQ(ac.running(), 2U);
}

// NOLINTNEXTLINE
TEST(admission_control, ticket_release) {
    AdmissionControl ac{1};
    {
        auto ticket = ac.admit(0s);
        ASSERT_TRUE(ticket);
        auto moved = std::move(*ticket);
        ticket.reset();
        EXPECT_EQ(ac.running(), 1U);
    }
    EXPECT_EQ(ac.running(), 0U);
    EXPECT_TRUE(ac.admit(0s));
}

// NOLINTNEXTLINE
TEST(admission_control, waiter_is_woken_up) {
    AdmissionControl ac{1};
    auto ticket = ac.admit(0s);
    ASSERT_TRUE(ticket);
    std::thread releaser{[&ticket] {
        std::this_thread::sleep_for(50ms);
        ticket.reset();
    }};
    auto next = ac.admit(10s);
    releaser.join();
    EXPECT_TRUE(next);
}

// NOLINTNEXTLINE
TEST(admission_control, bounds_concurrency) {
    constexpr size_t max_running = 3;
    AdmissionControl ac{max_running};
    std::atomic<size_t> running = 0;
    std::atomic<size_t> peak = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto ticket = ac.admit(30s);
            ASSERT_TRUE(ticket);
            auto now = ++running;
            auto prev = peak.load();
            while (prev < now and not peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(20ms);
            --running;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_LE(peak.load(), max_running);
    EXPECT_GT(peak.load(), 0U);
    EXPECT_EQ(ac.running(), 0U);
}
