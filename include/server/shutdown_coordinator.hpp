#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace urlscope {

/**
 * @brief Admission gate and drain tracker for POST /screenshot
 *
 * Each screenshot request holds an in-flight slot from admission until its
 * response is built, which covers the browser lease and both captures.
 * On SIGINT/SIGTERM the sequence is:
 * 1. initiate_shutdown(): new requests get 503, then the drain hooks run
 *    (main registers SessionPool::drain, which fails queued waiters and
 *    closes sessions as their leases come back)
 * 2. wait_for_drain(): block until every admitted request has answered, or
 *    until drain_timeout passes with captures still running
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds drain_timeout{30000};
    };

    using DrainHook = std::function<void()>;

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Register work to run once admissions close. Not thread-safe with initiate_shutdown.
    void on_shutdown(DrainHook hook);

    /// Close admissions and run the drain hooks; later calls do nothing.
    void initiate_shutdown();

    /// Take an in-flight slot for one screenshot request; false once shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Give the slot back after the response is built.
    void leave_request();

    /// True when the last admitted request finished within drain_timeout.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::vector<DrainHook> hooks_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace urlscope
