#include "server/shutdown_coordinator.hpp"

namespace urlscope {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::on_shutdown(DrainHook hook) {
    hooks_.push_back(std::move(hook));
}

void ShutdownCoordinator::initiate_shutdown() {
    bool first = false;
    {
        std::lock_guard lock(drain_mutex_);
        first = !shutting_down_.exchange(true, std::memory_order_acq_rel);
    }
    drain_cv_.notify_all();
    if (!first) return;

    // Admissions are closed; no request can take a lease after this point
    for (const auto& hook : hooks_) {
        hook();
    }
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Re-check after increment; initiate_shutdown may have run in between
    if (shutting_down_.load(std::memory_order_acquire)) {
        leave_request();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.drain_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace urlscope
