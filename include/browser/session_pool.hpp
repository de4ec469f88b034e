#pragma once

#include "browser/ibrowser_session.hpp"
#include "browser/ibrowser_session_factory.hpp"
#include "browser/leased_session.hpp"
#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace urlscope {

struct SessionPoolConfig {
    size_t max_connections = 10;                // concurrent leases
    size_t queue_size = 100;                    // waiters beyond that are rejected
    size_t min_sessions = 0;                    // pre-warmed at construction
    std::chrono::seconds max_session_age{3600}; // 0 = disabled
};

struct SessionPoolHealth {
    size_t leased_count = 0;
    size_t waiting_count = 0;
    size_t capacity = 0;
    size_t queue_capacity = 0;
    size_t idle_count = 0;
    bool draining = false;
};

struct SessionPoolStats {
    uint64_t total_acquires = 0;
    uint64_t rejections = 0;
    uint64_t timeouts = 0;
    uint64_t create_failures = 0;
    uint64_t sessions_created = 0;
    uint64_t sessions_destroyed = 0;
    uint64_t handoffs = 0;              // sessions passed straight to a waiter
};

/**
 * @brief Bounded browser-session pool with a FIFO admission queue
 *
 * acquire():
 * 1. idle session available -> lease it
 * 2. fewer than max_connections leases -> reserve one, create outside the lock
 * 3. fewer than queue_size waiters -> wait (FIFO) until hand-off or timeout
 * 4. otherwise -> POOL_REJECTED immediately
 *
 * One mutex guards the idle list, the waiter queue and the lease count. A
 * releasing thread hands its session (or, if the session is discarded, its
 * permission to create one) directly to the oldest waiter under that mutex,
 * so a waiter that times out either still sits in the queue and removes
 * itself, or has already been granted and keeps the grant.
 *
 * Leases must not outlive the pool.
 */
class SessionPool {
public:
    SessionPool(const SessionPoolConfig& config,
                std::shared_ptr<IBrowserSessionFactory> factory);

    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /**
     * @return Lease, or POOL_REJECTED / POOL_TIMEOUT / SESSION_CREATE_FAILED
     */
    [[nodiscard]] Result<LeasedSession> acquire(std::chrono::milliseconds timeout);

    [[nodiscard]] SessionPoolHealth health() const;
    [[nodiscard]] SessionPoolStats get_stats() const;

    /**
     * @brief Reject new acquires, wake waiters, close idle sessions.
     *        Outstanding leases are closed when returned.
     */
    void drain();

    [[nodiscard]] const SessionPoolConfig& config() const { return config_; }

private:
    struct Waiter {
        enum class State { WAITING, GRANTED_SESSION, GRANTED_PERMIT, CANCELLED };
        State state = State::WAITING;
        std::unique_ptr<IBrowserSession> session;
        std::condition_variable cv;
    };

    using SessionList = std::vector<std::unique_ptr<IBrowserSession>>;

    [[nodiscard]] LeasedSession make_lease(std::unique_ptr<IBrowserSession> session);

    // Caller holds a reserved lease slot; creates without holding the lock
    [[nodiscard]] Result<LeasedSession> create_for_lease();

    void return_session(std::unique_ptr<IBrowserSession> session, bool broken);

    // Give a reserved slot to the oldest waiter, or free it. Lock held.
    void pass_permit_locked();

    [[nodiscard]] bool is_reusable_locked(const IBrowserSession& session) const;
    void forget_locked(const IBrowserSession* session);
    void destroy_sessions(SessionList sessions);

    SessionPoolConfig config_;
    std::shared_ptr<IBrowserSessionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<std::unique_ptr<IBrowserSession>> idle_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    size_t leased_ = 0;             // outstanding leases + in-flight creations
    bool draining_ = false;
    std::unordered_map<const IBrowserSession*, std::chrono::steady_clock::time_point> created_at_;

    std::atomic<uint64_t> total_acquires_{0};
    std::atomic<uint64_t> rejections_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> create_failures_{0};
    std::atomic<uint64_t> sessions_created_{0};
    std::atomic<uint64_t> sessions_destroyed_{0};
    std::atomic<uint64_t> handoffs_{0};
};

} // namespace urlscope
