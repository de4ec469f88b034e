#include "browser/session_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace urlscope {

SessionPool::SessionPool(const SessionPoolConfig& config,
                         std::shared_ptr<IBrowserSessionFactory> factory)
    : config_(config),
      factory_(std::move(factory)) {

    if (!factory_) {
        throw std::invalid_argument("SessionPool requires a session factory");
    }
    if (config_.max_connections == 0) {
        throw std::invalid_argument("SessionPool max_connections must be > 0");
    }

    // Pre-warm with min_sessions
    const size_t warm = std::min(config_.min_sessions, config_.max_connections);
    for (size_t i = 0; i < warm; ++i) {
        auto created = factory_->create();
        if (created.is_ok()) {
            sessions_created_.fetch_add(1, std::memory_order_relaxed);
            std::lock_guard lock(mutex_);
            created_at_[created.value().get()] = std::chrono::steady_clock::now();
            idle_.push_back(std::move(created.value()));
        } else {
            utils::log::warn(std::format("Failed to create browser session {} during pool initialization: {}",
                i + 1, created.error_message()));
        }
    }

    utils::log::info(std::format("SessionPool initialized: {} idle sessions (max={}, queue={})",
        idle_.size(), config_.max_connections, config_.queue_size));
}

SessionPool::~SessionPool() {
    drain();
}

// ============================================================================
// Acquire
// ============================================================================

Result<LeasedSession> SessionPool::acquire(std::chrono::milliseconds timeout) {
    using R = Result<LeasedSession>;
    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    SessionList stale;
    std::unique_lock lock(mutex_);

    if (draining_) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::POOL_REJECTED, "Session pool is shutting down");
    }

    // 1. Idle session (discarding expired or dead ones)
    std::unique_ptr<IBrowserSession> session;
    while (!idle_.empty() && !session) {
        auto candidate = std::move(idle_.front());
        idle_.pop_front();
        if (is_reusable_locked(*candidate)) {
            session = std::move(candidate);
        } else {
            forget_locked(candidate.get());
            stale.push_back(std::move(candidate));
        }
    }
    if (session) {
        ++leased_;
        lock.unlock();
        destroy_sessions(std::move(stale));
        return R::ok(make_lease(std::move(session)));
    }

    // 2. Room for another session
    if (leased_ < config_.max_connections) {
        ++leased_;
        lock.unlock();
        destroy_sessions(std::move(stale));
        return create_for_lease();
    }

    // 3. Queue
    if (waiters_.size() >= config_.queue_size) {
        lock.unlock();
        destroy_sessions(std::move(stale));
        rejections_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("SessionPool: queue full ({} waiting), request rejected",
            config_.queue_size));
        return R::error(ErrorCategory::POOL_REJECTED, "Server is busy, try again later");
    }

    auto waiter = std::make_shared<Waiter>();
    waiters_.push_back(waiter);
    waiter->cv.wait_for(lock, timeout, [this, &waiter] {
        return waiter->state != Waiter::State::WAITING || draining_;
    });

    if (waiter->state == Waiter::State::GRANTED_SESSION) {
        auto granted = std::move(waiter->session);
        lock.unlock();
        destroy_sessions(std::move(stale));
        return R::ok(make_lease(std::move(granted)));
    }
    if (waiter->state == Waiter::State::GRANTED_PERMIT) {
        lock.unlock();
        destroy_sessions(std::move(stale));
        return create_for_lease();
    }

    // Still WAITING: timed out or woken by drain; leave the queue
    waiter->state = Waiter::State::CANCELLED;
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    const bool shutting_down = draining_;
    lock.unlock();
    destroy_sessions(std::move(stale));

    if (shutting_down) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::POOL_REJECTED, "Session pool is shutting down");
    }
    timeouts_.fetch_add(1, std::memory_order_relaxed);
    return R::error(ErrorCategory::POOL_TIMEOUT,
        std::format("No browser session available within {}ms", timeout.count()));
}

Result<LeasedSession> SessionPool::create_for_lease() {
    using R = Result<LeasedSession>;

    using Created = Result<std::unique_ptr<IBrowserSession>>;

    auto created = [this]() -> Created {
        try {
            return factory_->create();
        } catch (const std::exception& e) {
            return Created::error(ErrorCategory::SESSION_CREATE_FAILED, e.what());
        }
    }();

    if (created.is_ok() && created.value()) {
        sessions_created_.fetch_add(1, std::memory_order_relaxed);
        auto session = std::move(created.value());
        {
            std::lock_guard lock(mutex_);
            created_at_[session.get()] = std::chrono::steady_clock::now();
        }
        return R::ok(make_lease(std::move(session)));
    }

    create_failures_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(mutex_);
        pass_permit_locked();
    }
    const std::string reason = created.is_error() ? created.error_message() : "factory returned no session";
    utils::log::error(std::format("SessionPool: browser session creation failed: {}", reason));
    return R::error(ErrorCategory::SESSION_CREATE_FAILED,
        std::format("Failed to create browser session: {}", reason));
}

LeasedSession SessionPool::make_lease(std::unique_ptr<IBrowserSession> session) {
    return LeasedSession(std::move(session),
        [this](std::unique_ptr<IBrowserSession> s, bool broken) {
            this->return_session(std::move(s), broken);
        });
}

// ============================================================================
// Release
// ============================================================================

void SessionPool::return_session(std::unique_ptr<IBrowserSession> session, bool broken) {
    if (!session) {
        return;
    }

    SessionList discard;
    {
        std::lock_guard lock(mutex_);

        if (broken || draining_ || !is_reusable_locked(*session)) {
            forget_locked(session.get());
            discard.push_back(std::move(session));
            pass_permit_locked();
        } else if (!waiters_.empty()) {
            auto waiter = std::move(waiters_.front());
            waiters_.pop_front();
            waiter->session = std::move(session);
            waiter->state = Waiter::State::GRANTED_SESSION;
            waiter->cv.notify_one();
            handoffs_.fetch_add(1, std::memory_order_relaxed);
        } else {
            idle_.push_back(std::move(session));
            --leased_;
        }
    }

    destroy_sessions(std::move(discard));
}

void SessionPool::pass_permit_locked() {
    if (!draining_ && !waiters_.empty()) {
        auto waiter = std::move(waiters_.front());
        waiters_.pop_front();
        waiter->state = Waiter::State::GRANTED_PERMIT;
        waiter->cv.notify_one();
        return;
    }
    --leased_;
}

// ============================================================================
// Helpers
// ============================================================================

bool SessionPool::is_reusable_locked(const IBrowserSession& session) const {
    if (!session.is_alive()) return false;
    if (config_.max_session_age.count() <= 0) return true;

    const auto it = created_at_.find(&session);
    if (it == created_at_.end()) return true;
    return std::chrono::steady_clock::now() - it->second <= config_.max_session_age;
}

void SessionPool::forget_locked(const IBrowserSession* session) {
    created_at_.erase(session);
}

void SessionPool::destroy_sessions(SessionList sessions) {
    for (auto& s : sessions) {
        try {
            s->close();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("SessionPool: closing session {} failed: {}", s->id(), e.what()));
        }
        sessions_destroyed_.fetch_add(1, std::memory_order_relaxed);
    }
}

// ============================================================================
// Introspection / shutdown
// ============================================================================

SessionPoolHealth SessionPool::health() const {
    std::lock_guard lock(mutex_);
    SessionPoolHealth h;
    h.leased_count = leased_;
    h.waiting_count = waiters_.size();
    h.capacity = config_.max_connections;
    h.queue_capacity = config_.queue_size;
    h.idle_count = idle_.size();
    h.draining = draining_;
    return h;
}

SessionPoolStats SessionPool::get_stats() const {
    SessionPoolStats stats;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.rejections = rejections_.load(std::memory_order_relaxed);
    stats.timeouts = timeouts_.load(std::memory_order_relaxed);
    stats.create_failures = create_failures_.load(std::memory_order_relaxed);
    stats.sessions_created = sessions_created_.load(std::memory_order_relaxed);
    stats.sessions_destroyed = sessions_destroyed_.load(std::memory_order_relaxed);
    stats.handoffs = handoffs_.load(std::memory_order_relaxed);
    return stats;
}

void SessionPool::drain() {
    SessionList idle;
    {
        std::lock_guard lock(mutex_);
        if (draining_ && idle_.empty()) return;
        draining_ = true;

        for (auto& s : idle_) {
            forget_locked(s.get());
            idle.push_back(std::move(s));
        }
        idle_.clear();

        for (auto& w : waiters_) {
            w->cv.notify_one();
        }
    }

    const size_t closed = idle.size();
    destroy_sessions(std::move(idle));
    utils::log::info(std::format("SessionPool drained: {} idle sessions closed", closed));
}

} // namespace urlscope
