#pragma once

#include "browser/ibrowser_session.hpp"

#include <functional>
#include <memory>

namespace urlscope {

/**
 * @brief RAII lease on a pooled browser session
 *
 * Returns the session to its pool on destruction or release().
 * Move-only; a moved-from or released lease is empty, and touching the
 * session through an empty lease throws std::logic_error.
 */
class LeasedSession {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IBrowserSession>, bool broken)>;

    LeasedSession() = default;

    /**
     * @param session Leased session
     * @param return_fn Called exactly once with the session (returns it to the pool)
     */
    LeasedSession(std::unique_ptr<IBrowserSession> session, ReturnFunc return_fn);

    ~LeasedSession();

    LeasedSession(LeasedSession&& other) noexcept;
    LeasedSession& operator=(LeasedSession&& other) noexcept;

    LeasedSession(const LeasedSession&) = delete;
    LeasedSession& operator=(const LeasedSession&) = delete;

    /**
     * @throws std::logic_error if the lease was already released
     */
    [[nodiscard]] IBrowserSession* get() const;
    IBrowserSession* operator->() const { return get(); }

    /**
     * @brief Destroy instead of reuse when the lease is returned
     */
    void mark_broken() { broken_ = true; }

    [[nodiscard]] bool is_broken() const { return broken_; }

    /**
     * @brief Return the session now
     * @throws std::logic_error on a second release
     */
    void release();

    [[nodiscard]] bool is_valid() const { return session_ != nullptr; }

private:
    void give_back() noexcept;

    std::unique_ptr<IBrowserSession> session_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace urlscope
