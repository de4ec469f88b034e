#include "browser/leased_session.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace urlscope {

LeasedSession::LeasedSession(std::unique_ptr<IBrowserSession> session, ReturnFunc return_fn)
    : session_(std::move(session)), return_fn_(std::move(return_fn)) {}

LeasedSession::~LeasedSession() {
    give_back();
}

LeasedSession::LeasedSession(LeasedSession&& other) noexcept
    : session_(std::move(other.session_)),
      return_fn_(std::move(other.return_fn_)),
      broken_(other.broken_) {
    other.broken_ = false;
}

LeasedSession& LeasedSession::operator=(LeasedSession&& other) noexcept {
    if (this != &other) {
        // Return current session before taking the new one
        give_back();
        session_ = std::move(other.session_);
        return_fn_ = std::move(other.return_fn_);
        broken_ = other.broken_;
        other.broken_ = false;
    }
    return *this;
}

IBrowserSession* LeasedSession::get() const {
    if (!session_) {
        throw std::logic_error("LeasedSession: session already released");
    }
    return session_.get();
}

void LeasedSession::release() {
    if (!session_) {
        throw std::logic_error("LeasedSession: double release");
    }
    give_back();
}

void LeasedSession::give_back() noexcept {
    if (!session_) {
        return;
    }
    if (!return_fn_) {
        session_.reset();
        return;
    }
    auto fn = std::move(return_fn_);
    return_fn_ = nullptr;
    try {
        fn(std::move(session_), broken_);
    } catch (const std::exception& e) {
        utils::log::error(std::format("LeasedSession: returning session failed: {}", e.what()));
    }
    session_.reset();
}

} // namespace urlscope
