#pragma once

#include "browser/ibrowser_session.hpp"
#include "core/error.hpp"

#include <memory>

namespace urlscope {

/**
 * @brief Abstract factory for remote browser sessions
 *
 * Must be callable from several threads at once.
 */
class IBrowserSessionFactory {
public:
    virtual ~IBrowserSessionFactory() = default;

    /**
     * @brief Start a new session
     * @return Session, or SESSION_CREATE_FAILED with the reason
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IBrowserSession>> create() = 0;
};

} // namespace urlscope
