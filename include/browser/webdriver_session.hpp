#pragma once

#include "browser/ibrowser_session.hpp"
#include "browser/ibrowser_session_factory.hpp"
#include "core/json.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace urlscope {

struct WebDriverConfig {
    std::string webdriver_url = "http://localhost:4444";   // may carry a path prefix, e.g. /wd/hub
    std::string browser_name = "chrome";
    bool headless = true;
    Viewport viewport;
    std::chrono::milliseconds page_load_timeout{30000};
    std::chrono::milliseconds settle_delay{500};
    std::vector<std::string> chrome_args = {"--no-sandbox", "--disable-dev-shm-usage", "--disable-gpu"};
};

/**
 * @brief W3C WebDriver session driven over HTTP (cpp-httplib + glaze)
 *
 * capture_screenshot(): navigate, wait until `body` is present (bounded by
 * page_load_timeout), settle, then take a viewport screenshot.
 */
class WebDriverSession : public IBrowserSession {
public:
    WebDriverSession(WebDriverConfig config, std::string session_id);
    ~WebDriverSession() override;

    WebDriverSession(const WebDriverSession&) = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    [[nodiscard]] Result<std::vector<uint8_t>> capture_screenshot(
        const std::string& url, const Viewport& viewport) override;

    [[nodiscard]] bool is_alive() const override { return alive_.load(std::memory_order_acquire); }

    void close() override;

    [[nodiscard]] const std::string& id() const override { return session_id_; }

    /**
     * @brief Resize the browser window (no-op if unchanged)
     */
    [[nodiscard]] Result<bool> set_viewport(const Viewport& viewport);

private:
    [[nodiscard]] Result<JsonValue> command(const std::string& method,
                                            const std::string& path,
                                            const std::string& body = "");
    [[nodiscard]] bool wait_for_body();

    WebDriverConfig config_;
    std::string session_id_;
    Viewport current_viewport_{0, 0};
    std::atomic<bool> alive_{true};
    std::atomic<bool> closed_{false};
};

/**
 * @brief Starts WebDriver sessions against one endpoint
 */
class WebDriverSessionFactory : public IBrowserSessionFactory {
public:
    explicit WebDriverSessionFactory(WebDriverConfig config);

    [[nodiscard]] Result<std::unique_ptr<IBrowserSession>> create() override;

    /**
     * @brief Body of POST /session for this configuration
     */
    [[nodiscard]] std::string capabilities_json() const;

private:
    WebDriverConfig config_;
};

namespace webdriver {

/**
 * @brief Split webdriver_url into client origin and path prefix (no trailing '/')
 * @throws std::invalid_argument for a URL that does not parse
 */
[[nodiscard]] std::pair<std::string, std::string> split_endpoint(const std::string& webdriver_url);

/**
 * @brief Extract "value.message" / "value.error" from a WebDriver error body
 */
[[nodiscard]] std::string error_message(const JsonValue& body);

} // namespace webdriver

} // namespace urlscope
