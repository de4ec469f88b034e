#include "browser/webdriver_session.hpp"
#include "core/base64.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>
#include <thread>

namespace urlscope {

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds{10};
constexpr auto kCommandSlack = std::chrono::seconds{30};
constexpr auto kBodyPollInterval = std::chrono::milliseconds{100};

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(items[i]));
    }
    out += ']';
    return out;
}

/**
 * @brief One WebDriver HTTP exchange; non-200 answers become errors
 */
Result<JsonValue> perform(const WebDriverConfig& config,
                          const std::string& method,
                          const std::string& path,
                          const std::string& body) {
    const auto [origin, prefix] = webdriver::split_endpoint(config.webdriver_url);

    httplib::Client cli(origin);
    cli.set_connection_timeout(kConnectTimeout);
    cli.set_read_timeout(config.page_load_timeout + kCommandSlack);
    cli.set_write_timeout(kConnectTimeout);

    const std::string full_path = prefix + path;
    httplib::Result res = [&] {
        if (method == "GET") return cli.Get(full_path);
        if (method == "DELETE") return cli.Delete(full_path);
        return cli.Post(full_path, body.empty() ? std::string("{}") : body, "application/json");
    }();

    if (!res) {
        return Result<JsonValue>::error(ErrorCategory::NETWORK_ERROR,
            std::format("WebDriver {} {} failed: {}", method, path, httplib::to_string(res.error())));
    }

    JsonValue json;
    try {
        json = JsonValue::parse(res->body);
    } catch (const JsonValue::parse_error&) {
        return Result<JsonValue>::error(ErrorCategory::CAPTURE_FAILED,
            std::format("WebDriver {} {} returned invalid JSON (HTTP {})", method, path, res->status));
    }

    if (res->status != httplib::StatusCode::OK_200) {
        return Result<JsonValue>::error(ErrorCategory::CAPTURE_FAILED,
            std::format("WebDriver {} {} -> HTTP {}: {}", method, path, res->status,
                webdriver::error_message(json)));
    }
    return Result<JsonValue>::ok(std::move(json));
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

namespace webdriver {

std::pair<std::string, std::string> split_endpoint(const std::string& webdriver_url) {
    const auto parsed = Url::parse(webdriver_url);
    if (!parsed) {
        throw std::invalid_argument(std::format("Invalid WebDriver URL: {}", webdriver_url));
    }
    std::string prefix = parsed->path();
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {parsed->origin(), prefix};
}

std::string error_message(const JsonValue& body) {
    const JsonValue value = body["value"];
    std::string message = value.string_or("message");
    const std::string error = value.string_or("error");
    if (message.empty()) return error.empty() ? "unknown error" : error;
    // Drivers append multi-line stack traces to the message
    if (const auto nl = message.find('\n'); nl != std::string::npos) message.resize(nl);
    return error.empty() ? message : std::format("{}: {}", error, message);
}

} // namespace webdriver

// ============================================================================
// WebDriverSession
// ============================================================================

WebDriverSession::WebDriverSession(WebDriverConfig config, std::string session_id)
    : config_(std::move(config)), session_id_(std::move(session_id)) {}

WebDriverSession::~WebDriverSession() {
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("WebDriver session {} close failed: {}", session_id_, e.what()));
    }
}

Result<JsonValue> WebDriverSession::command(const std::string& method,
                                            const std::string& path,
                                            const std::string& body) {
    auto result = perform(config_, method, std::format("/session/{}{}", session_id_, path), body);
    if (result.is_error()) {
        const bool gone = result.error_category() == ErrorCategory::NETWORK_ERROR ||
                          result.error_message().find("invalid session id") != std::string::npos;
        if (gone) {
            alive_.store(false, std::memory_order_release);
        }
    }
    return result;
}

Result<bool> WebDriverSession::set_viewport(const Viewport& viewport) {
    if (viewport.width == current_viewport_.width && viewport.height == current_viewport_.height) {
        return Result<bool>::ok(true);
    }
    const auto res = command("POST", "/window/rect",
        std::format(R"({{"width":{},"height":{}}})", viewport.width, viewport.height));
    if (res.is_error()) {
        return Result<bool>::error(res.error_category(), res.error_message());
    }
    current_viewport_ = viewport;
    return Result<bool>::ok(true);
}

bool WebDriverSession::wait_for_body() {
    const auto deadline = std::chrono::steady_clock::now() + config_.page_load_timeout;
    while (true) {
        const auto res = command("POST", "/element", R"({"using":"css selector","value":"body"})");
        if (res.is_ok()) return true;
        if (!is_alive() || std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kBodyPollInterval);
    }
}

Result<std::vector<uint8_t>> WebDriverSession::capture_screenshot(
    const std::string& url, const Viewport& viewport) {

    using R = Result<std::vector<uint8_t>>;

    if (!is_alive()) {
        return R::error(ErrorCategory::CAPTURE_FAILED, "Browser session is no longer alive");
    }

    if (const auto vp = set_viewport(viewport); vp.is_error()) {
        return R::error(ErrorCategory::CAPTURE_FAILED,
            std::format("Failed to set viewport: {}", vp.error_message()));
    }

    const auto nav = command("POST", "/url",
        std::format(R"({{"url":"{}"}})", utils::escape_json(url)));
    if (nav.is_error()) {
        return R::error(ErrorCategory::CAPTURE_FAILED,
            std::format("Navigation to {} failed: {}", url, nav.error_message()));
    }

    if (!wait_for_body()) {
        return R::error(ErrorCategory::CAPTURE_FAILED,
            std::format("Timed out waiting for page body of {}", url));
    }

    std::this_thread::sleep_for(config_.settle_delay);

    const auto shot = command("GET", "/screenshot");
    if (shot.is_error()) {
        return R::error(ErrorCategory::CAPTURE_FAILED,
            std::format("Screenshot of {} failed: {}", url, shot.error_message()));
    }

    const JsonValue value = shot.value()["value"];
    if (!value.is_string()) {
        return R::error(ErrorCategory::CAPTURE_FAILED, "Screenshot response carries no image data");
    }
    auto png = base64::decode(value.get<std::string>());
    if (!png) {
        return R::error(ErrorCategory::CAPTURE_FAILED, "Screenshot payload is not valid base64");
    }
    return R::ok(std::move(*png));
}

void WebDriverSession::close() {
    if (closed_.exchange(true)) return;

    if (alive_.exchange(false)) {
        const auto res = perform(config_, "DELETE", std::format("/session/{}", session_id_), "");
        if (res.is_error()) {
            utils::log::warn(std::format("WebDriver session {} delete failed: {}",
                session_id_, res.error_message()));
            return;
        }
    }
    utils::log::debug(std::format("WebDriver session {} closed", session_id_));
}

// ============================================================================
// WebDriverSessionFactory
// ============================================================================

WebDriverSessionFactory::WebDriverSessionFactory(WebDriverConfig config)
    : config_(std::move(config)) {
    // Fail fast on a bad endpoint
    (void)webdriver::split_endpoint(config_.webdriver_url);
}

std::string WebDriverSessionFactory::capabilities_json() const {
    std::vector<std::string> args = config_.chrome_args;
    const bool firefox = utils::to_lower(config_.browser_name) == "firefox";

    if (firefox) {
        if (config_.headless) args.push_back("-headless");
        return std::format(
            R"({{"capabilities":{{"alwaysMatch":{{"browserName":"firefox","moz:firefoxOptions":{{"args":{}}}}}}}}})",
            json_string_array(args));
    }

    if (config_.headless) args.push_back("--headless=new");
    args.push_back(std::format("--window-size={},{}", config_.viewport.width, config_.viewport.height));
    return std::format(
        R"({{"capabilities":{{"alwaysMatch":{{"browserName":"{}","goog:chromeOptions":{{"args":{}}}}}}}}})",
        utils::escape_json(config_.browser_name), json_string_array(args));
}

Result<std::unique_ptr<IBrowserSession>> WebDriverSessionFactory::create() {
    using R = Result<std::unique_ptr<IBrowserSession>>;

    const auto res = perform(config_, "POST", "/session", capabilities_json());
    if (res.is_error()) {
        return R::error(ErrorCategory::SESSION_CREATE_FAILED, res.error_message());
    }

    // W3C puts sessionId under "value"; legacy drivers at the top level
    std::string session_id = res.value()["value"].string_or("sessionId");
    if (session_id.empty()) session_id = res.value().string_or("sessionId");
    if (session_id.empty()) {
        return R::error(ErrorCategory::SESSION_CREATE_FAILED, "WebDriver response carries no sessionId");
    }

    auto session = std::make_unique<WebDriverSession>(config_, session_id);

    const auto timeouts = perform(config_, "POST", std::format("/session/{}/timeouts", session_id),
        std::format(R"({{"pageLoad":{}}})", config_.page_load_timeout.count()));
    if (timeouts.is_error()) {
        utils::log::warn(std::format("WebDriver session {}: could not set timeouts: {}",
            session_id, timeouts.error_message()));
    }

    if (const auto vp = session->set_viewport(config_.viewport); vp.is_error()) {
        session->close();
        return R::error(ErrorCategory::SESSION_CREATE_FAILED,
            std::format("Failed to size browser window: {}", vp.error_message()));
    }

    utils::log::info(std::format("WebDriver session {} started ({}x{}, headless={})",
        session_id, config_.viewport.width, config_.viewport.height,
        utils::booltostr(config_.headless)));
    return R::ok(std::move(session));
}

} // namespace urlscope
