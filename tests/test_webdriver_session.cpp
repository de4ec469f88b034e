#include <catch2/catch_test_macros.hpp>
#include "browser/webdriver_session.hpp"
#include "core/base64.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <atomic>
#include <format>
#include <mutex>
#include <thread>

using namespace urlscope;

namespace {

const std::vector<uint8_t> kPng = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 'o', 'k'};

/**
 * @brief Minimal W3C WebDriver endpoint under /wd/hub
 */
class FakeWebDriver {
public:
    FakeWebDriver() {
        svr_.Post("/wd/hub/session", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard lock(mutex_);
                capabilities_ = req.body;
            }
            if (refuse_sessions) {
                res.status = 500;
                res.set_content(R"({"value":{"error":"session not created","message":"no chrome binary\nstack"}})",
                                "application/json");
                return;
            }
            res.set_content(R"({"value":{"sessionId":"abc123","capabilities":{}}})", "application/json");
        });
        svr_.Post(R"(/wd/hub/session/([^/]+)/(timeouts|window/rect|element))",
                  [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"value":null})", "application/json");
        });
        svr_.Post(R"(/wd/hub/session/([^/]+)/url)", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches[1] != "abc123") {
                res.status = 404;
                res.set_content(R"({"value":{"error":"invalid session id","message":"gone"}})",
                                "application/json");
                return;
            }
            {
                std::lock_guard lock(mutex_);
                navigations_.push_back(req.body);
            }
            if (fail_navigation) {
                res.status = 500;
                res.set_content(R"({"value":{"error":"unknown error","message":"net::ERR_NAME_NOT_RESOLVED"}})",
                                "application/json");
                return;
            }
            res.set_content(R"({"value":null})", "application/json");
        });
        svr_.Get(R"(/wd/hub/session/([^/]+)/screenshot)", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::format(R"({{"value":"{}"}})", base64::encode(kPng.data(), kPng.size())),
                            "application/json");
        });
        svr_.Delete(R"(/wd/hub/session/([^/]+))", [this](const httplib::Request&, httplib::Response& res) {
            deletes.fetch_add(1);
            res.set_content(R"({"value":null})", "application/json");
        });

        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        while (!svr_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~FakeWebDriver() {
        svr_.stop();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] WebDriverConfig config() const {
        WebDriverConfig cfg;
        cfg.webdriver_url = std::format("http://127.0.0.1:{}/wd/hub/", port_);
        cfg.page_load_timeout = std::chrono::milliseconds(500);
        cfg.settle_delay = std::chrono::milliseconds(0);
        return cfg;
    }

    [[nodiscard]] std::string capabilities() {
        std::lock_guard lock(mutex_);
        return capabilities_;
    }

    [[nodiscard]] std::vector<std::string> navigations() {
        std::lock_guard lock(mutex_);
        return navigations_;
    }

    std::atomic<bool> refuse_sessions{false};
    std::atomic<bool> fail_navigation{false};
    std::atomic<int> deletes{0};

private:
    httplib::Server svr_;
    int port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    std::string capabilities_;
    std::vector<std::string> navigations_;
};

} // namespace

TEST_CASE("webdriver: endpoint splitting", "[webdriver]") {
    const auto local = webdriver::split_endpoint("http://localhost:4444");
    CHECK(local.first == "http://localhost:4444");
    CHECK(local.second.empty());

    const auto grid = webdriver::split_endpoint("https://grid.example/wd/hub/");
    CHECK(grid.first == "https://grid.example");
    CHECK(grid.second == "/wd/hub");

    CHECK_THROWS_AS(webdriver::split_endpoint("not a url"), std::invalid_argument);
}

TEST_CASE("webdriver: error messages", "[webdriver]") {
    CHECK(webdriver::error_message(JsonValue::parse(
        R"({"value":{"error":"no such element","message":"Unable to locate\n  at stack"}})"))
        == "no such element: Unable to locate");
    CHECK(webdriver::error_message(JsonValue::parse(R"({"value":{"error":"timeout"}})")) == "timeout");
    CHECK(webdriver::error_message(JsonValue::parse(R"({"value":null})")) == "unknown error");
}

TEST_CASE("WebDriverSessionFactory: capabilities per browser", "[webdriver]") {
    WebDriverConfig cfg;
    cfg.viewport = {1280, 720};
    cfg.chrome_args = {"--no-sandbox"};

    const auto chrome = JsonValue::parse(WebDriverSessionFactory(cfg).capabilities_json());
    const auto match = chrome["capabilities"]["alwaysMatch"];
    CHECK(match.string_or("browserName") == "chrome");
    const auto args = match["goog:chromeOptions"]["args"];
    REQUIRE(args.size() == 3);
    CHECK(args[size_t{0}].get<std::string>() == "--no-sandbox");
    CHECK(args[size_t{1}].get<std::string>() == "--headless=new");
    CHECK(args[size_t{2}].get<std::string>() == "--window-size=1280,720");

    cfg.browser_name = "Firefox";
    cfg.headless = false;
    const auto firefox = JsonValue::parse(WebDriverSessionFactory(cfg).capabilities_json());
    const auto fmatch = firefox["capabilities"]["alwaysMatch"];
    CHECK(fmatch.string_or("browserName") == "firefox");
    CHECK(fmatch["moz:firefoxOptions"]["args"].size() == 1);
}

TEST_CASE("WebDriverSessionFactory: rejects a bad endpoint", "[webdriver]") {
    WebDriverConfig cfg;
    cfg.webdriver_url = "localhost";
    CHECK_THROWS_AS(WebDriverSessionFactory(cfg), std::invalid_argument);
}

TEST_CASE("WebDriverSession: capture against a WebDriver endpoint", "[webdriver][integration]") {
    FakeWebDriver driver;
    WebDriverSessionFactory factory(driver.config());

    auto created = factory.create();
    REQUIRE(created.is_ok());
    auto session = std::move(created.value());
    CHECK(session->id() == "abc123");
    CHECK(session->is_alive());
    CHECK(driver.capabilities().find("goog:chromeOptions") != std::string::npos);

    const auto shot = session->capture_screenshot("https://example.com/?q=\"x\"", Viewport{});
    REQUIRE(shot.is_ok());
    CHECK(shot.value() == kPng);

    const auto navs = driver.navigations();
    REQUIRE(navs.size() == 1);
    CHECK(JsonValue::parse(navs[0]).string_or("url") == "https://example.com/?q=\"x\"");

    session->close();
    session->close();
    CHECK(driver.deletes == 1);
    CHECK_FALSE(session->is_alive());
}

TEST_CASE("WebDriverSession: navigation failure is a capture error", "[webdriver][integration]") {
    FakeWebDriver driver;
    driver.fail_navigation = true;
    WebDriverSessionFactory factory(driver.config());

    auto created = factory.create();
    REQUIRE(created.is_ok());
    const auto shot = created.value()->capture_screenshot("https://nowhere.invalid/", Viewport{});
    REQUIRE(shot.is_error());
    CHECK(shot.error_category() == ErrorCategory::CAPTURE_FAILED);
    CHECK(shot.error_message().find("ERR_NAME_NOT_RESOLVED") != std::string::npos);
    CHECK(created.value()->is_alive());
}

TEST_CASE("WebDriverSession: stale session id marks the session dead", "[webdriver][integration]") {
    FakeWebDriver driver;
    WebDriverSession session(driver.config(), "stale");

    const auto shot = session.capture_screenshot("https://example.com/", Viewport{});
    REQUIRE(shot.is_error());
    CHECK_FALSE(session.is_alive());

    session.close();
    CHECK(driver.deletes == 0);
}

TEST_CASE("WebDriverSessionFactory: driver refusal becomes SESSION_CREATE_FAILED", "[webdriver][integration]") {
    FakeWebDriver driver;
    driver.refuse_sessions = true;
    WebDriverSessionFactory factory(driver.config());

    const auto created = factory.create();
    REQUIRE(created.is_error());
    CHECK(created.error_category() == ErrorCategory::SESSION_CREATE_FAILED);
    CHECK(created.error_message().find("session not created: no chrome binary") != std::string::npos);
}

TEST_CASE("WebDriverSessionFactory: unreachable endpoint", "[webdriver][integration]") {
    WebDriverConfig cfg;
    cfg.webdriver_url = "http://127.0.0.1:1";
    WebDriverSessionFactory factory(cfg);

    const auto created = factory.create();
    REQUIRE(created.is_error());
    CHECK(created.error_category() == ErrorCategory::SESSION_CREATE_FAILED);
}
