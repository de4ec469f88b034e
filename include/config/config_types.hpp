#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace urlscope {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 8;
    uint32_t shutdown_timeout_ms = 30000;   // Graceful shutdown timeout
};

struct LoggingConfig {
    std::string level = "info";             // debug | info | warn | error
};

struct RequestConfig {
    uint32_t timeout_ms = 60000;            // Bounds the wait for a browser session
    size_t max_url_length = 2048;
};

struct CodecSettings {
    size_t min_candidate_length = 8;
    bool report_binary = false;
};

struct AnonymizerSettings {
    std::string mode = "literal";           // literal | hashed
    std::string placeholder = "anonymized_value";
};

struct CrawlerSettings {
    size_t max_hops = 10;
    uint32_t per_hop_timeout_ms = 30000;
    uint32_t hop_delay_ms = 0;
    std::string user_agent = "urlscope/1.0";
    std::vector<std::string> allowed_schemes = {"http", "https"};
    std::vector<std::string> allowed_domains;   // empty = any
    std::string probe_method = "GET";           // GET | HEAD
    bool verify_tls = true;
};

struct PoolSettings {
    size_t max_connections = 10;
    size_t queue_size = 100;
    size_t min_sessions = 0;
    uint32_t max_session_age_s = 3600;      // 0 = disabled
};

struct BrowserSettings {
    std::string webdriver_url = "http://localhost:4444";
    std::string browser_name = "chrome";
    bool headless = true;
    uint32_t viewport_width = 1920;
    uint32_t viewport_height = 1080;
    uint32_t page_load_timeout_ms = 30000;
    uint32_t settle_delay_ms = 500;
    size_t capture_attempts = 3;
    uint32_t capture_retry_delay_ms = 1000;
    std::string screenshot_dir;             // empty = do not write PNG files
    std::vector<std::string> chrome_args = {"--no-sandbox", "--disable-dev-shm-usage", "--disable-gpu"};
};

struct InspectionSettings {
    bool certificates = true;               // TLS certificate of original/final host
    bool whois = true;
    uint32_t timeout_ms = 5000;             // Per lookup
    uint16_t certificate_port = 443;
    uint32_t warning_days = 30;             // expiring_soon below this
    std::string whois_server = "whois.iana.org";
    uint16_t whois_port = 43;
    bool follow_referrals = true;
};

struct ServiceConfig {
    ServerConfig server;
    LoggingConfig logging;
    RequestConfig request;
    CodecSettings codec;
    AnonymizerSettings anonymizer;
    CrawlerSettings crawler;
    PoolSettings pool;
    BrowserSettings browser;
    InspectionSettings inspection;
};

} // namespace urlscope
