#include "config/config_loader.hpp"
#include "codec/anonymizer.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <utility>

using namespace std::string_literals;

namespace urlscope {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

constexpr uint32_t kMaxTimeoutMs = 3600000;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/**
 * @brief Read an integer key as int64 and narrow it only if it fits T
 * @throws std::runtime_error on a non-integer value or one outside T's range
 */
template<typename T>
T toml_int(const toml::table& tbl, std::string_view section, std::string_view key, T fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;

    const auto* integer = node.as_integer();
    if (!integer) {
        throw std::runtime_error(std::format("{}.{} must be an integer", section, key));
    }
    const int64_t value = integer->get();
    if (!std::in_range<T>(value)) {
        throw std::runtime_error(std::format("{}.{}: {} is out of range", section, key, value));
    }
    return static_cast<T>(value);
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key,
                                           std::vector<std::string> fallback) {
    const auto* arr = tbl[key].as_array();
    if (!arr) return fallback;

    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            result.emplace_back(s->get());
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = toml_int<uint16_t>(s, "server", "port", 8080);
    cfg.thread_pool_size = toml_int<size_t>(s, "server", "threads", 8);
    cfg.shutdown_timeout_ms = toml_int<uint32_t>(s, "server", "shutdown_timeout_ms", 30000);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

RequestConfig ConfigLoader::extract_request(const toml::table& root) {
    RequestConfig cfg;
    const auto* request = root["request"].as_table();
    if (!request) return cfg;
    const auto& r = *request;

    cfg.timeout_ms = toml_int<uint32_t>(r, "request", "timeout_ms", 60000);
    cfg.max_url_length = toml_int<size_t>(r, "request", "max_url_length", 2048);
    return cfg;
}

CodecSettings ConfigLoader::extract_codec(const toml::table& root) {
    CodecSettings cfg;
    const auto* codec = root["codec"].as_table();
    if (!codec) return cfg;

    cfg.min_candidate_length = toml_int<size_t>(*codec, "codec", "min_candidate_length", 8);
    cfg.report_binary = (*codec)["report_binary"].value_or(false);
    return cfg;
}

AnonymizerSettings ConfigLoader::extract_anonymizer(const toml::table& root) {
    AnonymizerSettings cfg;
    const auto* anon = root["anonymizer"].as_table();
    if (!anon) return cfg;

    cfg.mode = (*anon)["mode"].value_or("literal"s);
    cfg.placeholder = (*anon)["placeholder"].value_or("anonymized_value"s);
    return cfg;
}

CrawlerSettings ConfigLoader::extract_crawler(const toml::table& root) {
    CrawlerSettings cfg;
    const auto* crawler = root["crawler"].as_table();
    if (!crawler) return cfg;
    const auto& c = *crawler;

    cfg.max_hops = toml_int<size_t>(c, "crawler", "max_hops", 10);
    cfg.per_hop_timeout_ms = toml_int<uint32_t>(c, "crawler", "per_hop_timeout_ms", 30000);
    cfg.hop_delay_ms = toml_int<uint32_t>(c, "crawler", "hop_delay_ms", 0);
    cfg.user_agent = c["user_agent"].value_or("urlscope/1.0"s);
    cfg.allowed_schemes = toml_string_array(c, "allowed_schemes", cfg.allowed_schemes);
    cfg.allowed_domains = toml_string_array(c, "allowed_domains", {});
    cfg.probe_method = c["probe_method"].value_or("GET"s);
    cfg.verify_tls = c["verify_tls"].value_or(true);

    for (auto& scheme : cfg.allowed_schemes) scheme = utils::to_lower(scheme);
    return cfg;
}

PoolSettings ConfigLoader::extract_pool(const toml::table& root) {
    PoolSettings cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.max_connections = toml_int<size_t>(p, "pool", "max_connections", 10);
    cfg.queue_size = toml_int<size_t>(p, "pool", "queue_size", 100);
    cfg.min_sessions = toml_int<size_t>(p, "pool", "min_sessions", 0);
    cfg.max_session_age_s = toml_int<uint32_t>(p, "pool", "max_session_age_s", 3600);
    return cfg;
}

BrowserSettings ConfigLoader::extract_browser(const toml::table& root) {
    BrowserSettings cfg;
    const auto* browser = root["browser"].as_table();
    if (!browser) return cfg;
    const auto& b = *browser;

    cfg.webdriver_url = b["webdriver_url"].value_or("http://localhost:4444"s);
    cfg.browser_name = b["browser_name"].value_or("chrome"s);
    cfg.headless = b["headless"].value_or(true);
    cfg.viewport_width = toml_int<uint32_t>(b, "browser", "viewport_width", 1920);
    cfg.viewport_height = toml_int<uint32_t>(b, "browser", "viewport_height", 1080);
    cfg.page_load_timeout_ms = toml_int<uint32_t>(b, "browser", "page_load_timeout_ms", 30000);
    cfg.settle_delay_ms = toml_int<uint32_t>(b, "browser", "settle_delay_ms", 500);
    cfg.capture_attempts = toml_int<size_t>(b, "browser", "capture_attempts", 3);
    cfg.capture_retry_delay_ms = toml_int<uint32_t>(b, "browser", "capture_retry_delay_ms", 1000);
    cfg.screenshot_dir = b["screenshot_dir"].value_or(""s);
    cfg.chrome_args = toml_string_array(b, "chrome_args", cfg.chrome_args);
    return cfg;
}

InspectionSettings ConfigLoader::extract_inspection(const toml::table& root) {
    InspectionSettings cfg;
    const auto* inspection = root["inspection"].as_table();
    if (!inspection) return cfg;
    const auto& i = *inspection;

    cfg.certificates = i["certificates"].value_or(true);
    cfg.whois = i["whois"].value_or(true);
    cfg.timeout_ms = toml_int<uint32_t>(i, "inspection", "timeout_ms", 5000);
    cfg.certificate_port = toml_int<uint16_t>(i, "inspection", "certificate_port", 443);
    cfg.warning_days = toml_int<uint32_t>(i, "inspection", "warning_days", 30);
    cfg.whois_server = i["whois_server"].value_or("whois.iana.org"s);
    cfg.whois_port = toml_int<uint16_t>(i, "inspection", "whois_port", 43);
    cfg.follow_referrals = i["follow_referrals"].value_or(true);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

ServiceConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ServiceConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.request = extract_request(tbl);
    config.codec = extract_codec(tbl);
    config.anonymizer = extract_anonymizer(tbl);
    config.crawler = extract_crawler(tbl);
    config.pool = extract_pool(tbl);
    config.browser = extract_browser(tbl);
    config.inspection = extract_inspection(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ServiceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ServiceConfig& config) {
    std::vector<std::string> errors;

    // [server]
    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (!utils::in_range<1, 1024>(config.server.thread_pool_size)) {
        errors.push_back(std::format("server.threads must be 1-1024, got {}", config.server.thread_pool_size));
    }

    // [logging]
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
            config.logging.level));
    }

    // [request]
    if (!utils::in_range<1, kMaxTimeoutMs>(config.request.timeout_ms)) {
        errors.push_back(std::format("request.timeout_ms must be 1-{}, got {}",
            kMaxTimeoutMs, config.request.timeout_ms));
    }
    if (!utils::in_range<16, 1048576>(config.request.max_url_length)) {
        errors.push_back(std::format("request.max_url_length must be 16-1048576, got {}",
            config.request.max_url_length));
    }

    // [codec]
    if (!utils::in_range<4, 4096>(config.codec.min_candidate_length)) {
        errors.push_back(std::format("codec.min_candidate_length must be 4-4096, got {}",
            config.codec.min_candidate_length));
    }

    // [anonymizer]
    const auto mode = parse_anonymizer_mode(config.anonymizer.mode);
    if (!mode) {
        errors.push_back(std::format("anonymizer.mode must be literal|hashed, got '{}'",
            config.anonymizer.mode));
    } else if (*mode == AnonymizerConfig::Mode::LITERAL && config.anonymizer.placeholder.empty()) {
        errors.push_back("anonymizer.placeholder must not be empty in literal mode");
    }

    // [crawler]
    if (!utils::in_range<0, 100>(config.crawler.max_hops)) {
        errors.push_back(std::format("crawler.max_hops must be 0-100, got {}", config.crawler.max_hops));
    }
    if (!utils::in_range<1, kMaxTimeoutMs>(config.crawler.per_hop_timeout_ms)) {
        errors.push_back(std::format("crawler.per_hop_timeout_ms must be 1-{}, got {}",
            kMaxTimeoutMs, config.crawler.per_hop_timeout_ms));
    }
    if (!utils::in_range<0, 60000>(config.crawler.hop_delay_ms)) {
        errors.push_back(std::format("crawler.hop_delay_ms must be 0-60000, got {}",
            config.crawler.hop_delay_ms));
    }
    if (config.crawler.probe_method != "GET" && config.crawler.probe_method != "HEAD") {
        errors.push_back(std::format("crawler.probe_method must be GET or HEAD, got '{}'",
            config.crawler.probe_method));
    }
    if (config.crawler.allowed_schemes.empty()) {
        errors.push_back("crawler.allowed_schemes must not be empty");
    }
    for (const auto& scheme : config.crawler.allowed_schemes) {
        if (scheme != "http" && scheme != "https") {
            errors.push_back(std::format("crawler.allowed_schemes: unsupported scheme '{}'", scheme));
        }
    }

    // [pool]
    if (!utils::in_range<1, 1000>(config.pool.max_connections)) {
        errors.push_back(std::format("pool.max_connections must be 1-1000, got {}",
            config.pool.max_connections));
    }
    if (!utils::in_range<0, 100000>(config.pool.queue_size)) {
        errors.push_back(std::format("pool.queue_size must be 0-100000, got {}", config.pool.queue_size));
    }
    if (config.pool.min_sessions > config.pool.max_connections) {
        errors.push_back(std::format("pool.min_sessions ({}) > max_connections ({})",
            config.pool.min_sessions, config.pool.max_connections));
    }

    // [browser]
    if (config.browser.webdriver_url.empty()) {
        errors.push_back("browser.webdriver_url must not be empty");
    } else if (!Url::parse(config.browser.webdriver_url)) {
        errors.push_back(std::format("browser.webdriver_url is not a valid URL: '{}'",
            config.browser.webdriver_url));
    }
    if (!utils::in_range<1, 16384>(config.browser.viewport_width) ||
        !utils::in_range<1, 16384>(config.browser.viewport_height)) {
        errors.push_back(std::format("browser viewport must be 1-16384 in each dimension, got {}x{}",
            config.browser.viewport_width, config.browser.viewport_height));
    }
    if (!utils::in_range<1, kMaxTimeoutMs>(config.browser.page_load_timeout_ms)) {
        errors.push_back(std::format("browser.page_load_timeout_ms must be 1-{}, got {}",
            kMaxTimeoutMs, config.browser.page_load_timeout_ms));
    }
    if (!utils::in_range<1, 10>(config.browser.capture_attempts)) {
        errors.push_back(std::format("browser.capture_attempts must be 1-10, got {}",
            config.browser.capture_attempts));
    }

    // [inspection]
    if (!utils::in_range<1, kMaxTimeoutMs>(config.inspection.timeout_ms)) {
        errors.push_back(std::format("inspection.timeout_ms must be 1-{}, got {}",
            kMaxTimeoutMs, config.inspection.timeout_ms));
    }
    if (config.inspection.certificates && config.inspection.certificate_port == 0) {
        errors.push_back("inspection.certificate_port must be 1-65535, got 0");
    }
    if (!utils::in_range<0, 3650>(config.inspection.warning_days)) {
        errors.push_back(std::format("inspection.warning_days must be 0-3650, got {}",
            config.inspection.warning_days));
    }
    if (config.inspection.whois) {
        if (config.inspection.whois_server.empty()) {
            errors.push_back("inspection.whois_server must not be empty when whois is enabled");
        }
        if (config.inspection.whois_port == 0) {
            errors.push_back("inspection.whois_port must be 1-65535, got 0");
        }
    }

    return errors;
}

} // namespace urlscope
