#include "browser/session_pool.hpp"
#include "browser/webdriver_session.hpp"
#include "cert/tls_certificate_inspector.hpp"
#include "classifier/identifier_classifier.hpp"
#include "codec/anonymizer.hpp"
#include "codec/identifier_codec.hpp"
#include "config/config_loader.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "crawler/http_redirect_probe.hpp"
#include "crawler/redirect_crawler.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "whois/tcp_whois_client.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace urlscope;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<SessionPool> g_pool;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop admissions, then drain the session pool (registered hook)
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }

    // Wait for in-flight requests to drain
    if (g_shutdown) {
        bool drained = g_shutdown->wait_for_drain();
        if (drained) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("urlscope starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/urlscope.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));

        ServiceConfig config;
        if (!std::filesystem::exists(config_file)) {
            utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
        } else {
            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                throw std::runtime_error(config_result.error_message);
            }
            config = std::move(config_result.config);
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // Identifier codec + anonymizer
        CodecConfig codec_config;
        codec_config.min_candidate_length = config.codec.min_candidate_length;
        codec_config.report_binary = config.codec.report_binary;
        auto classifier = std::make_shared<const IdentifierClassifier>();
        auto codec = std::make_shared<IdentifierCodec>(codec_config, classifier);

        AnonymizerConfig anonymizer_config;
        anonymizer_config.mode = parse_anonymizer_mode(config.anonymizer.mode)
            .value_or(AnonymizerConfig::Mode::LITERAL);
        anonymizer_config.placeholder = config.anonymizer.placeholder;
        auto anonymizer = std::make_shared<Anonymizer>(anonymizer_config);

        utils::log::info(std::format("[2/7] Identifier codec: {} rules, min length {}, anonymizer mode {}",
            classifier->rules().size(), codec_config.min_candidate_length, config.anonymizer.mode));

        // Redirect crawler
        HttpRedirectProbe::Config probe_config;
        probe_config.method = config.crawler.probe_method;
        probe_config.user_agent = config.crawler.user_agent;
        probe_config.verify_tls = config.crawler.verify_tls;
        auto probe = std::make_shared<HttpRedirectProbe>(probe_config);

        CrawlerConfig crawler_config;
        crawler_config.max_hops = config.crawler.max_hops;
        crawler_config.per_hop_timeout = std::chrono::milliseconds{config.crawler.per_hop_timeout_ms};
        crawler_config.hop_delay = std::chrono::milliseconds{config.crawler.hop_delay_ms};
        crawler_config.allowed_schemes = config.crawler.allowed_schemes;
        crawler_config.allowed_domains = config.crawler.allowed_domains;
        auto crawler = std::make_shared<RedirectCrawler>(probe, crawler_config);

        utils::log::info(std::format("[3/7] Redirect crawler: {} probes, max {} hops, {}ms per hop",
            probe_config.method, crawler_config.max_hops, config.crawler.per_hop_timeout_ms));

        // Certificate + WHOIS lookups
        std::shared_ptr<ICertificateInspector> certificates;
        if (config.inspection.certificates) {
            TlsCertificateInspector::Config cert_config;
            cert_config.port = config.inspection.certificate_port;
            cert_config.warning_days = config.inspection.warning_days;
            certificates = std::make_shared<TlsCertificateInspector>(cert_config);
        }
        std::shared_ptr<IWhoisClient> whois;
        if (config.inspection.whois) {
            TcpWhoisClient::Config whois_config;
            whois_config.server = config.inspection.whois_server;
            whois_config.port = config.inspection.whois_port;
            whois_config.follow_referrals = config.inspection.follow_referrals;
            whois = std::make_shared<TcpWhoisClient>(whois_config);
        }

        utils::log::info(std::format("[4/7] Domain inspection: certificates {}, whois {} via {}, {}ms per lookup",
            config.inspection.certificates ? "on" : "off", config.inspection.whois ? "on" : "off",
            config.inspection.whois_server, config.inspection.timeout_ms));

        // Browser sessions
        WebDriverConfig webdriver_config;
        webdriver_config.webdriver_url = config.browser.webdriver_url;
        webdriver_config.browser_name = config.browser.browser_name;
        webdriver_config.headless = config.browser.headless;
        webdriver_config.viewport = Viewport{config.browser.viewport_width, config.browser.viewport_height};
        webdriver_config.page_load_timeout = std::chrono::milliseconds{config.browser.page_load_timeout_ms};
        webdriver_config.settle_delay = std::chrono::milliseconds{config.browser.settle_delay_ms};
        webdriver_config.chrome_args = config.browser.chrome_args;
        auto factory = std::make_shared<WebDriverSessionFactory>(webdriver_config);

        SessionPoolConfig pool_config;
        pool_config.max_connections = config.pool.max_connections;
        pool_config.queue_size = config.pool.queue_size;
        pool_config.min_sessions = config.pool.min_sessions;
        pool_config.max_session_age = std::chrono::seconds{config.pool.max_session_age_s};
        g_pool = std::make_shared<SessionPool>(pool_config, factory);

        utils::log::info(std::format("[5/7] Browser pool: {} via {}, max {} sessions, queue {}",
            webdriver_config.browser_name, webdriver_config.webdriver_url,
            pool_config.max_connections, pool_config.queue_size));

        // Pipeline
        PipelineConfig pipeline_config;
        pipeline_config.request_timeout = std::chrono::milliseconds{config.request.timeout_ms};
        pipeline_config.max_url_length = config.request.max_url_length;
        pipeline_config.capture_attempts = config.browser.capture_attempts;
        pipeline_config.capture_retry_delay = std::chrono::milliseconds{config.browser.capture_retry_delay_ms};
        pipeline_config.viewport = webdriver_config.viewport;
        pipeline_config.screenshot_dir = config.browser.screenshot_dir;
        pipeline_config.inspection_timeout = std::chrono::milliseconds{config.inspection.timeout_ms};

        auto pipeline = std::make_shared<Pipeline>(
            PipelineComponents{codec, anonymizer, crawler, g_pool, certificates, whois}, pipeline_config);

        utils::log::info(std::format("[6/7] Pipeline: request timeout {}ms, {} capture attempts{}",
            config.request.timeout_ms, pipeline_config.capture_attempts,
            pipeline_config.screenshot_dir.empty() ? "" : ", saving to " + pipeline_config.screenshot_dir));

        // HTTP server
        g_server = std::make_shared<HttpServer>(pipeline, config.server.host, config.server.port,
                                                config.server.thread_pool_size);

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.drain_timeout = std::chrono::milliseconds{config.server.shutdown_timeout_ms};
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);
        // Queued waiters are rejected; leased sessions close as they come back
        g_shutdown->on_shutdown([pool = g_pool] { pool->drain(); });
        g_server->set_shutdown_coordinator(g_shutdown);

        utils::log::info(std::format("[7/7] Server ready on http://{}:{}",
            config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
