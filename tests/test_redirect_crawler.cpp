#include <catch2/catch_test_macros.hpp>
#include "crawler/redirect_crawler.hpp"
#include "mocks/mock_redirect_probe.hpp"

#include <format>

using namespace urlscope;
using urlscope::testing::MockRedirectProbe;

TEST_CASE("RedirectCrawler: non-redirect resolves immediately", "[crawler]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://example.com/");
    CHECK(chain.steps == std::vector<std::string>{"https://example.com/"});
    CHECK(chain.final_url == "https://example.com/");
    CHECK(chain.terminated_reason == TerminationReason::RESOLVED_NON_REDIRECT);
    CHECK(chain.last_status == 200);
    CHECK(chain.hop_count() == 0);
}

TEST_CASE("RedirectCrawler: 301 then 200 gives two steps", "[crawler]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://short.example/x", "https://example.com/landing");
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://short.example/x");
    CHECK(chain.steps == std::vector<std::string>{
        "https://short.example/x", "https://example.com/landing"});
    CHECK(chain.final_url == "https://example.com/landing");
    CHECK(chain.terminated_reason == TerminationReason::RESOLVED_NON_REDIRECT);
}

TEST_CASE("RedirectCrawler: relative Location resolved against current URL", "[crawler][resolve]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://example.com/a/b", "../c?x=1", 302);
    probe->redirect("https://example.com/c?x=1", "//cdn.example.com/d", 307);
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://example.com/a/b");
    CHECK(chain.steps == std::vector<std::string>{
        "https://example.com/a/b", "https://example.com/c?x=1", "https://cdn.example.com/d"});
    CHECK(chain.hop_count() == 2);
}

TEST_CASE("RedirectCrawler: 3xx without Location ends the chain", "[crawler]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->on("https://example.com/", ProbeResponse::ok(304));
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://example.com/");
    CHECK(chain.terminated_reason == TerminationReason::RESOLVED_NON_REDIRECT);
    CHECK(chain.last_status == 304);
}

TEST_CASE("RedirectCrawler: self redirect terminates as a loop", "[crawler][loop]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://example.com/loop", "/loop");
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://example.com/loop");
    CHECK(chain.terminated_reason == TerminationReason::MAX_HOPS_EXCEEDED);
    CHECK(chain.steps.size() <= 2);
    CHECK(chain.final_url == "https://example.com/loop");
    CHECK(probe->probed().size() == 1);
}

TEST_CASE("RedirectCrawler: two-URL cycle terminates", "[crawler][loop]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://a.example/", "https://b.example/");
    probe->redirect("https://b.example/", "https://a.example/");
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://a.example/");
    CHECK(chain.terminated_reason == TerminationReason::MAX_HOPS_EXCEEDED);
    CHECK(chain.steps == std::vector<std::string>{"https://a.example/", "https://b.example/"});
}

TEST_CASE("RedirectCrawler: max_hops bounds the chain", "[crawler]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    for (int i = 0; i < 20; ++i) {
        probe->redirect(std::format("https://example.com/{}", i), std::format("/{}", i + 1));
    }
    CrawlerConfig cfg;
    cfg.max_hops = 3;
    RedirectCrawler crawler(probe, cfg);

    const auto chain = crawler.follow("https://example.com/0");
    CHECK(chain.terminated_reason == TerminationReason::MAX_HOPS_EXCEEDED);
    CHECK(chain.steps.size() == cfg.max_hops + 1);
    CHECK(chain.final_url == "https://example.com/3");

    const auto none = crawler.follow("https://example.com/0", 0, std::chrono::milliseconds{100});
    CHECK(none.steps.size() == 1);
    CHECK(none.terminated_reason == TerminationReason::MAX_HOPS_EXCEEDED);
}

TEST_CASE("RedirectCrawler: timeout keeps last visited URL", "[crawler][error]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://example.com/", "https://slow.example/");
    probe->on("https://slow.example/", ProbeResponse::timeout("Connection timed out"));
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://example.com/");
    CHECK(chain.terminated_reason == TerminationReason::TIMEOUT);
    CHECK(chain.final_url == "https://slow.example/");
    CHECK(chain.detail == "Connection timed out");
}

TEST_CASE("RedirectCrawler: network error on first hop falls back to the input", "[crawler][error]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->on("https://down.example/", ProbeResponse::network_error("Could not establish connection"));
    RedirectCrawler crawler(probe);

    const auto chain = crawler.follow("https://down.example/");
    CHECK(chain.terminated_reason == TerminationReason::NETWORK_ERROR);
    CHECK(chain.final_url == "https://down.example/");
    CHECK(chain.steps.size() == 1);
}

TEST_CASE("RedirectCrawler: disallowed scheme is blocked", "[crawler][policy]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://example.com/", "ftp://files.example.com/secret");
    probe->redirect("https://example.com/js", "javascript:alert(1)");
    RedirectCrawler crawler(probe);

    const auto ftp = crawler.follow("https://example.com/");
    CHECK(ftp.terminated_reason == TerminationReason::REDIRECT_BLOCKED);
    CHECK(ftp.final_url == "https://example.com/");

    const auto js = crawler.follow("https://example.com/js");
    CHECK(js.terminated_reason == TerminationReason::REDIRECT_BLOCKED);
    CHECK(js.steps.size() == 1);
}

TEST_CASE("RedirectCrawler: allowed_domains restricts targets", "[crawler][policy]") {
    auto probe = std::make_shared<MockRedirectProbe>();
    probe->redirect("https://example.com/", "https://www.partner.org/x");
    probe->redirect("https://www.partner.org/x", "https://evil.example.net/");
    CrawlerConfig cfg;
    cfg.allowed_domains = {"example.com", "partner.org"};
    RedirectCrawler crawler(probe, cfg);

    const auto chain = crawler.follow("https://example.com/");
    CHECK(chain.terminated_reason == TerminationReason::REDIRECT_BLOCKED);
    CHECK(chain.final_url == "https://www.partner.org/x");
    CHECK(chain.detail.find("evil.example.net") != std::string::npos);
}

TEST_CASE("RedirectCrawler: requires a probe", "[crawler]") {
    CHECK_THROWS_AS(RedirectCrawler(nullptr), std::invalid_argument);
}
