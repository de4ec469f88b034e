#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"
#include "browser/session_pool.hpp"
#include "config/config_loader.hpp"
#include "mocks/mock_browser_session.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace urlscope;

TEST_CASE("ShutdownCoordinator: requests are admitted until shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    REQUIRE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);
    REQUIRE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 2);

    sc.leave_request();
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);

    sc.initiate_shutdown();
    CHECK(sc.is_shutting_down());
    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: in-flight request survives shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    REQUIRE(sc.try_enter_request());

    sc.initiate_shutdown();
    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);

    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: drain hooks run once after admissions close", "[shutdown][drain]") {
    ShutdownCoordinator sc;
    int calls = 0;
    bool admitted_inside_hook = true;
    sc.on_shutdown([&] {
        ++calls;
        admitted_inside_hook = sc.try_enter_request();
    });

    sc.initiate_shutdown();
    sc.initiate_shutdown();
    CHECK(calls == 1);
    CHECK_FALSE(admitted_inside_hook);
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: shutdown drains the session pool", "[shutdown][drain][pool]") {
    SessionPoolConfig pool_cfg;
    pool_cfg.max_connections = 1;
    auto pool = std::make_shared<SessionPool>(pool_cfg, std::make_shared<urlscope::testing::MockSessionFactory>());

    ShutdownCoordinator sc;
    sc.on_shutdown([pool] { pool->drain(); });
    REQUIRE(sc.try_enter_request());
    auto lease = pool->acquire(std::chrono::milliseconds(100));
    REQUIRE(lease.is_ok());

    sc.initiate_shutdown();
    CHECK(pool->health().draining);
    CHECK(pool->acquire(std::chrono::milliseconds(10)).is_error());

    lease.value().release();
    sc.leave_request();
    CHECK(sc.wait_for_drain());
    CHECK(pool->health().leased_count == 0);
}

TEST_CASE("ShutdownCoordinator: idle drain returns at once", "[shutdown][drain]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(1000)});
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(200));
}

TEST_CASE("ShutdownCoordinator: drain waits for the last capture to finish", "[shutdown][drain]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(5000)});
    REQUIRE(sc.try_enter_request());
    REQUIRE(sc.try_enter_request());

    std::atomic<bool> drained{false};
    std::thread waiter([&] {
        sc.initiate_shutdown();
        drained = sc.wait_for_drain();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sc.leave_request();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(drained.load());

    sc.leave_request();
    waiter.join();
    CHECK(drained.load());
}

TEST_CASE("ShutdownCoordinator: drain gives up after the timeout", "[shutdown][drain]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(50)});
    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(40));
    CHECK(sc.in_flight_count() == 1);

    sc.leave_request();
}

TEST_CASE("ShutdownCoordinator: concurrent admission and shutdown", "[shutdown][stress]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(2000)});

    std::atomic<int> entered{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 32; ++i) {
        threads.emplace_back([&, i] {
            std::this_thread::sleep_for(std::chrono::milliseconds(i % 8));
            if (sc.try_enter_request()) {
                entered.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                sc.leave_request();
            } else {
                rejected.fetch_add(1);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(4));
    sc.initiate_shutdown();
    const bool drained = sc.wait_for_drain();

    for (auto& t : threads) t.join();
    CHECK(drained);
    CHECK(sc.in_flight_count() == 0);
    CHECK(entered.load() + rejected.load() == 32);
}

TEST_CASE("ShutdownCoordinator: timeout comes from [server]", "[shutdown][config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
shutdown_timeout_ms = 15000
)");
    REQUIRE(result.success);
    CHECK(result.config.server.shutdown_timeout_ms == 15000);

    const auto defaults = ConfigLoader::load_from_string("");
    REQUIRE(defaults.success);
    CHECK(defaults.config.server.shutdown_timeout_ms == 30000);
}
