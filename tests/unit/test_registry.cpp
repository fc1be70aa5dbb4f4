// Sluice Registry Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../src/control/registry.hpp"
#include "../../src/core/errors.hpp"

using namespace sluice::control;
using sluice::core::Errc;

TEST_CASE("Register and resolve backends", "[control][registry]") {
    Registry registry;

    REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9001/", {{"zone", "a"}}));
    REQUIRE(registry.size() == 1);

    auto registration = registry.resolve("math1");
    REQUIRE(registration.has_value());
    REQUIRE(registration->name == "math1");
    REQUIRE(registration->base_url == "http://localhost:9001");
    REQUIRE(registration->address.host == "localhost");
    REQUIRE(registration->address.port == 9001);
    REQUIRE(registration->meta["zone"] == "a");
    REQUIRE(registration->registered_at.size() == 20);  // 2025-01-01T00:00:00Z
    REQUIRE(registration->registered_at.back() == 'Z');

    REQUIRE_FALSE(registry.resolve("math2").has_value());
}

TEST_CASE("Registration errors", "[control][registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9001"));

    REQUIRE(registry.register_backend("math1", "http://localhost:9002") ==
            Errc::NameAlreadyRegistered);
    REQUIRE(registry.resolve("math1")->address.port == 9001);  // first wins

    REQUIRE(registry.register_backend("bad", "localhost:9001") == Errc::InvalidAddress);
    REQUIRE(registry.register_backend("", "http://localhost:9001") == Errc::InvalidRequest);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Unregister notifies listeners", "[control][registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9001"));

    std::vector<std::string> notified;
    auto id = registry.subscribe_unregister(
        [&](std::string_view name) { notified.emplace_back(name); });

    REQUIRE(registry.unregister("missing") == Errc::NameNotFound);
    REQUIRE(notified.empty());

    REQUIRE_FALSE(registry.unregister("math1"));
    REQUIRE(notified == std::vector<std::string>{"math1"});
    REQUIRE_FALSE(registry.resolve("math1").has_value());

    SECTION("name can be registered again") {
        REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9005"));
        REQUIRE(registry.resolve("math1")->address.port == 9005);
    }

    SECTION("unsubscribed listeners are not called") {
        registry.unsubscribe(id);
        REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9001"));
        REQUIRE_FALSE(registry.unregister("math1"));
        REQUIRE(notified.size() == 1);
    }
}

TEST_CASE("Unsubscribe waits for a running listener", "[control][registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.register_backend("math1", "http://localhost:9001"));

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto id = registry.subscribe_unregister([&](std::string_view) {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished.store(true);
    });

    std::thread unregistering([&] { (void)registry.unregister("math1"); });
    while (!started.load()) {
        std::this_thread::yield();
    }

    registry.unsubscribe(id);
    REQUIRE(finished.load());

    unregistering.join();
}

TEST_CASE("List returns registrations sorted by name", "[control][registry]") {
    Registry registry;
    REQUIRE_FALSE(registry.register_backend("zeta", "http://z:1"));
    REQUIRE_FALSE(registry.register_backend("alpha", "http://a:1"));
    REQUIRE_FALSE(registry.register_backend("mid", "http://m:1"));

    auto list = registry.list();
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].name == "alpha");
    REQUIRE(list[1].name == "mid");
    REQUIRE(list[2].name == "zeta");
}

TEST_CASE("Concurrent registration of one name admits exactly one", "[control][registry]") {
    Registry registry;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            if (!registry.register_backend("shared", "http://h:" + std::to_string(9000 + i))) {
                successes.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(successes.load() == 1);
    REQUIRE(registry.size() == 1);
}
