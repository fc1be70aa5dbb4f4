// Sluice Session Table Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/core/session_id.hpp"
#include "../../src/gateway/session_table.hpp"

using namespace sluice::gateway;
using sluice::core::BackendAddress;
using sluice::core::Errc;

namespace {

const BackendAddress kAddress{"127.0.0.1", 9001, ""};

std::shared_ptr<Session> create_published(SessionTable& table, std::string_view backend = "math1") {
    std::error_code ec;
    auto session = table.create(backend, kAddress, 8, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(table.publish(session->id()));
    return session;
}

int failing_random(unsigned char*, int) {
    return 0;
}

}  // namespace

TEST_CASE("Created sessions are hidden until published", "[session_table]") {
    SessionTable table;

    std::error_code ec;
    auto session = table.create("math1", kAddress, 8, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(session != nullptr);
    REQUIRE(sluice::core::is_valid_session_id(session->id()));
    REQUIRE(session->backend_name() == "math1");

    REQUIRE(table.size() == 1);
    REQUIRE(table.lookup(session->id()) == nullptr);

    REQUIRE(table.publish(session->id()));
    REQUIRE(table.lookup(session->id()) == session);
}

TEST_CASE("Lookup of unknown ids", "[session_table]") {
    SessionTable table;
    REQUIRE(table.lookup("00000000-0000-4000-8000-000000000000") == nullptr);
    REQUIRE(table.lookup("") == nullptr);
    REQUIRE_FALSE(table.publish("nope"));
}

TEST_CASE("Remove is idempotent", "[session_table]") {
    SessionTable table;
    auto session = create_published(table);

    REQUIRE(table.remove(session->id()));
    REQUIRE_FALSE(table.remove(session->id()));
    REQUIRE(table.lookup(session->id()) == nullptr);
    REQUIRE(table.size() == 0);

    // Holders keep the session alive after removal
    REQUIRE(session->backend_name() == "math1");
}

TEST_CASE("Session limit", "[session_table]") {
    SessionTable table(2);
    create_published(table);
    create_published(table);

    std::error_code ec;
    auto third = table.create("math1", kAddress, 8, ec);
    REQUIRE(ec == Errc::SessionLimitReached);
    REQUIRE(third == nullptr);
    REQUIRE(table.size() == 2);
}

TEST_CASE("Create fails when the random source fails", "[session_table]") {
    SessionTable table(10, failing_random);

    std::error_code ec;
    auto session = table.create("math1", kAddress, 8, ec);
    REQUIRE(ec == Errc::RandomUnavailable);
    REQUIRE(session == nullptr);
    REQUIRE(table.size() == 0);
}

TEST_CASE("Find sessions by backend", "[session_table]") {
    SessionTable table;
    auto a1 = create_published(table, "a");
    auto a2 = create_published(table, "a");
    auto b1 = create_published(table, "b");

    std::error_code ec;
    auto pending = table.create("a", kAddress, 8, ec);

    auto found = table.find_by_backend("a");
    REQUIRE(found.size() == 3);
    REQUIRE(table.find_by_backend("b").size() == 1);
    REQUIRE(table.find_by_backend("c").empty());
    REQUIRE(table.snapshot().size() == 4);
}

TEST_CASE("Concurrent creates yield distinct ids", "[session_table][concurrency]") {
    SessionTable table(100000);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::mutex ids_mutex;
    std::set<std::string> ids;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                std::error_code ec;
                auto session = table.create("math1", kAddress, 4, ec);
                if (ec || !table.publish(session->id())) {
                    failures.fetch_add(1);
                    continue;
                }
                std::lock_guard lock(ids_mutex);
                ids.insert(session->id());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(ids.size() == kThreads * kPerThread);
    REQUIRE(table.size() == kThreads * kPerThread);
}

TEST_CASE("Concurrent lookups and removes", "[session_table][concurrency]") {
    SessionTable table;
    std::vector<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.push_back(create_published(table)->id());
    }

    std::atomic<int> removed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (const auto& id : ids) {
                (void)table.lookup(id);
                if (table.remove(id)) {
                    removed.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(removed.load() == 200);
    REQUIRE(table.size() == 0);
}
