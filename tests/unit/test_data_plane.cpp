// Sluice Data Plane Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/control/registry.hpp"
#include "../../src/core/errors.hpp"
#include "../../src/gateway/data_plane.hpp"
#include "../../src/gateway/http_backend_connector.hpp"
#include "test_support.hpp"

using namespace sluice::gateway;
using namespace sluice::testing;
using sluice::control::Registry;
using sluice::control::SessionConfig;
using sluice::core::Errc;
using Catch::Matchers::ContainsSubstring;

namespace {

SessionConfig fast_config() {
    SessionConfig config;
    config.buffer_capacity = 16;
    config.heartbeat_interval_ms = 1000;
    config.connect_timeout_ms = 1000;
    config.disconnect_poll_ms = 10;
    config.shutdown_grace_ms = 2000;
    return config;
}

/// Registry and connector outlive the data plane (declaration order)
struct DataPlaneFixture {
    explicit DataPlaneFixture(SessionConfig config = fast_config())
        : data_plane(std::make_unique<DataPlane>(registry, connector, config)) {
        REQUIRE_FALSE(registry.register_backend("math1", "http://127.0.0.1:9001"));
        REQUIRE_FALSE(registry.register_backend("math2", "http://127.0.0.1:9002/v1"));
    }

    /// Connect to a backend whose stream stays open until cancelled
    std::string connect_hanging(std::string_view name) {
        connector.set_script({.frames = {}, .ending = StreamScript::Ending::Hang});
        auto result = data_plane->connect(name);
        REQUIRE_FALSE(result.error);
        return result.session_id;
    }

    Registry registry;
    ScriptedConnector connector;
    std::unique_ptr<DataPlane> data_plane;
};

}  // namespace

TEST_CASE_METHOD(DataPlaneFixture, "Connect to an unknown name", "[data_plane]") {
    auto result = data_plane->connect("nope");

    REQUIRE(result.error == Errc::NameNotFound);
    REQUIRE(result.session_id.empty());
    REQUIRE(connector.counters().streams_opened.load() == 0);
    REQUIRE(data_plane->metrics().snapshot().sessions_rejected == 1);
}

TEST_CASE_METHOD(DataPlaneFixture, "Connect publishes a streaming session", "[data_plane]") {
    auto id = connect_hanging("math2");

    REQUIRE(sluice::core::is_valid_session_id(id));
    auto session = data_plane->find_session(id);
    REQUIRE(session != nullptr);
    REQUIRE(session->state() == SessionState::Streaming);
    REQUIRE(session->backend_name() == "math2");

    // Stream opened against the registered address
    auto address = connector.last_stream_address();
    REQUIRE(address.port == 9002);
    REQUIRE(address.base_path == "/v1");
}

TEST_CASE_METHOD(DataPlaneFixture, "Unreachable backend never becomes a session",
                 "[data_plane]") {
    connector.set_script({.reachable = false});

    auto result = data_plane->connect("math1");

    REQUIRE(result.error == Errc::BackendUnreachable);
    REQUIRE(result.session_id.empty());
    REQUIRE(data_plane->sessions().size() == 0);
    REQUIRE(connector.counters().streams_released.load() == 1);
    REQUIRE(data_plane->metrics().snapshot().sessions_opened == 0);
}

TEST_CASE("Slow backend hits the connect timeout", "[data_plane]") {
    auto config = fast_config();
    config.connect_timeout_ms = 50;
    DataPlaneFixture fixture(config);
    fixture.connector.set_script({.open_delay = std::chrono::milliseconds(5000)});

    auto start = std::chrono::steady_clock::now();
    auto result = fixture.data_plane->connect("math1");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.error == Errc::BackendUnreachable);
    REQUIRE_THAT(result.message, ContainsSubstring("did not answer"));
    REQUIRE(elapsed < std::chrono::milliseconds(2000));
    REQUIRE(fixture.data_plane->sessions().size() == 0);
    REQUIRE(fixture.connector.counters().aborts.load() == 1);
}

TEST_CASE("Backend answering at the connect deadline never yields a closing session",
          "[data_plane]") {
    auto config = fast_config();
    config.connect_timeout_ms = 20;
    DataPlaneFixture fixture(config);
    fixture.connector.set_script(
        {.open_delay = std::chrono::milliseconds(20), .ending = StreamScript::Ending::Hang});

    for (int attempt = 0; attempt < 25; ++attempt) {
        auto result = fixture.data_plane->connect("math1");
        if (result.error) {
            REQUIRE(result.error == Errc::BackendUnreachable);
            REQUIRE(result.session_id.empty());
            continue;
        }

        auto session = fixture.data_plane->find_session(result.session_id);
        REQUIRE(session != nullptr);
        REQUIRE(session->state() == SessionState::Streaming);
        REQUIRE(session->close_reason() == CloseReason::None);
        REQUIRE_FALSE(fixture.data_plane->close_session(result.session_id));
        REQUIRE(eventually([&] { return session->state() == SessionState::Closed; }));
    }

    REQUIRE(eventually([&] { return fixture.data_plane->sessions().size() == 0; }));
}

TEST_CASE_METHOD(DataPlaneFixture, "Stream reaches the client then ends", "[data_plane]") {
    connector.set_script({.frames = {"a", "b", "c"},
                          .frame_interval = std::chrono::milliseconds(100),
                          .ending = StreamScript::Ending::Complete});
    auto result = data_plane->connect("math1");
    REQUIRE_FALSE(result.error);

    RecordingSink sink;
    auto published = data_plane->attach_stream(result.session_id, sink);

    REQUIRE_FALSE(published.error);
    REQUIRE(published.reason == CloseReason::BackendComplete);
    REQUIRE(sink.frames() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(sink.end_reason() == CloseReason::BackendComplete);
    REQUIRE(eventually([&] { return data_plane->find_session(result.session_id) == nullptr; }));
}

TEST_CASE_METHOD(DataPlaneFixture, "Attach to unknown and busy sessions", "[data_plane]") {
    RecordingSink sink;
    REQUIRE(data_plane->attach_stream("00000000-0000-4000-8000-000000000000", sink).error ==
            Errc::SessionNotFound);

    auto id = connect_hanging("math1");
    auto session = data_plane->find_session(id);
    REQUIRE(session->try_attach_publisher());

    RecordingSink second;
    REQUIRE(data_plane->attach_stream(id, second).error == Errc::SessionBusy);
    session->detach_publisher();
}

TEST_CASE_METHOD(DataPlaneFixture, "A reserved stream slot excludes other attaches",
                 "[data_plane]") {
    auto id = connect_hanging("math1");
    auto session = data_plane->find_session(id);

    std::error_code ec;
    auto reserved = data_plane->reserve_stream(id, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(reserved == session);

    REQUIRE(data_plane->reserve_stream(id, ec) == nullptr);
    REQUIRE(ec == Errc::SessionBusy);

    RecordingSink other;
    REQUIRE(data_plane->attach_stream(id, other).error == Errc::SessionBusy);

    REQUIRE(data_plane->reserve_stream("00000000-0000-4000-8000-000000000000", ec) == nullptr);
    REQUIRE(ec == Errc::SessionNotFound);

    // Delivery releases the slot when the client goes away
    RecordingSink sink;
    std::thread delivering([&] { (void)data_plane->deliver_stream(*reserved, sink); });
    sink.disconnect();
    delivering.join();

    REQUIRE_FALSE(session->has_publisher());
    REQUIRE(session->close_reason() == CloseReason::ClientCancel);
}

TEST_CASE_METHOD(DataPlaneFixture, "Unregister closes only that backend's sessions",
                 "[data_plane]") {
    auto a = connect_hanging("math1");
    auto b = connect_hanging("math1");
    auto other = connect_hanging("math2");

    auto session_a = data_plane->find_session(a);
    auto session_b = data_plane->find_session(b);

    RecordingSink sink;
    std::thread client([&] { (void)data_plane->attach_stream(a, sink); });

    REQUIRE(eventually([&] { return session_a->has_publisher(); }));
    REQUIRE_FALSE(registry.unregister("math1"));
    client.join();

    REQUIRE(session_a->wait_closed(3s));
    REQUIRE(session_b->wait_closed(3s));
    REQUIRE(session_a->close_reason() == CloseReason::BackendUnregistered);
    REQUIRE(session_b->close_reason() == CloseReason::BackendUnregistered);
    REQUIRE(sink.end_reason() == CloseReason::BackendUnregistered);

    auto survivor = data_plane->find_session(other);
    REQUIRE(survivor != nullptr);
    REQUIRE(survivor->state() == SessionState::Streaming);

    // New connects to the removed name fail
    REQUIRE(data_plane->connect("math1").error == Errc::NameNotFound);
}

TEST_CASE_METHOD(DataPlaneFixture, "Explicit close cancels the session", "[data_plane]") {
    REQUIRE(data_plane->close_session("00000000-0000-4000-8000-000000000000") ==
            Errc::SessionNotFound);

    auto id = connect_hanging("math1");
    auto session = data_plane->find_session(id);

    REQUIRE_FALSE(data_plane->close_session(id));
    REQUIRE(session->wait_closed(3s));
    REQUIRE(session->close_reason() == CloseReason::ClientCancel);
    REQUIRE(data_plane->find_session(id) == nullptr);
    REQUIRE(data_plane->close_session(id) == Errc::SessionNotFound);
    REQUIRE(connector.counters().streams_released.load() == 1);
}

TEST_CASE_METHOD(DataPlaneFixture, "Calls route by session", "[data_plane]") {
    auto id = connect_hanging("math1");

    auto result = data_plane->call(id, "add", {{"a", 10}, {"b", 5}});
    REQUIRE(result.ok());
    REQUIRE(result.body["backend"] == "http://127.0.0.1:9001");

    REQUIRE_FALSE(data_plane->close_session(id));
    REQUIRE(eventually([&] { return data_plane->find_session(id) == nullptr; }));
    REQUIRE(data_plane->call(id, "add", {}).error == Errc::SessionNotFound);
}

TEST_CASE("Session limit rejects connects", "[data_plane]") {
    auto config = fast_config();
    config.max_sessions = 1;
    DataPlaneFixture fixture(config);

    auto first = fixture.connect_hanging("math1");
    auto second = fixture.data_plane->connect("math1");

    REQUIRE(second.error == Errc::SessionLimitReached);
    REQUIRE(fixture.data_plane->find_session(first) != nullptr);
}

TEST_CASE_METHOD(DataPlaneFixture, "Shutdown closes every session", "[data_plane]") {
    auto a = connect_hanging("math1");
    auto b = connect_hanging("math2");
    auto session_a = data_plane->find_session(a);
    auto session_b = data_plane->find_session(b);

    data_plane->shutdown();

    // Bridges are gone once shutdown returns
    REQUIRE(session_a->state() == SessionState::Closed);
    REQUIRE(session_b->state() == SessionState::Closed);
    REQUIRE(session_a->close_reason() == CloseReason::GatewayShutdown);
    REQUIRE(session_b->close_reason() == CloseReason::GatewayShutdown);
    REQUIRE(data_plane->sessions().size() == 0);
    REQUIRE_FALSE(data_plane->is_accepting());

    REQUIRE(data_plane->connect("math1").error == Errc::ShuttingDown);

    // Idempotent, and unregister no longer reaches the data plane
    data_plane->shutdown();
    REQUIRE_FALSE(registry.unregister("math1"));
}

TEST_CASE_METHOD(DataPlaneFixture, "Destroying the data plane stops its bridges",
                 "[data_plane]") {
    auto id = connect_hanging("math1");
    auto session = data_plane->find_session(id);

    data_plane.reset();

    REQUIRE(session->state() == SessionState::Closed);
    REQUIRE(connector.counters().streams_released.load() == 1);
}

TEST_CASE("Silent HTTP backend ends the session with backend-error", "[data_plane]") {
    MathBackend backend;
    Registry registry;
    REQUIRE_FALSE(registry.register_backend("math", backend.base_url()));

    sluice::control::BackendClientConfig backend_config;
    backend_config.stream_params = {{"n", "1"}, {"interval_ms", "1"}, {"hang", "1"}};
    backend_config.connect_timeout_ms = 1000;
    backend_config.stream_idle_timeout_ms = 100;
    HttpBackendConnector connector(backend_config);

    DataPlane data_plane(registry, connector, fast_config());
    auto result = data_plane.connect("math");
    REQUIRE_FALSE(result.error);

    auto session = data_plane.find_session(result.session_id);
    REQUIRE(session != nullptr);

    RecordingSink sink;
    auto published = data_plane.attach_stream(result.session_id, sink);

    REQUIRE(published.reason == CloseReason::BackendError);
    REQUIRE(session->close_reason() == CloseReason::BackendError);
    REQUIRE(sink.frames() == std::vector<std::string>{R"({"step": 1})"});
    REQUIRE(sink.end_reason() == CloseReason::BackendError);
    REQUIRE(eventually([&] { return session->state() == SessionState::Closed; }));
}
