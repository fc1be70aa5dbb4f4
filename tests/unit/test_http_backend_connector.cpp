// Sluice HTTP Backend Connector Tests (against a loopback backend)

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/core/url.hpp"
#include "../../src/gateway/http_backend_connector.hpp"
#include "test_support.hpp"

using namespace sluice::gateway;
using namespace sluice::testing;
using sluice::core::Errc;

namespace {

sluice::core::BackendAddress address_of(const std::string& url) {
    auto address = sluice::core::parse_backend_address(url);
    REQUIRE(address.has_value());
    return *address;
}

sluice::control::BackendClientConfig stream_config(std::vector<std::pair<std::string, std::string>> params) {
    sluice::control::BackendClientConfig config;
    config.stream_params = std::move(params);
    config.connect_timeout_ms = 1000;
    config.call_timeout_ms = 2000;
    config.stream_idle_timeout_ms = 0;
    return config;
}

/// Collects frames on the bridge thread
class CollectingObserver final : public StreamObserver {
public:
    bool on_open() override {
        opened = true;
        return true;
    }

    bool on_frame(Frame frame) override {
        std::lock_guard lock(mutex);
        frames.push_back(std::move(frame));
        return stop_after < 0 || static_cast<int>(frames.size()) < stop_after;
    }

    size_t count() {
        std::lock_guard lock(mutex);
        return frames.size();
    }

    std::atomic<bool> opened{false};
    int stop_after = -1;
    std::mutex mutex;
    std::vector<std::string> frames;
};

}  // namespace

TEST_CASE("Backend stream is decoded into frames", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(stream_config({{"n", "5"}, {"interval_ms", "1"}}));

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Completed);
    REQUIRE(observer.opened.load());
    REQUIRE(observer.frames.size() == 5);
    REQUIRE(observer.frames.front() == R"({"step": 1})");
    REQUIRE(observer.frames.back() == R"({"step": 5})");
    REQUIRE(backend.stream_requests() == 1);
}

TEST_CASE("Observer can stop the stream", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(stream_config({{"n", "100"}, {"interval_ms", "1"}}));

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;
    observer.stop_after = 3;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Aborted);
    REQUIRE(observer.frames.size() == 3);
}

TEST_CASE("Abort unblocks an idle stream", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(
        stream_config({{"n", "1"}, {"interval_ms", "1"}, {"hang", "1"}}));

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;

    StreamOutcome outcome;
    std::thread runner([&] { outcome = stream->run(observer); });

    REQUIRE(eventually([&] { return observer.count() == 1; }));
    stream->abort();
    runner.join();

    REQUIRE(outcome.end == StreamEnd::Aborted);
}

TEST_CASE("Abort before run never connects", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(stream_config({{"n", "1"}}));

    auto stream = connector.open_stream(address_of(backend.base_url()));
    stream->abort();

    CollectingObserver observer;
    auto outcome = stream->run(observer);
    REQUIRE(outcome.end == StreamEnd::Aborted);
    REQUIRE_FALSE(observer.opened.load());
    REQUIRE(backend.stream_requests() == 0);
}

TEST_CASE("Refused stream is unreachable", "[http_connector]") {
    HttpBackendConnector connector(stream_config({}));

    auto stream = connector.open_stream(address_of(kRefusedUrl));
    CollectingObserver observer;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Unreachable);
    REQUIRE_FALSE(observer.opened.load());
    REQUIRE_FALSE(outcome.detail.empty());
}

TEST_CASE("Non-200 stream answer is unreachable", "[http_connector]") {
    MathBackend backend;
    auto config = stream_config({});
    config.stream_path = "/missing";
    HttpBackendConnector connector(config);

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Unreachable);
    REQUIRE(outcome.detail == "backend answered HTTP 404");
}

TEST_CASE("Stream cut mid-event is a failure", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(
        stream_config({{"n", "2"}, {"interval_ms", "1"}, {"truncate", "1"}}));

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Failed);
    REQUIRE(outcome.detail == "stream ended mid-event");
    REQUIRE(observer.frames.size() == 2);  // the partial third event is never delivered
}

TEST_CASE("Oversized event fails the stream", "[http_connector]") {
    MathBackend backend;
    auto config = stream_config({{"n", "1"}, {"interval_ms", "1"}, {"oversize", "262144"}});
    config.max_event_bytes = 4096;
    HttpBackendConnector connector(config);

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;
    auto outcome = stream->run(observer);

    REQUIRE(outcome.end == StreamEnd::Failed);
    REQUIRE(outcome.detail == "event exceeds 4096 bytes");
    REQUIRE(observer.frames.size() == 1);
}

TEST_CASE("Silent backend hits the read timeout", "[http_connector]") {
    MathBackend backend;
    auto config = stream_config({{"n", "1"}, {"interval_ms", "1"}, {"hang", "1"}});
    config.stream_idle_timeout_ms = 100;
    HttpBackendConnector connector(config);

    auto stream = connector.open_stream(address_of(backend.base_url()));
    CollectingObserver observer;

    auto start = std::chrono::steady_clock::now();
    auto outcome = stream->run(observer);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome.end == StreamEnd::Failed);
    REQUIRE(observer.opened.load());
    REQUIRE(observer.frames.size() == 1);
    REQUIRE(elapsed < std::chrono::seconds(3));
}

TEST_CASE("Calls are posted under the call prefix", "[http_connector]") {
    MathBackend backend;
    HttpBackendConnector connector(stream_config({}));
    auto address = address_of(backend.base_url());

    SECTION("success") {
        auto result = connector.call(address, "add", {{"a", 10}, {"b", 5}});
        REQUIRE(result.ok());
        REQUIRE(result.status == 200);
        REQUIRE(result.body["result"].get<double>() == 15.0);
    }

    SECTION("backend error keeps status and message") {
        auto result = connector.call(address, "divide", {{"a", 1}, {"b", 0}});
        REQUIRE(result.error == Errc::BackendCallError);
        REQUIRE(result.status == 400);
        REQUIRE(result.message == "division by zero");
    }

    SECTION("unknown method") {
        auto result = connector.call(address, "modulo", {{"a", 1}, {"b", 2}});
        REQUIRE(result.error == Errc::BackendCallError);
        REQUIRE(result.status == 404);
    }

    SECTION("validation error") {
        auto result = connector.call(address, "add", {{"a", 1}});
        REQUIRE(result.error == Errc::BackendCallError);
        REQUIRE(result.status == 422);
        REQUIRE(result.message == "expected a and b");
    }
}

TEST_CASE("Refused call is unreachable", "[http_connector]") {
    HttpBackendConnector connector(stream_config({}));

    auto result = connector.call(address_of(kRefusedUrl), "add", {{"a", 1}, {"b", 2}});
    REQUIRE(result.error == Errc::BackendUnreachable);
    REQUIRE(result.status == 0);
}

TEST_CASE("Backend error message extraction", "[http_connector]") {
    REQUIRE(extract_backend_message(R"({"error":"boom"})") == "boom");
    REQUIRE(extract_backend_message(R"({"detail":"division by zero"})") == "division by zero");
    REQUIRE(extract_backend_message(R"({"message":"nope"})") == "nope");
    REQUIRE(extract_backend_message(R"({"detail":{"loc":["a"]}})") == R"({"loc":["a"]})");
    REQUIRE(extract_backend_message("Internal Server Error") == "Internal Server Error");
}
