/*
 * Copyright 2025 Sluice Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Sluice HTTP Backend Connector - Implementation

#include "http_backend_connector.hpp"

#include <httplib.h>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../http/sse.hpp"

namespace sluice::gateway {

namespace {

// httplib treats a zero read timeout as "return immediately"
constexpr auto kNoIdleTimeout = std::chrono::hours(24 * 365);

void apply_timeouts(httplib::Client& client, uint32_t connect_ms, uint32_t read_ms) {
    client.set_connection_timeout(std::chrono::milliseconds(connect_ms));
    if (read_ms == 0) {
        client.set_read_timeout(kNoIdleTimeout);
    } else {
        client.set_read_timeout(std::chrono::milliseconds(read_ms));
    }
    client.set_keep_alive(false);
}

}  // namespace

// ============================
// HttpBackendStream
// ============================

HttpBackendStream::HttpBackendStream(core::BackendAddress address,
                                     const control::BackendClientConfig& config)
    : address_(std::move(address)), config_(config) {}

StreamOutcome HttpBackendStream::run(StreamObserver& observer) {
    httplib::Client client(address_.origin());
    apply_timeouts(client, config_.connect_timeout_ms, config_.stream_idle_timeout_ms);

    {
        std::lock_guard lock(client_mutex_);
        if (aborted_.load(std::memory_order_acquire)) {
            return {StreamEnd::Aborted, "aborted before connect"};
        }
        client_ = &client;
    }

    httplib::Params params;
    for (const auto& [key, value] : config_.stream_params) {
        params.emplace(key, value);
    }
    httplib::Headers headers = {{"Accept", "text/event-stream"}, {"Cache-Control", "no-cache"}};

    http::SseDecoder decoder(config_.max_event_bytes);
    bool opened = false;
    bool observer_stopped = false;
    int status = 0;

    auto on_response = [&](const httplib::Response& response) {
        status = response.status;
        if (response.status != 200 || aborted_.load(std::memory_order_acquire)) {
            return false;
        }
        opened = true;
        if (!observer.on_open()) {
            observer_stopped = true;
            return false;
        }
        return true;
    };

    auto on_content = [&](const char* data, size_t length) {
        bool within_limit = decoder.feed(std::string_view(data, length), [&](std::string&& event) {
            if (!observer_stopped && !observer.on_frame(std::move(event))) {
                observer_stopped = true;
            }
        });
        return within_limit && !observer_stopped && !aborted_.load(std::memory_order_acquire);
    };

    auto result = client.Get(address_.path(config_.stream_path), params, headers, on_response,
                             on_content);

    {
        std::lock_guard lock(client_mutex_);
        client_ = nullptr;
    }

    if (aborted_.load(std::memory_order_acquire) || observer_stopped) {
        return {StreamEnd::Aborted, "stream aborted"};
    }

    if (!opened) {
        if (status != 0) {
            return {StreamEnd::Unreachable, fmt::format("backend answered HTTP {}", status)};
        }
        return {StreamEnd::Unreachable, httplib::to_string(result.error())};
    }

    if (decoder.overflowed()) {
        return {StreamEnd::Failed,
                fmt::format("event exceeds {} bytes", config_.max_event_bytes)};
    }
    if (!result) {
        // Includes the read timeout: a silent backend counts as a failed stream
        return {StreamEnd::Failed, httplib::to_string(result.error())};
    }
    if (decoder.has_pending()) {
        return {StreamEnd::Failed, "stream ended mid-event"};
    }
    return {StreamEnd::Completed, "end of stream"};
}

void HttpBackendStream::abort() noexcept {
    aborted_.store(true, std::memory_order_release);

    std::lock_guard lock(client_mutex_);
    if (client_ != nullptr) {
        client_->stop();  // Shuts the socket down; the blocked read returns
    }
}

// ============================
// HttpBackendConnector
// ============================

HttpBackendConnector::HttpBackendConnector(control::BackendClientConfig config)
    : config_(std::move(config)) {}

std::unique_ptr<BackendStream> HttpBackendConnector::open_stream(
    const core::BackendAddress& address) {
    return std::make_unique<HttpBackendStream>(address, config_);
}

CallResult HttpBackendConnector::call(const core::BackendAddress& address,
                                      std::string_view method, const nlohmann::json& payload) {
    CallResult result;

    httplib::Client client(address.origin());
    apply_timeouts(client, config_.connect_timeout_ms, config_.call_timeout_ms);

    std::string path = address.path(fmt::format("{}/{}", config_.call_path_prefix, method));
    auto response = client.Post(path, payload.dump(), "application/json");
    if (!response) {
        result.error = core::Errc::BackendUnreachable;
        result.message = httplib::to_string(response.error());
        return result;
    }

    result.status = static_cast<uint16_t>(response->status);

    if (response->status >= 400) {
        result.error = core::Errc::BackendCallError;
        result.message = extract_backend_message(response->body);
        return result;
    }

    if (response->body.empty()) {
        result.body = nlohmann::json::object();
        return result;
    }

    result.body = nlohmann::json::parse(response->body, nullptr, false);
    if (result.body.is_discarded()) {
        result.error = core::Errc::BackendCallError;
        result.message = "backend returned a non-JSON body";
        result.body = nullptr;
    }
    return result;
}

std::string extract_backend_message(std::string_view body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (const char* key : {"error", "detail", "message"}) {
            auto it = parsed.find(key);
            if (it == parsed.end()) {
                continue;
            }
            return it->is_string() ? it->get<std::string>() : it->dump();
        }
    }
    return std::string(body);
}

}  // namespace sluice::gateway
