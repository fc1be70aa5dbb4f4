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

// Sluice Data Plane - Header
// Session lifecycle entry points used by the HTTP surface

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../control/metrics.hpp"
#include "../control/registry.hpp"
#include "backend_connector.hpp"
#include "forwarder.hpp"
#include "publisher.hpp"
#include "session_table.hpp"

namespace sluice::gateway {

struct ConnectResult {
    std::error_code error;
    std::string session_id;
    std::string backend_name;
    std::string message;
};

/// Data plane
///
/// Ties the registry, the session table, bridge tasks, the stream publisher
/// and the request forwarder together. Subscribes to registry unregister
/// events for its lifetime.
class DataPlane {
public:
    DataPlane(control::Registry& registry, BackendConnector& connector,
              const control::SessionConfig& config);
    ~DataPlane();

    DataPlane(const DataPlane&) = delete;
    DataPlane& operator=(const DataPlane&) = delete;

    /// Resolve name, open the backend stream, publish the session.
    /// NameNotFound, BackendUnreachable, SessionLimitReached, ShuttingDown.
    [[nodiscard]] ConnectResult connect(std::string_view backend_name);

    /// Blocking client stream (SessionNotFound, SessionBusy, ClientDisconnected)
    [[nodiscard]] PublishResult attach_stream(std::string_view session_id, ClientSink& sink);

    /// First half of attach_stream(): claim the session's single stream slot
    /// (SessionNotFound, SessionBusy). The slot stays held until
    /// deliver_stream() returns or the caller calls detach_publisher().
    [[nodiscard]] std::shared_ptr<Session> reserve_stream(std::string_view session_id,
                                                          std::error_code& ec);

    /// Second half of attach_stream(): deliver on a reserved session
    [[nodiscard]] PublishResult deliver_stream(Session& session, ClientSink& sink);

    /// Forward one request/response call
    [[nodiscard]] CallResult call(std::string_view session_id, std::string_view method,
                                  const nlohmann::json& payload);

    /// Explicit client cancel (SessionNotFound if unknown)
    std::error_code close_session(std::string_view session_id);

    /// Stop accepting connects, cancel every session, wait for bridges
    void shutdown();

    [[nodiscard]] std::shared_ptr<Session> find_session(std::string_view session_id) const {
        return table_.lookup(session_id);
    }

    [[nodiscard]] SessionTable& sessions() noexcept { return table_; }
    [[nodiscard]] const control::GatewayMetrics& metrics() const noexcept { return metrics_; }
    [[nodiscard]] bool is_accepting() const noexcept {
        return accepting_.load(std::memory_order_acquire);
    }

private:
    void on_backend_unregistered(std::string_view name);

    /// Block until the session's bridge has stopped (warns after the grace period)
    void await_closed(Session& session);

    control::Registry& registry_;
    BackendConnector& connector_;
    const control::SessionConfig config_;

    control::GatewayMetrics metrics_;
    SessionTable table_;
    StreamPublisher publisher_;
    RequestForwarder forwarder_;

    std::atomic<bool> accepting_{true};
    uint64_t subscription_id_ = 0;
};

}  // namespace sluice::gateway
