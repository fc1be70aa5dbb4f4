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

// Sluice Stream Publisher - Header
// Delivers one session's buffered frames to its client transport

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "../control/metrics.hpp"
#include "session.hpp"

namespace sluice::gateway {

/// Client-facing transport of one stream
///
/// The publisher decides what to send; the sink decides how it looks on the
/// wire. Every send returns false once the client is gone.
class ClientSink {
public:
    virtual ~ClientSink() = default;

    [[nodiscard]] virtual bool send_frame(std::string_view frame) = 0;
    [[nodiscard]] virtual bool send_heartbeat() = 0;
    [[nodiscard]] virtual bool send_end(CloseReason reason) = 0;

    /// Polled between frames to notice a disconnect on an idle stream
    [[nodiscard]] virtual bool is_connected() const = 0;
};

struct PublishResult {
    std::error_code error;  // SessionBusy, ClientDisconnected, or empty
    CloseReason reason = CloseReason::None;
    uint64_t frames = 0;
    uint64_t heartbeats = 0;
};

struct PublisherSettings {
    std::chrono::milliseconds heartbeat_interval{15000};
    std::chrono::milliseconds disconnect_poll_interval{1000};
};

/// Stream publisher
///
/// publish() blocks for the life of one client stream. Frames are sent in
/// buffer order; after heartbeat_interval without a frame a heartbeat goes
/// out instead. When the buffer reports end of stream, the end marker carries
/// the session's close reason. If the client goes away the session is
/// cancelled with client-cancel, whatever is still buffered is discarded,
/// and publish() returns without waiting for the bridge.
class StreamPublisher {
public:
    StreamPublisher(PublisherSettings settings, control::GatewayMetrics& metrics);

    [[nodiscard]] PublishResult publish(Session& session, ClientSink& sink);

    /// publish() for a caller that already holds the publisher slot
    /// (try_attach_publisher() succeeded); the slot is released on return
    [[nodiscard]] PublishResult publish_attached(Session& session, ClientSink& sink);

    [[nodiscard]] const PublisherSettings& settings() const noexcept { return settings_; }

private:
    PublishResult disconnect(Session& session, PublishResult result);

    const PublisherSettings settings_;
    control::GatewayMetrics& metrics_;
};

}  // namespace sluice::gateway
