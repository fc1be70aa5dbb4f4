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

// Sluice Stream Publisher - Implementation

#include "publisher.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace sluice::gateway {

namespace {

PublisherSettings normalize(PublisherSettings settings) {
    if (settings.disconnect_poll_interval.count() <= 0) {
        settings.disconnect_poll_interval = settings.heartbeat_interval;
    }
    return settings;
}

/// Releases the single-publisher slot on every exit path
class AttachGuard {
public:
    explicit AttachGuard(Session& session) : session_(session) {}
    ~AttachGuard() { session_.detach_publisher(); }

    AttachGuard(const AttachGuard&) = delete;
    AttachGuard& operator=(const AttachGuard&) = delete;

private:
    Session& session_;
};

}  // namespace

StreamPublisher::StreamPublisher(PublisherSettings settings, control::GatewayMetrics& metrics)
    : settings_(normalize(settings)), metrics_(metrics) {}

PublishResult StreamPublisher::publish(Session& session, ClientSink& sink) {
    PublishResult result;

    if (!session.try_attach_publisher()) {
        result.error = core::Errc::SessionBusy;
        return result;
    }
    return publish_attached(session, sink);
}

PublishResult StreamPublisher::publish_attached(Session& session, ClientSink& sink) {
    PublishResult result;
    AttachGuard guard(session);

    auto* logger = logging::get_logger();
    LOG_SESSION(logger, "attached", session.id(), session.backend_name(),
                to_string(session.state()));

    using Clock = std::chrono::steady_clock;
    auto idle_deadline = Clock::now() + settings_.heartbeat_interval;

    Frame frame;
    while (true) {
        auto now = Clock::now();
        auto until_heartbeat =
            std::chrono::duration_cast<std::chrono::milliseconds>(idle_deadline - now);
        auto wait = std::clamp(until_heartbeat, std::chrono::milliseconds(0),
                               settings_.disconnect_poll_interval);

        switch (session.buffer().pop(frame, wait)) {
            case PopStatus::Frame:
                if (!sink.send_frame(frame)) {
                    return disconnect(session, result);
                }
                ++result.frames;
                metrics_.record_frame_delivered();
                idle_deadline = Clock::now() + settings_.heartbeat_interval;
                break;

            case PopStatus::Timeout:
                if (!sink.is_connected()) {
                    return disconnect(session, result);
                }
                if (Clock::now() >= idle_deadline) {
                    if (!sink.send_heartbeat()) {
                        return disconnect(session, result);
                    }
                    ++result.heartbeats;
                    metrics_.record_heartbeat();
                    idle_deadline = Clock::now() + settings_.heartbeat_interval;
                }
                break;

            case PopStatus::Closed: {
                result.reason = session.close_reason();
                if (result.reason == CloseReason::None) {
                    result.reason = CloseReason::BackendComplete;
                }
                // Best effort; the stream is over either way
                if (!sink.send_end(result.reason)) {
                    LOG_DEBUG(logger, "End marker not delivered: session_id={}", session.id());
                }
                LOG_SESSION(logger, "detached", session.id(), session.backend_name(),
                            fmt::format("reason={}, frames={}, heartbeats={}",
                                        to_string(result.reason), result.frames,
                                        result.heartbeats));
                return result;
            }
        }
    }
}

PublishResult StreamPublisher::disconnect(Session& session, PublishResult result) {
    session.cancel(CloseReason::ClientCancel);
    session.buffer().clear();
    metrics_.record_client_disconnect();

    result.error = core::Errc::ClientDisconnected;
    result.reason = session.close_reason();

    auto* logger = logging::get_logger();
    LOG_SESSION(logger, "client disconnected", session.id(), session.backend_name(),
                fmt::format("frames={}, heartbeats={}", result.frames, result.heartbeats));
    return result;
}

}  // namespace sluice::gateway
