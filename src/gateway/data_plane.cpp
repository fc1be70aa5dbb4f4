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

// Sluice Data Plane - Implementation

#include "data_plane.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "bridge.hpp"

namespace sluice::gateway {

namespace {

PublisherSettings publisher_settings(const control::SessionConfig& config) {
    PublisherSettings settings;
    settings.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_interval_ms);
    settings.disconnect_poll_interval = std::chrono::milliseconds(config.disconnect_poll_ms);
    return settings;
}

}  // namespace

DataPlane::DataPlane(control::Registry& registry, BackendConnector& connector,
                     const control::SessionConfig& config)
    : registry_(registry),
      connector_(connector),
      config_(config),
      table_(config.max_sessions),
      publisher_(publisher_settings(config), metrics_),
      forwarder_(table_, connector_, metrics_) {
    subscription_id_ = registry_.subscribe_unregister(
        [this](std::string_view name) { on_backend_unregistered(name); });
}

DataPlane::~DataPlane() {
    shutdown();
}

ConnectResult DataPlane::connect(std::string_view backend_name) {
    ConnectResult result;
    result.backend_name = std::string(backend_name);
    auto* logger = logging::get_logger();

    if (!is_accepting()) {
        result.error = core::Errc::ShuttingDown;
        result.message = "gateway is shutting down";
        return result;
    }

    auto registration = registry_.resolve(backend_name);
    if (!registration) {
        metrics_.record_session_rejected();
        result.error = core::Errc::NameNotFound;
        result.message = fmt::format("backend '{}' is not registered", backend_name);
        return result;
    }

    std::error_code ec;
    auto session = table_.create(registration->name, registration->address,
                                 config_.buffer_capacity, ec);
    if (ec) {
        metrics_.record_session_rejected();
        result.error = ec;
        result.message = ec == core::Errc::SessionLimitReached
                             ? fmt::format("session limit {} reached", table_.max_sessions())
                             : ec.message();
        LOG_ERROR_CTX(logger, "Connect rejected", "-", core::error_name(ec), result.message);
        return result;
    }

    LOG_SESSION(logger, "created", session->id(), session->backend_name(),
                session->address().to_string());

    BridgeTask::start(session, connector_, table_, metrics_);

    // Synchronous probe: the session becomes visible only once the backend answered
    auto state = session->wait_until_started(std::chrono::milliseconds(config_.connect_timeout_ms));
    bool timed_out = state == SessionState::Connecting;
    if (timed_out) {
        // The backend may still answer before this lands; the probe has failed regardless
        session->cancel(CloseReason::BackendError);
    }

    bool published = !timed_out && session->was_streaming() && !session->is_cancelled() &&
                     table_.publish(session->id());
    if (!published) {
        metrics_.record_session_rejected();
        if (timed_out) {
            result.error = core::Errc::BackendUnreachable;
            result.message = fmt::format("backend '{}' did not answer within {} ms", backend_name,
                                         config_.connect_timeout_ms);
        } else if (!session->was_streaming()) {
            result.error = core::Errc::BackendUnreachable;
            result.message = fmt::format("backend '{}' at {} is unreachable", backend_name,
                                         registration->base_url);
        } else {
            result.error = core::Errc::BackendStreamError;
            result.message = fmt::format("backend '{}' stream ended before attach", backend_name);
        }
        // Fully torn down before we answer; the bridge removes the pending entry
        await_closed(*session);
        LOG_ERROR_CTX(logger, "Connect failed", session->id(), core::error_name(result.error),
                      result.message);
        return result;
    }

    // An unregister or shutdown between resolve() and publish() did not see this session
    if (!is_accepting()) {
        session->cancel(CloseReason::GatewayShutdown);
        result.error = core::Errc::ShuttingDown;
        result.message = "gateway is shutting down";
    } else if (!registry_.resolve(backend_name)) {
        session->cancel(CloseReason::BackendUnregistered);
        result.error = core::Errc::NameNotFound;
        result.message = fmt::format("backend '{}' was unregistered during connect", backend_name);
    }
    if (result.error) {
        metrics_.record_session_rejected();
        await_closed(*session);
        return result;
    }

    result.session_id = session->id();
    return result;
}

PublishResult DataPlane::attach_stream(std::string_view session_id, ClientSink& sink) {
    std::error_code ec;
    auto session = reserve_stream(session_id, ec);
    if (!session) {
        PublishResult result;
        result.error = ec;
        return result;
    }
    return deliver_stream(*session, sink);
}

std::shared_ptr<Session> DataPlane::reserve_stream(std::string_view session_id,
                                                   std::error_code& ec) {
    ec.clear();
    auto session = table_.lookup(session_id);
    if (!session) {
        ec = core::Errc::SessionNotFound;
        return nullptr;
    }
    if (!session->try_attach_publisher()) {
        ec = core::Errc::SessionBusy;
        return nullptr;
    }
    return session;
}

PublishResult DataPlane::deliver_stream(Session& session, ClientSink& sink) {
    return publisher_.publish_attached(session, sink);
}

CallResult DataPlane::call(std::string_view session_id, std::string_view method,
                           const nlohmann::json& payload) {
    return forwarder_.forward(session_id, method, payload);
}

std::error_code DataPlane::close_session(std::string_view session_id) {
    auto session = table_.lookup(session_id);
    if (!session) {
        return core::Errc::SessionNotFound;
    }

    if (session->cancel(CloseReason::ClientCancel)) {
        session->buffer().clear();
        auto* logger = logging::get_logger();
        LOG_SESSION(logger, "closing", session->id(), session->backend_name(),
                    "reason=client-cancel (explicit)");
    }
    return {};
}

void DataPlane::shutdown() {
    bool was_accepting = accepting_.exchange(false, std::memory_order_acq_rel);
    if (!was_accepting) {
        return;
    }

    registry_.unsubscribe(subscription_id_);

    auto sessions = table_.snapshot();
    auto* logger = logging::get_logger();
    LOG_INFO(logger, "Data plane shutting down: sessions={}", sessions.size());

    for (const auto& session : sessions) {
        session->cancel(CloseReason::GatewayShutdown);
    }

    // Bridges reference the table and metrics, so every one must be gone before we return
    for (const auto& session : sessions) {
        await_closed(*session);
    }
}

void DataPlane::await_closed(Session& session) {
    auto grace = std::chrono::milliseconds(config_.shutdown_grace_ms);
    if (session.wait_closed(grace)) {
        return;
    }

    auto* logger = logging::get_logger();
    LOG_WARNING(logger, "Session did not close within grace period: session_id={}, state={}",
                session.id(), to_string(session.state()));
    while (!session.wait_closed(grace)) {
    }
}

void DataPlane::on_backend_unregistered(std::string_view name) {
    auto sessions = table_.find_by_backend(name);
    auto* logger = logging::get_logger();

    for (const auto& session : sessions) {
        if (session->cancel(CloseReason::BackendUnregistered)) {
            LOG_SESSION(logger, "closing", session->id(), name, "reason=backend-unregistered");
        }
    }
}

}  // namespace sluice::gateway
