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

// Sluice Bridge Task - Implementation

#include "bridge.hpp"

#include <bit>
#include <exception>
#include <thread>

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace sluice::gateway {

namespace {

/// Feeds backend frames into the session buffer
class BufferingObserver final : public StreamObserver {
public:
    BufferingObserver(Session& session, control::GatewayMetrics& metrics)
        : session_(session), metrics_(metrics) {}

    bool on_open() override {
        if (!session_.mark_streaming()) {
            return false;  // Cancelled while connecting
        }
        metrics_.record_session_opened();
        auto* logger = logging::get_logger();
        LOG_SESSION(logger, "streaming", session_.id(), session_.backend_name(),
                    session_.address().to_string());
        return true;
    }

    bool on_frame(Frame frame) override {
        if (session_.is_cancelled()) {
            return false;
        }

        metrics_.record_frame_received();
        if (session_.buffer().push(std::move(frame))) {
            metrics_.record_frame_dropped();

            // First drop, then every power of two
            uint64_t dropped = session_.buffer().dropped();
            if (std::has_single_bit(dropped)) {
                auto* logger = logging::get_logger();
                LOG_WARNING(logger,
                            "Buffer overflow: session_id={}, backend={}, capacity={}, dropped={}",
                            session_.id(), session_.backend_name(), session_.buffer().capacity(),
                            dropped);
            }
        }
        return true;
    }

private:
    Session& session_;
    control::GatewayMetrics& metrics_;
};

}  // namespace

CloseReason close_reason_for(StreamEnd end) noexcept {
    switch (end) {
        case StreamEnd::Completed:
            return CloseReason::BackendComplete;
        case StreamEnd::Failed:
        case StreamEnd::Unreachable:
            return CloseReason::BackendError;
        case StreamEnd::Aborted:
            return CloseReason::ClientCancel;
    }
    return CloseReason::BackendError;
}

BridgeTask::BridgeTask(std::shared_ptr<Session> session, BackendConnector& connector,
                       SessionTable& table, control::GatewayMetrics& metrics)
    : session_(std::move(session)), connector_(&connector), table_(&table), metrics_(&metrics) {}

void BridgeTask::start(const std::shared_ptr<Session>& session, BackendConnector& connector,
                       SessionTable& table, control::GatewayMetrics& metrics) {
    std::thread thread(BridgeTask(session, connector, table, metrics));
    session->adopt_bridge_thread(std::move(thread));
}

void BridgeTask::operator()() {
    Session& session = *session_;
    auto* logger = logging::get_logger();

    StreamOutcome outcome{StreamEnd::Aborted, "not started"};
    {
        std::unique_ptr<BackendStream> stream;
        try {
            stream = connector_->open_stream(session.address());
        } catch (const std::exception& e) {
            outcome = {StreamEnd::Unreachable, e.what()};
        }

        if (stream) {
            BackendStream* raw = stream.get();
            session.set_abort_handler([raw] { raw->abort(); });

            BufferingObserver observer(session, *metrics_);
            try {
                outcome = stream->run(observer);
            } catch (const std::exception& e) {
                outcome = {session.was_streaming() ? StreamEnd::Failed : StreamEnd::Unreachable,
                           e.what()};
            }

            session.clear_abort_handler();
        }
        // Backend stream handle released here, before anyone is told the session ended
    }

    LOG_BACKEND(logger, "stream ended", session.backend_name(),
                fmt::format("session_id={}, outcome={}", session.id(), outcome.detail));

    if (outcome.end == StreamEnd::Unreachable || outcome.end == StreamEnd::Failed) {
        LOG_ERROR_CTX(logger, "Backend stream failed", session.id(),
                      outcome.end == StreamEnd::Unreachable ? "BackendUnreachable"
                                                            : "BackendStreamError",
                      outcome.detail);
    }

    session.cancel(close_reason_for(outcome.end));
    session.buffer().close();

    bool removed = table_->remove(session.id());
    if (session.was_streaming()) {
        metrics_->record_session_closed();
    }

    LOG_SESSION(logger, "closed", session.id(), session.backend_name(),
                fmt::format("reason={}, frames={}, dropped={}, removed={}",
                            to_string(session.close_reason()), session.buffer().pushed(),
                            session.buffer().dropped(), removed));

    // Last step: waiters may tear down the table and metrics once this returns
    session.mark_closed();
}

}  // namespace sluice::gateway
