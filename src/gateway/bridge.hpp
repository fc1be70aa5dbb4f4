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

// Sluice Bridge Task - Header
// Per-session pump from the backend stream into the session's event buffer

#pragma once

#include <memory>

#include "../control/metrics.hpp"
#include "backend_connector.hpp"
#include "session.hpp"
#include "session_table.hpp"

namespace sluice::gateway {

/// Bridge task
///
/// Runs on its own thread, one per session, started once by start().
/// Opens the backend stream, pushes every frame into the buffer (drop-oldest
/// when full) and, whatever ends the stream, winds down in a fixed order:
///   1. release the backend stream handle (exactly once)
///   2. enter Closing with the reason (no-op if someone cancelled first)
///   3. close the buffer, remove the session from the table
///   4. mark Closed
class BridgeTask {
public:
    BridgeTask(std::shared_ptr<Session> session, BackendConnector& connector,
               SessionTable& table, control::GatewayMetrics& metrics);

    /// Spawn the bridge thread and hand it to the session
    static void start(const std::shared_ptr<Session>& session, BackendConnector& connector,
                      SessionTable& table, control::GatewayMetrics& metrics);

    /// Thread body
    void operator()();

private:
    std::shared_ptr<Session> session_;  // Keeps the session alive until the bridge exits
    BackendConnector* connector_;
    SessionTable* table_;
    control::GatewayMetrics* metrics_;
};

/// Map a stream outcome to the close reason the bridge records
[[nodiscard]] CloseReason close_reason_for(StreamEnd end) noexcept;

}  // namespace sluice::gateway
