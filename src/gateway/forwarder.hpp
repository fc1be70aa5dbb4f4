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

// Sluice Request Forwarder - Header
// Request/response calls routed by session_id to the session's backend

#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "../control/metrics.hpp"
#include "backend_connector.hpp"
#include "session_table.hpp"

namespace sluice::gateway {

/// Method names become a path segment: [A-Za-z0-9_.-]+, not "." or ".."
[[nodiscard]] bool is_valid_method_name(std::string_view method) noexcept;

/// Request forwarder
///
/// Independent of the stream plane: a call neither reads nor writes the
/// session's buffer and does not change its state. Each call resolves the
/// session's backend address, then talks to the backend without holding
/// any table lock, so calls on one session may run concurrently.
class RequestForwarder {
public:
    RequestForwarder(SessionTable& table, BackendConnector& connector,
                     control::GatewayMetrics& metrics);

    [[nodiscard]] CallResult forward(std::string_view session_id, std::string_view method,
                                     const nlohmann::json& payload);

private:
    SessionTable& table_;
    BackendConnector& connector_;
    control::GatewayMetrics& metrics_;
};

}  // namespace sluice::gateway
