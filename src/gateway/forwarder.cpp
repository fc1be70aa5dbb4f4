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

// Sluice Request Forwarder - Implementation

#include "forwarder.hpp"

#include <chrono>
#include <exception>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace sluice::gateway {

bool is_valid_method_name(std::string_view method) noexcept {
    if (method.empty() || method.size() > 128 || method == "." || method == "..") {
        return false;
    }
    for (char c : method) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

RequestForwarder::RequestForwarder(SessionTable& table, BackendConnector& connector,
                                   control::GatewayMetrics& metrics)
    : table_(table), connector_(connector), metrics_(metrics) {}

CallResult RequestForwarder::forward(std::string_view session_id, std::string_view method,
                                     const nlohmann::json& payload) {
    CallResult result;

    auto session = table_.lookup(session_id);
    if (!session) {
        result.error = core::Errc::SessionNotFound;
        result.message = "unknown session_id";
        return result;
    }

    if (!is_valid_method_name(method)) {
        result.error = core::Errc::InvalidRequest;
        result.message = "invalid method name";
        return result;
    }

    // The session may close while the call is in flight
    core::BackendAddress address = session->address();
    std::string backend = session->backend_name();
    session.reset();

    auto start = std::chrono::steady_clock::now();
    try {
        result = connector_.call(address, method, payload);
    } catch (const std::exception& e) {
        result = CallResult{};
        result.error = core::Errc::BackendUnreachable;
        result.message = e.what();
    }
    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    metrics_.record_call(latency, !result.ok());

    auto* logger = logging::get_logger();
    if (result.ok()) {
        LOG_DEBUG(logger, "Call forwarded: session_id={}, backend={}, method={}, latency_us={}",
                  session_id, backend, method, latency.count());
    } else {
        LOG_ERROR_CTX(logger, "Call failed", session_id, core::error_name(result.error),
                      result.message);
    }
    return result;
}

}  // namespace sluice::gateway
