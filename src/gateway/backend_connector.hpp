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

// Sluice Backend Connector - Header
// Transport seam between the data plane and backends

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../core/url.hpp"
#include "event_buffer.hpp"

namespace sluice::gateway {

/// How a backend stream ended
enum class StreamEnd : uint8_t {
    Completed,    // Backend closed the stream cleanly
    Failed,       // Transport error or idle timeout after the stream opened
    Unreachable,  // Stream never opened (connect failure, non-200 status)
    Aborted       // abort() or the observer asked to stop
};

struct StreamOutcome {
    StreamEnd end = StreamEnd::Completed;
    std::string detail;
};

/// Receives a backend stream as it arrives (called on the bridge thread)
class StreamObserver {
public:
    virtual ~StreamObserver() = default;

    /// Backend accepted the stream. Return false to abort before any frame.
    virtual bool on_open() = 0;

    /// One frame, in backend order. Return false to stop reading.
    virtual bool on_frame(Frame frame) = 0;
};

/// One open backend stream
///
/// Owned by the bridge task; destroying it releases the connection.
class BackendStream {
public:
    virtual ~BackendStream() = default;

    /// Pump the stream into observer until it ends. Blocks.
    [[nodiscard]] virtual StreamOutcome run(StreamObserver& observer) = 0;

    /// Unblock run() from another thread. Idempotent.
    virtual void abort() noexcept = 0;
};

/// Result of a request/response call
struct CallResult {
    std::error_code error;     // Empty on success
    nlohmann::json body;       // Backend's decoded response on success
    uint16_t status = 0;       // Backend HTTP status, 0 if none was received
    std::string message;       // Backend or transport error text

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

/// Backend transport
///
/// Implementations must be safe to call from many threads at once.
class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    /// Prepare a stream for the address; connection happens in run()
    [[nodiscard]] virtual std::unique_ptr<BackendStream> open_stream(
        const core::BackendAddress& address) = 0;

    /// Forward one request and wait for the response
    [[nodiscard]] virtual CallResult call(const core::BackendAddress& address,
                                          std::string_view method,
                                          const nlohmann::json& payload) = 0;
};

}  // namespace sluice::gateway
