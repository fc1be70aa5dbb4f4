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

// Sluice Session - Header
// One client's logical connection to one backend: lifecycle state machine,
// cancellation handle, event buffer and the bridge thread that feeds it

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "../core/url.hpp"
#include "event_buffer.hpp"

namespace sluice::gateway {

/// Session lifecycle
///
/// Connecting -> Streaming -> Closing -> Closed
/// Connecting -> Closing (backend unreachable, cancelled during connect)
/// Transitions only move forward.
enum class SessionState : uint8_t {
    Connecting,  // Bridge opening the backend stream
    Streaming,   // Backend accepted; frames flow into the buffer
    Closing,     // Cancellation requested; bridge winding down
    Closed       // Bridge stopped, backend stream released, removed from table
};

/// Why a session left Streaming (first recorded reason wins)
enum class CloseReason : uint8_t {
    None,
    BackendComplete,      // Backend ended its stream normally
    BackendError,         // Backend unreachable or stream failed mid-flight
    ClientCancel,         // Client transport went away or DELETE /data/session
    BackendUnregistered,  // Registry entry removed
    GatewayShutdown       // Process stopping
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Streaming:
            return "streaming";
        case SessionState::Closing:
            return "closing";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::None:
            return "none";
        case CloseReason::BackendComplete:
            return "backend-complete";
        case CloseReason::BackendError:
            return "backend-error";
        case CloseReason::ClientCancel:
            return "client-cancel";
        case CloseReason::BackendUnregistered:
            return "backend-unregistered";
        case CloseReason::GatewayShutdown:
            return "gateway-shutdown";
    }
    return "unknown";
}

/// Live session
///
/// Always held by std::shared_ptr: the session table, the bridge thread and
/// an attached publisher each keep a reference, so whichever finishes last
/// frees it. cancel() is the single cancellation signal; it is idempotent,
/// safe from any thread, and aborts the backend stream through the handler
/// the bridge installs.
class Session {
public:
    using AbortHandler = std::function<void()>;

    Session(std::string id, std::string backend_name, core::BackendAddress address,
            size_t buffer_capacity);

    // Joins the bridge thread (detaches when the bridge itself drops the last reference)
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& backend_name() const noexcept { return backend_name_; }
    [[nodiscard]] const core::BackendAddress& address() const noexcept { return address_; }

    [[nodiscard]] EventBuffer& buffer() noexcept { return buffer_; }
    [[nodiscard]] const EventBuffer& buffer() const noexcept { return buffer_; }

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] CloseReason close_reason() const;

    /// True once Closing or Closed
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// True if the backend stream was ever opened
    [[nodiscard]] bool was_streaming() const noexcept {
        return was_streaming_.load(std::memory_order_acquire);
    }

    // --- State transitions ---

    /// Connecting -> Streaming. False if the session was already cancelled.
    bool mark_streaming();

    /// Enter Closing with reason, close the buffer and abort the backend stream.
    /// Returns true for the call that recorded the reason.
    bool cancel(CloseReason reason);

    /// Closing -> Closed (bridge only, after the backend stream is released)
    void mark_closed();

    /// Block until the session leaves Connecting or timeout; returns the state seen
    SessionState wait_until_started(std::chrono::milliseconds timeout);

    /// Block until Closed or timeout
    bool wait_closed(std::chrono::milliseconds timeout);

    // --- Backend stream abort hook ---

    /// Install the abort callback. Invoked immediately if already cancelled.
    void set_abort_handler(AbortHandler handler);

    /// Remove the abort callback; waits for an in-flight invocation to finish
    void clear_abort_handler();

    // --- Publisher attachment (at most one client stream) ---

    [[nodiscard]] bool try_attach_publisher() noexcept;
    void detach_publisher() noexcept;
    [[nodiscard]] bool has_publisher() const noexcept {
        return publisher_attached_.load(std::memory_order_acquire);
    }

    // --- Bridge thread ownership ---

    /// Take ownership of the bridge thread (started exactly once)
    void adopt_bridge_thread(std::thread thread);

private:
    const std::string id_;
    const std::string backend_name_;
    const core::BackendAddress address_;

    EventBuffer buffer_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_changed_;
    SessionState state_ = SessionState::Connecting;
    CloseReason close_reason_ = CloseReason::None;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> was_streaming_{false};
    std::atomic<bool> publisher_attached_{false};

    // Guards the handler and serializes its invocation against clear_abort_handler()
    std::mutex abort_mutex_;
    AbortHandler abort_handler_;
    bool abort_fired_ = false;  // The handler runs at most once

    std::thread bridge_thread_;
};

}  // namespace sluice::gateway
