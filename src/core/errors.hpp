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

// Sluice Errors - Header
// Gateway error taxonomy as a std::error_code category

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace sluice::core {

/// Gateway error codes (0 is reserved for success)
enum class Errc : int {
    NameNotFound = 1,       // Registry resolve failed
    SessionNotFound,        // Unknown or expired session_id
    SessionBusy,            // Second concurrent stream attach
    BackendUnreachable,     // Backend stream or RPC could not be opened
    BackendStreamError,     // Backend stream failed mid-flight
    BackendCallError,       // Backend RPC returned a structured error
    ClientDisconnected,     // Internal only, drives cleanup

    NameAlreadyRegistered,  // Duplicate registry name
    InvalidAddress,         // Unparsable backend URL
    InvalidRequest,         // Malformed client input
    SessionLimitReached,    // max_sessions live sessions
    ShuttingDown,           // Data plane no longer accepts work
    RandomUnavailable       // CSPRNG failed; no session id can be drawn
};

/// Category singleton for Errc
[[nodiscard]] const std::error_category& gateway_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

/// Stable name used in client-facing error bodies ("SessionNotFound", ...)
[[nodiscard]] constexpr std::string_view to_string(Errc e) noexcept {
    switch (e) {
        case Errc::NameNotFound:
            return "NameNotFound";
        case Errc::SessionNotFound:
            return "SessionNotFound";
        case Errc::SessionBusy:
            return "SessionBusy";
        case Errc::BackendUnreachable:
            return "BackendUnreachable";
        case Errc::BackendStreamError:
            return "BackendStreamError";
        case Errc::BackendCallError:
            return "BackendCallError";
        case Errc::ClientDisconnected:
            return "ClientDisconnected";
        case Errc::NameAlreadyRegistered:
            return "NameAlreadyRegistered";
        case Errc::InvalidAddress:
            return "InvalidAddress";
        case Errc::InvalidRequest:
            return "InvalidRequest";
        case Errc::SessionLimitReached:
            return "SessionLimitReached";
        case Errc::ShuttingDown:
            return "ShuttingDown";
        case Errc::RandomUnavailable:
            return "RandomUnavailable";
    }
    return "Unknown";
}

/// Error name for any error_code (gateway codes by name, others as "InternalError")
[[nodiscard]] std::string_view error_name(const std::error_code& ec) noexcept;

/// HTTP status for a client-facing error
[[nodiscard]] uint16_t to_http_status(const std::error_code& ec) noexcept;

}  // namespace sluice::core

template <>
struct std::is_error_code_enum<sluice::core::Errc> : std::true_type {};
