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

// Sluice Errors - Implementation

#include "errors.hpp"

#include <string>

namespace sluice::core {

namespace {

class GatewayCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "sluice"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::NameNotFound:
                return "backend name is not registered";
            case Errc::SessionNotFound:
                return "session not found";
            case Errc::SessionBusy:
                return "session already has an attached stream";
            case Errc::BackendUnreachable:
                return "backend unreachable";
            case Errc::BackendStreamError:
                return "backend stream failed";
            case Errc::BackendCallError:
                return "backend call returned an error";
            case Errc::ClientDisconnected:
                return "client disconnected";
            case Errc::NameAlreadyRegistered:
                return "name already registered";
            case Errc::InvalidAddress:
                return "invalid backend address";
            case Errc::InvalidRequest:
                return "invalid request";
            case Errc::SessionLimitReached:
                return "session limit reached";
            case Errc::ShuttingDown:
                return "gateway is shutting down";
            case Errc::RandomUnavailable:
                return "secure random source unavailable";
        }
        return "unknown gateway error";
    }
};

}  // namespace

const std::error_category& gateway_category() noexcept {
    static const GatewayCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), gateway_category()};
}

std::string_view error_name(const std::error_code& ec) noexcept {
    if (ec.category() == gateway_category()) {
        return to_string(static_cast<Errc>(ec.value()));
    }
    return "InternalError";
}

uint16_t to_http_status(const std::error_code& ec) noexcept {
    if (ec.category() != gateway_category()) {
        return 500;
    }

    switch (static_cast<Errc>(ec.value())) {
        case Errc::NameNotFound:
        case Errc::SessionNotFound:
            return 404;
        case Errc::SessionBusy:
            return 409;
        case Errc::NameAlreadyRegistered:
        case Errc::InvalidAddress:
        case Errc::InvalidRequest:
            return 400;
        case Errc::BackendUnreachable:
        case Errc::BackendStreamError:
        case Errc::BackendCallError:
            return 502;
        case Errc::SessionLimitReached:
        case Errc::ShuttingDown:
        case Errc::RandomUnavailable:
            return 503;
        case Errc::ClientDisconnected:
            return 499;  // Internal only
    }
    return 500;
}

}  // namespace sluice::core
