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

// Sluice Session IDs - Implementation

#include "session_id.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>

#include "errors.hpp"
#include "logging.hpp"

namespace sluice::core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

}  // namespace

std::string generate_session_id(std::error_code& ec, RandomSource source) {
    ec.clear();
    if (source == nullptr) {
        source = RAND_bytes;
    }

    std::array<uint8_t, 16> uuid_bytes{};
    if (source(uuid_bytes.data(), static_cast<int>(uuid_bytes.size())) != 1) {
        unsigned long err = ERR_get_error();
        char reason[256] = "no OpenSSL error queued";
        if (err != 0) {
            ERR_error_string_n(err, reason, sizeof(reason));
        }
        auto* logger = logging::get_logger();
        LOG_ERROR(logger, "Session id generation failed: {}", reason);
        ec = Errc::RandomUnavailable;
        return {};
    }

    // Set version to 4 (random UUID)
    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
    // Set variant to RFC4122
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

    std::string id;
    id.reserve(36);
    for (size_t i = 0; i < uuid_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id.push_back(HEX_DIGITS[uuid_bytes[i] >> 4]);
        id.push_back(HEX_DIGITS[uuid_bytes[i] & 0x0F]);
    }
    return id;
}

bool is_valid_session_id(std::string_view id) noexcept {
    // 36 characters: 8-4-4-4-12 with hyphens
    if (id.length() != 36) {
        return false;
    }

    if (id[8] != '-' || id[13] != '-' || id[18] != '-' || id[23] != '-') {
        return false;
    }

    // Version nibble
    if (id[14] != '4') {
        return false;
    }

    // Variant nibble (RFC4122: 8, 9, a, b)
    char variant = id[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b') {
        return false;
    }

    auto is_hex = [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); };

    for (size_t i = 0; i < id.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        if (!is_hex(id[i])) return false;
    }

    return true;
}

}  // namespace sluice::core
