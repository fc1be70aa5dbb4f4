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

// Sluice Session IDs - Header
// Opaque session tokens: UUID v4 drawn from the OpenSSL CSPRNG

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace sluice::core {

/// Fills buf with num random bytes, returns 1 on success (RAND_bytes contract)
using RandomSource = int (*)(unsigned char* buf, int num);

/// Generate a random UUID v4 string (8-4-4-4-12, lowercase hex)
/// 122 random bits per id; uniqueness among live sessions is additionally
/// enforced by SessionTable on insert. Draws from source, or OpenSSL
/// RAND_bytes when null. If the source fails, ec is RandomUnavailable and
/// the result is empty; there is no weaker fallback.
[[nodiscard]] std::string generate_session_id(std::error_code& ec,
                                              RandomSource source = nullptr);

/// Validate session id format (UUID v4, 8-4-4-4-12)
[[nodiscard]] bool is_valid_session_id(std::string_view id) noexcept;

}  // namespace sluice::core
