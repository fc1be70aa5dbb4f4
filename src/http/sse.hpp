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

// Sluice Server-Sent Events - Header
// Incremental SSE decoder (backend side) and frame encoders (client side)

#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace sluice::http {

/// Incremental text/event-stream decoder
///
/// Input arrives in arbitrary chunks (TCP segments, chunked encoding).
/// Lines may end in LF, CRLF or CR. "data:" lines accumulate into one event,
/// joined by '\n'; a blank line dispatches it. Comments (':') and the
/// event/id/retry fields are ignored. An event still open at end of input
/// is never dispatched; has_pending() tells the caller the input was cut short.
class SseDecoder {
public:
    using EventHandler = std::function<void(std::string&& data)>;

    static constexpr size_t kDefaultMaxEventBytes = 1048576;

    explicit SseDecoder(size_t max_event_bytes = kDefaultMaxEventBytes)
        : max_event_bytes_(max_event_bytes) {}

    /// Feed a chunk, invoking handler once per completed event.
    /// Returns false once the pending line plus event data exceeds
    /// max_event_bytes; the partial event is dropped and later input ignored.
    bool feed(std::string_view chunk, const EventHandler& handler);

    /// Bytes of an unterminated line currently buffered
    [[nodiscard]] size_t pending_bytes() const noexcept { return line_.size(); }

    /// A line or an event is open (input ending now would truncate it)
    [[nodiscard]] bool has_pending() const noexcept { return has_data_ || !line_.empty(); }

    [[nodiscard]] bool overflowed() const noexcept { return overflowed_; }

private:
    void process_line(std::string_view line, const EventHandler& handler);

    const size_t max_event_bytes_;
    bool overflowed_ = false;

    std::string line_;
    std::string data_;
    bool has_data_ = false;
    bool last_was_cr_ = false;  // Swallow the LF of a CRLF split across chunks
};

/// "data: <line>\n" per payload line, then a blank line
[[nodiscard]] std::string encode_data(std::string_view payload);

/// SSE comment line; ignored by clients, keeps proxies and sockets alive
[[nodiscard]] std::string encode_heartbeat();

/// Named event: "event: <name>\ndata: <data>\n\n"
[[nodiscard]] std::string encode_event(std::string_view name, std::string_view data);

}  // namespace sluice::http
