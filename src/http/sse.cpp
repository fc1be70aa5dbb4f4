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

// Sluice Server-Sent Events - Implementation

#include "sse.hpp"

namespace sluice::http {

bool SseDecoder::feed(std::string_view chunk, const EventHandler& handler) {
    if (overflowed_) {
        return false;
    }

    for (char c : chunk) {
        if (last_was_cr_) {
            last_was_cr_ = false;
            if (c == '\n') {
                continue;  // Second half of CRLF
            }
        }

        if (c == '\r' || c == '\n') {
            last_was_cr_ = (c == '\r');
            process_line(line_, handler);
            line_.clear();
            continue;
        }

        line_.push_back(c);
        if (line_.size() + data_.size() > max_event_bytes_) {
            overflowed_ = true;
            line_.clear();
            data_.clear();
            has_data_ = false;
            return false;
        }
    }
    return true;
}

void SseDecoder::process_line(std::string_view line, const EventHandler& handler) {
    // Blank line: dispatch
    if (line.empty()) {
        if (has_data_) {
            std::string event = std::move(data_);
            data_.clear();
            has_data_ = false;
            handler(std::move(event));
        }
        return;
    }

    // Comment
    if (line.front() == ':') {
        return;
    }

    std::string_view field = line;
    std::string_view value;
    size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field != "data") {
        return;
    }

    if (has_data_) {
        data_.push_back('\n');
    }
    data_.append(value);
    has_data_ = true;
}

std::string encode_data(std::string_view payload) {
    std::string out;
    out.reserve(payload.size() + 8);

    // Multi-line payloads become one event with several data lines
    size_t start = 0;
    while (true) {
        size_t nl = payload.find('\n', start);
        std::string_view line =
            payload.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        out.append("data: ");
        out.append(line);
        out.push_back('\n');
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }

    out.push_back('\n');
    return out;
}

std::string encode_heartbeat() {
    return ":\n\n";
}

std::string encode_event(std::string_view name, std::string_view data) {
    std::string out = "event: ";
    out.append(name);
    out.push_back('\n');
    out.append(encode_data(data));
    return out;
}

}  // namespace sluice::http
