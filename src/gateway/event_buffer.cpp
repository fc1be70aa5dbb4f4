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

// Sluice Event Buffer - Implementation

#include "event_buffer.hpp"

#include <algorithm>

namespace sluice::gateway {

EventBuffer::EventBuffer(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

bool EventBuffer::push(Frame frame) {
    bool evicted = false;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }

        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
            evicted = true;
        }

        frames_.push_back(std::move(frame));
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }

    readable_.notify_one();
    return evicted;
}

PopStatus EventBuffer::pop(Frame& out, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);

    bool ready = readable_.wait_for(lock, timeout, [this] { return !frames_.empty() || closed_; });
    if (!ready) {
        return PopStatus::Timeout;
    }

    if (!frames_.empty()) {
        out = std::move(frames_.front());
        frames_.pop_front();
        return PopStatus::Frame;
    }

    return PopStatus::Closed;
}

void EventBuffer::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    readable_.notify_all();
}

void EventBuffer::clear() {
    std::lock_guard lock(mutex_);
    frames_.clear();
}

size_t EventBuffer::size() const {
    std::lock_guard lock(mutex_);
    return frames_.size();
}

bool EventBuffer::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace sluice::gateway
