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

// Sluice Event Buffer - Header
// Bounded per-session FIFO of opaque frames with drop-oldest overflow

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace sluice::gateway {

/// Opaque backend payload (one SSE event's data)
using Frame = std::string;

/// Outcome of a blocking read
enum class PopStatus : uint8_t {
    Frame,    // A frame was dequeued
    Timeout,  // Nothing arrived within the timeout (heartbeat opportunity)
    Closed    // Buffer closed and drained (end of stream)
};

/// Bounded FIFO with drop-oldest overflow
///
/// One writer (bridge task) and at most one reader (attached publisher).
/// The mutex only guards the writer/reader handoff. When full, push() evicts
/// the head so the newest frame always gets a slot; evictions are counted.
/// After close(), already buffered frames are still handed out, then every
/// pop() returns Closed.
class EventBuffer {
public:
    explicit EventBuffer(size_t capacity);
    ~EventBuffer() = default;

    // Non-copyable, non-movable (owned in place by its Session)
    EventBuffer(const EventBuffer&) = delete;
    EventBuffer& operator=(const EventBuffer&) = delete;

    /// Enqueue a frame. Returns true if the oldest frame was evicted to make room.
    /// Frames pushed after close() are discarded (returns false).
    bool push(Frame frame);

    /// Dequeue the oldest frame, waiting up to timeout
    [[nodiscard]] PopStatus pop(Frame& out, std::chrono::milliseconds timeout);

    /// Stop accepting frames and wake the reader
    void close();

    /// Drop everything still buffered (client went away, nobody will read it)
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool is_closed() const;

    /// Frames evicted by the drop-oldest policy
    [[nodiscard]] uint64_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    /// Frames accepted by push()
    [[nodiscard]] uint64_t pushed() const noexcept {
        return pushed_.load(std::memory_order_relaxed);
    }

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable readable_;
    std::deque<Frame> frames_;
    bool closed_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> pushed_{0};
};

}  // namespace sluice::gateway
