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

// Sluice Session - Implementation

#include "session.hpp"

#include <utility>

namespace sluice::gateway {

Session::Session(std::string id, std::string backend_name, core::BackendAddress address,
                 size_t buffer_capacity)
    : id_(std::move(id)),
      backend_name_(std::move(backend_name)),
      address_(std::move(address)),
      buffer_(buffer_capacity) {}

Session::~Session() {
    if (!bridge_thread_.joinable()) {
        return;
    }

    // The bridge lambda holds a reference; if it was the last one we are
    // running on the bridge thread and cannot join ourselves.
    if (bridge_thread_.get_id() == std::this_thread::get_id()) {
        bridge_thread_.detach();
    } else {
        bridge_thread_.join();
    }
}

SessionState Session::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

CloseReason Session::close_reason() const {
    std::lock_guard lock(state_mutex_);
    return close_reason_;
}

bool Session::mark_streaming() {
    {
        std::lock_guard lock(state_mutex_);
        if (state_ != SessionState::Connecting) {
            return false;
        }
        state_ = SessionState::Streaming;
        was_streaming_.store(true, std::memory_order_release);
    }
    state_changed_.notify_all();
    return true;
}

bool Session::cancel(CloseReason reason) {
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            return false;
        }
        state_ = SessionState::Closing;
        close_reason_ = reason;
        cancelled_.store(true, std::memory_order_release);
    }
    state_changed_.notify_all();

    // Wake a blocked publisher; it drains what is left, then sees end of stream
    buffer_.close();

    std::lock_guard lock(abort_mutex_);
    if (abort_handler_ && !abort_fired_) {
        abort_fired_ = true;
        abort_handler_();
    }
    return true;
}

void Session::mark_closed() {
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closed;
        if (close_reason_ == CloseReason::None) {
            close_reason_ = CloseReason::BackendComplete;
        }
        cancelled_.store(true, std::memory_order_release);
    }
    buffer_.close();
    state_changed_.notify_all();
}

SessionState Session::wait_until_started(std::chrono::milliseconds timeout) {
    std::unique_lock lock(state_mutex_);
    state_changed_.wait_for(lock, timeout, [this] { return state_ != SessionState::Connecting; });
    return state_;
}

bool Session::wait_closed(std::chrono::milliseconds timeout) {
    std::unique_lock lock(state_mutex_);
    return state_changed_.wait_for(lock, timeout,
                                   [this] { return state_ == SessionState::Closed; });
}

void Session::set_abort_handler(AbortHandler handler) {
    std::lock_guard lock(abort_mutex_);
    abort_handler_ = std::move(handler);
    if (abort_handler_ && !abort_fired_ && is_cancelled()) {
        abort_fired_ = true;
        abort_handler_();
    }
}

void Session::clear_abort_handler() {
    std::lock_guard lock(abort_mutex_);
    abort_handler_ = nullptr;
}

bool Session::try_attach_publisher() noexcept {
    bool expected = false;
    return publisher_attached_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void Session::detach_publisher() noexcept {
    publisher_attached_.store(false, std::memory_order_release);
}

void Session::adopt_bridge_thread(std::thread thread) {
    bridge_thread_ = std::move(thread);
}

}  // namespace sluice::gateway
