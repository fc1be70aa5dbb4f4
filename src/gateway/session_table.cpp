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

// Sluice Session Table - Implementation

#include "session_table.hpp"

#include <mutex>

#include "../core/errors.hpp"
#include "../core/session_id.hpp"

namespace sluice::gateway {

SessionTable::SessionTable(size_t max_sessions, core::RandomSource random)
    : max_sessions_(max_sessions), random_(random) {}

std::shared_ptr<Session> SessionTable::create(std::string_view backend_name,
                                              const core::BackendAddress& address,
                                              size_t buffer_capacity, std::error_code& ec) {
    ec.clear();

    std::unique_lock lock(mutex_);
    if (max_sessions_ > 0 && entries_.size() >= max_sessions_) {
        ec = core::Errc::SessionLimitReached;
        return nullptr;
    }

    // 122 random bits; the loop only guards the theoretical collision
    std::string id = core::generate_session_id(ec, random_);
    while (!ec && entries_.contains(id)) {
        id = core::generate_session_id(ec, random_);
    }
    if (ec) {
        return nullptr;
    }

    auto session = std::make_shared<Session>(id, std::string(backend_name), address,
                                             buffer_capacity);
    entries_.emplace(std::move(id), Entry{session, false});
    return session;
}

bool SessionTable::publish(std::string_view session_id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.published = true;
    return true;
}

std::shared_ptr<Session> SessionTable::lookup(std::string_view session_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.published) {
        return nullptr;
    }
    return it->second.session;
}

bool SessionTable::remove(std::string_view session_id) {
    std::shared_ptr<Session> removed;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(session_id);
        if (it == entries_.end()) {
            return false;
        }
        removed = std::move(it->second.session);
        entries_.erase(it);
    }
    // Last reference may be dropped here, outside the lock
    return true;
}

std::vector<std::shared_ptr<Session>> SessionTable::find_by_backend(std::string_view name) const {
    std::vector<std::shared_ptr<Session>> result;
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry.session->backend_name() == name) {
            result.push_back(entry.session);
        }
    }
    return result;
}

std::vector<std::shared_ptr<Session>> SessionTable::snapshot() const {
    std::vector<std::shared_ptr<Session>> result;
    std::shared_lock lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry.session);
    }
    return result;
}

size_t SessionTable::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace sluice::gateway
