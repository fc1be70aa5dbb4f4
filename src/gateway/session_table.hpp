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

// Sluice Session Table - Header
// Concurrent session_id -> Session map shared by every HTTP worker and bridge

#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "../core/session_id.hpp"
#include "session.hpp"

namespace sluice::gateway {

/// Session table
///
/// create() reserves a collision-free id and stores the session as pending:
/// it counts against the limit but lookup() does not see it until publish().
/// A session whose backend never answers is removed without ever having been
/// visible. Lookups take a shared lock; create/publish/remove take it
/// exclusively. Sessions are handed out as shared_ptr so a reader keeps one
/// alive after it has been removed.
class SessionTable {
public:
    /// random: id source, OpenSSL RAND_bytes when null
    explicit SessionTable(size_t max_sessions = 10000, core::RandomSource random = nullptr);

    /// Allocate a fresh id and a pending session
    /// (SessionLimitReached when full, RandomUnavailable if no id can be drawn)
    [[nodiscard]] std::shared_ptr<Session> create(std::string_view backend_name,
                                                  const core::BackendAddress& address,
                                                  size_t buffer_capacity, std::error_code& ec);

    /// Make a pending session visible to lookup(). False if it is gone.
    bool publish(std::string_view session_id);

    /// Published session by id, nullptr if absent
    [[nodiscard]] std::shared_ptr<Session> lookup(std::string_view session_id) const;

    /// Remove (pending or published). Idempotent; true if this call removed it.
    bool remove(std::string_view session_id);

    /// Sessions bound to a backend name, pending included
    [[nodiscard]] std::vector<std::shared_ptr<Session>> find_by_backend(std::string_view name) const;

    /// Every session, pending included
    [[nodiscard]] std::vector<std::shared_ptr<Session>> snapshot() const;

    /// Sessions stored, pending included
    [[nodiscard]] size_t size() const;

    [[nodiscard]] size_t max_sessions() const noexcept { return max_sessions_; }

private:
    struct Entry {
        std::shared_ptr<Session> session;
        bool published = false;
    };

    const size_t max_sessions_;
    const core::RandomSource random_;

    mutable std::shared_mutex mutex_;
    core::string_map<Entry> entries_;
};

}  // namespace sluice::gateway
