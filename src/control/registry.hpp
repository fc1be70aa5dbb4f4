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

// Sluice Registry - Header
// Control plane: name -> backend address bookkeeping

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "../core/url.hpp"

namespace sluice::control {

/// A registered backend server
struct Registration {
    std::string name;
    std::string base_url;  // As registered, trailing '/' stripped
    core::BackendAddress address;
    nlohmann::json meta = nlohmann::json::object();
    std::string registered_at;  // ISO-8601 UTC
};

/// Registry of backend servers (concurrency-safe, passed by reference)
///
/// Names are unique at any instant. The data plane only calls resolve(),
/// once per session at connect time; unregister listeners let it close
/// sessions bound to a removed name.
class Registry {
public:
    using UnregisterListener = std::function<void(std::string_view name)>;

    Registry() = default;
    ~Registry() = default;

    // Non-copyable, non-movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Register backend (NameAlreadyRegistered, InvalidAddress, InvalidRequest on empty name)
    [[nodiscard]] std::error_code register_backend(std::string_view name, std::string_view base_url,
                                                   nlohmann::json meta = nlohmann::json::object());

    /// Remove backend by name (NameNotFound if absent); notifies listeners after removal
    [[nodiscard]] std::error_code unregister(std::string_view name);

    /// Look up a backend by name (nullopt = NameNotFound)
    [[nodiscard]] std::optional<Registration> resolve(std::string_view name) const;

    /// Snapshot of all registrations, sorted by name
    [[nodiscard]] std::vector<Registration> list() const;

    [[nodiscard]] size_t size() const;

    /// Subscribe to unregister events, returns subscription id.
    /// Listeners run on the unregistering thread and must not subscribe or unsubscribe.
    uint64_t subscribe_unregister(UnregisterListener listener);

    /// Once this returns the listener is not running and will not run again
    void unsubscribe(uint64_t subscription_id);

private:
    mutable std::shared_mutex mutex_;
    core::string_map<Registration> entries_;

    std::shared_mutex listeners_mutex_;
    std::vector<std::pair<uint64_t, UnregisterListener>> listeners_;
    uint64_t next_subscription_id_ = 1;
};

}  // namespace sluice::control
