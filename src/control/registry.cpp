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

// Sluice Registry - Implementation

#include "registry.hpp"

#include <algorithm>
#include <ctime>
#include <mutex>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace sluice::control {

namespace {

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);

    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf, len);
}

}  // namespace

std::error_code Registry::register_backend(std::string_view name, std::string_view base_url,
                                           nlohmann::json meta) {
    if (name.empty()) {
        return core::Errc::InvalidRequest;
    }

    auto address = core::parse_backend_address(base_url);
    if (!address.has_value()) {
        return core::Errc::InvalidAddress;
    }

    Registration registration;
    registration.name = std::string(name);
    registration.address = *address;
    registration.base_url = std::string(base_url);
    while (!registration.base_url.empty() && registration.base_url.back() == '/') {
        registration.base_url.pop_back();
    }
    registration.meta = meta.is_null() ? nlohmann::json::object() : std::move(meta);
    registration.registered_at = utc_timestamp();

    {
        std::unique_lock lock(mutex_);
        if (entries_.contains(name)) {
            return core::Errc::NameAlreadyRegistered;
        }
        entries_.emplace(registration.name, registration);
    }

    auto* logger = logging::get_logger();
    LOG_BACKEND(logger, "registered", registration.name, registration.base_url);
    return {};
}

std::error_code Registry::unregister(std::string_view name) {
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return core::Errc::NameNotFound;
        }
        entries_.erase(it);
    }

    auto* logger = logging::get_logger();
    LOG_BACKEND(logger, "unregistered", name, "notifying listeners");

    // Held shared for the whole fan-out so unsubscribe() waits for running listeners
    std::shared_lock lock(listeners_mutex_);
    for (const auto& [id, listener] : listeners_) {
        listener(name);
    }
    return {};
}

std::optional<Registration> Registry::resolve(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Registration> Registry::list() const {
    std::vector<Registration> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [name, registration] : entries_) {
            result.push_back(registration);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const Registration& a, const Registration& b) { return a.name < b.name; });
    return result;
}

size_t Registry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

uint64_t Registry::subscribe_unregister(UnregisterListener listener) {
    std::unique_lock lock(listeners_mutex_);
    uint64_t id = next_subscription_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void Registry::unsubscribe(uint64_t subscription_id) {
    std::unique_lock lock(listeners_mutex_);
    std::erase_if(listeners_, [subscription_id](const auto& entry) {
        return entry.first == subscription_id;
    });
}

}  // namespace sluice::control
