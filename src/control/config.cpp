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

// Sluice Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "../core/url.hpp"

namespace sluice::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult* result) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        if (result != nullptr) {
            result->add_error("Cannot open config file '" + path_str + "'");
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult* result) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is not up yet at config load time
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        if (result != nullptr) {
            result->add_error(std::string("JSON parsing error: ") + e.what());
        }
        return std::nullopt;
    }

    auto validation = validate(config);
    if (result != nullptr) {
        *result = validation;
    }

    if (validation.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.listen_address.empty()) {
        result.add_error("Server listen_address cannot be empty");
    }

    if (config.server.worker_threads == 0) {
        result.add_error("Server worker_threads must be > 0");
    }

    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }

    // Session
    if (config.session.buffer_capacity == 0) {
        result.add_error("Session buffer_capacity must be > 0");
    }

    if (config.session.heartbeat_interval_ms == 0) {
        result.add_error("Session heartbeat_interval_ms must be > 0");
    }

    if (config.session.connect_timeout_ms == 0) {
        result.add_error("Session connect_timeout_ms must be > 0");
    }

    if (config.session.max_sessions == 0) {
        result.add_error("Session max_sessions must be > 0");
    }

    if (config.session.disconnect_poll_ms == 0) {
        result.add_error("Session disconnect_poll_ms must be > 0");
    }

    if (config.session.shutdown_grace_ms == 0) {
        result.add_error("Session shutdown_grace_ms must be > 0");
    }

    if (config.session.max_sessions > config.server.worker_threads) {
        result.add_warning("Session max_sessions exceeds server worker_threads (streams beyond "
                           "worker_threads wait for a free worker)");
    }

    // Backend client
    if (config.backend.stream_path.empty() || config.backend.stream_path.front() != '/') {
        result.add_error("Backend stream_path must start with '/'");
    }

    if (!config.backend.call_path_prefix.empty() && config.backend.call_path_prefix.front() != '/') {
        result.add_error("Backend call_path_prefix must be empty or start with '/'");
    }

    if (config.backend.connect_timeout_ms == 0) {
        result.add_error("Backend connect_timeout_ms must be > 0");
    }

    if (config.backend.call_timeout_ms == 0) {
        result.add_error("Backend call_timeout_ms must be > 0");
    }

    if (config.backend.max_event_bytes == 0) {
        result.add_error("Backend max_event_bytes must be > 0");
    }

    if (config.backend.stream_idle_timeout_ms == 0) {
        result.add_warning(
            "Backend stream_idle_timeout_ms is 0 (an unresponsive backend pins its bridge "
            "task until the session is cancelled)");
    }

    // Registrations
    if (config.registrations.empty()) {
        result.add_warning("No registrations configured (register backends via /control/register)");
    }

    std::unordered_set<std::string> names;
    for (const auto& registration : config.registrations) {
        if (registration.name.empty()) {
            result.add_error("Registration name cannot be empty");
            continue;
        }

        if (!names.insert(registration.name).second) {
            result.add_error("Duplicate registration name '" + registration.name + "'");
        }

        if (!core::parse_backend_address(registration.base_url).has_value()) {
            result.add_error("Registration '" + registration.name + "' has invalid base_url '" +
                             registration.base_url + "'");
        }
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace sluice::control
