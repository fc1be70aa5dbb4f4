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

// Sluice Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sluice::control {

/// Client-facing HTTP server configuration
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8000;

    // Each attached stream occupies one worker for its whole lifetime
    uint32_t worker_threads = 64;

    // Timeouts (milliseconds)
    uint32_t read_timeout_ms = 30000;
    uint32_t write_timeout_ms = 30000;

    // Limits
    uint32_t max_request_size = 1048576;  // 1MB
};

/// Per-session data plane settings
struct SessionConfig {
    uint32_t buffer_capacity = 100;          // Event buffer capacity C (frames)
    uint32_t heartbeat_interval_ms = 15000;  // Idle timeout T before a heartbeat
    uint32_t connect_timeout_ms = 5000;      // Bound on the synchronous attach probe
    uint32_t max_sessions = 10000;           // Live sessions across the gateway
    uint32_t disconnect_poll_ms = 1000;      // Client liveness check on idle streams
    uint32_t shutdown_grace_ms = 5000;       // Wait for bridges to stop on shutdown
};

/// How the gateway talks to backend servers
struct BackendClientConfig {
    std::string stream_path = "/stream";
    std::vector<std::pair<std::string, std::string>> stream_params = {{"n", "50"}};
    std::string call_path_prefix = "/math";  // RPC = POST {prefix}/{method}

    uint32_t connect_timeout_ms = 5000;
    uint32_t call_timeout_ms = 10000;
    uint32_t stream_idle_timeout_ms = 60000;  // 0 = block until cancelled
    uint32_t max_event_bytes = 1048576;       // 1MB, larger SSE events fail the stream
};

/// Registration loaded at startup
struct RegistrationConfig {
    std::string name;
    std::string base_url;
    nlohmann::json meta = nlohmann::json::object();
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";   // debug, info, warning, error
    std::string format = "json";  // json, text
    std::string output;           // Log directory (sluice.log appended), empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Sluice configuration
struct Config {
    ServerConfig server;
    SessionConfig session;
    BackendClientConfig backend;
    std::vector<RegistrationConfig> registrations;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
};

// All config types use custom from_json/to_json (partial configs fall back to defaults)

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8000));
    s.worker_threads = j.value("worker_threads", 64u);
    s.read_timeout_ms = j.value("read_timeout_ms", 30000u);
    s.write_timeout_ms = j.value("write_timeout_ms", 30000u);
    s.max_request_size = j.value("max_request_size", 1048576u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"worker_threads", s.worker_threads},
                       {"read_timeout_ms", s.read_timeout_ms},
                       {"write_timeout_ms", s.write_timeout_ms},
                       {"max_request_size", s.max_request_size}};
}

inline void from_json(const nlohmann::json& j, SessionConfig& s) {
    s.buffer_capacity = j.value("buffer_capacity", 100u);
    s.heartbeat_interval_ms = j.value("heartbeat_interval_ms", 15000u);
    s.connect_timeout_ms = j.value("connect_timeout_ms", 5000u);
    s.max_sessions = j.value("max_sessions", 10000u);
    s.disconnect_poll_ms = j.value("disconnect_poll_ms", 1000u);
    s.shutdown_grace_ms = j.value("shutdown_grace_ms", 5000u);
}

inline void to_json(nlohmann::json& j, const SessionConfig& s) {
    j = nlohmann::json{{"buffer_capacity", s.buffer_capacity},
                       {"heartbeat_interval_ms", s.heartbeat_interval_ms},
                       {"connect_timeout_ms", s.connect_timeout_ms},
                       {"max_sessions", s.max_sessions},
                       {"disconnect_poll_ms", s.disconnect_poll_ms},
                       {"shutdown_grace_ms", s.shutdown_grace_ms}};
}

inline void from_json(const nlohmann::json& j, BackendClientConfig& b) {
    b.stream_path = j.value("stream_path", std::string("/stream"));
    b.call_path_prefix = j.value("call_path_prefix", std::string("/math"));
    b.connect_timeout_ms = j.value("connect_timeout_ms", 5000u);
    b.call_timeout_ms = j.value("call_timeout_ms", 10000u);
    b.stream_idle_timeout_ms = j.value("stream_idle_timeout_ms", 60000u);
    b.max_event_bytes = j.value("max_event_bytes", 1048576u);

    // stream_params: {"n": 50, "topic": "x"} - scalar values are stringified
    if (j.contains("stream_params")) {
        b.stream_params.clear();
        for (const auto& [key, value] : j.at("stream_params").items()) {
            b.stream_params.emplace_back(key,
                                         value.is_string() ? value.get<std::string>() : value.dump());
        }
    }
}

inline void to_json(nlohmann::json& j, const BackendClientConfig& b) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [key, value] : b.stream_params) {
        params[key] = value;
    }
    j = nlohmann::json{{"stream_path", b.stream_path},
                       {"stream_params", params},
                       {"call_path_prefix", b.call_path_prefix},
                       {"connect_timeout_ms", b.connect_timeout_ms},
                       {"call_timeout_ms", b.call_timeout_ms},
                       {"stream_idle_timeout_ms", b.stream_idle_timeout_ms},
                       {"max_event_bytes", b.max_event_bytes}};
}

inline void from_json(const nlohmann::json& j, RegistrationConfig& r) {
    j.at("name").get_to(r.name);          // name is required
    j.at("base_url").get_to(r.base_url);  // base_url is required
    r.meta = j.value("meta", nlohmann::json::object());
}

inline void to_json(nlohmann::json& j, const RegistrationConfig& r) {
    j = nlohmann::json{{"name", r.name}, {"base_url", r.base_url}, {"meta", r.meta}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string());
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    c.server = j.value("server", ServerConfig{});
    c.session = j.value("session", SessionConfig{});
    c.backend = j.value("backend", BackendClientConfig{});
    if (j.contains("registrations")) {
        j.at("registrations").get_to(c.registrations);
    }
    c.logging = j.value("logging", LogConfig{});
    c.version = j.value("version", std::string("1.0"));
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["server"] = c.server;
    j["session"] = c.session;
    j["backend"] = c.backend;
    j["registrations"] = c.registrations;
    j["logging"] = c.logging;
    j["version"] = c.version;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult* result = nullptr);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult* result = nullptr);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace sluice::control
