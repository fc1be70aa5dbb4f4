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

// Sluice API Server - Header
// Client-facing HTTP surface: control routes, data routes, health

#pragma once

#include <atomic>
#include <memory>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../control/registry.hpp"
#include "../gateway/data_plane.hpp"
#include "../gateway/publisher.hpp"

namespace httplib {
class Server;
class DataSink;
struct Response;
}  // namespace httplib

namespace sluice::http {

/// ClientSink over an httplib chunked response, framed as text/event-stream
class SseClientSink final : public gateway::ClientSink {
public:
    explicit SseClientSink(httplib::DataSink& sink) : sink_(sink) {}

    [[nodiscard]] bool send_frame(std::string_view frame) override;
    [[nodiscard]] bool send_heartbeat() override;
    [[nodiscard]] bool send_end(gateway::CloseReason reason) override;
    [[nodiscard]] bool is_connected() const override;

private:
    bool write(const std::string& chunk);

    httplib::DataSink& sink_;
    bool failed_ = false;
};

/// Write {"error": "<ErrcName>", "message": "..."} with the mapped status
void write_error(httplib::Response& res, const std::error_code& ec, std::string_view message);

/// API server
///
/// Routes:
///   POST   /control/register                    {name, base_url, meta?}
///   POST   /control/unregister                  {name}
///   GET    /control/list
///   POST   /data/connect                        {server}
///   GET    /data/stream/{session_id}            text/event-stream
///   POST   /data/request/{session_id}/{method}  JSON in, backend JSON out
///   DELETE /data/session/{session_id}
///   GET    /health
///
/// Each attached stream holds one worker thread for its lifetime.
class ApiServer {
public:
    ApiServer(const control::ServerConfig& config, control::Registry& registry,
              gateway::DataPlane& data_plane);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /// Bind the listen socket (port 0 picks an ephemeral port)
    [[nodiscard]] std::error_code bind();

    /// Serve until stop(); bind() must have succeeded
    bool run();

    /// Unblock run(); safe from any thread
    void stop();

    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] bool is_running() const;

private:
    void register_routes();

    const control::ServerConfig config_;
    control::Registry& registry_;
    gateway::DataPlane& data_plane_;

    std::unique_ptr<httplib::Server> server_;
    int port_ = -1;
};

}  // namespace sluice::http
