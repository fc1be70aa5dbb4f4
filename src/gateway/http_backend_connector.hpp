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

// Sluice HTTP Backend Connector - Header
// Backend transport over plain HTTP/1.1 (cpp-httplib)
//
// Stream:  GET  {base}{stream_path}?{stream_params}, Accept: text/event-stream
// Call:    POST {base}{call_path_prefix}/{method}, JSON body in and out

#pragma once

#include <atomic>
#include <mutex>

#include "../control/config.hpp"
#include "backend_connector.hpp"

namespace httplib {
class Client;
}

namespace sluice::gateway {

/// Streaming GET whose body is decoded as SSE
class HttpBackendStream final : public BackendStream {
public:
    HttpBackendStream(core::BackendAddress address, const control::BackendClientConfig& config);
    ~HttpBackendStream() override = default;

    [[nodiscard]] StreamOutcome run(StreamObserver& observer) override;
    void abort() noexcept override;

private:
    const core::BackendAddress address_;
    const control::BackendClientConfig config_;

    std::atomic<bool> aborted_{false};

    // Client alive for the duration of run(); abort() stops it under the mutex
    std::mutex client_mutex_;
    httplib::Client* client_ = nullptr;
};

/// Stateless apart from config: every stream and call opens its own connection
class HttpBackendConnector final : public BackendConnector {
public:
    explicit HttpBackendConnector(control::BackendClientConfig config);

    [[nodiscard]] std::unique_ptr<BackendStream> open_stream(
        const core::BackendAddress& address) override;

    [[nodiscard]] CallResult call(const core::BackendAddress& address, std::string_view method,
                                  const nlohmann::json& payload) override;

    [[nodiscard]] const control::BackendClientConfig& config() const noexcept { return config_; }

private:
    const control::BackendClientConfig config_;
};

/// Best human-readable error from a backend error body ("error", then "detail", else raw)
[[nodiscard]] std::string extract_backend_message(std::string_view body);

}  // namespace sluice::gateway
