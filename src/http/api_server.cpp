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

// Sluice API Server - Implementation

#include "api_server.hpp"

#include <httplib.h>

#include <exception>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/session_id.hpp"
#include "sse.hpp"

namespace sluice::http {

namespace {

constexpr const char* kJson = "application/json";

void write_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

/// Parse a JSON object body; an empty body counts as {}
std::optional<nlohmann::json> parse_object(const httplib::Request& req, httplib::Response& res) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }

    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        write_error(res, core::Errc::InvalidRequest, "request body must be a JSON object");
        return std::nullopt;
    }
    return body;
}

/// Required non-empty string field
std::optional<std::string> string_field(const nlohmann::json& body, const char* key,
                                        httplib::Response& res) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        write_error(res, core::Errc::InvalidRequest,
                    fmt::format("missing or empty string field '{}'", key));
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

// ============================
// SseClientSink
// ============================

bool SseClientSink::write(const std::string& chunk) {
    if (failed_) {
        return false;
    }
    if (!sink_.write(chunk.data(), chunk.size())) {
        failed_ = true;
    }
    return !failed_;
}

bool SseClientSink::send_frame(std::string_view frame) {
    return write(encode_data(frame));
}

bool SseClientSink::send_heartbeat() {
    return write(encode_heartbeat());
}

bool SseClientSink::send_end(gateway::CloseReason reason) {
    nlohmann::json data = {{"reason", gateway::to_string(reason)}};
    return write(encode_event("end", data.dump()));
}

bool SseClientSink::is_connected() const {
    return !failed_ && (!sink_.is_writable || sink_.is_writable());
}

void write_error(httplib::Response& res, const std::error_code& ec, std::string_view message) {
    write_json(res, core::to_http_status(ec),
               {{"error", core::error_name(ec)}, {"message", message}});
}

// ============================
// ApiServer
// ============================

ApiServer::ApiServer(const control::ServerConfig& config, control::Registry& registry,
                     gateway::DataPlane& data_plane)
    : config_(config),
      registry_(registry),
      data_plane_(data_plane),
      server_(std::make_unique<httplib::Server>()) {
    size_t workers = config_.worker_threads > 0 ? config_.worker_threads : 1;
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server_->set_read_timeout(std::chrono::milliseconds(config_.read_timeout_ms));
    server_->set_write_timeout(std::chrono::milliseconds(config_.write_timeout_ms));
    server_->set_payload_max_length(config_.max_request_size);

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
            auto* logger = logging::get_logger();
            LOG_ERROR(logger, "Handler exception: method={}, path={}, error={}", req.method,
                      req.path, what);
            write_json(res, 500, {{"error", "InternalError"}, {"message", what}});
        });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        auto* logger = logging::get_logger();
        LOG_DEBUG(logger, "HTTP {} {} -> {}", req.method, req.path, res.status);
    });

    register_routes();
}

ApiServer::~ApiServer() {
    stop();
}

std::error_code ApiServer::bind() {
    if (config_.listen_port == 0) {
        port_ = server_->bind_to_any_port(config_.listen_address);
    } else if (server_->bind_to_port(config_.listen_address, config_.listen_port)) {
        port_ = config_.listen_port;
    } else {
        port_ = -1;
    }

    if (port_ < 0) {
        return std::make_error_code(std::errc::address_in_use);
    }

    auto* logger = logging::get_logger();
    LOG_INFO(logger, "API server bound: address={}, port={}, workers={}", config_.listen_address,
             port_, config_.worker_threads);
    return {};
}

bool ApiServer::run() {
    return server_->listen_after_bind();
}

void ApiServer::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
}

bool ApiServer::is_running() const {
    return server_->is_running();
}

void ApiServer::register_routes() {
    auto* logger = logging::get_logger();

    // --- Control plane ---

    server_->Post("/control/register", [this](const httplib::Request& req,
                                              httplib::Response& res) {
        auto body = parse_object(req, res);
        if (!body) return;
        auto name = string_field(*body, "name", res);
        if (!name) return;
        auto base_url = string_field(*body, "base_url", res);
        if (!base_url) return;

        nlohmann::json meta = body->value("meta", nlohmann::json::object());
        if (auto ec = registry_.register_backend(*name, *base_url, std::move(meta))) {
            write_error(res, ec,
                        ec == core::Errc::NameAlreadyRegistered
                            ? "name already registered"
                            : fmt::format("cannot register '{}' at '{}'", *name, *base_url));
            return;
        }
        write_json(res, 200, {{"status", "ok"}, {"registered", *name}});
    });

    server_->Post("/control/unregister", [this](const httplib::Request& req,
                                                httplib::Response& res) {
        auto body = parse_object(req, res);
        if (!body) return;
        auto name = string_field(*body, "name", res);
        if (!name) return;

        if (auto ec = registry_.unregister(*name)) {
            write_error(res, ec, "name not found");
            return;
        }
        write_json(res, 200, {{"status", "ok"}, {"unregistered", *name}});
    });

    server_->Get("/control/list", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json servers = nlohmann::json::object();
        for (const auto& registration : registry_.list()) {
            servers[registration.name] = {{"url", registration.base_url},
                                          {"meta", registration.meta},
                                          {"registered_at", registration.registered_at}};
        }
        write_json(res, 200, {{"servers", servers}});
    });

    // --- Data plane ---

    server_->Post("/data/connect", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = parse_object(req, res);
        if (!body) return;
        auto server = string_field(*body, "server", res);
        if (!server) return;

        auto result = data_plane_.connect(*server);
        if (result.error) {
            write_error(res, result.error, result.message);
            return;
        }
        write_json(res, 200, {{"session_id", result.session_id}, {"server", result.backend_name}});
    });

    server_->Get(R"(/data/stream/([^/]+))", [this](const httplib::Request& req,
                                                   httplib::Response& res) {
        std::string session_id = req.matches[1];
        if (!core::is_valid_session_id(session_id)) {
            write_error(res, core::Errc::SessionNotFound, "session not found");
            return;
        }

        // The stream slot is taken here, while a 404/409 can still be answered
        std::error_code ec;
        auto session = data_plane_.reserve_stream(session_id, ec);
        if (!session) {
            write_error(res, ec,
                        ec == core::Errc::SessionBusy ? "session already has a stream attached"
                                                      : "session not found");
            return;
        }

        // Cleared by the provider; still set in the releaser if it never ran
        auto pending = std::make_shared<bool>(true);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, session, pending](size_t, httplib::DataSink& sink) {
                if (!*pending) {
                    return false;
                }
                *pending = false;

                SseClientSink client(sink);
                auto result = data_plane_.deliver_stream(*session, client);
                if (result.error) {
                    auto* logger = logging::get_logger();
                    LOG_DEBUG(logger, "Stream ended: session_id={}, error={}", session->id(),
                              core::error_name(result.error));
                    return false;
                }
                sink.done();
                return true;
            },
            [session, pending](bool) {
                if (*pending) {
                    session->detach_publisher();
                }
            });
    });

    server_->Post(R"(/data/request/([^/]+)/([^/]+))", [this](const httplib::Request& req,
                                                             httplib::Response& res) {
        std::string session_id = req.matches[1];
        std::string method = req.matches[2];
        if (!core::is_valid_session_id(session_id)) {
            write_error(res, core::Errc::SessionNotFound, "session not found");
            return;
        }

        auto body = parse_object(req, res);
        if (!body) return;

        auto result = data_plane_.call(session_id, method, *body);
        if (result.ok()) {
            write_json(res, 200, result.body);
            return;
        }

        if (result.error == core::Errc::BackendCallError) {
            // Backend's own status passes through
            int status = (result.status >= 400 && result.status <= 599) ? result.status : 502;
            write_json(res, status, {{"error", core::error_name(result.error)},
                                     {"code", result.status},
                                     {"message", result.message}});
            return;
        }
        write_error(res, result.error, result.message);
    });

    server_->Delete(R"(/data/session/([^/]+))", [this](const httplib::Request& req,
                                                       httplib::Response& res) {
        std::string session_id = req.matches[1];
        if (!core::is_valid_session_id(session_id)) {
            write_error(res, core::Errc::SessionNotFound, "session not found");
            return;
        }
        if (auto ec = data_plane_.close_session(session_id)) {
            write_error(res, ec, "session not found");
            return;
        }
        write_json(res, 200, {{"status", "ok"}, {"closed", session_id}});
    });

    // --- Health ---

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"status", data_plane_.is_accepting() ? "ok" : "shutting_down"},
            {"sessions", data_plane_.sessions().size()},
            {"registrations", registry_.size()},
            {"metrics", data_plane_.metrics().snapshot()}};
        write_json(res, 200, body);
    });

    LOG_DEBUG(logger, "API routes registered");
}

}  // namespace sluice::http
