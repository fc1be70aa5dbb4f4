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

// Sluice Stream Gateway - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "control/registry.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "gateway/data_plane.hpp"
#include "gateway/http_backend_connector.hpp"
#include "http/api_server.hpp"

namespace {
std::atomic<bool> g_running{true};
}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

int main(int argc, char* argv[]) {
    printf("Sluice Stream Gateway v0.1.0\n");
    printf("Session-oriented SSE gateway for registered backends\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    printf("Loading configuration from %s...\n", config_path.c_str());

    sluice::control::ValidationResult validation;
    auto config_opt = sluice::control::ConfigLoader::load_from_file(config_path, &validation);
    if (!config_opt) {
        fprintf(stderr, "Failed to load configuration\n");
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }

    const sluice::control::Config& config = *config_opt;

    sluice::logging::init_logging_system();
    auto* logger = sluice::logging::init_logger(config.logging);
    LOG_INFO(logger, "Sluice starting: config={}, version={}", config_path, config.version);

    // Control plane
    sluice::control::Registry registry;
    for (const auto& registration : config.registrations) {
        if (auto ec = registry.register_backend(registration.name, registration.base_url,
                                                registration.meta)) {
            fprintf(stderr, "Failed to register backend '%s': %s\n", registration.name.c_str(),
                    std::string(sluice::core::error_name(ec)).c_str());
            sluice::logging::shutdown_logging();
            return EXIT_FAILURE;
        }
    }

    // Data plane
    sluice::gateway::HttpBackendConnector connector(config.backend);
    sluice::gateway::DataPlane data_plane(registry, connector, config.session);

    sluice::http::ApiServer server(config.server, registry, data_plane);
    if (auto ec = server.bind()) {
        fprintf(stderr, "Failed to bind %s:%u: %s\n", config.server.listen_address.c_str(),
                config.server.listen_port, ec.message().c_str());
        LOG_ERROR(logger, "Bind failed: address={}, port={}, error={}",
                  config.server.listen_address, config.server.listen_port, ec.message());
        sluice::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Listening on %s:%d (%u workers)\n", config.server.listen_address.c_str(), server.port(),
           config.server.worker_threads);

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    std::atomic<bool> server_failed{false};
    std::thread server_thread([&server, &server_failed] {
        if (!server.run()) {
            server_failed = true;
            g_running = false;
        }
    });

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    printf("\nShutting down...\n");
    LOG_INFO(logger, "Shutdown requested: sessions={}", data_plane.sessions().size());

    // Cancel streams first so workers blocked in publishers return, then stop accepting
    data_plane.shutdown();
    server.stop();
    server_thread.join();

    LOG_INFO(logger, "Sluice stopped");
    sluice::logging::shutdown_logging();

    if (server_failed) {
        fprintf(stderr, "Server error: listener exited unexpectedly\n");
        return EXIT_FAILURE;
    }

    printf("Sluice stopped.\n");
    return EXIT_SUCCESS;
}
