/*
 * Copyright 2025 Prism Contributors
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

// Prism Protocol Gateway - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "gateway/factory.hpp"

namespace {

std::atomic<bool> g_running{true};

// Idle sessions are reaped on this cadence
constexpr auto kMaintenanceInterval = std::chrono::seconds(1);

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

int main(int argc, char* argv[]) {
    printf("Prism Protocol Gateway v0.1.0\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json> [--check]\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    bool check_only = false;
    for (int i = 3; i < argc; ++i) {
        if (std::string(argv[i]) == "--check") {
            check_only = true;
        }
    }

    printf("Loading configuration from %s...\n", config_path.c_str());
    auto config = prism::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    auto validation = prism::control::ConfigLoader::validate(*config);
    for (const auto& warning : validation.warnings) {
        printf("  warning: %s\n", warning.c_str());
    }
    if (check_only) {
        printf("Configuration OK\n");
        return EXIT_SUCCESS;
    }

    prism::logging::init_logging_system();
    auto* logger = prism::logging::init_logger(config->logging);

    auto gateway = prism::gateway::build_gateway(*config, nullptr, nullptr, logger);
    if (!gateway) {
        fprintf(stderr, "Failed to build gateway\n");
        prism::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    if (auto ec = prism::gateway::start_listeners(*gateway, *config); ec) {
        fprintf(stderr, "Listener error: %s\n", ec.message().c_str());
        if (auto shutdown_ec = gateway->shutdown(std::chrono::milliseconds(0)); shutdown_ec) {
            fprintf(stderr, "Shutdown error: %s\n", shutdown_ec.message().c_str());
        }
        prism::logging::shutdown_logging();
        return EXIT_FAILURE;
    }
    for (const auto& listener : config->listeners) {
        printf("Listening: %s on %s:%u\n", listener.protocol.c_str(), listener.address.c_str(),
               listener.port);
    }

    gateway->start_health_checks();

    while (g_running.load()) {
        std::this_thread::sleep_for(kMaintenanceInterval);
        gateway->reap_idle_sessions();
    }

    printf("\nReceived shutdown signal, draining sessions...\n");
    auto timeout = std::chrono::milliseconds(config->gateway.shutdown_timeout_ms);
    if (auto ec = gateway->shutdown(timeout); ec) {
        fprintf(stderr, "Shutdown error: %s\n", ec.message().c_str());
    }
    gateway.reset();

    printf("Prism stopped.\n");
    prism::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
