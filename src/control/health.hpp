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

// Prism Health Checks - Header
// Periodic endpoint probes and health reporting

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/containers.hpp"
#include "../gateway/connector.hpp"
#include "../gateway/endpoint_registry.hpp"

namespace quill {
class Logger;
}

namespace prism::control {

using protocol::Endpoint;
using protocol::ProtocolKind;

/// Health status levels
enum class HealthStatus {
    Healthy,    // Every endpoint answers
    Degraded,   // Some endpoints down
    Unhealthy   // No endpoint answers
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

struct HealthCheckOptions {
    bool enabled = true;
    std::chrono::seconds interval{30};
    std::chrono::milliseconds timeout{2000};  // Per probe
};

/// Probe statistics for one endpoint
struct BackendHealth {
    uint64_t endpoint_id = 0;
    ProtocolKind protocol = ProtocolKind::Http;
    std::string host;
    uint16_t port = 0;
    bool healthy = false;
    uint64_t successful_checks = 0;
    uint64_t failed_checks = 0;
    std::chrono::milliseconds last_check_latency{0};
    std::chrono::system_clock::time_point last_check_time;
    std::string last_error;
};

/// Per-protocol rollup
struct ProtocolHealth {
    ProtocolKind protocol = ProtocolKind::Http;
    HealthStatus status = HealthStatus::Healthy;
    size_t healthy_endpoints = 0;
    size_t total_endpoints = 0;
};

/// Gateway health information
struct GatewayHealth {
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::seconds uptime{0};
    std::vector<ProtocolHealth> protocols;  // Only protocols with endpoints
    std::vector<BackendHealth> backends;
};

/// Called after every probe with the updated statistics
using ProbeObserver = std::function<void(const BackendHealth&)>;

/// Health checker. The only writer of Endpoint::healthy: every interval each
/// endpoint gets connect() then disconnect() through its protocol's adapter,
/// bounded by the probe timeout. Probes within a round run concurrently and
/// no registry lock is held while they run.
class HealthChecker {
public:
    HealthChecker(gateway::EndpointRegistry& registry, gateway::AdapterSet& adapters,
                  HealthCheckOptions options = {}, quill::Logger* logger = nullptr);
    ~HealthChecker();

    // Non-copyable, non-movable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Start the background probe loop (no-op when disabled or running)
    void start();

    /// Stop the probe loop and wait for the current round
    void stop();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    void set_observer(ProbeObserver observer);

    /// Probe one endpoint without touching the registry
    [[nodiscard]] BackendHealth check_endpoint(const Endpoint& endpoint) const;

    /// Run one round now: probe every endpoint and update the registry.
    /// Returns the number of healthy endpoints.
    size_t check_now();

    [[nodiscard]] GatewayHealth get_health() const;

    /// Endpoints with probe statistics. Deregistered ones drop out after the next round.
    [[nodiscard]] size_t tracked_endpoints() const;

    [[nodiscard]] const HealthCheckOptions& options() const noexcept { return options_; }

private:
    void run_loop();
    void record(const BackendHealth& result);
    void prune_stats();

    gateway::EndpointRegistry& registry_;
    gateway::AdapterSet& adapters_;
    HealthCheckOptions options_;
    quill::Logger* logger_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex round_mutex_;  // One round at a time

    mutable std::mutex stats_mutex_;
    core::fast_map<uint64_t, BackendHealth> stats_;
    ProbeObserver observer_;

    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

/// JSON rendering of health information
class HealthResponse {
public:
    [[nodiscard]] static nlohmann::json to_json(const GatewayHealth& health);
    [[nodiscard]] static nlohmann::json to_json(const BackendHealth& backend);
};

}  // namespace prism::control
