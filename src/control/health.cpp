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

// Prism Health Checks - Implementation

#include "health.hpp"

#include <algorithm>
#include <system_error>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::control {

HealthChecker::HealthChecker(gateway::EndpointRegistry& registry, gateway::AdapterSet& adapters,
                             HealthCheckOptions options, quill::Logger* logger)
    : registry_(registry),
      adapters_(adapters),
      options_(options),
      logger_(logger ? logger : logging::get_logger()) {}

HealthChecker::~HealthChecker() {
    stop();
}

void HealthChecker::start() {
    if (!options_.enabled || running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    start_time_ = std::chrono::steady_clock::now();
    thread_ = std::thread([this] { run_loop(); });
    LOG_INFO(logger_, "Health checker started: interval_s={}, timeout_ms={}",
             options_.interval.count(), options_.timeout.count());
}

void HealthChecker::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO(logger_, "Health checker stopped");
}

void HealthChecker::set_observer(ProbeObserver observer) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    observer_ = std::move(observer);
}

BackendHealth HealthChecker::check_endpoint(const Endpoint& endpoint) const {
    BackendHealth health;
    health.endpoint_id = endpoint.id;
    health.protocol = endpoint.protocol;
    health.host = endpoint.host;
    health.port = endpoint.port;
    health.last_check_time = std::chrono::system_clock::now();

    auto* adapter = adapters_.find(endpoint.protocol);
    if (!adapter) {
        health.healthy = false;
        health.last_error = std::error_code(core::GatewayErrc::unsupported_protocol).message();
        return health;
    }

    auto start = std::chrono::steady_clock::now();
    protocol::Connection conn;
    auto ec = adapter->connect(endpoint, core::deadline_after(options_.timeout), conn);
    if (!ec) {
        adapter->disconnect(conn);
    }
    health.last_check_latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    health.healthy = !ec;
    if (ec) {
        health.last_error = ec.message();
    }
    return health;
}

size_t HealthChecker::check_now() {
    std::lock_guard<std::mutex> round(round_mutex_);

    // Snapshot first: the registry lock is never held across a probe
    auto endpoints = registry_.all();
    std::vector<BackendHealth> results(endpoints.size());

    std::vector<std::thread> probes;
    probes.reserve(endpoints.size());
    for (size_t i = 0; i < endpoints.size(); ++i) {
        try {
            probes.emplace_back([this, &endpoints, &results, i] {
                results[i] = check_endpoint(endpoints[i]);
            });
        } catch (const std::system_error& e) {
            // Out of threads: probe this one inline, started probes still get joined
            LOG_WARNING(logger_, "Health probe thread failed: endpoint={}, error={}",
                        endpoints[i].address(), e.what());
            results[i] = check_endpoint(endpoints[i]);
        }
    }
    for (auto& probe : probes) {
        probe.join();
    }

    size_t healthy = 0;
    for (const auto& result : results) {
        if (!registry_.set_healthy(result.endpoint_id, result.healthy)) {
            continue;  // Deregistered while probing
        }
        if (result.healthy) {
            healthy++;
        }
        record(result);
    }
    prune_stats();
    return healthy;
}

void HealthChecker::prune_stats() {
    core::fast_set<uint64_t> live;
    for (const auto& endpoint : registry_.all()) {
        live.insert(endpoint.id);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    std::vector<uint64_t> stale;
    for (const auto& [id, entry] : stats_) {
        if (!live.contains(id)) {
            stale.push_back(id);
        }
    }
    for (auto id : stale) {
        stats_.erase(id);
    }
}

size_t HealthChecker::tracked_endpoints() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_.size();
}

void HealthChecker::record(const BackendHealth& result) {
    ProbeObserver observer;
    BackendHealth updated;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        auto [it, inserted] = stats_.try_emplace(result.endpoint_id, result);
        auto& entry = it->second;
        changed = inserted || entry.healthy != result.healthy;
        if (!inserted) {
            entry.healthy = result.healthy;
            entry.last_check_latency = result.last_check_latency;
            entry.last_check_time = result.last_check_time;
            entry.last_error = result.last_error;
        } else {
            entry.successful_checks = 0;
            entry.failed_checks = 0;
        }
        if (result.healthy) {
            entry.successful_checks++;
            entry.last_error.clear();
        } else {
            entry.failed_checks++;
        }
        updated = entry;
        observer = observer_;
    }

    if (changed) {
        LOG_ENDPOINT_EVENT(logger_, updated.healthy ? "healthy" : "unhealthy", updated.endpoint_id,
                           updated.host, updated.port, protocol::to_string(updated.protocol));
    }
    if (!updated.healthy) {
        LOG_DEBUG(logger_, "Health probe failed: endpoint={}:{}, error={}", updated.host,
                  updated.port, updated.last_error);
    }
    if (observer) {
        observer(updated);
    }
}

GatewayHealth HealthChecker::get_health() const {
    GatewayHealth health;
    health.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);

    auto endpoints = registry_.all();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        for (const auto& endpoint : endpoints) {
            auto it = stats_.find(endpoint.id);
            if (it != stats_.end()) {
                health.backends.push_back(it->second);
                health.backends.back().healthy = endpoint.healthy;
                continue;
            }
            // Registered but not probed yet
            BackendHealth pending;
            pending.endpoint_id = endpoint.id;
            pending.protocol = endpoint.protocol;
            pending.host = endpoint.host;
            pending.port = endpoint.port;
            pending.healthy = endpoint.healthy;
            health.backends.push_back(std::move(pending));
        }
    }

    for (auto kind : protocol::kAllProtocols) {
        ProtocolHealth rollup;
        rollup.protocol = kind;
        for (const auto& endpoint : endpoints) {
            if (endpoint.protocol != kind) {
                continue;
            }
            rollup.total_endpoints++;
            if (endpoint.healthy) {
                rollup.healthy_endpoints++;
            }
        }
        if (rollup.total_endpoints == 0) {
            continue;
        }

        if (rollup.healthy_endpoints == 0) {
            rollup.status = HealthStatus::Unhealthy;
        } else if (rollup.healthy_endpoints < rollup.total_endpoints) {
            rollup.status = HealthStatus::Degraded;
        } else {
            rollup.status = HealthStatus::Healthy;
        }
        health.status = std::max(health.status, rollup.status);
        health.protocols.push_back(rollup);
    }

    return health;
}

void HealthChecker::run_loop() {
    while (running_.load(std::memory_order_acquire)) {
        size_t healthy = check_now();
        LOG_DEBUG(logger_, "Health round complete: healthy={}, total={}", healthy,
                  registry_.size());

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, options_.interval,
                          [this] { return !running_.load(std::memory_order_acquire); });
    }
}

// HealthResponse

nlohmann::json HealthResponse::to_json(const BackendHealth& backend) {
    return {
        {"endpoint_id", backend.endpoint_id},
        {"protocol", std::string(protocol::to_string(backend.protocol))},
        {"address", backend.host + ":" + std::to_string(backend.port)},
        {"healthy", backend.healthy},
        {"successful_checks", backend.successful_checks},
        {"failed_checks", backend.failed_checks},
        {"last_check_latency_ms", backend.last_check_latency.count()},
        {"last_error", backend.last_error},
    };
}

nlohmann::json HealthResponse::to_json(const GatewayHealth& health) {
    nlohmann::json out;
    out["status"] = std::string(to_string(health.status));
    out["uptime_seconds"] = health.uptime.count();

    auto protocols = nlohmann::json::array();
    for (const auto& rollup : health.protocols) {
        protocols.push_back({
            {"protocol", std::string(protocol::to_string(rollup.protocol))},
            {"status", std::string(to_string(rollup.status))},
            {"healthy_endpoints", rollup.healthy_endpoints},
            {"total_endpoints", rollup.total_endpoints},
        });
    }
    out["protocols"] = std::move(protocols);

    auto backends = nlohmann::json::array();
    for (const auto& backend : health.backends) {
        backends.push_back(to_json(backend));
    }
    out["endpoints"] = std::move(backends);
    return out;
}

}  // namespace prism::control
