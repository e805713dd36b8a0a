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

// Prism Load Balancer - Implementation

#include "load_balancer.hpp"

#include <vector>

namespace prism::gateway {

namespace {

std::vector<const Endpoint*> healthy_for(ProtocolKind protocol,
                                         std::span<const Endpoint> endpoints) {
    std::vector<const Endpoint*> available;
    available.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
        if (endpoint.protocol == protocol && endpoint.healthy) {
            available.push_back(&endpoint);
        }
    }
    return available;
}

}  // namespace

std::optional<BalancingStrategy> parse_balancing_strategy(std::string_view name) {
    if (name == "round_robin") return BalancingStrategy::RoundRobin;
    if (name == "weighted_random") return BalancingStrategy::WeightedRandom;
    if (name == "least_connections") return BalancingStrategy::LeastConnections;
    return std::nullopt;
}

const Endpoint* RoundRobinBalancer::select(ProtocolKind protocol,
                                           std::span<const Endpoint> endpoints) {
    auto available = healthy_for(protocol, endpoints);
    if (available.empty()) {
        return nullptr;
    }

    auto& counter = counters_[protocol::index_of(protocol)];
    uint64_t index = counter.fetch_add(1, std::memory_order_relaxed) % available.size();
    return available[index];
}

const Endpoint* WeightedRandomBalancer::select(ProtocolKind protocol,
                                               std::span<const Endpoint> endpoints) {
    auto available = healthy_for(protocol, endpoints);
    if (available.empty()) {
        return nullptr;
    }

    uint64_t total_weight = 0;
    for (const auto* endpoint : available) {
        total_weight += endpoint->weight;
    }
    if (total_weight == 0) {
        return available.front();
    }

    uint64_t draw = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<uint64_t> dist(0, total_weight - 1);
        draw = dist(rng_);
    }

    // Walk the cumulative weights
    for (const auto* endpoint : available) {
        if (draw < endpoint->weight) {
            return endpoint;
        }
        draw -= endpoint->weight;
    }
    return available.back();
}

const Endpoint* LeastConnectionsBalancer::select(ProtocolKind protocol,
                                                 std::span<const Endpoint> endpoints) {
    const Endpoint* selected = nullptr;
    for (const auto& endpoint : endpoints) {
        if (endpoint.protocol != protocol || !endpoint.healthy || !endpoint.has_capacity()) {
            continue;
        }
        // Strict comparison keeps the earliest registered on ties
        if (!selected || endpoint.current_load < selected->current_load) {
            selected = &endpoint;
        }
    }
    return selected;
}

std::unique_ptr<LoadBalancer> make_balancer(BalancingStrategy strategy) {
    switch (strategy) {
        case BalancingStrategy::RoundRobin:
            return std::make_unique<RoundRobinBalancer>();
        case BalancingStrategy::WeightedRandom:
            return std::make_unique<WeightedRandomBalancer>();
        case BalancingStrategy::LeastConnections:
            return std::make_unique<LeastConnectionsBalancer>();
    }
    return std::make_unique<RoundRobinBalancer>();
}

}  // namespace prism::gateway
