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

// Prism Load Balancer - Header
// Endpoint selection strategies

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string_view>

#include "../protocol/protocol.hpp"

namespace prism::gateway {

using protocol::Endpoint;
using protocol::ProtocolKind;

/// Load balancing strategy
enum class BalancingStrategy : uint8_t {
    RoundRobin,       // Cycle through healthy endpoints in registration order
    WeightedRandom,   // Probability proportional to weight
    LeastConnections  // Smallest current_load below max_load
};

[[nodiscard]] constexpr std::string_view to_string(BalancingStrategy strategy) noexcept {
    switch (strategy) {
        case BalancingStrategy::RoundRobin:
            return "round_robin";
        case BalancingStrategy::WeightedRandom:
            return "weighted_random";
        case BalancingStrategy::LeastConnections:
            return "least_connections";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BalancingStrategy> parse_balancing_strategy(std::string_view name);

/// Load balancer interface. Selection only considers endpoints of `protocol`
/// that are healthy; it never falls back to an unhealthy one.
class LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    /// Pick an endpoint, or nullptr when none qualifies.
    /// The pointer refers into `endpoints`.
    [[nodiscard]] virtual const Endpoint* select(ProtocolKind protocol,
                                                 std::span<const Endpoint> endpoints) = 0;

    [[nodiscard]] virtual BalancingStrategy strategy() const noexcept = 0;
};

/// Round-robin with one counter per protocol
class RoundRobinBalancer final : public LoadBalancer {
public:
    const Endpoint* select(ProtocolKind protocol, std::span<const Endpoint> endpoints) override;

    [[nodiscard]] BalancingStrategy strategy() const noexcept override {
        return BalancingStrategy::RoundRobin;
    }

private:
    std::array<std::atomic<uint64_t>, protocol::kProtocolCount> counters_{};
};

/// Weighted random selection
class WeightedRandomBalancer final : public LoadBalancer {
public:
    WeightedRandomBalancer() : rng_(std::random_device{}()) {}
    explicit WeightedRandomBalancer(uint64_t seed) : rng_(seed) {}

    const Endpoint* select(ProtocolKind protocol, std::span<const Endpoint> endpoints) override;

    [[nodiscard]] BalancingStrategy strategy() const noexcept override {
        return BalancingStrategy::WeightedRandom;
    }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

/// Least connections; ties go to the earliest registered endpoint
class LeastConnectionsBalancer final : public LoadBalancer {
public:
    const Endpoint* select(ProtocolKind protocol, std::span<const Endpoint> endpoints) override;

    [[nodiscard]] BalancingStrategy strategy() const noexcept override {
        return BalancingStrategy::LeastConnections;
    }
};

/// Create a balancer for a strategy
[[nodiscard]] std::unique_ptr<LoadBalancer> make_balancer(BalancingStrategy strategy);

}  // namespace prism::gateway
