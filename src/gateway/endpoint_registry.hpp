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

// Prism Endpoint Registry - Header
// Backend endpoints per protocol with health and load tracking

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

#include "../protocol/protocol.hpp"

namespace prism::gateway {

using protocol::Endpoint;
using protocol::ProtocolKind;

class EndpointRegistry;

/// One unit of load held on an endpoint. Releases it on destruction.
/// The registry must outlive its leases.
class EndpointLease {
public:
    EndpointLease() = default;
    EndpointLease(EndpointRegistry* registry, uint64_t endpoint_id) noexcept
        : registry_(registry), endpoint_id_(endpoint_id) {}
    ~EndpointLease() { release(); }

    // Non-copyable, movable
    EndpointLease(const EndpointLease&) = delete;
    EndpointLease& operator=(const EndpointLease&) = delete;
    EndpointLease(EndpointLease&& other) noexcept;
    EndpointLease& operator=(EndpointLease&& other) noexcept;

    /// Give the load back early (idempotent)
    void release() noexcept;

    [[nodiscard]] uint64_t endpoint_id() const noexcept { return endpoint_id_; }
    [[nodiscard]] explicit operator bool() const noexcept { return registry_ != nullptr; }

private:
    EndpointRegistry* registry_ = nullptr;
    uint64_t endpoint_id_ = 0;
};

/// Registry of backend endpoints. A single mutex guards `healthy` and
/// `current_load`; it is held only for the read or update itself, never
/// across a network call. Callers work on snapshots.
class EndpointRegistry {
public:
    EndpointRegistry() = default;
    ~EndpointRegistry() = default;

    // Non-copyable, non-movable (leases point here)
    EndpointRegistry(const EndpointRegistry&) = delete;
    EndpointRegistry& operator=(const EndpointRegistry&) = delete;

    /// Register an endpoint and assign its id. invalid_argument when
    /// weight == 0, port == 0, max_load <= 0 or host is empty.
    [[nodiscard]] std::error_code register_endpoint(Endpoint endpoint, uint64_t& out_id);

    /// Remove an endpoint. Outstanding leases become no-ops.
    bool deregister_endpoint(uint64_t id);

    /// Endpoints for one protocol, in registration order
    [[nodiscard]] std::vector<Endpoint> snapshot(ProtocolKind protocol) const;

    /// All endpoints, in registration order
    [[nodiscard]] std::vector<Endpoint> all() const;

    [[nodiscard]] std::optional<Endpoint> find(uint64_t id) const;

    /// Health checker entry point. Returns false for unknown ids.
    bool set_healthy(uint64_t id, bool healthy);

    /// Count one dispatch against the endpoint. False if it no longer exists
    /// or is already at max_load.
    [[nodiscard]] bool acquire(uint64_t id);

    /// Undo one acquire. Load never drops below zero.
    void release(uint64_t id) noexcept;

    /// acquire() wrapped in a lease; empty lease when the endpoint is gone or full
    [[nodiscard]] EndpointLease lease(uint64_t id);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t healthy_count(ProtocolKind protocol) const;

private:
    Endpoint* find_locked(uint64_t id);

    mutable std::mutex mutex_;
    std::vector<Endpoint> endpoints_;  // Registration order
    uint64_t next_id_ = 1;
};

}  // namespace prism::gateway
