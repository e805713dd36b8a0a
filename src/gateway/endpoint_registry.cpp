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

// Prism Endpoint Registry - Implementation

#include "endpoint_registry.hpp"

#include <algorithm>

#include "../core/errors.hpp"

namespace prism::gateway {

// EndpointLease

EndpointLease::EndpointLease(EndpointLease&& other) noexcept
    : registry_(other.registry_), endpoint_id_(other.endpoint_id_) {
    other.registry_ = nullptr;
    other.endpoint_id_ = 0;
}

EndpointLease& EndpointLease::operator=(EndpointLease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        endpoint_id_ = other.endpoint_id_;
        other.registry_ = nullptr;
        other.endpoint_id_ = 0;
    }
    return *this;
}

void EndpointLease::release() noexcept {
    if (registry_) {
        registry_->release(endpoint_id_);
        registry_ = nullptr;
    }
}

// EndpointRegistry

std::error_code EndpointRegistry::register_endpoint(Endpoint endpoint, uint64_t& out_id) {
    if (endpoint.weight == 0 || endpoint.port == 0 || endpoint.max_load <= 0 ||
        endpoint.host.empty()) {
        return core::GatewayErrc::invalid_argument;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    endpoint.id = next_id_++;
    endpoint.current_load = 0;
    out_id = endpoint.id;
    endpoints_.push_back(std::move(endpoint));
    return {};
}

bool EndpointRegistry::deregister_endpoint(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [id](const Endpoint& e) { return e.id == id; });
    if (it == endpoints_.end()) {
        return false;
    }
    endpoints_.erase(it);
    return true;
}

std::vector<Endpoint> EndpointRegistry::snapshot(ProtocolKind protocol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Endpoint> result;
    for (const auto& endpoint : endpoints_) {
        if (endpoint.protocol == protocol) {
            result.push_back(endpoint);
        }
    }
    return result;
}

std::vector<Endpoint> EndpointRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_;
}

std::optional<Endpoint> EndpointRegistry::find(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& endpoint : endpoints_) {
        if (endpoint.id == id) {
            return endpoint;
        }
    }
    return std::nullopt;
}

bool EndpointRegistry::set_healthy(uint64_t id, bool healthy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* endpoint = find_locked(id);
    if (!endpoint) {
        return false;
    }
    endpoint->healthy = healthy;
    return true;
}

bool EndpointRegistry::acquire(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* endpoint = find_locked(id);
    if (!endpoint || !endpoint->has_capacity()) {
        return false;
    }
    endpoint->current_load++;
    return true;
}

void EndpointRegistry::release(uint64_t id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* endpoint = find_locked(id);
    if (endpoint && endpoint->current_load > 0) {
        endpoint->current_load--;
    }
}

EndpointLease EndpointRegistry::lease(uint64_t id) {
    if (!acquire(id)) {
        return {};
    }
    return EndpointLease(this, id);
}

size_t EndpointRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_.size();
}

size_t EndpointRegistry::healthy_count(ProtocolKind protocol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(endpoints_.begin(), endpoints_.end(), [protocol](const Endpoint& e) {
            return e.protocol == protocol && e.healthy;
        }));
}

Endpoint* EndpointRegistry::find_locked(uint64_t id) {
    for (auto& endpoint : endpoints_) {
        if (endpoint.id == id) {
            return &endpoint;
        }
    }
    return nullptr;
}

}  // namespace prism::gateway
