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

// Prism Endpoint Connector - Header
// Picks an endpoint, takes a load lease and opens a bound connection

#pragma once

#include <array>
#include <memory>
#include <shared_mutex>
#include <system_error>

#include "endpoint_registry.hpp"
#include "load_balancer.hpp"
#include "migrator.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

/// One adapter per protocol. Adapters are registered once and never
/// replaced, so references handed out stay valid for the set's lifetime.
class AdapterSet {
public:
    AdapterSet() = default;

    AdapterSet(const AdapterSet&) = delete;
    AdapterSet& operator=(const AdapterSet&) = delete;

    /// invalid_argument when the adapter is null or its protocol already has one
    [[nodiscard]] std::error_code add(std::unique_ptr<protocol::ProtocolAdapter> adapter);

    [[nodiscard]] protocol::ProtocolAdapter* find(ProtocolKind protocol) const;
    [[nodiscard]] bool supports(ProtocolKind protocol) const { return find(protocol) != nullptr; }

private:
    mutable std::shared_mutex mutex_;
    std::array<std::unique_ptr<protocol::ProtocolAdapter>, protocol::kProtocolCount> adapters_;
};

/// ConnectionOpener over the registry and load balancer. An endpoint that
/// refuses the connection is skipped and the next candidate tried until the
/// deadline passes or none remain.
class EndpointConnector final : public ConnectionOpener {
public:
    EndpointConnector(EndpointRegistry& registry, LoadBalancer& balancer, AdapterSet& adapters,
                      quill::Logger* logger = nullptr);

    /// unsupported_protocol without an adapter; no_healthy_endpoint when no
    /// endpoint is eligible; transport_unavailable when every candidate failed
    [[nodiscard]] std::error_code open(ProtocolKind protocol, Deadline deadline,
                                       std::shared_ptr<BoundConnection>& out) override;

private:
    EndpointRegistry& registry_;
    LoadBalancer& balancer_;
    AdapterSet& adapters_;
    quill::Logger* logger_;
};

}  // namespace prism::gateway
