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

// Prism Endpoint Connector - Implementation

#include "connector.hpp"

#include <algorithm>
#include <mutex>

#include "../core/containers.hpp"
#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::gateway {

// AdapterSet

std::error_code AdapterSet::add(std::unique_ptr<protocol::ProtocolAdapter> adapter) {
    if (!adapter) {
        return core::GatewayErrc::invalid_argument;
    }
    std::unique_lock lock(mutex_);
    auto& slot = adapters_[protocol::index_of(adapter->kind())];
    if (slot) {
        return core::GatewayErrc::invalid_argument;
    }
    slot = std::move(adapter);
    return {};
}

protocol::ProtocolAdapter* AdapterSet::find(ProtocolKind protocol) const {
    std::shared_lock lock(mutex_);
    return adapters_[protocol::index_of(protocol)].get();
}

// EndpointConnector

EndpointConnector::EndpointConnector(EndpointRegistry& registry, LoadBalancer& balancer,
                                     AdapterSet& adapters, quill::Logger* logger)
    : registry_(registry),
      balancer_(balancer),
      adapters_(adapters),
      logger_(logger ? logger : logging::get_logger()) {}

std::error_code EndpointConnector::open(ProtocolKind protocol, Deadline deadline,
                                        std::shared_ptr<BoundConnection>& out) {
    auto* adapter = adapters_.find(protocol);
    if (!adapter) {
        return core::GatewayErrc::unsupported_protocol;
    }

    core::fast_set<uint64_t> excluded;
    std::error_code last_error;

    while (core::remaining_ms(deadline) > 0) {
        // Selection works on a snapshot; the registry lock is not held past this line
        auto candidates = registry_.snapshot(protocol);
        std::erase_if(candidates, [&](const Endpoint& e) { return excluded.contains(e.id); });

        const Endpoint* chosen = balancer_.select(protocol, candidates);
        if (!chosen) {
            break;
        }
        Endpoint target = *chosen;

        auto lease = registry_.lease(target.id);
        if (!lease) {
            excluded.insert(target.id);
            continue;
        }

        protocol::Connection conn;
        if (auto ec = adapter->connect(target, deadline, conn); ec) {
            LOG_WARNING(logger_, "Endpoint connect failed: protocol={}, endpoint={}, error={}",
                        protocol::to_string(protocol), target.address(), ec.message());
            excluded.insert(target.id);
            last_error = ec;
            continue;
        }

        LOG_DEBUG(logger_, "Bound connection opened: protocol={}, endpoint={}, connection_id={}",
                  protocol::to_string(protocol), target.address(), conn.id);
        out = std::make_shared<BoundConnection>(*adapter, std::move(conn), std::move(lease));
        return {};
    }

    if (last_error) {
        return core::GatewayErrc::transport_unavailable;
    }
    if (core::remaining_ms(deadline) <= 0 && !excluded.empty()) {
        return core::GatewayErrc::transport_unavailable;
    }
    LOG_WARNING(logger_, "No healthy endpoint: protocol={}", protocol::to_string(protocol));
    return core::GatewayErrc::no_healthy_endpoint;
}

}  // namespace prism::gateway
