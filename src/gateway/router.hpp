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

// Prism Protocol Router - Header
// Prioritized rules choosing the target protocol for a message

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../protocol/protocol.hpp"

namespace prism::gateway {

using protocol::Message;
using protocol::ProtocolKind;

/// Per-message routing input besides the message itself
struct RoutingContext {
    std::string session_id;
    ProtocolKind inbound_protocol = ProtocolKind::Http;
    std::optional<ProtocolKind> current_protocol;  // Session's protocol, if bound
    std::string identity;                          // Already-authenticated principal
    protocol::MetadataList attributes;

    [[nodiscard]] std::optional<std::string_view> find_attribute(std::string_view name) const;
};

/// Rule predicate. Must be pure: no side effects, no hidden state.
using RouteCondition = std::function<bool(const Message&, const RoutingContext&)>;

/// Routing rule (immutable once registered)
struct RoutingRule {
    RouteCondition condition;  // Empty condition matches everything
    ProtocolKind target = ProtocolKind::Http;
    int32_t priority = 0;  // Higher priority = checked first
    std::string description;
};

/// Outcome of a routing decision
struct RouteDecision {
    ProtocolKind protocol = ProtocolKind::Http;
    bool matched = false;  // False when the default protocol was used
    std::string rule;      // Description of the rule that fired
    int32_t priority = 0;
};

/// Protocol router. Rules are kept sorted by descending priority; rules with
/// equal priority keep registration order. route() is deterministic.
class ProtocolRouter {
public:
    explicit ProtocolRouter(ProtocolKind default_protocol = ProtocolKind::Http);
    ~ProtocolRouter() = default;

    // Non-copyable, non-movable (guarded by a mutex)
    ProtocolRouter(const ProtocolRouter&) = delete;
    ProtocolRouter& operator=(const ProtocolRouter&) = delete;

    /// Register a rule
    void add_rule(RoutingRule rule);

    /// Target protocol for the message: first matching rule, else the default
    [[nodiscard]] ProtocolKind route(const Message& message, const RoutingContext& context) const;

    /// Same as route() but reports which rule fired
    [[nodiscard]] RouteDecision decide(const Message& message,
                                       const RoutingContext& context) const;

    [[nodiscard]] ProtocolKind default_protocol() const;
    void set_default_protocol(ProtocolKind protocol);

    [[nodiscard]] size_t rule_count() const;

    /// Rule descriptions in evaluation order
    [[nodiscard]] std::vector<std::string> describe() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<RoutingRule> rules_;
    ProtocolKind default_protocol_;
};

}  // namespace prism::gateway
