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

// Prism Protocol Router - Implementation

#include "router.hpp"

#include <algorithm>
#include <mutex>

namespace prism::gateway {

std::optional<std::string_view> RoutingContext::find_attribute(std::string_view name) const {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

ProtocolRouter::ProtocolRouter(ProtocolKind default_protocol)
    : default_protocol_(default_protocol) {}

void ProtocolRouter::add_rule(RoutingRule rule) {
    std::unique_lock lock(mutex_);
    // Insert after every rule with priority >= the new one (stable by registration)
    auto pos = std::upper_bound(
        rules_.begin(), rules_.end(), rule.priority,
        [](int32_t priority, const RoutingRule& existing) { return priority > existing.priority; });
    rules_.insert(pos, std::move(rule));
}

ProtocolKind ProtocolRouter::route(const Message& message, const RoutingContext& context) const {
    return decide(message, context).protocol;
}

RouteDecision ProtocolRouter::decide(const Message& message, const RoutingContext& context) const {
    std::shared_lock lock(mutex_);

    for (const auto& rule : rules_) {
        if (!rule.condition || rule.condition(message, context)) {
            return RouteDecision{rule.target, true, rule.description, rule.priority};
        }
    }
    return RouteDecision{default_protocol_, false, {}, 0};
}

ProtocolKind ProtocolRouter::default_protocol() const {
    std::shared_lock lock(mutex_);
    return default_protocol_;
}

void ProtocolRouter::set_default_protocol(ProtocolKind protocol) {
    std::unique_lock lock(mutex_);
    default_protocol_ = protocol;
}

size_t ProtocolRouter::rule_count() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

std::vector<std::string> ProtocolRouter::describe() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(rules_.size());
    for (const auto& rule : rules_) {
        result.push_back(rule.description);
    }
    return result;
}

}  // namespace prism::gateway
