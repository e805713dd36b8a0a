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

// Gateway Component Factory - Header
// Factory functions for building the gateway from configuration

#pragma once

#include <memory>
#include <optional>
#include <system_error>

#include "../control/config.hpp"
#include "events.hpp"
#include "gateway.hpp"
#include "handler.hpp"
#include "router.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

/// Compile a declarative condition into a routing predicate.
/// nullopt when a regex or protocol name does not parse.
[[nodiscard]] std::optional<RouteCondition> compile_condition(
    const control::RuleConditionConfig& condition);

/// Build one routing rule (nullopt on an unknown target or bad condition)
[[nodiscard]] std::optional<RoutingRule> build_routing_rule(const control::RoutingRuleConfig& rule);

/// Translate configuration into gateway options (names must already be validated)
[[nodiscard]] GatewayOptions make_gateway_options(const control::Config& config);

/// Build a gateway with adapters for every protocol, the configured endpoints
/// and routing rules. Listeners are not started. nullptr on failure.
[[nodiscard]] std::unique_ptr<Gateway> build_gateway(
    const control::Config& config, std::unique_ptr<MessageHandler> handler = nullptr,
    std::unique_ptr<EventSink> events = nullptr, quill::Logger* logger = nullptr);

/// Start every configured listener
[[nodiscard]] std::error_code start_listeners(Gateway& gateway, const control::Config& config);

}  // namespace prism::gateway
