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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include <string>
#include <utility>
#include <vector>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/regex.hpp"

namespace prism::gateway {

namespace {

/// Compiled form of RuleConditionConfig. Regexes are shared so the
/// predicate stays copyable.
struct CompiledCondition {
    std::vector<std::pair<std::string, std::string>> metadata;
    std::vector<std::pair<std::string, std::shared_ptr<const core::Regex>>> metadata_regex;
    std::optional<std::string> payload_prefix;
    std::optional<size_t> min_payload_size;
    std::optional<size_t> max_payload_size;
    std::optional<ProtocolKind> inbound_protocol;
    std::vector<std::pair<std::string, std::string>> attribute;

    bool operator()(const Message& message, const RoutingContext& context) const {
        if (inbound_protocol && message.protocol != *inbound_protocol) {
            return false;
        }
        if (min_payload_size && message.payload.size() < *min_payload_size) {
            return false;
        }
        if (max_payload_size && message.payload.size() > *max_payload_size) {
            return false;
        }
        if (payload_prefix && !message.payload_view().starts_with(*payload_prefix)) {
            return false;
        }
        for (const auto& [key, expected] : metadata) {
            auto value = message.find_metadata(key);
            if (!value || *value != expected) {
                return false;
            }
        }
        for (const auto& [key, regex] : metadata_regex) {
            auto value = message.find_metadata(key);
            if (!value || !regex->matches(*value)) {
                return false;
            }
        }
        for (const auto& [key, expected] : attribute) {
            auto value = context.find_attribute(key);
            if (!value || *value != expected) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace

std::optional<RouteCondition> compile_condition(const control::RuleConditionConfig& condition) {
    CompiledCondition compiled;
    compiled.metadata.assign(condition.metadata.begin(), condition.metadata.end());
    compiled.attribute.assign(condition.attribute.begin(), condition.attribute.end());
    compiled.payload_prefix = condition.payload_prefix;
    compiled.min_payload_size = condition.min_payload_size;
    compiled.max_payload_size = condition.max_payload_size;

    for (const auto& [key, pattern] : condition.metadata_regex) {
        auto regex = core::Regex::compile(pattern);
        if (!regex) {
            return std::nullopt;
        }
        compiled.metadata_regex.emplace_back(
            key, std::make_shared<const core::Regex>(std::move(*regex)));
    }

    if (condition.inbound_protocol) {
        compiled.inbound_protocol = protocol::parse_protocol(*condition.inbound_protocol);
        if (!compiled.inbound_protocol) {
            return std::nullopt;
        }
    }

    return RouteCondition(std::move(compiled));
}

std::optional<RoutingRule> build_routing_rule(const control::RoutingRuleConfig& config) {
    auto target = protocol::parse_protocol(config.target);
    if (!target) {
        return std::nullopt;
    }

    RoutingRule rule;
    rule.target = *target;
    rule.priority = config.priority;
    rule.description = config.description.empty() ? "to " + config.target : config.description;
    if (!config.condition.empty()) {
        auto condition = compile_condition(config.condition);
        if (!condition) {
            return std::nullopt;
        }
        rule.condition = std::move(*condition);
    }
    return rule;
}

GatewayOptions make_gateway_options(const control::Config& config) {
    using std::chrono::milliseconds;

    GatewayOptions options;
    options.default_protocol =
        protocol::parse_protocol(config.gateway.default_protocol).value_or(ProtocolKind::Http);
    options.balancing = parse_balancing_strategy(config.gateway.load_balancing)
                            .value_or(BalancingStrategy::RoundRobin);
    options.default_strategy = parse_migration_strategy(config.migration.default_strategy)
                                   .value_or(MigrationStrategy::GracefulDrain);

    options.connect_timeout = milliseconds(config.adapters.connect_timeout_ms);
    options.receive_timeout = milliseconds(config.adapters.receive_timeout_ms);

    options.migration.drain_timeout = milliseconds(config.migration.drain_timeout_ms);
    options.migration.overlap_window = milliseconds(config.migration.overlap_window_ms);
    options.migration.connect_timeout = options.connect_timeout;

    options.idle_timeout = milliseconds(config.session.idle_timeout_ms);
    options.failure_threshold = config.session.failure_threshold;
    options.retry_backoff = milliseconds(config.session.retry_backoff_ms);
    options.max_retry_backoff = milliseconds(config.session.max_retry_backoff_ms);

    options.adapter.send_timeout = options.receive_timeout;
    options.adapter.max_message_size = config.adapters.max_message_size;
    options.adapter.http_path = config.adapters.http_path;
    options.adapter.websocket_path = config.adapters.websocket_path;

    options.health.enabled = config.health_check.enabled;
    options.health.interval = std::chrono::seconds(config.health_check.interval_seconds);
    options.health.timeout = milliseconds(config.health_check.timeout_ms);
    return options;
}

std::unique_ptr<Gateway> build_gateway(const control::Config& config,
                                       std::unique_ptr<MessageHandler> handler,
                                       std::unique_ptr<EventSink> events, quill::Logger* logger) {
    if (!logger) {
        logger = logging::get_logger();
    }

    auto gateway = std::make_unique<Gateway>(make_gateway_options(config), std::move(handler),
                                             std::move(events), logger);
    gateway->register_default_adapters();

    for (const auto& endpoint_config : config.endpoints) {
        auto kind = protocol::parse_protocol(endpoint_config.protocol);
        if (!kind) {
            LOG_ERROR(logger, "Unknown endpoint protocol: {}", endpoint_config.protocol);
            return nullptr;
        }

        Endpoint endpoint;
        endpoint.protocol = *kind;
        endpoint.host = endpoint_config.address;
        endpoint.port = endpoint_config.port;
        endpoint.weight = endpoint_config.weight;
        endpoint.max_load = endpoint_config.max_load;

        uint64_t id = 0;
        if (auto ec = gateway->register_endpoint(std::move(endpoint), id); ec) {
            return nullptr;
        }
    }

    for (const auto& rule_config : config.routing_rules) {
        auto rule = build_routing_rule(rule_config);
        if (!rule) {
            LOG_ERROR(logger, "Invalid routing rule: description={}, target={}",
                      rule_config.description, rule_config.target);
            return nullptr;
        }
        gateway->add_rule(std::move(*rule));
    }

    LOG_INFO(logger, "Gateway built: endpoints={}, rules={}, default_protocol={}, strategy={}",
             config.endpoints.size(), config.routing_rules.size(), config.gateway.default_protocol,
             config.migration.default_strategy);
    return gateway;
}

std::error_code start_listeners(Gateway& gateway, const control::Config& config) {
    for (const auto& listener : config.listeners) {
        auto kind = protocol::parse_protocol(listener.protocol);
        if (!kind) {
            return core::GatewayErrc::unsupported_protocol;
        }
        if (auto ec = gateway.listen(*kind, listener.address, listener.port); ec) {
            return ec;
        }
    }
    return {};
}

}  // namespace prism::gateway
