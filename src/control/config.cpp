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

// Prism Configuration - Implementation

#include "config.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/regex.hpp"  // For metadata_regex validation
#include "../gateway/load_balancer.hpp"
#include "../gateway/migrator.hpp"
#include "../protocol/protocol.hpp"

namespace prism::control {

namespace {

void validate_condition(const RuleConditionConfig& condition, const std::string& context,
                        ValidationResult& result) {
    for (const auto& [key, pattern] : condition.metadata_regex) {
        std::string error;
        if (!core::Regex::compile(pattern, error)) {
            result.add_error(context + ": invalid metadata_regex for '" + key + "': " + error);
        }
    }

    if (condition.inbound_protocol && !protocol::parse_protocol(*condition.inbound_protocol)) {
        result.add_error(context + ": unknown inbound_protocol '" + *condition.inbound_protocol +
                         "'");
    }

    if (condition.min_payload_size && condition.max_payload_size &&
        *condition.min_payload_size > *condition.max_payload_size) {
        result.add_error(context + ": min_payload_size > max_payload_size");
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Runs before logging is configured
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Gateway section
    if (!protocol::parse_protocol(config.gateway.default_protocol)) {
        result.add_error("Unknown default_protocol '" + config.gateway.default_protocol + "'");
    }
    if (!gateway::parse_balancing_strategy(config.gateway.load_balancing)) {
        result.add_error("Unknown load_balancing strategy '" + config.gateway.load_balancing + "'");
    }
    if (config.gateway.shutdown_timeout_ms == 0) {
        result.add_warning("shutdown_timeout_ms is 0 (sessions are dropped without draining)");
    }

    // Listeners
    std::array<bool, protocol::kProtocolCount> listening{};
    for (const auto& listener : config.listeners) {
        auto kind = protocol::parse_protocol(listener.protocol);
        if (!kind) {
            result.add_error("Unknown listener protocol '" + listener.protocol + "'");
            continue;
        }
        if (listener.address.empty()) {
            result.add_error("Listener address cannot be empty for '" + listener.protocol + "'");
        }
        if (listener.port == 0) {
            result.add_error("Listener port must be > 0 for '" + listener.protocol + "'");
        }
        if (listening[protocol::index_of(*kind)]) {
            result.add_error("Duplicate listener for protocol '" + listener.protocol + "'");
        }
        listening[protocol::index_of(*kind)] = true;
    }

    // Endpoints
    if (config.endpoints.empty()) {
        result.add_warning("No endpoints configured");
    }

    std::array<bool, protocol::kProtocolCount> served{};
    for (const auto& endpoint : config.endpoints) {
        auto kind = protocol::parse_protocol(endpoint.protocol);
        std::string where = endpoint.address + ":" + std::to_string(endpoint.port);
        if (!kind) {
            result.add_error("Unknown protocol '" + endpoint.protocol + "' for endpoint " + where);
            continue;
        }
        served[protocol::index_of(*kind)] = true;

        if (endpoint.address.empty()) {
            result.add_error("Endpoint address cannot be empty");
        }
        if (endpoint.port == 0) {
            result.add_error("Endpoint port must be > 0 for " + where);
        }
        if (endpoint.weight == 0) {
            result.add_error("Endpoint weight must be > 0 for " + where);
        }
        if (endpoint.max_load <= 0) {
            result.add_error("Endpoint max_load must be > 0 for " + where);
        }
    }

    // Routing rules
    auto default_kind = protocol::parse_protocol(config.gateway.default_protocol);
    if (default_kind && !served[protocol::index_of(*default_kind)] && !config.endpoints.empty()) {
        result.add_warning("No endpoint for default_protocol '" + config.gateway.default_protocol +
                           "'");
    }

    for (size_t i = 0; i < config.routing_rules.size(); ++i) {
        const auto& rule = config.routing_rules[i];
        std::string context = rule.description.empty() ? "Routing rule #" + std::to_string(i)
                                                       : "Routing rule '" + rule.description + "'";

        auto target = protocol::parse_protocol(rule.target);
        if (!target) {
            result.add_error(context + ": unknown target '" + rule.target + "'");
        } else if (!served[protocol::index_of(*target)]) {
            result.add_warning(context + ": no endpoint registered for target '" + rule.target +
                               "'");
        }
        validate_condition(rule.condition, context, result);
    }

    // Migration
    if (!gateway::parse_migration_strategy(config.migration.default_strategy)) {
        result.add_error("Unknown migration strategy '" + config.migration.default_strategy + "'");
    }
    if (config.migration.drain_timeout_ms == 0) {
        result.add_warning("drain_timeout_ms is 0 (graceful drain cannot wait for in-flight work)");
    }

    // Health checks
    if (config.health_check.enabled) {
        if (config.health_check.interval_seconds == 0) {
            result.add_error("health_check interval_seconds must be > 0");
        }
        if (config.health_check.timeout_ms == 0) {
            result.add_error("health_check timeout_ms must be > 0");
        }
        if (config.health_check.timeout_ms >= config.health_check.interval_seconds * 1000u) {
            result.add_warning("health_check timeout_ms >= interval (probes may overlap rounds)");
        }
    }

    // Sessions
    if (config.session.failure_threshold == 0) {
        result.add_warning("failure_threshold is 0 (sessions never disconnect on failures)");
    }
    if (config.session.retry_backoff_ms > config.session.max_retry_backoff_ms) {
        result.add_error("retry_backoff_ms must be <= max_retry_backoff_ms");
    }

    // Adapters
    if (config.adapters.connect_timeout_ms == 0) {
        result.add_error("adapters connect_timeout_ms must be > 0");
    }
    if (config.adapters.receive_timeout_ms == 0) {
        result.add_error("adapters receive_timeout_ms must be > 0");
    }
    if (config.adapters.max_message_size == 0) {
        result.add_error("adapters max_message_size must be > 0");
    }
    if (config.adapters.http_path.empty() || config.adapters.http_path.front() != '/') {
        result.add_error("adapters http_path must start with '/'");
    }
    if (config.adapters.websocket_path.empty() || config.adapters.websocket_path.front() != '/') {
        result.add_error("adapters websocket_path must start with '/'");
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }
    if (!config.logging.output.empty() && config.logging.rotation.max_files == 0) {
        result.add_error("logging rotation max_files must be > 0");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace prism::control
