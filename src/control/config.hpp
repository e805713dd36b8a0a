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

// Prism Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prism::control {

/// Gateway-wide settings
struct GatewaySection {
    std::string default_protocol = "http";  // Target when no routing rule matches
    std::string load_balancing = "round_robin";  // round_robin, weighted_random, least_connections
    uint32_t shutdown_timeout_ms = 30000;
};

/// Inbound listener (at most one per protocol)
struct ListenerConfig {
    std::string protocol;
    std::string address = "0.0.0.0";
    uint16_t port = 0;
};

/// Backend endpoint
struct EndpointConfig {
    std::string protocol;
    std::string address;
    uint16_t port = 0;
    uint32_t weight = 1;
    int64_t max_load = 1000;  // Concurrent bound connections
};

/// Declarative routing condition. Every present clause must hold; a
/// condition with no clauses matches everything.
struct RuleConditionConfig {
    std::map<std::string, std::string> metadata;        // Exact value per key
    std::map<std::string, std::string> metadata_regex;  // PCRE2 pattern per key
    std::optional<std::string> payload_prefix;
    std::optional<size_t> min_payload_size;
    std::optional<size_t> max_payload_size;
    std::optional<std::string> inbound_protocol;
    std::map<std::string, std::string> attribute;  // Routing context attributes

    [[nodiscard]] bool empty() const noexcept {
        return metadata.empty() && metadata_regex.empty() && !payload_prefix &&
               !min_payload_size && !max_payload_size && !inbound_protocol && attribute.empty();
    }
};

struct RoutingRuleConfig {
    std::string description;
    int32_t priority = 0;  // Higher priority = checked first
    std::string target;
    RuleConditionConfig condition;
};

struct MigrationConfig {
    std::string default_strategy = "graceful_drain";
    uint32_t drain_timeout_ms = 5000;
    uint32_t overlap_window_ms = 500;
};

struct HealthCheckConfig {
    bool enabled = true;
    uint32_t interval_seconds = 30;
    uint32_t timeout_ms = 2000;
};

struct SessionConfig {
    uint32_t idle_timeout_ms = 300000;  // 5 minutes
    uint32_t failure_threshold = 3;     // Consecutive exchange failures before disconnect
    uint32_t retry_backoff_ms = 100;
    uint32_t max_retry_backoff_ms = 30000;
};

struct AdapterConfig {
    uint32_t connect_timeout_ms = 5000;
    uint32_t receive_timeout_ms = 5000;
    size_t max_message_size = 16 * 1024 * 1024;  // 16MB
    std::string http_path = "/";
    std::string websocket_path = "/";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";   // debug, info, warning, error
    std::string format = "text";  // text, json
    std::string output;           // Log directory; empty for console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Complete gateway configuration
struct Config {
    GatewaySection gateway;
    std::vector<ListenerConfig> listeners;
    std::vector<EndpointConfig> endpoints;
    std::vector<RoutingRuleConfig> routing_rules;
    MigrationConfig migration;
    HealthCheckConfig health_check;
    SessionConfig session;
    AdapterConfig adapters;
    LogConfig logging;

    std::string version = "1.0";
    std::string description;
};

// ============================================================================
// from_json functions (defaults for missing fields)
// ============================================================================

inline void from_json(const nlohmann::json& j, GatewaySection& g) {
    g.default_protocol = j.value("default_protocol", std::string("http"));
    g.load_balancing = j.value("load_balancing", std::string("round_robin"));
    g.shutdown_timeout_ms = j.value("shutdown_timeout_ms", 30000u);
}

inline void from_json(const nlohmann::json& j, ListenerConfig& l) {
    j.at("protocol").get_to(l.protocol);  // protocol is required
    l.address = j.value("address", std::string("0.0.0.0"));
    l.port = j.value("port", uint16_t(0));
}

inline void from_json(const nlohmann::json& j, EndpointConfig& e) {
    j.at("protocol").get_to(e.protocol);
    j.at("address").get_to(e.address);
    e.port = j.value("port", uint16_t(0));
    e.weight = j.value("weight", 1u);
    e.max_load = j.value("max_load", int64_t(1000));
}

inline void from_json(const nlohmann::json& j, RuleConditionConfig& c) {
    c.metadata = j.value("metadata", std::map<std::string, std::string>());
    c.metadata_regex = j.value("metadata_regex", std::map<std::string, std::string>());
    c.attribute = j.value("attribute", std::map<std::string, std::string>());
    if (j.contains("payload_prefix")) {
        c.payload_prefix = j.at("payload_prefix").get<std::string>();
    }
    if (j.contains("min_payload_size")) {
        c.min_payload_size = j.at("min_payload_size").get<size_t>();
    }
    if (j.contains("max_payload_size")) {
        c.max_payload_size = j.at("max_payload_size").get<size_t>();
    }
    if (j.contains("inbound_protocol")) {
        c.inbound_protocol = j.at("inbound_protocol").get<std::string>();
    }
}

inline void from_json(const nlohmann::json& j, RoutingRuleConfig& r) {
    j.at("target").get_to(r.target);  // target is required
    r.description = j.value("description", std::string());
    r.priority = j.value("priority", int32_t(0));
    if (j.contains("condition")) {
        j.at("condition").get_to(r.condition);
    }
}

inline void from_json(const nlohmann::json& j, MigrationConfig& m) {
    m.default_strategy = j.value("default_strategy", std::string("graceful_drain"));
    m.drain_timeout_ms = j.value("drain_timeout_ms", 5000u);
    m.overlap_window_ms = j.value("overlap_window_ms", 500u);
}

inline void from_json(const nlohmann::json& j, HealthCheckConfig& h) {
    h.enabled = j.value("enabled", true);
    h.interval_seconds = j.value("interval_seconds", 30u);
    h.timeout_ms = j.value("timeout_ms", 2000u);
}

inline void from_json(const nlohmann::json& j, SessionConfig& s) {
    s.idle_timeout_ms = j.value("idle_timeout_ms", 300000u);
    s.failure_threshold = j.value("failure_threshold", 3u);
    s.retry_backoff_ms = j.value("retry_backoff_ms", 100u);
    s.max_retry_backoff_ms = j.value("max_retry_backoff_ms", 30000u);
}

inline void from_json(const nlohmann::json& j, AdapterConfig& a) {
    a.connect_timeout_ms = j.value("connect_timeout_ms", 5000u);
    a.receive_timeout_ms = j.value("receive_timeout_ms", 5000u);
    a.max_message_size = j.value("max_message_size", size_t(16 * 1024 * 1024));
    a.http_path = j.value("http_path", std::string("/"));
    a.websocket_path = j.value("websocket_path", std::string("/"));
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() rather than value() for struct members
    if (j.contains("gateway")) {
        j.at("gateway").get_to(c.gateway);
    }
    if (j.contains("listeners")) {
        j.at("listeners").get_to(c.listeners);
    }
    if (j.contains("endpoints")) {
        j.at("endpoints").get_to(c.endpoints);
    }
    if (j.contains("routing_rules")) {
        j.at("routing_rules").get_to(c.routing_rules);
    }
    if (j.contains("migration")) {
        j.at("migration").get_to(c.migration);
    }
    if (j.contains("health_check")) {
        j.at("health_check").get_to(c.health_check);
    }
    if (j.contains("session")) {
        j.at("session").get_to(c.session);
    }
    if (j.contains("adapters")) {
        j.at("adapters").get_to(c.adapters);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        j.at("description").get_to(c.description);
    }
}

// ============================================================================
// to_json functions
// ============================================================================

inline void to_json(nlohmann::json& j, const GatewaySection& g) {
    j = nlohmann::json{{"default_protocol", g.default_protocol},
                       {"load_balancing", g.load_balancing},
                       {"shutdown_timeout_ms", g.shutdown_timeout_ms}};
}

inline void to_json(nlohmann::json& j, const ListenerConfig& l) {
    j = nlohmann::json{{"protocol", l.protocol}, {"address", l.address}, {"port", l.port}};
}

inline void to_json(nlohmann::json& j, const EndpointConfig& e) {
    j = nlohmann::json{{"protocol", e.protocol},
                       {"address", e.address},
                       {"port", e.port},
                       {"weight", e.weight},
                       {"max_load", e.max_load}};
}

inline void to_json(nlohmann::json& j, const RuleConditionConfig& c) {
    j = nlohmann::json::object();
    if (!c.metadata.empty()) {
        j["metadata"] = c.metadata;
    }
    if (!c.metadata_regex.empty()) {
        j["metadata_regex"] = c.metadata_regex;
    }
    if (c.payload_prefix) {
        j["payload_prefix"] = *c.payload_prefix;
    }
    if (c.min_payload_size) {
        j["min_payload_size"] = *c.min_payload_size;
    }
    if (c.max_payload_size) {
        j["max_payload_size"] = *c.max_payload_size;
    }
    if (c.inbound_protocol) {
        j["inbound_protocol"] = *c.inbound_protocol;
    }
    if (!c.attribute.empty()) {
        j["attribute"] = c.attribute;
    }
}

inline void to_json(nlohmann::json& j, const RoutingRuleConfig& r) {
    j = nlohmann::json{{"description", r.description},
                       {"priority", r.priority},
                       {"target", r.target},
                       {"condition", r.condition}};
}

inline void to_json(nlohmann::json& j, const MigrationConfig& m) {
    j = nlohmann::json{{"default_strategy", m.default_strategy},
                       {"drain_timeout_ms", m.drain_timeout_ms},
                       {"overlap_window_ms", m.overlap_window_ms}};
}

inline void to_json(nlohmann::json& j, const HealthCheckConfig& h) {
    j = nlohmann::json{{"enabled", h.enabled},
                       {"interval_seconds", h.interval_seconds},
                       {"timeout_ms", h.timeout_ms}};
}

inline void to_json(nlohmann::json& j, const SessionConfig& s) {
    j = nlohmann::json{{"idle_timeout_ms", s.idle_timeout_ms},
                       {"failure_threshold", s.failure_threshold},
                       {"retry_backoff_ms", s.retry_backoff_ms},
                       {"max_retry_backoff_ms", s.max_retry_backoff_ms}};
}

inline void to_json(nlohmann::json& j, const AdapterConfig& a) {
    j = nlohmann::json{{"connect_timeout_ms", a.connect_timeout_ms},
                       {"receive_timeout_ms", a.receive_timeout_ms},
                       {"max_message_size", a.max_message_size},
                       {"http_path", a.http_path},
                       {"websocket_path", a.websocket_path}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["gateway"] = c.gateway;
    j["listeners"] = c.listeners;
    j["endpoints"] = c.endpoints;
    j["routing_rules"] = c.routing_rules;
    j["migration"] = c.migration;
    j["health_check"] = c.health_check;
    j["session"] = c.session;
    j["adapters"] = c.adapters;
    j["logging"] = c.logging;
    j["version"] = c.version;
    j["description"] = c.description;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load and validate configuration from a JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load and validate configuration from a JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace prism::control
