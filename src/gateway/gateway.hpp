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

// Prism Gateway - Header
// Facade over listeners, routing, sessions and migration

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../control/health.hpp"
#include "../control/metrics.hpp"
#include "connector.hpp"
#include "endpoint_registry.hpp"
#include "events.hpp"
#include "handler.hpp"
#include "listener.hpp"
#include "load_balancer.hpp"
#include "migrator.hpp"
#include "router.hpp"
#include "session.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

struct GatewayOptions {
    ProtocolKind default_protocol = ProtocolKind::Http;
    BalancingStrategy balancing = BalancingStrategy::RoundRobin;
    MigrationStrategy default_strategy = MigrationStrategy::GracefulDrain;
    MigrationOptions migration;

    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds receive_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};  // Sessions reaped after this
    uint32_t failure_threshold = 3;                  // Consecutive exchange failures
    std::chrono::milliseconds retry_backoff{100};
    std::chrono::milliseconds max_retry_backoff{30000};

    protocol::AdapterOptions adapter;
    ListenerOptions listener;
    control::HealthCheckOptions health;
};

/// Protocol gateway facade. Public operations never throw: failures come
/// back as error codes or in the returned result.
///
/// Sessions are independent: each has its own control lock and state
/// machine, and a switch on one session never blocks another.
class Gateway final : public InboundDelegate {
public:
    explicit Gateway(GatewayOptions options = {}, std::unique_ptr<MessageHandler> handler = nullptr,
                     std::unique_ptr<EventSink> events = nullptr, quill::Logger* logger = nullptr);
    ~Gateway() override;

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Setup

    /// Install the adapter for its protocol (once per protocol)
    [[nodiscard]] std::error_code register_adapter(std::unique_ptr<protocol::ProtocolAdapter> adapter);

    /// Adapters from the built-in factory for every protocol not yet registered
    void register_default_adapters();

    [[nodiscard]] std::error_code register_endpoint(Endpoint endpoint, uint64_t& out_id);
    bool deregister_endpoint(uint64_t id);

    void add_rule(RoutingRule rule);

    // Listeners

    /// Start the protocol's listener. Idempotent for the same address and
    /// port; a different address or port restarts it.
    [[nodiscard]] std::error_code listen(ProtocolKind protocol, std::string_view address,
                                         uint16_t port);

    /// Bound port of a running listener (0 when not listening)
    [[nodiscard]] uint16_t listening_port(ProtocolKind protocol) const;

    void stop_listener(ProtocolKind protocol);

    // Sessions

    /// Create a session and connect it to an endpoint of `protocol`
    [[nodiscard]] std::error_code open_session(ProtocolKind protocol, std::string& out_id);

    /// Disconnect and forget a session
    [[nodiscard]] std::error_code close_session(std::string_view session_id);

    /// Route the message, switch protocol when the target differs, run the handler
    [[nodiscard]] std::error_code handle_message(std::string_view session_id,
                                                 const Message& message, Message& reply,
                                                 RoutingContext context = {});

    /// Move the session to `target`. Concurrent switches on one session are
    /// rejected with migration_in_progress.
    [[nodiscard]] MigrationResult switch_protocol(
        std::string_view session_id, ProtocolKind target,
        std::optional<MigrationStrategy> strategy = std::nullopt);

    /// Error -> Retry -> Idle -> Connect -> Connected once the backoff elapsed
    [[nodiscard]] std::error_code recover_session(std::string_view session_id);

    /// Close sessions idle for longer than idle_timeout. Returns how many.
    size_t reap_idle_sessions(Clock::time_point now = Clock::now());

    [[nodiscard]] std::shared_ptr<Session> find_session(std::string_view session_id) const;

    // Lifecycle

    void start_health_checks();

    /// Disconnect every session (graceful drain bounded by `timeout`), then
    /// stop listeners and health checks. Idempotent.
    [[nodiscard]] std::error_code shutdown(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_shutting_down() const noexcept {
        return shutting_down_.load(std::memory_order_acquire);
    }

    // Introspection

    [[nodiscard]] nlohmann::json health_report() const;
    [[nodiscard]] control::MetricsSnapshot metrics() const noexcept { return metrics_.snapshot(); }

    [[nodiscard]] EndpointRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] SessionRegistry& sessions() noexcept { return sessions_; }
    [[nodiscard]] ProtocolRouter& router() noexcept { return router_; }
    [[nodiscard]] control::HealthChecker& health() noexcept { return health_; }
    [[nodiscard]] const GatewayOptions& options() const noexcept { return options_; }

    // InboundDelegate

    [[nodiscard]] std::error_code on_message(InboundContext& context, const Message& request,
                                             Message& reply) override;
    void on_disconnect(InboundContext& context) noexcept override;

private:
    void wire_session(Session& session);

    // State machine actions
    std::error_code action_connect(Session& session);
    std::error_code action_bind(Session& session);
    std::error_code action_connect_failed(Session& session, const TransitionContext& context);
    std::error_code action_begin_switch(Session& session, const TransitionContext& context);
    std::error_code action_commit_switch(Session& session);
    std::error_code action_rollback_switch(Session& session, const TransitionContext& context);
    std::error_code action_begin_teardown(Session& session, const TransitionContext& context);
    std::error_code action_release(Session& session);
    std::error_code action_reset(Session& session);

    // Callers hold session.control_mutex()
    std::error_code connect_locked(Session& session);
    std::error_code disconnect_locked(Session& session, Deadline deadline);
    MigrationResult switch_locked(Session& session, ProtocolKind target,
                                  MigrationStrategy strategy);

    std::error_code close_session_impl(std::string_view session_id, Deadline deadline);
    void note_exchange_failure(Session& session, const std::error_code& ec);

    void emit_routing(const Session& session, const Message& message,
                      const RouteDecision& decision);
    void emit_migration(const Session& session, const MigrationResult& result);
    void emit_health(const control::BackendHealth& result);

    GatewayOptions options_;
    quill::Logger* logger_;

    EndpointRegistry registry_;
    AdapterSet adapters_;
    std::unique_ptr<LoadBalancer> balancer_;
    EndpointConnector connector_;
    ConnectionMigrator migrator_;
    ProtocolRouter router_;
    SessionRegistry sessions_;
    std::unique_ptr<MessageHandler> handler_;
    std::unique_ptr<EventSink> events_;
    control::GatewayMetrics metrics_;
    control::HealthChecker health_;

    mutable std::mutex listeners_mutex_;
    std::array<std::unique_ptr<Listener>, protocol::kProtocolCount> listeners_;

    std::atomic<bool> shutting_down_{false};
};

}  // namespace prism::gateway
