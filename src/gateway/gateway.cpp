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

// Prism Gateway - Implementation

#include "gateway.hpp"

#include <exception>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::gateway {

namespace {

/// Clears the session's migration flag on scope exit
class MigrationFlag {
public:
    explicit MigrationFlag(Session& session) : session_(session) {}
    ~MigrationFlag() { session_.end_migration(); }

    MigrationFlag(const MigrationFlag&) = delete;
    MigrationFlag& operator=(const MigrationFlag&) = delete;

private:
    Session& session_;
};

std::string bool_string(bool value) {
    return value ? "true" : "false";
}

}  // namespace

Gateway::Gateway(GatewayOptions options, std::unique_ptr<MessageHandler> handler,
                 std::unique_ptr<EventSink> events, quill::Logger* logger)
    : options_(std::move(options)),
      logger_(logger ? logger : logging::get_logger()),
      balancer_(make_balancer(options_.balancing)),
      connector_(registry_, *balancer_, adapters_, logger_),
      migrator_(connector_, options_.migration, logger_),
      router_(options_.default_protocol),
      handler_(handler ? std::move(handler)
                       : std::make_unique<ForwardingHandler>(options_.receive_timeout)),
      events_(events ? std::move(events) : std::make_unique<LoggingEventSink>(logger_)),
      health_(registry_, adapters_, options_.health, logger_) {
    health_.set_observer([this](const control::BackendHealth& result) { emit_health(result); });
}

Gateway::~Gateway() {
    if (auto ec = shutdown(options_.migration.drain_timeout); ec) {
        LOG_WARNING(logger_, "Gateway shutdown on destruction failed: error={}", ec.message());
    }
}

// Setup

std::error_code Gateway::register_adapter(std::unique_ptr<protocol::ProtocolAdapter> adapter) {
    if (!adapter) {
        return core::GatewayErrc::invalid_argument;
    }
    ProtocolKind kind = adapter->kind();
    if (auto ec = adapters_.add(std::move(adapter)); ec) {
        LOG_WARNING(logger_, "Adapter already registered: protocol={}", protocol::to_string(kind));
        return ec;
    }
    LOG_DEBUG(logger_, "Adapter registered: protocol={}", protocol::to_string(kind));
    return {};
}

void Gateway::register_default_adapters() {
    for (auto kind : protocol::kAllProtocols) {
        if (adapters_.supports(kind)) {
            continue;
        }
        if (auto ec = adapters_.add(protocol::make_adapter(kind, options_.adapter, logger_)); ec) {
            LOG_WARNING(logger_, "Default adapter not registered: protocol={}, error={}",
                        protocol::to_string(kind), ec.message());
        }
    }
}

std::error_code Gateway::register_endpoint(Endpoint endpoint, uint64_t& out_id) {
    std::string address = endpoint.address();
    ProtocolKind kind = endpoint.protocol;
    if (auto ec = registry_.register_endpoint(std::move(endpoint), out_id); ec) {
        LOG_WARNING(logger_, "Endpoint rejected: address={}, protocol={}, error={}", address,
                    protocol::to_string(kind), ec.message());
        return ec;
    }
    LOG_INFO(logger_, "Endpoint registered: endpoint_id={}, address={}, protocol={}", out_id,
             address, protocol::to_string(kind));
    return {};
}

bool Gateway::deregister_endpoint(uint64_t id) {
    return registry_.deregister_endpoint(id);
}

void Gateway::add_rule(RoutingRule rule) {
    router_.add_rule(std::move(rule));
}

// Listeners

std::error_code Gateway::listen(ProtocolKind protocol, std::string_view address, uint16_t port) {
    try {
        if (is_shutting_down()) {
            return core::GatewayErrc::shutting_down;
        }
        auto* adapter = adapters_.find(protocol);
        if (!adapter) {
            return core::GatewayErrc::unsupported_protocol;
        }

        std::lock_guard<std::mutex> lock(listeners_mutex_);
        auto& slot = listeners_[protocol::index_of(protocol)];
        if (slot && slot->running()) {
            if (slot->address() == address && (port == 0 || slot->port() == port)) {
                return {};
            }
            LOG_INFO(logger_, "Listener restarting: protocol={}, from={}:{}, to={}:{}",
                     protocol::to_string(protocol), slot->address(), slot->port(), address, port);
            slot->stop();
            slot.reset();
        }

        auto listener = std::make_unique<Listener>(
            *adapter, protocol::make_acceptor(protocol, options_.adapter, logger_), *this,
            options_.listener, logger_);
        if (auto ec = listener->start(address, port); ec) {
            return ec;
        }
        slot = std::move(listener);
        return {};
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Listen failed: protocol={}, error={}", protocol::to_string(protocol),
                  e.what());
        return core::GatewayErrc::listener_failed;
    }
}

uint16_t Gateway::listening_port(ProtocolKind protocol) const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const auto& slot = listeners_[protocol::index_of(protocol)];
    return slot && slot->running() ? slot->port() : 0;
}

void Gateway::stop_listener(ProtocolKind protocol) {
    std::unique_ptr<Listener> listener;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listener = std::move(listeners_[protocol::index_of(protocol)]);
    }
    if (listener) {
        listener->stop();
    }
}

// Sessions

std::error_code Gateway::open_session(ProtocolKind protocol, std::string& out_id) {
    try {
        if (is_shutting_down()) {
            return core::GatewayErrc::shutting_down;
        }
        if (!adapters_.supports(protocol)) {
            return core::GatewayErrc::unsupported_protocol;
        }

        auto session = sessions_.create(protocol);
        wire_session(*session);

        std::error_code ec;
        {
            std::lock_guard<std::mutex> lock(session->control_mutex());
            ec = connect_locked(*session);
        }
        if (ec) {
            sessions_.remove(session->id());
            LOG_WARNING(logger_, "Session open failed: protocol={}, error={}",
                        protocol::to_string(protocol), ec.message());
            return ec;
        }

        metrics_.record_session_opened();
        LOG_SESSION_EVENT(logger_, "opened", session->id(), protocol::to_string(protocol),
                          to_string(session->state()));
        out_id = session->id();
        return {};
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Session open failed: protocol={}, error={}",
                  protocol::to_string(protocol), e.what());
        return core::GatewayErrc::internal_error;
    }
}

std::error_code Gateway::close_session(std::string_view session_id) {
    try {
        return close_session_impl(session_id,
                                  core::deadline_after(options_.migration.drain_timeout));
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Session close failed: session_id={}, error={}", session_id, e.what());
        return core::GatewayErrc::internal_error;
    }
}

std::error_code Gateway::handle_message(std::string_view session_id, const Message& message,
                                        Message& reply, RoutingContext context) {
    try {
        if (is_shutting_down()) {
            return core::GatewayErrc::shutting_down;
        }
        auto session = sessions_.find(session_id);
        if (!session) {
            return core::GatewayErrc::session_not_found;
        }

        if (session->state() == GatewayState::Error) {
            if (auto ec = recover_session(session_id); ec) {
                LOG_DEBUG(logger_, "Session not recovered: session_id={}, error={}", session_id,
                          ec.message());
                return core::GatewayErrc::session_unavailable;
            }
        }
        if (session->state() != GatewayState::Connected && !session->migrating()) {
            return core::GatewayErrc::session_unavailable;
        }

        context.session_id = session->id();
        context.inbound_protocol = message.protocol;
        context.current_protocol = session->current_protocol();

        auto decision = router_.decide(message, context);
        metrics_.record_routing_decision(decision.protocol);
        emit_routing(*session, message, decision);

        if (decision.protocol != session->current_protocol()) {
            auto result = switch_protocol(session_id, decision.protocol, options_.default_strategy);
            if (!result.success) {
                if (result.error == core::GatewayErrc::migration_failed) {
                    return result.error;
                }
                // Another switch is running or the target is refused: stay on the current binding
                LOG_DEBUG(logger_, "Routed switch skipped: session_id={}, target={}, reason={}",
                          session_id, protocol::to_string(decision.protocol), result.reason);
            }
        }

        auto ec = handler_->handle(message, *session, reply);
        if (!ec) {
            session->reset_failures();
            metrics_.record_message(message.payload.size(), reply.payload.size());
            return {};
        }

        GatewayEvent event;
        event.type = EventType::HandlerFailed;
        event.with("session", session->id())
            .with("protocol", std::string(protocol::to_string(session->current_protocol())))
            .with("error", ec.message());
        events_->emit(event);
        LOG_WARNING(logger_, "Handler failed: session_id={}, protocol={}, error={}", session->id(),
                    protocol::to_string(session->current_protocol()), ec.message());

        if (core::is_exchange_failure(ec)) {
            metrics_.record_exchange_failure();
            note_exchange_failure(*session, ec);
            return ec;
        }
        metrics_.record_handler_failure();
        if (ec == core::GatewayErrc::session_unavailable) {
            return ec;
        }
        return core::GatewayErrc::handler_failed;
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Message handling failed: session_id={}, error={}", session_id,
                  e.what());
        metrics_.record_handler_failure();
        return core::GatewayErrc::handler_failed;
    }
}

MigrationResult Gateway::switch_protocol(std::string_view session_id, ProtocolKind target,
                                         std::optional<MigrationStrategy> strategy) {
    MigrationResult result;
    result.to = target;
    result.strategy = strategy.value_or(options_.default_strategy);

    try {
        if (is_shutting_down()) {
            result.error = core::GatewayErrc::shutting_down;
            result.reason = result.error.message();
            return result;
        }
        auto session = sessions_.find(session_id);
        if (!session) {
            result.error = core::GatewayErrc::session_not_found;
            result.reason = result.error.message();
            return result;
        }
        result.from = session->current_protocol();

        if (!session->try_begin_migration()) {
            LOG_DEBUG(logger_, "Switch rejected, migration running: session_id={}, target={}",
                      session_id, protocol::to_string(target));
            result.error = core::GatewayErrc::migration_in_progress;
            result.reason = result.error.message();
            return result;
        }
        MigrationFlag flag(*session);

        std::lock_guard<std::mutex> lock(session->control_mutex());
        return switch_locked(*session, target, result.strategy);
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Switch failed: session_id={}, error={}", session_id, e.what());
        result.success = false;
        result.error = core::GatewayErrc::internal_error;
        result.reason = e.what();
        return result;
    }
}

std::error_code Gateway::recover_session(std::string_view session_id) {
    try {
        auto session = sessions_.find(session_id);
        if (!session) {
            return core::GatewayErrc::session_not_found;
        }

        std::lock_guard<std::mutex> lock(session->control_mutex());
        switch (session->state()) {
            case GatewayState::Connected:
                return {};
            case GatewayState::Error:
                break;
            default:
                return core::GatewayErrc::invalid_transition;
        }

        if (auto ec = session->machine().dispatch(StateEvent::Retry); ec) {
            return ec;
        }
        auto ec = connect_locked(*session);
        if (!ec) {
            LOG_SESSION_EVENT(logger_, "recovered", session->id(),
                              protocol::to_string(session->current_protocol()),
                              to_string(session->state()));
        }
        return ec;
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Session recovery failed: session_id={}, error={}", session_id,
                  e.what());
        return core::GatewayErrc::internal_error;
    }
}

size_t Gateway::reap_idle_sessions(Clock::time_point now) {
    size_t reaped = 0;
    try {
        for (const auto& session : sessions_.list()) {
            if (session->migrating() || session->in_flight() > 0) {
                continue;
            }
            if (now - session->last_activity() < options_.idle_timeout) {
                continue;
            }
            LOG_DEBUG(logger_, "Reaping idle session: session_id={}", session->id());
            auto ec = close_session_impl(session->id(),
                                         core::deadline_after(options_.migration.drain_timeout));
            if (ec != core::GatewayErrc::session_not_found) {
                reaped++;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Idle reaping failed: error={}", e.what());
    }
    return reaped;
}

std::shared_ptr<Session> Gateway::find_session(std::string_view session_id) const {
    return sessions_.find(session_id);
}

// Lifecycle

void Gateway::start_health_checks() {
    health_.start();
}

std::error_code Gateway::shutdown(std::chrono::milliseconds timeout) {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }

    try {
        Deadline deadline = core::deadline_after(timeout);
        auto sessions = sessions_.list();
        LOG_INFO(logger_, "Shutdown started: sessions={}, timeout_ms={}", sessions.size(),
                 timeout.count());

        for (const auto& session : sessions) {
            auto ec = close_session_impl(session->id(), deadline);
            if (ec && ec != core::GatewayErrc::session_not_found) {
                LOG_WARNING(logger_, "Session teardown failed: session_id={}, error={}",
                            session->id(), ec.message());
            }
        }

        for (auto kind : protocol::kAllProtocols) {
            stop_listener(kind);
        }
        health_.stop();

        LOG_INFO(logger_, "Shutdown complete: dropped_after_deadline={}",
                 Clock::now() > deadline ? "yes" : "no");
        return {};
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Shutdown failed: error={}", e.what());
        return core::GatewayErrc::internal_error;
    }
}

// Introspection

nlohmann::json Gateway::health_report() const {
    try {
        auto report = control::HealthResponse::to_json(health_.get_health());
        auto snap = metrics_.snapshot();

        report["sessions"] = {
            {"active", sessions_.size()},
            {"opened", snap.sessions_opened},
            {"closed", snap.sessions_closed},
        };
        report["traffic"] = {
            {"messages", snap.messages_handled},
            {"handler_failures", snap.handler_failures},
            {"exchange_failures", snap.exchange_failures},
            {"bytes_received", snap.bytes_received},
            {"bytes_sent", snap.bytes_sent},
        };
        report["migrations"] = {
            {"started", snap.migrations_started},
            {"failed", snap.migrations_failed},
            {"dropped_connections", snap.dropped_connections},
            {"avg_migration_ms", snap.avg_migration_ms()},
        };

        auto routed = nlohmann::json::object();
        for (auto kind : protocol::kAllProtocols) {
            routed[std::string(protocol::to_string(kind))] =
                snap.routed_to[protocol::index_of(kind)];
        }
        report["routing"] = {
            {"default_protocol", std::string(protocol::to_string(router_.default_protocol()))},
            {"rules", router_.describe()},
            {"decisions", snap.routing_decisions},
            {"routed_to", std::move(routed)},
        };

        auto listeners = nlohmann::json::array();
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            for (const auto& listener : listeners_) {
                if (!listener || !listener->running()) {
                    continue;
                }
                listeners.push_back({
                    {"protocol", std::string(protocol::to_string(listener->protocol()))},
                    {"address", listener->address()},
                    {"port", listener->port()},
                    {"connections", listener->active_connections()},
                });
            }
        }
        report["listeners"] = std::move(listeners);
        return report;
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Health report failed: error={}", e.what());
        return {{"status", "unknown"}, {"error", e.what()}};
    }
}

// InboundDelegate

std::error_code Gateway::on_message(InboundContext& context, const Message& request,
                                    Message& reply) {
    RoutingContext routing;
    routing.inbound_protocol = request.protocol;
    routing.attributes.emplace_back("peer", context.peer);

    if (context.session_id.empty()) {
        // First message on the connection picks the session's initial protocol
        ProtocolKind initial = router_.route(request, routing);
        std::string id;
        if (auto ec = open_session(initial, id); ec) {
            return ec;
        }
        context.session_id = std::move(id);
    }

    auto ec = handle_message(context.session_id, request, reply, routing);
    if (ec == core::GatewayErrc::session_not_found) {
        // Reaped or disconnected after repeated failures; the next message starts over
        context.session_id.clear();
    }
    return ec;
}

void Gateway::on_disconnect(InboundContext& context) noexcept {
    if (context.session_id.empty()) {
        return;
    }
    try {
        auto ec = close_session_impl(context.session_id,
                                     core::deadline_after(options_.migration.drain_timeout));
        if (ec && ec != core::GatewayErrc::session_not_found) {
            LOG_DEBUG(logger_, "Inbound session close failed: session_id={}, error={}",
                      context.session_id, ec.message());
        }
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Inbound session close failed: session_id={}, error={}",
                  context.session_id, e.what());
    }
    context.session_id.clear();
}

// State machine wiring

void Gateway::wire_session(Session& session) {
    auto& machine = session.machine();
    machine.set_backoff(options_.retry_backoff, options_.max_retry_backoff);

    machine.set_guard(GatewayState::Connected, StateEvent::Switch,
                      [this, &session](const TransitionContext& ctx) {
                          return ctx.target && adapters_.supports(*ctx.target) &&
                                 *ctx.target != session.current_protocol();
                      });

    machine.set_action(GatewayState::Idle, StateEvent::Connect,
                       [this, &session](const TransitionContext&) { return action_connect(session); });
    machine.set_action(GatewayState::Connecting, StateEvent::Connected,
                       [this, &session](const TransitionContext&) { return action_bind(session); });
    machine.set_action(GatewayState::Connecting, StateEvent::Error,
                       [this, &session](const TransitionContext& ctx) {
                           return action_connect_failed(session, ctx);
                       });
    machine.set_action(GatewayState::Connected, StateEvent::Switch,
                       [this, &session](const TransitionContext& ctx) {
                           return action_begin_switch(session, ctx);
                       });
    machine.set_action(GatewayState::Switching, StateEvent::Switched,
                       [this, &session](const TransitionContext&) {
                           return action_commit_switch(session);
                       });
    machine.set_action(GatewayState::Switching, StateEvent::Error,
                       [this, &session](const TransitionContext& ctx) {
                           return action_rollback_switch(session, ctx);
                       });
    machine.set_action(GatewayState::Connected, StateEvent::Disconnect,
                       [this, &session](const TransitionContext& ctx) {
                           return action_begin_teardown(session, ctx);
                       });
    machine.set_action(GatewayState::Disconnecting, StateEvent::Disconnected,
                       [this, &session](const TransitionContext&) { return action_release(session); });
    machine.set_action(GatewayState::Error, StateEvent::Retry,
                       [this, &session](const TransitionContext&) { return action_reset(session); });

    machine.set_observer([this, &session](GatewayState from, StateEvent event, GatewayState to) {
        LOG_DEBUG(logger_, "Session transition: session_id={}, from={}, event={}, to={}",
                  session.id(), to_string(from), to_string(event), to_string(to));
    });
}

std::error_code Gateway::action_connect(Session& session) {
    // Recovery reuses a binding that survived a failed switch
    auto bound = session.binding();
    if (bound && bound->is_open() && bound->protocol() == session.current_protocol()) {
        return {};
    }

    std::shared_ptr<BoundConnection> opened;
    if (auto ec = connector_.open(session.current_protocol(),
                                  core::deadline_after(options_.connect_timeout), opened);
        ec) {
        return ec;
    }
    session.stage_binding(std::move(opened));
    return {};
}

std::error_code Gateway::action_bind(Session& session) {
    if (auto staged = session.take_staged_binding()) {
        if (auto previous = session.swap_binding(std::move(staged))) {
            previous->close();
        }
    }

    auto bound = session.binding();
    if (!bound || !bound->is_open()) {
        return core::GatewayErrc::session_unavailable;
    }
    session.reset_failures();
    session.resume_traffic();
    return {};
}

std::error_code Gateway::action_connect_failed(Session& session, const TransitionContext& context) {
    if (auto staged = session.take_staged_binding()) {
        staged->close();
    }
    LOG_WARNING(logger_, "Session connect failed: session_id={}, protocol={}, error={}",
                session.id(), protocol::to_string(session.current_protocol()),
                context.error.message());
    return {};
}

std::error_code Gateway::action_begin_switch(Session& session, const TransitionContext& context) {
    auto* plan = session.plan();
    if (!plan || !context.target || plan->to != *context.target) {
        return core::GatewayErrc::internal_error;
    }
    plan->started_at = Clock::now();
    LOG_INFO(logger_, "Switch started: session_id={}, from={}, to={}, strategy={}", session.id(),
             protocol::to_string(plan->from), protocol::to_string(plan->to),
             to_string(plan->strategy));
    return {};
}

std::error_code Gateway::action_commit_switch(Session& session) {
    auto* plan = session.plan();
    if (!plan) {
        return core::GatewayErrc::internal_error;
    }
    if (!plan->next || session.binding() != plan->next) {
        return core::GatewayErrc::session_unavailable;
    }

    session.set_current_protocol(plan->to);
    session.end_plan();
    session.reset_failures();
    session.resume_traffic();
    return {};
}

std::error_code Gateway::action_rollback_switch(Session& session,
                                                const TransitionContext& context) {
    auto plan = session.end_plan();
    session.set_overlap(nullptr);

    if (plan) {
        auto previous = plan->previous;
        if (previous && previous->is_open()) {
            if (auto displaced = session.swap_binding(previous); displaced && displaced != previous) {
                displaced->close();
            }
            LOG_WARNING(logger_, "Switch rolled back: session_id={}, protocol={}, reason={}",
                        session.id(), protocol::to_string(previous->protocol()), context.reason);
        } else {
            if (plan->next && session.binding() != plan->next) {
                plan->next->close();
            }
            LOG_WARNING(logger_, "Switch failed without rollback: session_id={}, reason={}",
                        session.id(), context.reason);
        }
    }

    session.resume_traffic();
    return {};
}

std::error_code Gateway::action_begin_teardown(Session& session, const TransitionContext& context) {
    session.pause_traffic();
    Deadline deadline =
        context.deadline.value_or(core::deadline_after(options_.migration.drain_timeout));
    if (uint32_t remaining = session.wait_drained(deadline); remaining > 0) {
        LOG_WARNING(logger_, "Teardown drain timed out: session_id={}, in_flight={}",
                    session.id(), remaining);
    }
    return {};
}

std::error_code Gateway::action_release(Session& session) {
    if (auto staged = session.take_staged_binding()) {
        staged->close();
    }
    if (auto bound = session.swap_binding(nullptr)) {
        bound->close();
    }
    session.set_overlap(nullptr);
    session.resume_traffic();
    return {};
}

std::error_code Gateway::action_reset(Session& session) {
    if (auto staged = session.take_staged_binding()) {
        staged->close();
    }
    auto bound = session.binding();
    if (bound && !bound->is_open()) {
        session.swap_binding(nullptr);
        bound->close();
    }
    session.end_plan();
    session.reset_failures();
    session.resume_traffic();
    return {};
}

// Locked helpers

std::error_code Gateway::connect_locked(Session& session) {
    auto& machine = session.machine();
    if (auto ec = machine.dispatch(StateEvent::Connect); ec) {
        return ec;
    }
    return machine.dispatch(StateEvent::Connected);
}

std::error_code Gateway::disconnect_locked(Session& session, Deadline deadline) {
    auto& machine = session.machine();
    if (session.state() != GatewayState::Connected) {
        // Error or never connected: nothing to drain, just let go of the binding
        return action_release(session);
    }

    TransitionContext context;
    context.deadline = deadline;
    if (auto ec = machine.dispatch(StateEvent::Disconnect, context); ec) {
        return ec;
    }
    return machine.dispatch(StateEvent::Disconnected);
}

MigrationResult Gateway::switch_locked(Session& session, ProtocolKind target,
                                       MigrationStrategy strategy) {
    auto& machine = session.machine();
    ProtocolKind from = session.current_protocol();

    session.begin_plan(
        std::make_unique<MigrationPlan>(migrator_.prepare(session, from, target, strategy)));

    TransitionContext context;
    context.target = target;
    if (auto ec = machine.dispatch(StateEvent::Switch, context); ec) {
        session.end_plan();
        MigrationResult rejected;
        rejected.from = from;
        rejected.to = target;
        rejected.strategy = strategy;
        rejected.error = ec;
        rejected.reason = ec.message();
        LOG_DEBUG(logger_, "Switch refused: session_id={}, target={}, state={}, error={}",
                  session.id(), protocol::to_string(target), to_string(session.state()),
                  ec.message());
        return rejected;
    }

    MigrationResult result = migrator_.execute(*session.plan());
    if (result.success) {
        if (auto ec = machine.dispatch(StateEvent::Switched); ec) {
            result.success = false;
            result.error = core::GatewayErrc::migration_failed;
            result.cause = ec;
            result.reason = ec.message();
        }
    } else {
        TransitionContext failure;
        failure.trigger = StateEvent::Switch;
        failure.error = result.cause;
        failure.reason = fmt::format("{}: {}", to_string(strategy), result.reason);
        if (auto ec = machine.dispatch(StateEvent::Error, failure); ec) {
            LOG_WARNING(logger_, "Switch failure not recorded: session_id={}, error={}",
                        session.id(), ec.message());
        }
    }

    metrics_.record_migration(result.success, result.dropped_connections,
                              std::chrono::milliseconds(result.migration_time_ms));
    emit_migration(session, result);
    return result;
}

std::error_code Gateway::close_session_impl(std::string_view session_id, Deadline deadline) {
    auto session = sessions_.find(session_id);
    if (!session) {
        return core::GatewayErrc::session_not_found;
    }

    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(session->control_mutex());
        ec = disconnect_locked(*session, deadline);
        if (ec) {
            // The binding goes regardless of how the teardown ended
            if (auto release_ec = action_release(*session); release_ec) {
                LOG_WARNING(logger_, "Session release failed: session_id={}, error={}",
                            session->id(), release_ec.message());
            }
        }
    }

    if (sessions_.remove(session_id)) {
        metrics_.record_session_closed();
        LOG_SESSION_EVENT(logger_, "closed", session->id(),
                          protocol::to_string(session->current_protocol()),
                          to_string(session->state()));
    }
    return ec;
}

void Gateway::note_exchange_failure(Session& session, const std::error_code& ec) {
    uint32_t failures = session.record_failure();
    if (options_.failure_threshold == 0 || failures < options_.failure_threshold) {
        return;
    }

    LOG_WARNING(logger_, "Failure threshold reached: session_id={}, failures={}, error={}",
                session.id(), failures, ec.message());
    if (auto close_ec = close_session_impl(session.id(),
                                           core::deadline_after(options_.migration.drain_timeout));
        close_ec && close_ec != core::GatewayErrc::session_not_found) {
        LOG_WARNING(logger_, "Session disconnect failed: session_id={}, error={}", session.id(),
                    close_ec.message());
    }
}

// Events

void Gateway::emit_routing(const Session& session, const Message& message,
                           const RouteDecision& decision) {
    GatewayEvent event;
    event.type = EventType::RoutingDecision;
    event.with("session", session.id())
        .with("inbound", std::string(protocol::to_string(message.protocol)))
        .with("current", std::string(protocol::to_string(session.current_protocol())))
        .with("target", std::string(protocol::to_string(decision.protocol)))
        .with("matched", bool_string(decision.matched))
        .with("rule", decision.rule)
        .with("priority", std::to_string(decision.priority));
    events_->emit(event);
}

void Gateway::emit_migration(const Session& session, const MigrationResult& result) {
    GatewayEvent complete;
    complete.type = EventType::MigrationComplete;
    complete.with("session", session.id())
        .with("from", std::string(protocol::to_string(result.from)))
        .with("to", std::string(protocol::to_string(result.to)))
        .with("strategy", std::string(to_string(result.strategy)))
        .with("success", bool_string(result.success))
        .with("dropped_connections", std::to_string(result.dropped_connections))
        .with("migration_time_ms", std::to_string(result.migration_time_ms))
        .with("state_bytes", std::to_string(result.state_bytes));
    if (!result.success) {
        complete.with("error", result.reason);
    }
    events_->emit(complete);

    if (result.success) {
        GatewayEvent switched;
        switched.type = EventType::ProtocolSwitch;
        switched.with("session", session.id())
            .with("from", std::string(protocol::to_string(result.from)))
            .with("to", std::string(protocol::to_string(result.to)))
            .with("strategy", std::string(to_string(result.strategy)));
        events_->emit(switched);
    }
}

void Gateway::emit_health(const control::BackendHealth& result) {
    metrics_.record_health_check(result.healthy);

    GatewayEvent event;
    event.type = EventType::HealthCheckResult;
    event.with("endpoint_id", std::to_string(result.endpoint_id))
        .with("protocol", std::string(protocol::to_string(result.protocol)))
        .with("address", result.host + ":" + std::to_string(result.port))
        .with("healthy", bool_string(result.healthy))
        .with("latency_ms", std::to_string(result.last_check_latency.count()));
    if (!result.healthy) {
        event.with("error", result.last_error);
    }
    events_->emit(event);
}

}  // namespace prism::gateway
