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

// Prism Connection Migrator - Implementation

#include "migrator.hpp"

#include <thread>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::gateway {

namespace {

/// Poll interval while waiting for the old connection to go idle
constexpr std::chrono::milliseconds IDLE_POLL_INTERVAL{5};

uint32_t in_flight_on(const std::shared_ptr<BoundConnection>& bound) {
    return bound ? bound->in_flight() : 0;
}

void close_if_set(const std::shared_ptr<BoundConnection>& bound) {
    if (bound) {
        bound->close();
    }
}

/// Wait for `bound` to finish its current exchange. Returns what is still in flight.
uint32_t wait_idle(const std::shared_ptr<BoundConnection>& bound, Deadline deadline) {
    while (in_flight_on(bound) > 0 && Clock::now() < deadline) {
        std::this_thread::sleep_for(IDLE_POLL_INTERVAL);
    }
    return in_flight_on(bound);
}

}  // namespace

std::optional<MigrationStrategy> parse_migration_strategy(std::string_view name) {
    if (name == "graceful_drain") return MigrationStrategy::GracefulDrain;
    if (name == "immediate") return MigrationStrategy::Immediate;
    if (name == "overlap") return MigrationStrategy::Overlap;
    if (name == "state_preserving") return MigrationStrategy::StatePreserving;
    return std::nullopt;
}

// GracefulDrainExecutor

std::error_code GracefulDrainExecutor::execute(MigrationPlan& plan, ConnectionOpener& opener,
                                               const MigrationOptions& options,
                                               uint32_t& dropped) {
    Session& session = *plan.session;
    session.pause_traffic();
    dropped = session.wait_drained(core::deadline_after(options.drain_timeout));

    if (auto ec = opener.open(plan.to, core::deadline_after(options.connect_timeout), plan.next);
        ec) {
        // Old binding untouched: it stays authoritative
        dropped = 0;
        session.resume_traffic();
        return ec;
    }

    session.swap_binding(plan.next);
    close_if_set(plan.previous);
    session.resume_traffic();
    return {};
}

// ImmediateExecutor

std::error_code ImmediateExecutor::execute(MigrationPlan& plan, ConnectionOpener& opener,
                                           const MigrationOptions& options, uint32_t& dropped) {
    dropped = in_flight_on(plan.previous);
    close_if_set(plan.previous);

    if (auto ec = opener.open(plan.to, core::deadline_after(options.connect_timeout), plan.next);
        ec) {
        return ec;
    }

    plan.session->swap_binding(plan.next);
    return {};
}

// OverlapExecutor

std::error_code OverlapExecutor::execute(MigrationPlan& plan, ConnectionOpener& opener,
                                         const MigrationOptions& options, uint32_t& dropped) {
    Session& session = *plan.session;
    if (auto ec = opener.open(plan.to, core::deadline_after(options.connect_timeout), plan.next);
        ec) {
        return ec;
    }

    // Both connections live; the old one keeps carrying traffic for the window
    session.set_overlap(plan.next);
    std::this_thread::sleep_for(options.overlap_window);

    // The old connection stays authoritative for writes until it is closed
    session.pause_traffic();
    dropped = wait_idle(plan.previous, core::deadline_after(options.overlap_window));
    close_if_set(plan.previous);
    session.swap_binding(plan.next);
    session.resume_traffic();
    return {};
}

// StatePreservingExecutor

std::error_code StatePreservingExecutor::execute(MigrationPlan& plan, ConnectionOpener& opener,
                                                 const MigrationOptions& options,
                                                 uint32_t& dropped) {
    Session& session = *plan.session;
    session.pause_traffic();

    plan.captured_state = nlohmann::json::to_msgpack(session.application_state());
    dropped = in_flight_on(plan.previous);
    close_if_set(plan.previous);

    if (auto ec = opener.open(plan.to, core::deadline_after(options.connect_timeout), plan.next);
        ec) {
        session.resume_traffic();
        return ec;
    }

    nlohmann::json restored;
    try {
        restored = nlohmann::json::from_msgpack(plan.captured_state);
    } catch (const nlohmann::json::exception&) {
        plan.next->close();
        plan.next.reset();
        session.resume_traffic();
        return core::GatewayErrc::internal_error;
    }

    session.set_application_state(std::move(restored));
    session.swap_binding(plan.next);
    session.resume_traffic();
    return {};
}

std::unique_ptr<MigrationExecutor> make_executor(MigrationStrategy strategy) {
    switch (strategy) {
        case MigrationStrategy::GracefulDrain:
            return std::make_unique<GracefulDrainExecutor>();
        case MigrationStrategy::Immediate:
            return std::make_unique<ImmediateExecutor>();
        case MigrationStrategy::Overlap:
            return std::make_unique<OverlapExecutor>();
        case MigrationStrategy::StatePreserving:
            return std::make_unique<StatePreservingExecutor>();
    }
    return std::make_unique<GracefulDrainExecutor>();
}

// ConnectionMigrator

ConnectionMigrator::ConnectionMigrator(ConnectionOpener& opener, MigrationOptions options,
                                       quill::Logger* logger)
    : opener_(opener),
      options_(options),
      logger_(logger ? logger : logging::get_logger()) {
    for (size_t i = 0; i < kMigrationStrategyCount; ++i) {
        executors_[i] = make_executor(static_cast<MigrationStrategy>(i));
    }
}

MigrationPlan ConnectionMigrator::prepare(Session& session, ProtocolKind from, ProtocolKind to,
                                          MigrationStrategy strategy) const {
    MigrationPlan plan;
    plan.session = &session;
    plan.from = from;
    plan.to = to;
    plan.strategy = strategy;
    plan.started_at = Clock::now();
    plan.previous = session.binding();
    return plan;
}

MigrationResult ConnectionMigrator::execute(MigrationPlan& plan) {
    MigrationResult result;
    result.strategy = plan.strategy;
    result.from = plan.from;
    result.to = plan.to;

    LOG_INFO(logger_, "Migration started: session={}, from={}, to={}, strategy={}",
             plan.session->id(), protocol::to_string(plan.from), protocol::to_string(plan.to),
             to_string(plan.strategy));

    auto& executor = *executors_[static_cast<size_t>(plan.strategy)];
    uint32_t dropped = 0;
    std::error_code ec = executor.execute(plan, opener_, options_, dropped);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                         plan.started_at);
    result.migration_time_ms = static_cast<uint64_t>(elapsed.count());
    result.dropped_connections = dropped;
    result.state_bytes = plan.captured_state.size();

    if (ec) {
        result.error = core::GatewayErrc::migration_failed;
        result.cause = ec;
        result.reason = ec.message();
        result.rolled_back = plan.previous && plan.previous->is_open() &&
                             plan.session->binding() == plan.previous;
        LOG_WARNING(logger_,
                    "Migration failed: session={}, to={}, strategy={}, error={}, rolled_back={}",
                    plan.session->id(), protocol::to_string(plan.to), to_string(plan.strategy),
                    ec.message(), result.rolled_back);
        return result;
    }

    plan.session->set_current_protocol(plan.to);
    result.success = true;
    LOG_INFO(logger_,
             "Migration complete: session={}, from={}, to={}, strategy={}, dropped={}, "
             "elapsed_ms={}",
             plan.session->id(), protocol::to_string(plan.from), protocol::to_string(plan.to),
             to_string(plan.strategy), dropped, result.migration_time_ms);
    return result;
}

MigrationResult ConnectionMigrator::migrate(Session& session, ProtocolKind from, ProtocolKind to,
                                            MigrationStrategy strategy) {
    auto plan = prepare(session, from, to, strategy);
    return execute(plan);
}

}  // namespace prism::gateway
