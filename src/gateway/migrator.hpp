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

// Prism Connection Migrator - Header
// Moves a session's backend binding from one protocol to another

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "session.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

enum class MigrationStrategy : uint8_t {
    GracefulDrain,   // Stop new traffic, wait for in-flight, then switch
    Immediate,       // Close old, open new; in-flight exchanges are dropped
    Overlap,         // Open new first, keep both for a window, then close old
    StatePreserving  // Serialize session state, reconnect, restore state
};

inline constexpr size_t kMigrationStrategyCount = 4;

[[nodiscard]] constexpr std::string_view to_string(MigrationStrategy strategy) noexcept {
    switch (strategy) {
        case MigrationStrategy::GracefulDrain:
            return "graceful_drain";
        case MigrationStrategy::Immediate:
            return "immediate";
        case MigrationStrategy::Overlap:
            return "overlap";
        case MigrationStrategy::StatePreserving:
            return "state_preserving";
    }
    return "unknown";
}

[[nodiscard]] std::optional<MigrationStrategy> parse_migration_strategy(std::string_view name);

struct MigrationOptions {
    std::chrono::milliseconds drain_timeout{5000};    // Graceful drain upper bound
    std::chrono::milliseconds overlap_window{500};    // Both connections live
    std::chrono::milliseconds connect_timeout{5000};  // Opening the new connection
};

/// One migration in progress. Owned by the caller for its duration.
struct MigrationPlan {
    Session* session = nullptr;
    ProtocolKind from = ProtocolKind::Http;
    ProtocolKind to = ProtocolKind::Http;
    MigrationStrategy strategy = MigrationStrategy::GracefulDrain;
    Clock::time_point started_at{};

    std::shared_ptr<BoundConnection> previous;  // Binding when the plan was made
    std::shared_ptr<BoundConnection> next;      // Set once the new connection is open
    std::vector<uint8_t> captured_state;        // State-preserving: MessagePack snapshot
};

struct MigrationResult {
    bool success = false;
    uint32_t dropped_connections = 0;  // In-flight exchanges abandoned
    uint64_t migration_time_ms = 0;
    MigrationStrategy strategy = MigrationStrategy::GracefulDrain;
    ProtocolKind from = ProtocolKind::Http;
    ProtocolKind to = ProtocolKind::Http;
    size_t state_bytes = 0;  // Size of the captured state snapshot

    std::error_code error;  // migration_failed on failure
    std::error_code cause;  // Underlying failure
    std::string reason;

    /// Previous binding still open and bound after a failure
    bool rolled_back = false;
};

/// Opens backend connections for a protocol
class ConnectionOpener {
public:
    virtual ~ConnectionOpener() = default;

    [[nodiscard]] virtual std::error_code open(ProtocolKind protocol, Deadline deadline,
                                               std::shared_ptr<BoundConnection>& out) = 0;
};

/// One migration strategy
class MigrationExecutor {
public:
    virtual ~MigrationExecutor() = default;

    [[nodiscard]] virtual MigrationStrategy strategy() const noexcept = 0;

    /// Carry out the plan. On success the session is bound to plan.next.
    /// `dropped` counts in-flight exchanges abandoned along the way.
    [[nodiscard]] virtual std::error_code execute(MigrationPlan& plan, ConnectionOpener& opener,
                                                  const MigrationOptions& options,
                                                  uint32_t& dropped) = 0;
};

class GracefulDrainExecutor final : public MigrationExecutor {
public:
    [[nodiscard]] MigrationStrategy strategy() const noexcept override {
        return MigrationStrategy::GracefulDrain;
    }
    [[nodiscard]] std::error_code execute(MigrationPlan& plan, ConnectionOpener& opener,
                                          const MigrationOptions& options,
                                          uint32_t& dropped) override;
};

class ImmediateExecutor final : public MigrationExecutor {
public:
    [[nodiscard]] MigrationStrategy strategy() const noexcept override {
        return MigrationStrategy::Immediate;
    }
    [[nodiscard]] std::error_code execute(MigrationPlan& plan, ConnectionOpener& opener,
                                          const MigrationOptions& options,
                                          uint32_t& dropped) override;
};

class OverlapExecutor final : public MigrationExecutor {
public:
    [[nodiscard]] MigrationStrategy strategy() const noexcept override {
        return MigrationStrategy::Overlap;
    }
    [[nodiscard]] std::error_code execute(MigrationPlan& plan, ConnectionOpener& opener,
                                          const MigrationOptions& options,
                                          uint32_t& dropped) override;
};

class StatePreservingExecutor final : public MigrationExecutor {
public:
    [[nodiscard]] MigrationStrategy strategy() const noexcept override {
        return MigrationStrategy::StatePreserving;
    }
    [[nodiscard]] std::error_code execute(MigrationPlan& plan, ConnectionOpener& opener,
                                          const MigrationOptions& options,
                                          uint32_t& dropped) override;
};

[[nodiscard]] std::unique_ptr<MigrationExecutor> make_executor(MigrationStrategy strategy);

/// Runs migrations. Does not touch the session's state machine: callers
/// dispatch Switch before and Switched/Error after.
class ConnectionMigrator {
public:
    explicit ConnectionMigrator(ConnectionOpener& opener, MigrationOptions options = {},
                                quill::Logger* logger = nullptr);

    /// Snapshot the session's binding into a new plan
    [[nodiscard]] MigrationPlan prepare(Session& session, ProtocolKind from, ProtocolKind to,
                                        MigrationStrategy strategy) const;

    /// Run a prepared plan. On success the session's protocol is `to`.
    [[nodiscard]] MigrationResult execute(MigrationPlan& plan);

    /// prepare() + execute()
    [[nodiscard]] MigrationResult migrate(Session& session, ProtocolKind from, ProtocolKind to,
                                          MigrationStrategy strategy);

    [[nodiscard]] const MigrationOptions& options() const noexcept { return options_; }

private:
    ConnectionOpener& opener_;
    MigrationOptions options_;
    std::array<std::unique_ptr<MigrationExecutor>, kMigrationStrategyCount> executors_;
    quill::Logger* logger_;
};

}  // namespace prism::gateway
