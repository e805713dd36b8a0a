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

// Prism Session - Header
// Logical client sessions and their bound backend connections

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/containers.hpp"
#include "../protocol/adapter.hpp"
#include "endpoint_registry.hpp"
#include "state_machine.hpp"

namespace prism::gateway {

using protocol::Deadline;
using protocol::Message;

struct MigrationPlan;

/// A backend connection owned by one session, together with the adapter
/// that drives it and the endpoint load it holds.
class BoundConnection {
public:
    BoundConnection(protocol::ProtocolAdapter& adapter, protocol::Connection connection,
                    EndpointLease lease);
    ~BoundConnection();

    // Non-copyable, non-movable (shared between the session and migrations)
    BoundConnection(const BoundConnection&) = delete;
    BoundConnection& operator=(const BoundConnection&) = delete;

    /// Send one request and wait for its reply. Exchanges on one connection
    /// are serialized.
    [[nodiscard]] std::error_code exchange(std::span<const uint8_t> payload,
                                           std::chrono::milliseconds timeout, Message& reply);

    /// Tear the connection down and release the endpoint load. Unblocks a
    /// concurrent exchange first. Idempotent.
    void close() noexcept;

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] ProtocolKind protocol() const noexcept { return protocol_; }
    [[nodiscard]] uint64_t endpoint_id() const noexcept { return endpoint_id_; }
    [[nodiscard]] uint64_t connection_id() const noexcept { return connection_id_; }
    [[nodiscard]] uint32_t in_flight() const noexcept {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    protocol::ProtocolAdapter& adapter_;
    protocol::Connection connection_;
    EndpointLease lease_;

    ProtocolKind protocol_;
    uint64_t endpoint_id_;
    uint64_t connection_id_;
    std::atomic<int> fd_;  // Copy of connection_.fd for unlocked shutdown
    std::atomic<bool> closed_{false};
    std::atomic<bool> open_{true};  // Transport state after the last exchange
    std::atomic<uint32_t> in_flight_{0};

    mutable std::mutex io_mutex_;
};

/// One logical client session.
///
/// Locking:
///  - control_mutex() serializes state machine dispatch (connect, switch,
///    disconnect, recovery) for this session only.
///  - The binding is swapped under its own mutex; exchanges take a
///    shared_ptr copy and never hold the session lock across I/O.
///  - The traffic gate pauses new exchanges during drains.
class Session {
public:
    Session(std::string id, ProtocolKind protocol);
    ~Session();

    // Non-copyable, non-movable (state machine actions capture it)
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] ProtocolKind current_protocol() const noexcept {
        return protocol_.load(std::memory_order_acquire);
    }
    void set_current_protocol(ProtocolKind protocol) noexcept {
        protocol_.store(protocol, std::memory_order_release);
    }

    [[nodiscard]] StateMachine& machine() noexcept { return machine_; }
    [[nodiscard]] GatewayState state() const noexcept { return machine_.state(); }
    [[nodiscard]] std::mutex& control_mutex() noexcept { return control_mutex_; }

    // Application state carried across migrations

    [[nodiscard]] nlohmann::json application_state() const;
    void set_application_state(nlohmann::json state);
    void update_application_state(std::string_view key, nlohmann::json value);

    // Binding

    [[nodiscard]] std::shared_ptr<BoundConnection> binding() const;

    /// Install a new binding and return the previous one
    std::shared_ptr<BoundConnection> swap_binding(std::shared_ptr<BoundConnection> next);

    /// Second connection held during an overlap migration (nullptr clears it)
    void set_overlap(std::shared_ptr<BoundConnection> pending);

    /// Number of open connections bound to this session (0, 1, or 2 during overlap)
    [[nodiscard]] size_t bound_connections() const;

    /// Connection opened by Connect, waiting for Connected to bind it
    void stage_binding(std::shared_ptr<BoundConnection> staged);
    [[nodiscard]] std::shared_ptr<BoundConnection> take_staged_binding();

    // Migration plan (touched only under control_mutex())

    void begin_plan(std::unique_ptr<MigrationPlan> plan);
    [[nodiscard]] MigrationPlan* plan() const noexcept { return plan_.get(); }
    std::unique_ptr<MigrationPlan> end_plan();

    // Migration flag

    /// False when a migration is already running
    [[nodiscard]] bool try_begin_migration() noexcept;
    void end_migration() noexcept;
    [[nodiscard]] bool migrating() const noexcept {
        return migrating_.load(std::memory_order_acquire);
    }

    // Traffic gate

    void pause_traffic();
    void resume_traffic();
    [[nodiscard]] bool accepting() const;

    /// Wait until no exchange is in flight. Returns the number still in flight
    /// when the deadline passes (0 when drained).
    [[nodiscard]] uint32_t wait_drained(Deadline deadline);

    [[nodiscard]] uint32_t in_flight() const;

    /// Exchange on the current binding. Waits (bounded by `timeout`) while
    /// traffic is paused. session_unavailable when paused past the deadline
    /// or unbound.
    [[nodiscard]] std::error_code exchange(std::span<const uint8_t> payload,
                                           std::chrono::milliseconds timeout, Message& reply);

    // Bookkeeping

    [[nodiscard]] Clock::time_point created_at() const noexcept { return created_at_; }
    [[nodiscard]] Clock::time_point last_activity() const noexcept;
    void touch() noexcept;

    /// Count one failed exchange; returns the new consecutive count
    uint32_t record_failure() noexcept;
    void reset_failures() noexcept { consecutive_failures_.store(0, std::memory_order_release); }
    [[nodiscard]] uint32_t consecutive_failures() const noexcept {
        return consecutive_failures_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t messages() const noexcept {
        return messages_.load(std::memory_order_relaxed);
    }

    /// Session summary for the admin report
    [[nodiscard]] nlohmann::json describe() const;

private:
    std::string id_;
    std::atomic<ProtocolKind> protocol_;
    StateMachine machine_;
    std::mutex control_mutex_;

    mutable std::mutex state_mutex_;
    nlohmann::json application_state_ = nlohmann::json::object();

    mutable std::mutex binding_mutex_;
    std::shared_ptr<BoundConnection> binding_;
    std::shared_ptr<BoundConnection> overlap_;
    std::shared_ptr<BoundConnection> staged_;

    std::unique_ptr<MigrationPlan> plan_;

    std::atomic<bool> migrating_{false};

    mutable std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool accepting_ = true;
    uint32_t in_flight_ = 0;

    Clock::time_point created_at_;
    std::atomic<int64_t> last_activity_;
    std::atomic<uint32_t> consecutive_failures_{0};
    std::atomic<uint64_t> messages_{0};
};

/// Live sessions by id
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Create a session in Idle with a fresh {uuid}#{counter} id
    [[nodiscard]] std::shared_ptr<Session> create(ProtocolKind protocol);

    [[nodiscard]] std::shared_ptr<Session> find(std::string_view id) const;

    /// Remove and return the session (nullptr when unknown)
    std::shared_ptr<Session> remove(std::string_view id);

    [[nodiscard]] std::vector<std::shared_ptr<Session>> list() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace prism::gateway
