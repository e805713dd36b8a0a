// Prism Metrics - Header
// Lock-free gateway counters

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "../protocol/protocol.hpp"

namespace prism::control {

/// Counters snapshot at a point in time
struct MetricsSnapshot {
    // Sessions
    uint64_t sessions_opened = 0;
    uint64_t sessions_closed = 0;
    uint64_t active_sessions = 0;

    // Traffic
    uint64_t messages_handled = 0;
    uint64_t handler_failures = 0;
    uint64_t exchange_failures = 0;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;

    // Routing and migration
    uint64_t routing_decisions = 0;
    uint64_t migrations_started = 0;
    uint64_t migrations_failed = 0;
    uint64_t dropped_connections = 0;
    uint64_t total_migration_ms = 0;

    // Health
    uint64_t health_checks = 0;
    uint64_t health_check_failures = 0;

    // Per-protocol routing targets
    std::array<uint64_t, protocol::kProtocolCount> routed_to{};

    [[nodiscard]] double avg_migration_ms() const noexcept {
        uint64_t completed = migrations_started - migrations_failed;
        if (completed == 0) return 0.0;
        return static_cast<double>(total_migration_ms) / static_cast<double>(completed);
    }
};

/// Gateway-wide counters (lock-free, relaxed ordering)
class GatewayMetrics {
public:
    GatewayMetrics() = default;
    ~GatewayMetrics() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;

    void record_session_opened() noexcept {
        sessions_opened_.fetch_add(1, std::memory_order_relaxed);
        active_sessions_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_session_closed() noexcept {
        sessions_closed_.fetch_add(1, std::memory_order_relaxed);
        // Never below zero
        uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_sessions_.compare_exchange_weak(current, current - 1,
                                                       std::memory_order_relaxed)) {
        }
    }

    void record_message(uint64_t bytes_in, uint64_t bytes_out) noexcept {
        messages_handled_.fetch_add(1, std::memory_order_relaxed);
        bytes_received_.fetch_add(bytes_in, std::memory_order_relaxed);
        bytes_sent_.fetch_add(bytes_out, std::memory_order_relaxed);
    }

    void record_handler_failure() noexcept {
        handler_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_exchange_failure() noexcept {
        exchange_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_routing_decision(protocol::ProtocolKind target) noexcept {
        routing_decisions_.fetch_add(1, std::memory_order_relaxed);
        routed_to_[protocol::index_of(target)].fetch_add(1, std::memory_order_relaxed);
    }

    void record_migration(bool success, uint64_t dropped, std::chrono::milliseconds elapsed) noexcept {
        migrations_started_.fetch_add(1, std::memory_order_relaxed);
        if (!success) {
            migrations_failed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_migration_ms_.fetch_add(static_cast<uint64_t>(elapsed.count()),
                                          std::memory_order_relaxed);
        }
        dropped_connections_.fetch_add(dropped, std::memory_order_relaxed);
    }

    void record_health_check(bool healthy) noexcept {
        health_checks_.fetch_add(1, std::memory_order_relaxed);
        if (!healthy) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /// Get current counters snapshot
    [[nodiscard]] MetricsSnapshot snapshot() const noexcept {
        MetricsSnapshot snap;
        snap.sessions_opened = sessions_opened_.load(std::memory_order_relaxed);
        snap.sessions_closed = sessions_closed_.load(std::memory_order_relaxed);
        snap.active_sessions = active_sessions_.load(std::memory_order_relaxed);
        snap.messages_handled = messages_handled_.load(std::memory_order_relaxed);
        snap.handler_failures = handler_failures_.load(std::memory_order_relaxed);
        snap.exchange_failures = exchange_failures_.load(std::memory_order_relaxed);
        snap.bytes_received = bytes_received_.load(std::memory_order_relaxed);
        snap.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
        snap.routing_decisions = routing_decisions_.load(std::memory_order_relaxed);
        snap.migrations_started = migrations_started_.load(std::memory_order_relaxed);
        snap.migrations_failed = migrations_failed_.load(std::memory_order_relaxed);
        snap.dropped_connections = dropped_connections_.load(std::memory_order_relaxed);
        snap.total_migration_ms = total_migration_ms_.load(std::memory_order_relaxed);
        snap.health_checks = health_checks_.load(std::memory_order_relaxed);
        snap.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
        for (size_t i = 0; i < routed_to_.size(); ++i) {
            snap.routed_to[i] = routed_to_[i].load(std::memory_order_relaxed);
        }
        return snap;
    }

private:
    std::atomic<uint64_t> sessions_opened_{0};
    std::atomic<uint64_t> sessions_closed_{0};
    std::atomic<uint64_t> active_sessions_{0};
    std::atomic<uint64_t> messages_handled_{0};
    std::atomic<uint64_t> handler_failures_{0};
    std::atomic<uint64_t> exchange_failures_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> routing_decisions_{0};
    std::atomic<uint64_t> migrations_started_{0};
    std::atomic<uint64_t> migrations_failed_{0};
    std::atomic<uint64_t> dropped_connections_{0};
    std::atomic<uint64_t> total_migration_ms_{0};
    std::atomic<uint64_t> health_checks_{0};
    std::atomic<uint64_t> health_check_failures_{0};
    std::array<std::atomic<uint64_t>, protocol::kProtocolCount> routed_to_{};
};

}  // namespace prism::control
