// Prism Test Support
// In-memory adapter, recording event sink and gateway fixtures

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/errors.hpp"
#include "../../src/gateway/connector.hpp"
#include "../../src/gateway/events.hpp"
#include "../../src/gateway/gateway.hpp"
#include "../../src/protocol/adapter.hpp"

namespace prism::testing {

using protocol::ProtocolKind;

/// Knobs shared by every FakeAdapter of one test
struct FakeNetwork {
    std::atomic<bool> fail_sends{false};
    std::atomic<bool> drop_replies{false};     // receive() times out
    std::atomic<bool> close_on_receive{false};  // Peer hangs up mid-exchange
    std::atomic<int> reply_delay_ms{0};
    std::atomic<uint64_t> connects{0};
    std::atomic<uint64_t> disconnects{0};

    void refuse(uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        refused_.insert(port);
    }

    void allow(uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        refused_.erase(port);
    }

    bool refuses(uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        return refused_.contains(port);
    }

private:
    std::mutex mutex_;
    std::set<uint16_t> refused_;
};

/// Replies queued on one fake connection
class FakeState final : public protocol::TransportState {
public:
    std::deque<std::vector<uint8_t>> pending;
};

/// Adapter without sockets. Every send queues the reply
/// "<protocol>@<host:port>|<payload>" for the next receive.
class FakeAdapter final : public protocol::ProtocolAdapter {
public:
    FakeAdapter(ProtocolKind kind, std::shared_ptr<FakeNetwork> network)
        : ProtocolAdapter(kind, protocol::AdapterOptions{}, nullptr),
          network_(std::move(network)) {}

    std::error_code connect(const protocol::Endpoint& target, protocol::Deadline deadline,
                            protocol::Connection& out) override {
        if (network_->refuses(target.port) || protocol::Clock::now() >= deadline) {
            return core::GatewayErrc::transport_unavailable;
        }
        init_connection(out, protocol::ConnectionRole::Client, -1, target.address());
        out.endpoint_id = target.id;
        out.authority = target.address();
        out.transport = std::make_unique<FakeState>();
        network_->connects++;
        return {};
    }

    std::error_code send(protocol::Connection& conn, std::span<const uint8_t> payload) override {
        if (!conn.open || network_->fail_sends.load()) {
            return core::GatewayErrc::send_failed;
        }
        std::string reply = std::string(protocol::to_string(kind())) + "@" + conn.peer + "|";
        reply.append(reinterpret_cast<const char*>(payload.data()), payload.size());
        conn.state<FakeState>()->pending.push_back(protocol::to_bytes(reply));
        conn.stats.messages_sent++;
        return {};
    }

    std::error_code receive(protocol::Connection& conn, std::chrono::milliseconds timeout,
                            protocol::Message& out) override {
        if (!conn.open) {
            return core::GatewayErrc::connection_closed;
        }
        if (network_->close_on_receive.load()) {
            conn.open = false;
            return core::GatewayErrc::connection_closed;
        }

        auto delay = std::chrono::milliseconds(network_->reply_delay_ms.load());
        if (network_->drop_replies.load() || delay > timeout) {
            std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(50)));
            return core::GatewayErrc::receive_timeout;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        auto* state = conn.state<FakeState>();
        if (!state || state->pending.empty()) {
            return core::GatewayErrc::receive_timeout;
        }
        out.protocol = kind();
        out.payload = std::move(state->pending.front());
        out.received_at = protocol::Clock::now();
        state->pending.pop_front();
        conn.stats.messages_received++;
        return {};
    }

    void disconnect(protocol::Connection& conn) noexcept override {
        if (conn.open) {
            conn.open = false;
            network_->disconnects++;
        }
        conn.transport.reset();
    }

    bool is_connected(const protocol::Connection& conn) const noexcept override {
        return conn.open;
    }

private:
    std::shared_ptr<FakeNetwork> network_;
};

/// Keeps every event for inspection
class RecordingSink final : public gateway::EventSink {
public:
    void emit(const gateway::GatewayEvent& event) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<gateway::GatewayEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(gateway::EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                n++;
            }
        }
        return n;
    }

    std::optional<gateway::GatewayEvent> last(gateway::EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->type == type) {
                return *it;
            }
        }
        return std::nullopt;
    }

private:
    mutable std::mutex mutex_;
    std::vector<gateway::GatewayEvent> events_;
};

/// Port used for the fake endpoint of each protocol
inline uint16_t fake_port(ProtocolKind kind, uint16_t replica = 0) {
    return static_cast<uint16_t>(9000 + protocol::index_of(kind) * 10 + replica);
}

inline protocol::Endpoint make_endpoint(ProtocolKind kind, uint16_t port, uint32_t weight = 1) {
    protocol::Endpoint endpoint;
    endpoint.protocol = kind;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    endpoint.weight = weight;
    return endpoint;
}

/// Registry, adapters and connector over the fake network
struct FakeBackend {
    std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>();
    gateway::EndpointRegistry registry;
    gateway::AdapterSet adapters;
    std::unique_ptr<gateway::LoadBalancer> balancer =
        gateway::make_balancer(gateway::BalancingStrategy::RoundRobin);
    gateway::EndpointConnector connector{registry, *balancer, adapters};

    FakeBackend() {
        for (auto kind : protocol::kAllProtocols) {
            REQUIRE_FALSE(adapters.add(std::make_unique<FakeAdapter>(kind, network)));
            uint64_t id = 0;
            REQUIRE_FALSE(registry.register_endpoint(make_endpoint(kind, fake_port(kind)), id));
        }
    }
};

/// Gateway over fake adapters with one endpoint per protocol
struct GatewayFixture {
    std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>();
    RecordingSink* sink = nullptr;
    std::unique_ptr<gateway::Gateway> gateway;

    explicit GatewayFixture(gateway::GatewayOptions options = fast_options(),
                            std::unique_ptr<gateway::MessageHandler> handler = nullptr) {
        auto recording = std::make_unique<RecordingSink>();
        sink = recording.get();
        gateway = std::make_unique<gateway::Gateway>(std::move(options), std::move(handler),
                                                     std::move(recording));
        for (auto kind : protocol::kAllProtocols) {
            REQUIRE_FALSE(gateway->register_adapter(std::make_unique<FakeAdapter>(kind, network)));
            uint64_t id = 0;
            REQUIRE_FALSE(gateway->register_endpoint(make_endpoint(kind, fake_port(kind)), id));
        }
    }

    static gateway::GatewayOptions fast_options() {
        gateway::GatewayOptions options;
        options.connect_timeout = std::chrono::milliseconds(500);
        options.receive_timeout = std::chrono::milliseconds(500);
        options.retry_backoff = std::chrono::milliseconds(0);
        options.migration.drain_timeout = std::chrono::milliseconds(200);
        options.migration.overlap_window = std::chrono::milliseconds(20);
        options.migration.connect_timeout = std::chrono::milliseconds(500);
        options.health.enabled = false;
        return options;
    }
};

inline protocol::Message text_message(ProtocolKind kind, std::string_view text) {
    return protocol::Message::from_text(kind, text);
}

}  // namespace prism::testing
