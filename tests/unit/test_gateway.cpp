// Prism Gateway Facade Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/gateway/gateway.hpp"
#include "test_support.hpp"

using namespace prism;
using namespace prism::gateway;
using namespace std::chrono_literals;
using prism::testing::GatewayFixture;
using prism::testing::fake_port;
using prism::testing::make_endpoint;
using prism::testing::text_message;

namespace {

std::string expected_reply(ProtocolKind kind, std::string_view payload) {
    return std::string(protocol::to_string(kind)) + "@127.0.0.1:" +
           std::to_string(fake_port(kind)) + "|" + std::string(payload);
}

std::string open(GatewayFixture& fixture, ProtocolKind kind) {
    std::string id;
    REQUIRE_FALSE(fixture.gateway->open_session(kind, id));
    REQUIRE_FALSE(id.empty());
    return id;
}

uint64_t endpoint_id_for(Gateway& gateway, ProtocolKind kind) {
    auto endpoints = gateway.registry().snapshot(kind);
    REQUIRE(endpoints.size() == 1);
    return endpoints.front().id;
}

RoutingRule metadata_rule(std::string key, std::string value, ProtocolKind target,
                          int32_t priority, std::string description) {
    RouteCondition condition = [key = std::move(key), value = std::move(value)](
                                   const Message& message, const RoutingContext&) {
        return message.find_metadata(key) == value;
    };
    return RoutingRule{std::move(condition), target, priority, std::move(description)};
}

/// Fails or throws on demand, otherwise answers "ok"
class ScriptedHandler final : public MessageHandler {
public:
    std::atomic<bool> fail{false};
    std::atomic<bool> throw_error{false};
    std::atomic<bool> unavailable{false};

    std::error_code handle(const Message&, Session&, Message& reply) override {
        if (throw_error.load()) {
            throw std::runtime_error("handler exploded");
        }
        if (unavailable.load()) {
            return core::GatewayErrc::session_unavailable;
        }
        if (fail.load()) {
            return core::GatewayErrc::handler_failed;
        }
        reply.payload = protocol::to_bytes("ok");
        return {};
    }
};

}  // namespace

TEST_CASE("Routing to a realtime endpoint", "[gateway][scenario]") {
    Gateway gateway(GatewayFixture::fast_options(), nullptr, std::make_unique<NullEventSink>());
    uint64_t http_id = 0;
    uint64_t ws_id = 0;
    REQUIRE_FALSE(gateway.register_endpoint(make_endpoint(ProtocolKind::Http, 8080), http_id));
    REQUIRE_FALSE(gateway.register_endpoint(make_endpoint(ProtocolKind::WebSocket, 8081), ws_id));
    gateway.add_rule(metadata_rule("channel", "realtime", ProtocolKind::WebSocket, 100, "realtime"));

    auto message = text_message(ProtocolKind::Http, "tick");
    message.metadata.emplace_back("channel", "realtime");
    REQUIRE(gateway.router().route(message, {}) == ProtocolKind::WebSocket);

    auto balancer = make_balancer(BalancingStrategy::RoundRobin);
    auto endpoints = gateway.registry().all();
    const Endpoint* selected = balancer->select(ProtocolKind::WebSocket, endpoints);
    REQUIRE(selected != nullptr);
    REQUIRE(selected->port == 8081);
    REQUIRE(selected->id == ws_id);
}

TEST_CASE("Overlap switch from HTTP to WebSocket", "[gateway][scenario]") {
    GatewayFixture fixture;
    auto id = open(fixture, ProtocolKind::Http);

    auto result = fixture.gateway->switch_protocol(id, ProtocolKind::WebSocket,
                                                   MigrationStrategy::Overlap);
    REQUIRE(result.success);
    REQUIRE_FALSE(result.error);
    REQUIRE(result.dropped_connections == 0);
    REQUIRE(result.from == ProtocolKind::Http);
    REQUIRE(result.to == ProtocolKind::WebSocket);

    auto session = fixture.gateway->find_session(id);
    REQUIRE(session->state() == GatewayState::Connected);
    REQUIRE(session->current_protocol() == ProtocolKind::WebSocket);
    REQUIRE(session->bound_connections() == 1);

    Message reply;
    REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http, "hi"), reply));
    REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::WebSocket, "hi"));

    REQUIRE(fixture.sink->count(EventType::ProtocolSwitch) == 1);
    auto complete = fixture.sink->last(EventType::MigrationComplete);
    REQUIRE(complete.has_value());
    REQUIRE(complete->find("strategy") == "overlap");
    REQUIRE(complete->find("success") == "true");
    REQUIRE(complete->find("dropped_connections") == "0");
    REQUIRE(fixture.gateway->metrics().migrations_started == 1);
}

TEST_CASE("Unhealthy endpoint is never selected", "[gateway][scenario]") {
    EndpointRegistry registry;
    uint64_t id = 0;
    REQUIRE_FALSE(registry.register_endpoint(make_endpoint(ProtocolKind::Tcp, 7000), id));
    REQUIRE(registry.set_healthy(id, false));

    auto balancer = make_balancer(BalancingStrategy::RoundRobin);
    auto endpoints = registry.snapshot(ProtocolKind::Tcp);
    REQUIRE(balancer->select(ProtocolKind::Tcp, endpoints) == nullptr);

    SECTION("sessions cannot open on that protocol") {
        GatewayFixture fixture;
        REQUIRE(fixture.gateway->registry().set_healthy(
            endpoint_id_for(*fixture.gateway, ProtocolKind::Tcp), false));

        std::string session_id;
        auto ec = fixture.gateway->open_session(ProtocolKind::Tcp, session_id);
        REQUIRE(ec == core::GatewayErrc::no_healthy_endpoint);
        REQUIRE(session_id.empty());
        REQUIRE(fixture.gateway->sessions().size() == 0);
    }
}

TEST_CASE("Gateway setup", "[gateway]") {
    Gateway gateway(GatewayFixture::fast_options(), nullptr, std::make_unique<NullEventSink>());
    auto network = std::make_shared<prism::testing::FakeNetwork>();

    SECTION("adapters register once per protocol") {
        REQUIRE(gateway.register_adapter(nullptr) == core::GatewayErrc::invalid_argument);
        REQUIRE_FALSE(gateway.register_adapter(
            std::make_unique<prism::testing::FakeAdapter>(ProtocolKind::Tcp, network)));
        REQUIRE(gateway.register_adapter(std::make_unique<prism::testing::FakeAdapter>(
                    ProtocolKind::Tcp, network)) == core::GatewayErrc::invalid_argument);
    }

    SECTION("protocols without an adapter are unsupported") {
        std::string id;
        REQUIRE(gateway.open_session(ProtocolKind::Udp, id) ==
                core::GatewayErrc::unsupported_protocol);
        REQUIRE(gateway.listen(ProtocolKind::Udp, "127.0.0.1", 0) ==
                core::GatewayErrc::unsupported_protocol);
    }

    SECTION("endpoint registration") {
        uint64_t id = 0;
        REQUIRE(gateway.register_endpoint(make_endpoint(ProtocolKind::Http, 0), id) ==
                core::GatewayErrc::invalid_argument);
        REQUIRE_FALSE(gateway.register_endpoint(make_endpoint(ProtocolKind::Http, 80), id));
        REQUIRE(gateway.deregister_endpoint(id));
        REQUIRE_FALSE(gateway.deregister_endpoint(id));
    }
}

TEST_CASE("Session lifecycle", "[gateway][session]") {
    GatewayFixture fixture;
    auto& gateway = *fixture.gateway;
    auto id = open(fixture, ProtocolKind::Tcp);

    auto session = gateway.find_session(id);
    REQUIRE(session != nullptr);
    REQUIRE(session->state() == GatewayState::Connected);
    REQUIRE(session->current_protocol() == ProtocolKind::Tcp);
    REQUIRE(gateway.registry().find(endpoint_id_for(gateway, ProtocolKind::Tcp))->current_load == 1);
    REQUIRE(gateway.metrics().sessions_opened == 1);

    REQUIRE_FALSE(gateway.recover_session(id));  // Already connected

    REQUIRE_FALSE(gateway.close_session(id));
    REQUIRE(gateway.find_session(id) == nullptr);
    REQUIRE(session->state() == GatewayState::Idle);
    REQUIRE(gateway.registry().find(endpoint_id_for(gateway, ProtocolKind::Tcp))->current_load == 0);
    REQUIRE(fixture.network->disconnects == 1);
    REQUIRE(gateway.metrics().sessions_closed == 1);

    REQUIRE(gateway.close_session(id) == core::GatewayErrc::session_not_found);
    REQUIRE(gateway.recover_session(id) == core::GatewayErrc::session_not_found);
}

TEST_CASE("Concurrent sessions respect endpoint capacity", "[gateway][session][concurrency]") {
    auto options = GatewayFixture::fast_options();
    options.balancing = BalancingStrategy::LeastConnections;
    GatewayFixture fixture(options);
    auto& gateway = *fixture.gateway;

    REQUIRE(gateway.deregister_endpoint(endpoint_id_for(gateway, ProtocolKind::Tcp)));
    auto capped = make_endpoint(ProtocolKind::Tcp, fake_port(ProtocolKind::Tcp));
    capped.max_load = 2;
    uint64_t capped_id = 0;
    REQUIRE_FALSE(gateway.register_endpoint(capped, capped_id));

    std::atomic<int> opened{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            std::string id;
            if (gateway.open_session(ProtocolKind::Tcp, id)) {
                refused++;
            } else {
                opened++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(opened == 2);
    REQUIRE(refused == 6);
    REQUIRE(gateway.registry().find(capped_id)->current_load == 2);
    REQUIRE(gateway.sessions().size() == 2);
}

TEST_CASE("Messages are forwarded over the session binding", "[gateway][handle]") {
    GatewayFixture fixture;
    auto id = open(fixture, ProtocolKind::Http);

    Message reply;
    REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http, "hello"),
                                                  reply));
    REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::Http, "hello"));

    auto snap = fixture.gateway->metrics();
    REQUIRE(snap.messages_handled == 1);
    REQUIRE(snap.bytes_received == 5);
    REQUIRE(snap.bytes_sent == reply.payload.size());
    REQUIRE(snap.routing_decisions == 1);
    REQUIRE(snap.routed_to[protocol::index_of(ProtocolKind::Http)] == 1);

    auto routing = fixture.sink->last(EventType::RoutingDecision);
    REQUIRE(routing.has_value());
    REQUIRE(routing->find("session") == id);
    REQUIRE(routing->find("target") == "http");
    REQUIRE(routing->find("matched") == "false");

    SECTION("unknown session") {
        REQUIRE(fixture.gateway->handle_message("missing", text_message(ProtocolKind::Http, "x"),
                                                reply) == core::GatewayErrc::session_not_found);
    }
}

TEST_CASE("Routing rules switch the session protocol", "[gateway][handle]") {
    GatewayFixture fixture;
    fixture.gateway->add_rule(
        metadata_rule("channel", "realtime", ProtocolKind::WebSocket, 100, "realtime"));
    fixture.gateway->add_rule(metadata_rule("channel", "bulk", ProtocolKind::Tcp, 50, "bulk"));
    auto id = open(fixture, ProtocolKind::Http);

    auto message = text_message(ProtocolKind::Http, "tick");
    message.metadata.emplace_back("channel", "realtime");

    Message reply;
    REQUIRE_FALSE(fixture.gateway->handle_message(id, message, reply));
    REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::WebSocket, "tick"));
    REQUIRE(fixture.gateway->find_session(id)->current_protocol() == ProtocolKind::WebSocket);

    auto routing = fixture.sink->last(EventType::RoutingDecision);
    REQUIRE(routing->find("rule") == "realtime");
    REQUIRE(routing->find("priority") == "100");
    auto complete = fixture.sink->last(EventType::MigrationComplete);
    REQUIRE(complete->find("strategy") == "graceful_drain");

    SECTION("an unmatched message returns to the default protocol") {
        REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http, "x"),
                                                      reply));
        REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::Http, "x"));
        REQUIRE(fixture.sink->count(EventType::ProtocolSwitch) == 2);
    }

    SECTION("a refused target keeps the session where it is") {
        fixture.network->refuse(fake_port(ProtocolKind::Tcp));
        auto bulk = text_message(ProtocolKind::Http, "load");
        bulk.metadata.emplace_back("channel", "bulk");

        auto ec = fixture.gateway->handle_message(id, bulk, reply);
        REQUIRE(ec == core::GatewayErrc::migration_failed);
        REQUIRE(fixture.gateway->metrics().migrations_failed == 1);
    }
}

TEST_CASE("Switch validation", "[gateway][switch]") {
    GatewayFixture fixture;
    auto id = open(fixture, ProtocolKind::Http);

    SECTION("same protocol is refused by the guard") {
        auto result = fixture.gateway->switch_protocol(id, ProtocolKind::Http);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == core::GatewayErrc::guard_rejected);
        REQUIRE(fixture.gateway->find_session(id)->state() == GatewayState::Connected);
    }

    SECTION("unknown session") {
        auto result = fixture.gateway->switch_protocol("missing", ProtocolKind::Tcp);
        REQUIRE(result.error == core::GatewayErrc::session_not_found);
    }

    SECTION("default strategy from the options") {
        auto result = fixture.gateway->switch_protocol(id, ProtocolKind::Udp);
        REQUIRE(result.success);
        REQUIRE(result.strategy == MigrationStrategy::GracefulDrain);
    }

    SECTION("every strategy lands on the target") {
        for (auto strategy : {MigrationStrategy::Immediate, MigrationStrategy::StatePreserving}) {
            auto target = fixture.gateway->find_session(id)->current_protocol() == ProtocolKind::Tcp
                              ? ProtocolKind::Http2
                              : ProtocolKind::Tcp;
            auto result = fixture.gateway->switch_protocol(id, target, strategy);
            REQUIRE(result.success);
            REQUIRE(fixture.gateway->find_session(id)->current_protocol() == target);
        }
    }
}

TEST_CASE("Failed switch rolls back and recovers", "[gateway][switch]") {
    GatewayFixture fixture;
    auto id = open(fixture, ProtocolKind::Http);
    auto session = fixture.gateway->find_session(id);
    fixture.network->refuse(fake_port(ProtocolKind::Tcp));

    auto result = fixture.gateway->switch_protocol(id, ProtocolKind::Tcp,
                                                   MigrationStrategy::GracefulDrain);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == core::GatewayErrc::migration_failed);
    REQUIRE(result.rolled_back);
    REQUIRE(session->state() == GatewayState::Error);
    REQUIRE(session->current_protocol() == ProtocolKind::Http);
    REQUIRE(session->binding()->is_open());

    auto complete = fixture.sink->last(EventType::MigrationComplete);
    REQUIRE(complete->find("success") == "false");
    REQUIRE(complete->find("error").has_value());
    REQUIRE(fixture.sink->count(EventType::ProtocolSwitch) == 0);

    SECTION("explicit recovery") {
        REQUIRE_FALSE(fixture.gateway->recover_session(id));
        REQUIRE(session->state() == GatewayState::Connected);
        REQUIRE(session->current_protocol() == ProtocolKind::Http);
        // The surviving binding is reused
        REQUIRE(fixture.network->connects == 1);
    }

    SECTION("the next message recovers the session") {
        Message reply;
        REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http, "again"),
                                                      reply));
        REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::Http, "again"));
        REQUIRE(session->state() == GatewayState::Connected);
    }
}

TEST_CASE("Concurrent switches on one session", "[gateway][switch][concurrency]") {
    auto options = GatewayFixture::fast_options();
    options.migration.overlap_window = 300ms;
    GatewayFixture fixture(options);
    auto a = open(fixture, ProtocolKind::Http);
    auto b = open(fixture, ProtocolKind::Http);
    auto session_a = fixture.gateway->find_session(a);

    auto first = std::async(std::launch::async, [&] {
        return fixture.gateway->switch_protocol(a, ProtocolKind::Tcp, MigrationStrategy::Overlap);
    });

    auto deadline = core::deadline_after(1000ms);
    while (!session_a->migrating() && protocol::Clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(session_a->migrating());

    SECTION("a second switch is rejected") {
        auto second = fixture.gateway->switch_protocol(a, ProtocolKind::Udp);
        REQUIRE_FALSE(second.success);
        REQUIRE(second.error == core::GatewayErrc::migration_in_progress);
    }

    SECTION("other sessions are not blocked") {
        auto start = protocol::Clock::now();
        Message reply;
        REQUIRE_FALSE(fixture.gateway->handle_message(b, text_message(ProtocolKind::Http, "b"),
                                                      reply));
        REQUIRE(protocol::Clock::now() - start < 200ms);
        REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::Http, "b"));
    }

    auto result = first.get();
    REQUIRE(result.success);
    REQUIRE(session_a->current_protocol() == ProtocolKind::Tcp);
    REQUIRE_FALSE(session_a->migrating());
}

TEST_CASE("Exchange failures", "[gateway][failures]") {
    SECTION("repeated failures disconnect the session") {
        GatewayFixture fixture;
        auto id = open(fixture, ProtocolKind::Udp);
        fixture.network->drop_replies = true;

        Message reply;
        for (int i = 0; i < 3; ++i) {
            auto ec = fixture.gateway->handle_message(id, text_message(ProtocolKind::Udp, "x"), reply);
            REQUIRE(ec == core::GatewayErrc::receive_timeout);
        }
        REQUIRE(fixture.gateway->find_session(id) == nullptr);
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Udp, "x"), reply) ==
                core::GatewayErrc::session_not_found);

        auto snap = fixture.gateway->metrics();
        REQUIRE(snap.exchange_failures == 3);
        REQUIRE(snap.handler_failures == 0);
        REQUIRE(fixture.sink->count(EventType::HandlerFailed) == 3);
    }

    SECTION("a success resets the count") {
        GatewayFixture fixture;
        auto id = open(fixture, ProtocolKind::Udp);
        auto session = fixture.gateway->find_session(id);

        Message reply;
        fixture.network->drop_replies = true;
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Udp, "x"), reply));
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Udp, "x"), reply));
        REQUIRE(session->consecutive_failures() == 2);
        REQUIRE(session->state() == GatewayState::Connected);

        fixture.network->drop_replies = false;
        REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Udp, "y"),
                                                      reply));
        REQUIRE(session->consecutive_failures() == 0);
    }

    SECTION("threshold zero never disconnects") {
        auto options = GatewayFixture::fast_options();
        options.failure_threshold = 0;
        GatewayFixture fixture(options);
        auto id = open(fixture, ProtocolKind::Tcp);
        fixture.network->fail_sends = true;

        Message reply;
        for (int i = 0; i < 5; ++i) {
            REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Tcp, "x"), reply) ==
                    core::GatewayErrc::send_failed);
        }
        REQUIRE(fixture.gateway->find_session(id) != nullptr);
    }
}

TEST_CASE("Handler errors", "[gateway][handler]") {
    auto handler = std::make_unique<ScriptedHandler>();
    auto* script = handler.get();
    GatewayFixture fixture(GatewayFixture::fast_options(), std::move(handler));
    auto id = open(fixture, ProtocolKind::Http2);
    Message reply;

    SECTION("custom handler replies") {
        REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http2, "x"),
                                                      reply));
        REQUIRE(reply.payload_view() == "ok");
    }

    SECTION("failures map to handler_failed") {
        script->fail = true;
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http2, "x"), reply) ==
                core::GatewayErrc::handler_failed);

        auto event = fixture.sink->last(EventType::HandlerFailed);
        REQUIRE(event.has_value());
        REQUIRE(event->find("session") == id);
        REQUIRE(event->find("protocol") == "http2");
        REQUIRE(event->find("error") == "handler failed");
        REQUIRE(fixture.gateway->metrics().handler_failures == 1);
        // Handler failures do not count towards the disconnect threshold
        REQUIRE(fixture.gateway->find_session(id)->consecutive_failures() == 0);
    }

    SECTION("exceptions never escape") {
        script->throw_error = true;
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http2, "x"), reply) ==
                core::GatewayErrc::handler_failed);
    }

    SECTION("unavailable sessions are reported as such") {
        script->unavailable = true;
        REQUIRE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http2, "x"), reply) ==
                core::GatewayErrc::session_unavailable);
    }
}

TEST_CASE("Idle sessions are reaped", "[gateway][session]") {
    auto options = GatewayFixture::fast_options();
    options.idle_timeout = 1000ms;
    GatewayFixture fixture(options);
    auto idle = open(fixture, ProtocolKind::Http);
    auto other = open(fixture, ProtocolKind::Tcp);

    REQUIRE(fixture.gateway->reap_idle_sessions() == 0);

    auto later = protocol::Clock::now() + 2000ms;
    REQUIRE(fixture.gateway->reap_idle_sessions(later) == 2);
    REQUIRE(fixture.gateway->find_session(idle) == nullptr);
    REQUIRE(fixture.gateway->find_session(other) == nullptr);
    REQUIRE(fixture.gateway->metrics().active_sessions == 0);
}

TEST_CASE("Inbound delegate", "[gateway][inbound]") {
    GatewayFixture fixture;
    fixture.gateway->add_rule(
        metadata_rule("upgrade", "websocket", ProtocolKind::WebSocket, 100, "upgrades"));

    InboundContext context;
    context.protocol = ProtocolKind::Http;
    context.connection_id = 7;
    context.peer = "127.0.0.1:50000";

    auto request = text_message(ProtocolKind::Http, "first");
    request.metadata.emplace_back("upgrade", "websocket");

    Message reply;
    REQUIRE_FALSE(fixture.gateway->on_message(context, request, reply));
    REQUIRE_FALSE(context.session_id.empty());
    // The first message chooses the initial protocol
    auto session = fixture.gateway->find_session(context.session_id);
    REQUIRE(session->current_protocol() == ProtocolKind::WebSocket);
    REQUIRE(fixture.sink->count(EventType::ProtocolSwitch) == 0);
    REQUIRE(reply.payload_view() == expected_reply(ProtocolKind::WebSocket, "first"));

    auto id = context.session_id;
    REQUIRE_FALSE(fixture.gateway->on_message(context, request, reply));
    REQUIRE(context.session_id == id);
    REQUIRE(fixture.gateway->sessions().size() == 1);

    fixture.gateway->on_disconnect(context);
    REQUIRE(context.session_id.empty());
    REQUIRE(fixture.gateway->sessions().size() == 0);
}

TEST_CASE("Health events and report", "[gateway][health]") {
    GatewayFixture fixture;
    fixture.network->refuse(fake_port(ProtocolKind::Udp));
    auto id = open(fixture, ProtocolKind::Http);

    REQUIRE(fixture.gateway->health().check_now() == protocol::kProtocolCount - 1);
    REQUIRE(fixture.sink->count(EventType::HealthCheckResult) == protocol::kProtocolCount);
    REQUIRE(fixture.gateway->metrics().health_checks == protocol::kProtocolCount);
    REQUIRE(fixture.gateway->metrics().health_check_failures == 1);

    bool saw_udp = false;
    for (const auto& event : fixture.sink->events()) {
        if (event.type == EventType::HealthCheckResult && event.find("protocol") == "udp") {
            saw_udp = true;
            REQUIRE(event.find("healthy") == "false");
            REQUIRE(event.find("error") == "transport unavailable");
        }
    }
    REQUIRE(saw_udp);

    Message reply;
    REQUIRE_FALSE(fixture.gateway->handle_message(id, text_message(ProtocolKind::Http, "x"), reply));

    auto report = fixture.gateway->health_report();
    REQUIRE(report["status"] == "unhealthy");
    REQUIRE(report["sessions"]["active"] == 1);
    REQUIRE(report["traffic"]["messages"] == 1);
    REQUIRE(report["routing"]["default_protocol"] == "http");
    REQUIRE(report["routing"]["routed_to"]["http"] == 1);
    REQUIRE(report["listeners"].empty());
}

TEST_CASE("Gateway listeners", "[gateway][listener]") {
    Gateway gateway(GatewayFixture::fast_options(), nullptr, std::make_unique<NullEventSink>());
    gateway.register_default_adapters();

    REQUIRE(gateway.listening_port(ProtocolKind::Tcp) == 0);
    REQUIRE_FALSE(gateway.listen(ProtocolKind::Tcp, "127.0.0.1", 0));
    auto port = gateway.listening_port(ProtocolKind::Tcp);
    REQUIRE(port != 0);

    // Same address again is a no-op
    REQUIRE_FALSE(gateway.listen(ProtocolKind::Tcp, "127.0.0.1", port));
    REQUIRE(gateway.listening_port(ProtocolKind::Tcp) == port);

    auto report = gateway.health_report();
    REQUIRE(report["listeners"].size() == 1);
    REQUIRE(report["listeners"][0]["protocol"] == "tcp");
    REQUIRE(report["listeners"][0]["port"] == port);

    gateway.stop_listener(ProtocolKind::Tcp);
    REQUIRE(gateway.listening_port(ProtocolKind::Tcp) == 0);
    gateway.stop_listener(ProtocolKind::Tcp);
}

TEST_CASE("Gateway shutdown", "[gateway][shutdown]") {
    GatewayFixture fixture;
    auto& gateway = *fixture.gateway;
    auto a = open(fixture, ProtocolKind::Http);
    auto b = open(fixture, ProtocolKind::WebSocket);

    REQUIRE_FALSE(gateway.shutdown(500ms));
    REQUIRE(gateway.is_shutting_down());
    REQUIRE(gateway.sessions().size() == 0);
    REQUIRE(fixture.network->disconnects == 2);
    REQUIRE(gateway.metrics().sessions_closed == 2);

    std::string id;
    REQUIRE(gateway.open_session(ProtocolKind::Http, id) == core::GatewayErrc::shutting_down);
    Message reply;
    REQUIRE(gateway.handle_message(a, text_message(ProtocolKind::Http, "x"), reply) ==
            core::GatewayErrc::shutting_down);
    REQUIRE(gateway.switch_protocol(b, ProtocolKind::Tcp).error == core::GatewayErrc::shutting_down);
    REQUIRE(gateway.listen(ProtocolKind::Tcp, "127.0.0.1", 0) == core::GatewayErrc::shutting_down);

    // Idempotent
    REQUIRE_FALSE(gateway.shutdown(500ms));
}
