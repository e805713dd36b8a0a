// Prism Protocol Router Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "../../src/gateway/router.hpp"

using namespace prism::gateway;
using prism::protocol::Message;
using prism::protocol::ProtocolKind;

namespace {

RoutingRule rule(ProtocolKind target, int32_t priority, std::string description,
                 RouteCondition condition = {}) {
    return RoutingRule{std::move(condition), target, priority, std::move(description)};
}

RouteCondition metadata_equals(std::string name, std::string value) {
    return [name = std::move(name), value = std::move(value)](const Message& message,
                                                              const RoutingContext&) {
        return message.find_metadata(name) == value;
    };
}

}  // namespace

TEST_CASE("Router falls back to the default protocol", "[gateway][router]") {
    ProtocolRouter router(ProtocolKind::Tcp);
    auto message = Message::from_text(ProtocolKind::Http, "x");

    REQUIRE(router.rule_count() == 0);
    REQUIRE(router.route(message, {}) == ProtocolKind::Tcp);

    auto decision = router.decide(message, {});
    REQUIRE_FALSE(decision.matched);
    REQUIRE(decision.protocol == ProtocolKind::Tcp);
    REQUIRE(decision.rule.empty());

    router.set_default_protocol(ProtocolKind::Udp);
    REQUIRE(router.default_protocol() == ProtocolKind::Udp);
    REQUIRE(router.route(message, {}) == ProtocolKind::Udp);
}

TEST_CASE("Higher priority rules are evaluated first", "[gateway][router]") {
    ProtocolRouter router;
    router.add_rule(rule(ProtocolKind::Tcp, 10, "low"));
    router.add_rule(rule(ProtocolKind::WebSocket, 100, "high"));
    router.add_rule(rule(ProtocolKind::Http2, 50, "mid"));

    REQUIRE(router.describe() == std::vector<std::string>{"high", "mid", "low"});

    auto decision = router.decide(Message::from_text(ProtocolKind::Http, "x"), {});
    REQUIRE(decision.matched);
    REQUIRE(decision.protocol == ProtocolKind::WebSocket);
    REQUIRE(decision.rule == "high");
    REQUIRE(decision.priority == 100);
}

TEST_CASE("Equal priorities keep registration order", "[gateway][router]") {
    ProtocolRouter router;
    router.add_rule(rule(ProtocolKind::Tcp, 5, "first"));
    router.add_rule(rule(ProtocolKind::Udp, 5, "second"));
    router.add_rule(rule(ProtocolKind::Http2, 5, "third"));

    REQUIRE(router.describe() == std::vector<std::string>{"first", "second", "third"});
    REQUIRE(router.route(Message::from_text(ProtocolKind::Http, "x"), {}) == ProtocolKind::Tcp);
}

TEST_CASE("Non-matching rules are skipped", "[gateway][router]") {
    ProtocolRouter router(ProtocolKind::Http);
    router.add_rule(rule(ProtocolKind::WebSocket, 100, "upgrade",
                         metadata_equals("upgrade", "websocket")));
    router.add_rule(rule(ProtocolKind::Tcp, 50, "large payloads",
                         [](const Message& message, const RoutingContext&) {
                             return message.payload.size() > 8;
                         }));
    router.add_rule(rule(ProtocolKind::Udp, 10, "tenant blue",
                         [](const Message&, const RoutingContext& context) {
                             return context.find_attribute("tenant") == "blue";
                         }));

    SECTION("nothing matches") {
        auto message = Message::from_text(ProtocolKind::Http, "tiny");
        REQUIRE(router.route(message, {}) == ProtocolKind::Http);
    }

    SECTION("metadata rule") {
        auto message = Message::from_text(ProtocolKind::Http, "tiny");
        message.metadata.emplace_back("Upgrade", "websocket");
        REQUIRE(router.route(message, {}) == ProtocolKind::WebSocket);
    }

    SECTION("payload rule beats the context rule") {
        auto message = Message::from_text(ProtocolKind::Http, "a payload over eight bytes");
        RoutingContext context;
        context.attributes.emplace_back("tenant", "blue");
        REQUIRE(router.route(message, context) == ProtocolKind::Tcp);
    }

    SECTION("context rule") {
        auto message = Message::from_text(ProtocolKind::Http, "tiny");
        RoutingContext context;
        context.attributes.emplace_back("tenant", "blue");
        REQUIRE(context.find_attribute("tenant") == "blue");
        REQUIRE_FALSE(context.find_attribute("Tenant"));
        REQUIRE(router.decide(message, context).rule == "tenant blue");
    }
}

TEST_CASE("Routing is deterministic", "[gateway][router]") {
    ProtocolRouter router;
    router.add_rule(rule(ProtocolKind::Tcp, 1, "odd length",
                         [](const Message& message, const RoutingContext&) {
                             return message.payload.size() % 2 == 1;
                         }));

    auto odd = Message::from_text(ProtocolKind::Http, "abc");
    auto even = Message::from_text(ProtocolKind::Http, "ab");
    for (int i = 0; i < 100; ++i) {
        REQUIRE(router.route(odd, {}) == ProtocolKind::Tcp);
        REQUIRE(router.route(even, {}) == ProtocolKind::Http);
    }
}

TEST_CASE("Rules may be added while routing", "[gateway][router]") {
    ProtocolRouter router;
    std::atomic<bool> done{false};
    std::atomic<bool> unmatched_with_rules{false};
    auto message = Message::from_text(ProtocolKind::Http, "x");

    std::thread reader([&] {
        while (!done.load()) {
            size_t rules = router.rule_count();
            auto decision = router.decide(message, {});
            if (rules > 0 && !decision.matched) {
                unmatched_with_rules = true;
            }
        }
    });

    for (int i = 0; i < 100; ++i) {
        router.add_rule(rule(ProtocolKind::Tcp, i, "rule " + std::to_string(i)));
    }
    done = true;
    reader.join();

    REQUIRE_FALSE(unmatched_with_rules.load());
    REQUIRE(router.rule_count() == 100);
    REQUIRE(router.decide(message, {}).priority == 99);
}
