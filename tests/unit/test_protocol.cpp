// Prism Protocol Model Tests

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

#include "../../src/protocol/adapter.hpp"
#include "../../src/protocol/protocol.hpp"

using namespace prism::protocol;

TEST_CASE("Protocol names", "[protocol]") {
    SECTION("canonical names round-trip through the parser") {
        std::set<std::string_view> names;
        for (auto kind : kAllProtocols) {
            auto name = to_string(kind);
            names.insert(name);
            REQUIRE(parse_protocol(name) == kind);
        }
        REQUIRE(names.size() == kProtocolCount);
    }

    SECTION("aliases and case") {
        REQUIRE(parse_protocol("HTTP") == ProtocolKind::Http);
        REQUIRE(parse_protocol("h2") == ProtocolKind::Http2);
        REQUIRE(parse_protocol("h2c") == ProtocolKind::Http2);
        REQUIRE(parse_protocol("WS") == ProtocolKind::WebSocket);
        REQUIRE(parse_protocol("Tcp") == ProtocolKind::Tcp);
    }

    SECTION("unknown names") {
        REQUIRE_FALSE(parse_protocol(""));
        REQUIRE_FALSE(parse_protocol("grpc"));
        REQUIRE_FALSE(parse_protocol("quic"));
    }

    SECTION("indices are dense") {
        for (size_t i = 0; i < kAllProtocols.size(); ++i) {
            REQUIRE(index_of(kAllProtocols[i]) == i);
        }
        REQUIRE(is_datagram(ProtocolKind::Udp));
        REQUIRE_FALSE(is_datagram(ProtocolKind::Tcp));
    }
}

TEST_CASE("Message metadata", "[protocol][message]") {
    auto message = Message::from_text(ProtocolKind::Http, "hello");
    message.metadata.emplace_back("Content-Type", "text/plain");
    message.metadata.emplace_back("x-tenant", "blue");

    REQUIRE(message.payload_view() == "hello");
    REQUIRE(message.bytes().size() == 5);
    REQUIRE(message.find_metadata("content-type") == "text/plain");
    REQUIRE(message.find_metadata("X-Tenant") == "blue");
    REQUIRE_FALSE(message.find_metadata("x-missing"));
}

TEST_CASE("Endpoint capacity", "[protocol][endpoint]") {
    Endpoint endpoint;
    endpoint.host = "10.0.0.1";
    endpoint.port = 8080;
    endpoint.max_load = 2;

    REQUIRE(endpoint.address() == "10.0.0.1:8080");
    REQUIRE(endpoint.has_capacity());
    endpoint.current_load = 2;
    REQUIRE_FALSE(endpoint.has_capacity());
}

TEST_CASE("Adapter factory covers every protocol", "[protocol][adapter]") {
    AdapterOptions options;
    for (auto kind : kAllProtocols) {
        auto adapter = make_adapter(kind, options);
        REQUIRE(adapter != nullptr);
        REQUIRE(adapter->kind() == kind);

        auto acceptor = make_acceptor(kind, options);
        REQUIRE(acceptor != nullptr);
        REQUIRE(acceptor->kind() == kind);
        REQUIRE_FALSE(acceptor->is_open());
    }
}

TEST_CASE("Connections are movable handles", "[protocol][connection]") {
    Connection a;
    a.id = next_connection_id();
    a.open = true;
    a.peer = "127.0.0.1:1";

    Connection b = std::move(a);
    REQUIRE(b.open);
    REQUIRE(b.peer == "127.0.0.1:1");
    REQUIRE(next_connection_id() > b.id);
}
