// Prism Protocol Adapter Tests
// Loopback exchanges over real sockets on 127.0.0.1

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "../../src/core/errors.hpp"
#include "../../src/protocol/adapter.hpp"
#include "../../src/protocol/tcp_adapter.hpp"

using namespace prism;
using namespace prism::protocol;
using namespace std::chrono_literals;

namespace {

struct ServerResult {
    std::error_code ec;
    std::string request;
    std::string method;
};

Endpoint loopback(ProtocolKind kind, uint16_t port) {
    Endpoint endpoint;
    endpoint.id = 1;
    endpoint.protocol = kind;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    return endpoint;
}

/// Accept one client, read one message and answer "echo:<payload>"
ServerResult serve_once(ProtocolAcceptor& acceptor, ProtocolAdapter& adapter) {
    ServerResult result;
    Connection conn;
    result.ec = acceptor.accept(core::deadline_after(3000ms), conn);
    if (result.ec) {
        return result;
    }

    Message request;
    result.ec = adapter.receive(conn, 3000ms, request);
    if (!result.ec) {
        result.request = std::string(request.payload_view());
        result.method = std::string(request.find_metadata("method").value_or(""));
        auto reply = to_bytes("echo:" + result.request);
        result.ec = adapter.send(conn, reply);
    }

    // Let the client read the reply before the socket closes
    Message ignored;
    (void)adapter.receive(conn, 200ms, ignored);
    adapter.disconnect(conn);
    return result;
}

}  // namespace

TEST_CASE("Adapters exchange one message over loopback", "[protocol][adapter][loopback]") {
    auto kind = GENERATE(ProtocolKind::Http, ProtocolKind::Http2, ProtocolKind::WebSocket,
                         ProtocolKind::Tcp, ProtocolKind::Udp);
    INFO("protocol=" << to_string(kind));

    AdapterOptions options;
    auto acceptor = make_acceptor(kind, options);
    auto server_adapter = make_adapter(kind, options);
    auto client_adapter = make_adapter(kind, options);

    REQUIRE_FALSE(acceptor->open("127.0.0.1", 0));
    REQUIRE(acceptor->is_open());
    uint16_t port = acceptor->local_port();
    REQUIRE(port != 0);

    auto server = std::async(std::launch::async,
                             [&] { return serve_once(*acceptor, *server_adapter); });

    Connection conn;
    REQUIRE_FALSE(client_adapter->connect(loopback(kind, port), core::deadline_after(3000ms), conn));
    REQUIRE(client_adapter->is_connected(conn));
    REQUIRE(conn.role == ConnectionRole::Client);
    REQUIRE(conn.endpoint_id == 1);

    REQUIRE_FALSE(client_adapter->send(conn, to_bytes("hello")));

    Message reply;
    REQUIRE_FALSE(client_adapter->receive(conn, 3000ms, reply));
    REQUIRE(reply.protocol == kind);
    REQUIRE(reply.payload_view() == "echo:hello");
    REQUIRE(reply.find_metadata("peer").has_value());

    client_adapter->disconnect(conn);
    REQUIRE_FALSE(client_adapter->is_connected(conn));
    // Idempotent
    client_adapter->disconnect(conn);

    auto served = server.get();
    REQUIRE_FALSE(served.ec);
    REQUIRE(served.request == "hello");
    if (kind == ProtocolKind::Http || kind == ProtocolKind::Http2) {
        REQUIRE(served.method == "POST");
    }

    acceptor->close();
    REQUIRE_FALSE(acceptor->is_open());
}

TEST_CASE("Connect to a closed port is transport_unavailable", "[protocol][adapter]") {
    auto kind = GENERATE(ProtocolKind::Http, ProtocolKind::Http2, ProtocolKind::WebSocket,
                         ProtocolKind::Tcp);
    INFO("protocol=" << to_string(kind));

    AdapterOptions options;
    auto acceptor = make_acceptor(kind, options);
    REQUIRE_FALSE(acceptor->open("127.0.0.1", 0));
    uint16_t port = acceptor->local_port();
    acceptor->close();

    auto adapter = make_adapter(kind, options);
    Connection conn;
    auto ec = adapter->connect(loopback(kind, port), core::deadline_after(1000ms), conn);
    REQUIRE(ec == core::GatewayErrc::transport_unavailable);
    REQUIRE_FALSE(adapter->is_connected(conn));
}

TEST_CASE("Unresolvable host is transport_unavailable", "[protocol][adapter]") {
    auto adapter = make_adapter(ProtocolKind::Tcp, AdapterOptions{});
    Endpoint endpoint = loopback(ProtocolKind::Tcp, 9);
    endpoint.host = "no-such-host.invalid";

    Connection conn;
    auto ec = adapter->connect(endpoint, core::deadline_after(1000ms), conn);
    REQUIRE(ec == core::GatewayErrc::transport_unavailable);
}

TEST_CASE("Idle acceptor times out", "[protocol][adapter]") {
    auto kind = GENERATE(ProtocolKind::Tcp, ProtocolKind::Udp);
    auto acceptor = make_acceptor(kind, AdapterOptions{});
    REQUIRE_FALSE(acceptor->open("127.0.0.1", 0));

    Connection conn;
    auto ec = acceptor->accept(core::deadline_after(50ms), conn);
    REQUIRE(ec == core::GatewayErrc::receive_timeout);
}

TEST_CASE("TCP receive times out without a frame", "[protocol][adapter][tcp]") {
    AdapterOptions options;
    auto acceptor = make_acceptor(ProtocolKind::Tcp, options);
    auto adapter = make_adapter(ProtocolKind::Tcp, options);
    REQUIRE_FALSE(acceptor->open("127.0.0.1", 0));

    auto server = std::async(std::launch::async, [&] {
        Connection conn;
        auto ec = acceptor->accept(core::deadline_after(3000ms), conn);
        if (!ec) {
            Message ignored;
            (void)adapter->receive(conn, 500ms, ignored);
            adapter->disconnect(conn);
        }
        return ec;
    });

    Connection conn;
    REQUIRE_FALSE(adapter->connect(loopback(ProtocolKind::Tcp, acceptor->local_port()),
                                   core::deadline_after(3000ms), conn));

    Message message;
    auto ec = adapter->receive(conn, 50ms, message);
    REQUIRE(ec == core::GatewayErrc::receive_timeout);

    // The peer hangs up once its own receive expires
    ec = adapter->receive(conn, 3000ms, message);
    REQUIRE(ec == core::GatewayErrc::connection_closed);
    adapter->disconnect(conn);
    REQUIRE_FALSE(server.get());
}

TEST_CASE("TCP framing and size limit", "[protocol][adapter][tcp]") {
    auto frame = encode_tcp_frame(to_bytes("abc"));
    REQUIRE(frame.size() == TCP_FRAME_HEADER_SIZE + 3);
    REQUIRE(frame[0] == 0);
    REQUIRE(frame[3] == 3);
    REQUIRE(frame[4] == 'a');

    AdapterOptions options;
    options.max_message_size = 4;
    auto adapter = make_adapter(ProtocolKind::Tcp, options);

    Connection conn;  // Never sent on: the limit is checked first
    auto ec = adapter->send(conn, to_bytes("too long"));
    REQUIRE(ec == core::GatewayErrc::send_failed);
}
