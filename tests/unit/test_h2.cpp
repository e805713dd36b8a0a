// Prism HTTP/2 Session Tests

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

#include "../../src/http/h2.hpp"

using namespace prism::http;

namespace {

/// Move every pending byte from one session to the other
void pump(H2Session& from, H2Session& to) {
    std::vector<uint8_t> wire;
    REQUIRE_FALSE(from.take_output(wire));
    if (wire.empty()) {
        return;
    }
    size_t consumed = 0;
    REQUIRE_FALSE(to.recv(wire, consumed));
    REQUIRE(consumed == wire.size());
}

void pump_both(H2Session& client, H2Session& server) {
    for (int i = 0; i < 4; ++i) {
        pump(client, server);
        pump(server, client);
    }
}

std::vector<uint8_t> bytes_of(std::string_view text) {
    return {text.begin(), text.end()};
}

}  // namespace

TEST_CASE("HTTP/2 preface detection", "[h2][preface]") {
    std::string preface(HTTP2_PREFACE, HTTP2_PREFACE_LEN);
    auto data = bytes_of(preface + "extra");
    REQUIRE(is_http2_connection(data));

    REQUIRE_FALSE(is_http2_connection(bytes_of("PRI * HTTP/2.0\r\n")));
    REQUIRE_FALSE(is_http2_connection(bytes_of("GET / HTTP/1.1\r\nHost: a\r\n\r\n")));
}

TEST_CASE("HTTP/2 client preface starts the output", "[h2][session]") {
    H2Session client(false);
    REQUIRE_FALSE(client.is_server());
    REQUIRE(client.want_write());

    std::vector<uint8_t> wire;
    REQUIRE_FALSE(client.take_output(wire));
    REQUIRE(is_http2_connection(wire));
}

TEST_CASE("HTTP/2 request and response exchange", "[h2][session]") {
    H2Session client(false);
    H2Session server(true);

    pump_both(client, server);
    REQUIRE(client.remote_settings_received());
    REQUIRE(server.remote_settings_received());

    int32_t stream_id = 0;
    REQUIRE_FALSE(client.submit_request("backend:8443", "/rpc", bytes_of("ping"), stream_id));
    REQUIRE(stream_id == 1);
    pump(client, server);

    auto request = server.pop_completed();
    REQUIRE(request.has_value());
    REQUIRE(request->stream_id == stream_id);
    REQUIRE(request->method == Method::POST);
    REQUIRE(request->path == "/rpc");
    REQUIRE(request->body == bytes_of("ping"));
    REQUIRE_FALSE(request->reset);
    REQUIRE_FALSE(server.pop_completed().has_value());

    REQUIRE_FALSE(server.submit_response(stream_id, 200, bytes_of("pong")));
    pump(server, client);

    auto response = client.pop_completed();
    REQUIRE(response.has_value());
    REQUIRE(response->stream_id == stream_id);
    REQUIRE(response->status == 200);
    REQUIRE(response->body == bytes_of("pong"));
}

TEST_CASE("HTTP/2 streams are multiplexed", "[h2][session]") {
    H2Session client(false);
    H2Session server(true);
    pump_both(client, server);

    int32_t first = 0;
    int32_t second = 0;
    REQUIRE_FALSE(client.submit_request("a", "/one", bytes_of("1"), first));
    REQUIRE_FALSE(client.submit_request("a", "/two", bytes_of("22"), second));
    REQUIRE(second > first);
    pump(client, server);

    auto r1 = server.pop_completed();
    auto r2 = server.pop_completed();
    REQUIRE(r1.has_value());
    REQUIRE(r2.has_value());

    // Answer out of order
    REQUIRE_FALSE(server.submit_response(r2->stream_id, 200, r2->body));
    REQUIRE_FALSE(server.submit_response(r1->stream_id, 200, r1->body));
    pump(server, client);

    // Completion order follows the wire, not submission
    std::vector<H2Message> responses;
    while (auto response = client.pop_completed()) {
        responses.push_back(std::move(*response));
    }
    REQUIRE(responses.size() == 2);
    for (const auto& response : responses) {
        REQUIRE(response.status == 200);
        if (response.stream_id == first) {
            REQUIRE(response.body == bytes_of("1"));
        } else {
            REQUIRE(response.stream_id == second);
            REQUIRE(response.body == bytes_of("22"));
        }
    }
}

TEST_CASE("HTTP/2 role misuse is rejected", "[h2][session]") {
    H2Session client(false);
    H2Session server(true);

    int32_t stream_id = 0;
    REQUIRE(server.submit_request("a", "/", {}, stream_id));
    REQUIRE(client.submit_response(1, 200, {}));

    // Unknown stream
    REQUIRE(server.submit_response(7, 200, {}));
}

TEST_CASE("HTTP/2 garbage input closes the session", "[h2][session]") {
    H2Session server(true);
    auto garbage = bytes_of("GET / HTTP/1.1\r\nHost: a\r\n\r\n");

    size_t consumed = 0;
    REQUIRE(server.recv(garbage, consumed));
    REQUIRE(server.should_close());
}

TEST_CASE("HTTP/2 GOAWAY closes the peer", "[h2][session]") {
    H2Session client(false);
    H2Session server(true);
    pump_both(client, server);

    server.submit_goaway();
    pump(server, client);
    REQUIRE(client.should_close());
}
