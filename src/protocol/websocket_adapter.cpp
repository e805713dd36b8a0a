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

// Prism WebSocket Adapter - Implementation

#include "websocket_adapter.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../http/parser.hpp"
#include "../http/websocket.hpp"
#include "http_adapter.hpp"

namespace prism::protocol {

namespace {

/// Largest handshake we accept from either side
constexpr size_t MAX_HANDSHAKE_SIZE = 64 * 1024;

/// Close frame wait after we initiate a close
constexpr std::chrono::milliseconds CLOSE_SEND_TIMEOUT{200};

/// Per-connection WebSocket state (RFC 6455 §5.4 fragmentation)
class WebSocketState final : public TransportState {
public:
    std::vector<uint8_t> fragments;
    uint8_t fragment_opcode = 0;
    bool fragmenting = false;
    bool close_sent = false;
};

WebSocketState& ws_state(Connection& conn) {
    if (auto* state = conn.state<WebSocketState>()) {
        return *state;
    }
    auto state = std::make_unique<WebSocketState>();
    auto* raw = state.get();
    conn.transport = std::move(state);
    return *raw;
}

const char* opcode_name(uint8_t opcode) {
    return opcode == http::WebSocketOpcode::TEXT ? "text" : "binary";
}

}  // namespace

// WebSocketAdapter

WebSocketAdapter::WebSocketAdapter(AdapterOptions options, quill::Logger* logger)
    : ProtocolAdapter(ProtocolKind::WebSocket, std::move(options), logger) {}

std::error_code WebSocketAdapter::connect(const Endpoint& target, Deadline deadline,
                                          Connection& out) {
    if (auto ec = connect_stream(target, deadline, out); ec) {
        return ec;
    }

    std::string key = http::generate_websocket_key();
    auto request = http::create_upgrade_request(options_.websocket_path, out.authority, key);

    std::error_code ec = write_to_peer(out, request, deadline);
    http::HttpMessage response;
    if (!ec) {
        http::Parser parser(http::ParserMode::Response);
        ec = read_http_message(out, parser, MAX_HANDSHAKE_SIZE, deadline, response);
    }
    if (!ec && (response.status != 101 ||
                response.get_header("Sec-WebSocket-Accept") != http::compute_accept_key(key))) {
        ec = core::GatewayErrc::protocol_error;
    }

    if (ec) {
        LOG_WARNING(logger_, "WebSocket handshake failed: endpoint={}, status={}, error={}",
                    target.address(), response.status, ec.message());
        core::shutdown_socket(out.fd);
        release_connection(out);
        return core::GatewayErrc::transport_unavailable;
    }

    ws_state(out);
    LOG_DEBUG(logger_, "WebSocket connected: endpoint={}, connection_id={}", target.address(),
              out.id);
    return {};
}

std::error_code WebSocketAdapter::send(Connection& conn, std::span<const uint8_t> payload) {
    if (payload.size() > options_.max_message_size) {
        return core::GatewayErrc::send_failed;
    }
    if (ws_state(conn).close_sent) {
        return core::GatewayErrc::send_failed;
    }

    bool mask = conn.role == ConnectionRole::Client;
    auto frame = http::encode_frame(http::WebSocketOpcode::BINARY, payload, mask);
    if (auto ec = write_to_peer(conn, frame, send_deadline()); ec) {
        return ec;
    }
    conn.stats.messages_sent++;
    return {};
}

std::error_code WebSocketAdapter::receive(Connection& conn, std::chrono::milliseconds timeout,
                                          Message& out) {
    Deadline deadline = core::deadline_after(timeout);
    auto& state = ws_state(conn);
    bool mask_replies = conn.role == ConnectionRole::Client;

    while (true) {
        http::WebSocketFrame frame;
        size_t consumed = 0;
        auto result =
            http::decode_frame(conn.read_buffer, options_.max_message_size, frame, consumed);

        if (result == http::FrameResult::Error) {
            LOG_WARNING(logger_, "WebSocket protocol error: connection_id={}, peer={}", conn.id,
                        conn.peer);
            return core::GatewayErrc::protocol_error;
        }
        if (result == http::FrameResult::Incomplete) {
            if (auto ec = fill_read_buffer(conn, deadline); ec) {
                return ec;
            }
            continue;
        }

        conn.read_buffer.erase(conn.read_buffer.begin(),
                               conn.read_buffer.begin() + static_cast<ptrdiff_t>(consumed));

        // Client frames are masked, server frames are not (RFC 6455 §5.1)
        if (frame.masked != (conn.role == ConnectionRole::Server)) {
            return core::GatewayErrc::protocol_error;
        }

        switch (frame.opcode) {
            case http::WebSocketOpcode::PING: {
                auto pong = http::create_pong_frame(frame.payload, mask_replies);
                if (auto ec = write_to_peer(conn, pong, send_deadline()); ec) {
                    return ec;
                }
                continue;
            }
            case http::WebSocketOpcode::PONG:
                continue;
            case http::WebSocketOpcode::CLOSE: {
                if (!state.close_sent) {
                    auto reply = http::create_close_frame(http::WebSocketCloseCode::NORMAL_CLOSURE,
                                                          "", mask_replies);
                    state.close_sent = true;
                    if (auto ec = write_to_peer(conn, reply, send_deadline()); ec) {
                        LOG_DEBUG(logger_, "WebSocket close reply failed: connection_id={}",
                                  conn.id);
                    }
                }
                conn.open = false;
                return core::GatewayErrc::connection_closed;
            }
            case http::WebSocketOpcode::CONTINUATION:
                if (!state.fragmenting) {
                    return core::GatewayErrc::protocol_error;
                }
                break;
            default:  // TEXT or BINARY
                if (state.fragmenting) {
                    return core::GatewayErrc::protocol_error;
                }
                state.fragment_opcode = frame.opcode;
                state.fragments.clear();
                break;
        }

        if (state.fragments.size() + frame.payload.size() > options_.max_message_size) {
            return core::GatewayErrc::protocol_error;
        }
        state.fragments.insert(state.fragments.end(), frame.payload.begin(), frame.payload.end());

        if (!frame.fin) {
            state.fragmenting = true;
            continue;
        }

        state.fragmenting = false;
        out.protocol = ProtocolKind::WebSocket;
        out.payload = std::move(state.fragments);
        state.fragments.clear();
        out.metadata.clear();
        out.metadata.emplace_back("opcode", opcode_name(state.fragment_opcode));
        out.metadata.emplace_back("peer", conn.peer);
        out.received_at = Clock::now();
        conn.stats.messages_received++;
        return {};
    }
}

void WebSocketAdapter::disconnect(Connection& conn) noexcept {
    if (conn.fd < 0) {
        return;
    }

    auto* state = conn.state<WebSocketState>();
    if (conn.open && state && !state->close_sent) {
        state->close_sent = true;
        auto frame = http::create_close_frame(http::WebSocketCloseCode::GOING_AWAY, "",
                                              conn.role == ConnectionRole::Client);
        if (auto ec = write_to_peer(conn, frame, core::deadline_after(CLOSE_SEND_TIMEOUT)); ec) {
            LOG_DEBUG(logger_, "WebSocket close frame not sent: connection_id={}, error={}",
                      conn.id, ec.message());
        }
    }

    LOG_DEBUG(logger_, "WebSocket disconnect: connection_id={}, peer={}", conn.id, conn.peer);
    core::shutdown_socket(conn.fd);
    release_connection(conn);
}

bool WebSocketAdapter::is_connected(const Connection& conn) const noexcept {
    return conn.fd >= 0 && conn.open;
}

// WebSocketAcceptor

WebSocketAcceptor::WebSocketAcceptor(AdapterOptions options, quill::Logger* logger)
    : StreamAcceptor(ProtocolKind::WebSocket, std::move(options), logger) {}

std::error_code WebSocketAcceptor::handshake(Connection& conn, Deadline deadline) {
    http::Parser parser(http::ParserMode::Request);
    http::HttpMessage request;
    if (auto ec = read_http_message(conn, parser, MAX_HANDSHAKE_SIZE, deadline, request); ec) {
        return ec;
    }

    if (!http::is_valid_upgrade_request(request)) {
        std::vector<http::Header> headers = {{"Connection", "close"}};
        auto reply = http::serialize_response(426, http::reason_phrase(426), headers, {});
        if (auto ec = write_to_peer(conn, reply, deadline); ec) {
            LOG_DEBUG(logger_, "Upgrade rejection not sent: peer={}", conn.peer);
        }
        return core::GatewayErrc::protocol_error;
    }

    auto accept_key = http::compute_accept_key(request.get_header("Sec-WebSocket-Key"));
    auto response = http::create_upgrade_response(accept_key);
    if (auto ec = write_to_peer(conn, response, deadline); ec) {
        return ec;
    }

    conn.transport = std::make_unique<WebSocketState>();
    return {};
}

}  // namespace prism::protocol
