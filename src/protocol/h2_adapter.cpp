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

// Prism HTTP/2 Adapter - Implementation

#include "h2_adapter.hpp"

#include <deque>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../http/h2.hpp"

namespace prism::protocol {

namespace {

/// GOAWAY flush bound on disconnect
constexpr std::chrono::milliseconds GOAWAY_SEND_TIMEOUT{200};

/// Per-connection HTTP/2 state
class H2State final : public TransportState {
public:
    explicit H2State(bool is_server) : session(is_server) {}

    http::H2Session session;
    std::deque<int32_t> unanswered;  // Server: request streams awaiting send()
};

H2State* h2_state(Connection& conn) {
    return conn.state<H2State>();
}

/// Write whatever the session has queued
std::error_code flush(Connection& conn, H2State& state, Deadline deadline) {
    std::vector<uint8_t> output;
    if (auto ec = state.session.take_output(output); ec) {
        return ec;
    }
    if (output.empty()) {
        return {};
    }
    return write_to_peer(conn, output, deadline);
}

/// Read once, feed the session and write its replies (ACKs, WINDOW_UPDATE)
std::error_code pump(Connection& conn, H2State& state, Deadline deadline) {
    if (auto ec = fill_read_buffer(conn, deadline); ec) {
        return ec;
    }

    size_t consumed = 0;
    if (auto ec = state.session.recv(conn.read_buffer, consumed); ec) {
        return ec;
    }
    conn.read_buffer.erase(conn.read_buffer.begin(),
                           conn.read_buffer.begin() + static_cast<ptrdiff_t>(consumed));

    if (auto ec = flush(conn, state, deadline); ec) {
        return ec == core::GatewayErrc::send_failed
                   ? std::error_code(core::GatewayErrc::connection_closed)
                   : ec;
    }
    return {};
}

/// Feed bytes that arrived together with the handshake
std::error_code drain_buffered(Connection& conn, H2State& state) {
    if (conn.read_buffer.empty()) {
        return {};
    }
    size_t consumed = 0;
    if (auto ec = state.session.recv(conn.read_buffer, consumed); ec) {
        return ec;
    }
    conn.read_buffer.erase(conn.read_buffer.begin(),
                           conn.read_buffer.begin() + static_cast<ptrdiff_t>(consumed));
    return {};
}

/// Exchange SETTINGS until the peer's have been processed
std::error_code settle_settings(Connection& conn, H2State& state, Deadline deadline) {
    if (auto ec = flush(conn, state, deadline); ec) {
        return ec;
    }
    if (auto ec = drain_buffered(conn, state); ec) {
        return ec;
    }
    while (!state.session.remote_settings_received()) {
        if (auto ec = pump(conn, state, deadline); ec) {
            return ec;
        }
    }
    return flush(conn, state, deadline);
}

}  // namespace

// H2Adapter

H2Adapter::H2Adapter(AdapterOptions options, quill::Logger* logger)
    : ProtocolAdapter(ProtocolKind::Http2, std::move(options), logger) {}

std::error_code H2Adapter::connect(const Endpoint& target, Deadline deadline, Connection& out) {
    if (auto ec = connect_stream(target, deadline, out); ec) {
        return ec;
    }

    auto state = std::make_unique<H2State>(false);
    auto* raw = state.get();
    out.transport = std::move(state);

    if (auto ec = settle_settings(out, *raw, deadline); ec) {
        LOG_WARNING(logger_, "HTTP/2 handshake failed: endpoint={}, error={}", target.address(),
                    ec.message());
        core::shutdown_socket(out.fd);
        release_connection(out);
        return core::GatewayErrc::transport_unavailable;
    }

    LOG_DEBUG(logger_, "HTTP/2 connected: endpoint={}, connection_id={}", target.address(),
              out.id);
    return {};
}

std::error_code H2Adapter::send(Connection& conn, std::span<const uint8_t> payload) {
    auto* state = h2_state(conn);
    if (!state || payload.size() > options_.max_message_size) {
        return core::GatewayErrc::send_failed;
    }

    std::error_code ec;
    if (conn.role == ConnectionRole::Client) {
        int32_t stream_id = 0;
        ec = state->session.submit_request(conn.authority, options_.http_path, payload, stream_id);
    } else {
        if (state->unanswered.empty()) {
            LOG_WARNING(logger_, "HTTP/2 send without an open request stream: connection_id={}",
                        conn.id);
            return core::GatewayErrc::send_failed;
        }
        int32_t stream_id = state->unanswered.front();
        state->unanswered.pop_front();
        ec = state->session.submit_response(stream_id, 200, payload);
    }
    if (ec) {
        return core::GatewayErrc::send_failed;
    }

    if (auto flush_ec = flush(conn, *state, send_deadline()); flush_ec) {
        return core::GatewayErrc::send_failed;
    }
    conn.stats.messages_sent++;
    return {};
}

std::error_code H2Adapter::receive(Connection& conn, std::chrono::milliseconds timeout,
                                   Message& out) {
    auto* state = h2_state(conn);
    if (!state) {
        return core::GatewayErrc::connection_closed;
    }
    Deadline deadline = core::deadline_after(timeout);

    while (true) {
        if (auto message = state->session.pop_completed()) {
            if (message->reset) {
                LOG_DEBUG(logger_, "HTTP/2 stream reset: connection_id={}, stream_id={}",
                          conn.id, message->stream_id);
                if (conn.role == ConnectionRole::Client) {
                    return core::GatewayErrc::protocol_error;
                }
                continue;
            }

            out.protocol = ProtocolKind::Http2;
            out.payload = std::move(message->body);
            out.metadata.clear();
            out.received_at = Clock::now();
            if (conn.role == ConnectionRole::Server) {
                state->unanswered.push_back(message->stream_id);
                out.metadata.emplace_back("method", std::string(http::to_string(message->method)));
                out.metadata.emplace_back("path", message->path);
            } else {
                out.metadata.emplace_back("status", std::to_string(message->status));
            }
            out.metadata.emplace_back("stream_id", std::to_string(message->stream_id));
            out.metadata.emplace_back("peer", conn.peer);
            for (auto& header : message->headers) {
                out.metadata.emplace_back(std::move(header.name), std::move(header.value));
            }
            conn.stats.messages_received++;
            return {};
        }

        if (state->session.should_close()) {
            conn.open = false;
            return core::GatewayErrc::connection_closed;
        }

        if (auto ec = pump(conn, *state, deadline); ec) {
            return ec;
        }
    }
}

void H2Adapter::disconnect(Connection& conn) noexcept {
    if (conn.fd < 0) {
        return;
    }

    if (auto* state = h2_state(conn); state && conn.open) {
        state->session.submit_goaway();
        if (auto ec = flush(conn, *state, core::deadline_after(GOAWAY_SEND_TIMEOUT)); ec) {
            LOG_DEBUG(logger_, "HTTP/2 GOAWAY not sent: connection_id={}, error={}", conn.id,
                      ec.message());
        }
    }

    LOG_DEBUG(logger_, "HTTP/2 disconnect: connection_id={}, peer={}", conn.id, conn.peer);
    core::shutdown_socket(conn.fd);
    release_connection(conn);
}

bool H2Adapter::is_connected(const Connection& conn) const noexcept {
    return conn.fd >= 0 && conn.open;
}

// H2Acceptor

H2Acceptor::H2Acceptor(AdapterOptions options, quill::Logger* logger)
    : StreamAcceptor(ProtocolKind::Http2, std::move(options), logger) {}

std::error_code H2Acceptor::handshake(Connection& conn, Deadline deadline) {
    // Prior knowledge only: the client must open with the connection preface
    while (conn.read_buffer.size() < http::HTTP2_PREFACE_LEN) {
        if (auto ec = fill_read_buffer(conn, deadline); ec) {
            return ec;
        }
    }
    if (!http::is_http2_connection(conn.read_buffer)) {
        return core::GatewayErrc::protocol_error;
    }

    auto state = std::make_unique<H2State>(true);
    auto* raw = state.get();
    conn.transport = std::move(state);
    return settle_settings(conn, *raw, deadline);
}

}  // namespace prism::protocol
