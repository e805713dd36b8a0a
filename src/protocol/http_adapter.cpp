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

// Prism HTTP/1.1 Adapter - Implementation

#include "http_adapter.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::protocol {

namespace {

/// Per-connection HTTP state
class HttpState final : public TransportState {
public:
    explicit HttpState(http::ParserMode mode) : parser(mode) {}

    http::Parser parser;
    bool close_after_response = false;  // Client sent Connection: close
};

HttpState& http_state(Connection& conn) {
    if (auto* state = conn.state<HttpState>()) {
        return *state;
    }
    auto mode = conn.role == ConnectionRole::Server ? http::ParserMode::Request
                                                    : http::ParserMode::Response;
    auto state = std::make_unique<HttpState>(mode);
    auto* raw = state.get();
    conn.transport = std::move(state);
    return *raw;
}

}  // namespace

std::error_code read_http_message(Connection& conn, http::Parser& parser, size_t max_size,
                                  Deadline deadline, http::HttpMessage& out) {
    size_t parsed_bytes = 0;

    while (true) {
        if (!conn.read_buffer.empty()) {
            auto [result, consumed] = parser.feed(conn.read_buffer);
            conn.read_buffer.erase(conn.read_buffer.begin(),
                                   conn.read_buffer.begin() + static_cast<ptrdiff_t>(consumed));
            parsed_bytes += consumed;

            if (result == http::ParseResult::Complete) {
                out = parser.take_message();
                return {};
            }
            if (result == http::ParseResult::Error) {
                return core::GatewayErrc::protocol_error;
            }
            if (parsed_bytes > max_size) {
                return core::GatewayErrc::protocol_error;
            }
        }

        if (auto ec = fill_read_buffer(conn, deadline); ec) {
            return ec;
        }
    }
}

HttpAdapter::HttpAdapter(AdapterOptions options, quill::Logger* logger)
    : ProtocolAdapter(ProtocolKind::Http, std::move(options), logger) {}

std::error_code HttpAdapter::connect(const Endpoint& target, Deadline deadline, Connection& out) {
    if (auto ec = connect_stream(target, deadline, out); ec) {
        return ec;
    }
    http_state(out);
    return {};
}

std::error_code HttpAdapter::send(Connection& conn, std::span<const uint8_t> payload) {
    if (payload.size() > options_.max_message_size) {
        return core::GatewayErrc::send_failed;
    }

    std::vector<uint8_t> wire;
    auto& state = http_state(conn);

    if (conn.role == ConnectionRole::Client) {
        std::vector<http::Header> headers = {
            {"Content-Type", "application/octet-stream"},
            {"Connection", "keep-alive"},
        };
        wire = http::serialize_request(http::Method::POST, options_.http_path, conn.authority,
                                       headers, payload);
    } else {
        std::vector<http::Header> headers = {
            {"Content-Type", "application/octet-stream"},
            {"Connection", state.close_after_response ? "close" : "keep-alive"},
        };
        wire = http::serialize_response(200, http::reason_phrase(200), headers, payload);
    }

    if (auto ec = write_to_peer(conn, wire, send_deadline()); ec) {
        return ec;
    }
    conn.stats.messages_sent++;

    if (conn.role == ConnectionRole::Server && state.close_after_response) {
        disconnect(conn);
    }
    return {};
}

std::error_code HttpAdapter::receive(Connection& conn, std::chrono::milliseconds timeout,
                                     Message& out) {
    auto& state = http_state(conn);

    http::HttpMessage parsed;
    auto ec = read_http_message(conn, state.parser, options_.max_message_size,
                                core::deadline_after(timeout), parsed);
    if (ec) {
        if (ec == core::GatewayErrc::protocol_error) {
            LOG_WARNING(logger_, "HTTP parse error: connection_id={}, peer={}, error={}", conn.id,
                        conn.peer, state.parser.error_message());
        }
        return ec;
    }

    out.protocol = ProtocolKind::Http;
    out.payload = std::move(parsed.body);
    out.metadata.clear();
    out.received_at = Clock::now();

    if (conn.role == ConnectionRole::Server) {
        out.metadata.emplace_back("method", std::string(http::to_string(parsed.method)));
        out.metadata.emplace_back("path", parsed.target);
        state.close_after_response = !parsed.keep_alive;
    } else {
        out.metadata.emplace_back("status", std::to_string(parsed.status));
        if (!parsed.keep_alive) {
            conn.open = false;
        }
    }
    out.metadata.emplace_back("peer", conn.peer);
    for (auto& header : parsed.headers) {
        out.metadata.emplace_back(std::move(header.name), std::move(header.value));
    }

    conn.stats.messages_received++;
    return {};
}

void HttpAdapter::disconnect(Connection& conn) noexcept {
    if (conn.fd < 0) {
        return;
    }
    LOG_DEBUG(logger_, "HTTP disconnect: connection_id={}, peer={}", conn.id, conn.peer);
    core::shutdown_socket(conn.fd);
    release_connection(conn);
}

bool HttpAdapter::is_connected(const Connection& conn) const noexcept {
    return conn.fd >= 0 && conn.open;
}

}  // namespace prism::protocol
