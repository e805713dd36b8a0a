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

// Prism WebSocket - Header
// WebSocket handshake and framing (RFC 6455)

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "http.hpp"

namespace prism::http {

/// WebSocket frame opcodes (RFC 6455 §5.2)
namespace WebSocketOpcode {
constexpr uint8_t CONTINUATION = 0x0;
constexpr uint8_t TEXT = 0x1;
constexpr uint8_t BINARY = 0x2;
constexpr uint8_t CLOSE = 0x8;
constexpr uint8_t PING = 0x9;
constexpr uint8_t PONG = 0xA;
}  // namespace WebSocketOpcode

/// WebSocket close status codes (RFC 6455 §7.4)
namespace WebSocketCloseCode {
constexpr uint16_t NORMAL_CLOSURE = 1000;
constexpr uint16_t GOING_AWAY = 1001;
constexpr uint16_t PROTOCOL_ERROR = 1002;
constexpr uint16_t MESSAGE_TOO_BIG = 1009;
}  // namespace WebSocketCloseCode

/// One decoded frame. The payload is owned and already unmasked.
struct WebSocketFrame {
    bool fin = false;
    uint8_t opcode = 0;
    bool masked = false;
    std::vector<uint8_t> payload;

    [[nodiscard]] bool is_control_frame() const noexcept { return opcode >= 0x8; }
};

enum class FrameResult : uint8_t {
    Complete,    // One frame decoded
    Incomplete,  // Need more data
    Error        // Protocol violation (close connection)
};

/// Compute Sec-WebSocket-Accept header value (RFC 6455 §4.2.2)
/// Accept-Value = Base64(SHA1(Key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11"))
[[nodiscard]] std::string compute_accept_key(std::string_view sec_websocket_key);

/// Random base64 nonce for Sec-WebSocket-Key (16 bytes from the OpenSSL RNG)
[[nodiscard]] std::string generate_websocket_key();

/// Validate WebSocket upgrade request headers
[[nodiscard]] bool is_valid_upgrade_request(const HttpMessage& request);

/// Client handshake request
[[nodiscard]] std::vector<uint8_t> create_upgrade_request(std::string_view target,
                                                          std::string_view host,
                                                          std::string_view key);

/// 101 Switching Protocols response
[[nodiscard]] std::vector<uint8_t> create_upgrade_response(std::string_view accept_key);

/// Encode WebSocket frame header
void encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode, bool mask,
                         uint64_t payload_length, uint32_t masking_key = 0);

/// Encode a complete frame. Client frames must be masked (RFC 6455 §5.3).
[[nodiscard]] std::vector<uint8_t> encode_frame(uint8_t opcode, std::span<const uint8_t> payload,
                                                bool mask);

[[nodiscard]] std::vector<uint8_t> create_close_frame(uint16_t status_code,
                                                      std::string_view reason, bool mask);

[[nodiscard]] std::vector<uint8_t> create_pong_frame(std::span<const uint8_t> ping_payload,
                                                     bool mask);

/// XOR masking (RFC 6455 §5.3); applying it twice restores the input
void apply_mask(std::span<uint8_t> payload, uint32_t masking_key) noexcept;

/// Decode one frame from the front of `data`. On Complete, `consumed` is the
/// frame size; otherwise nothing is consumed. Frames whose payload exceeds
/// `max_payload` are an Error.
[[nodiscard]] FrameResult decode_frame(std::span<const uint8_t> data, size_t max_payload,
                                       WebSocketFrame& out, size_t& consumed);

}  // namespace prism::http
