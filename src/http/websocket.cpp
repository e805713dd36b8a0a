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

// Prism WebSocket - Implementation
// WebSocket handshake and framing (RFC 6455)

#include "websocket.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>

namespace prism::http {

namespace {

/// Magic GUID for WebSocket handshake (RFC 6455 §4.2.2)
constexpr std::string_view WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64_encode(const unsigned char* data, size_t length) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(length));
    (void)BIO_flush(bio);

    char* encoded_data = nullptr;
    long encoded_length = BIO_get_mem_data(bio, &encoded_data);
    std::string result(encoded_data, static_cast<size_t>(encoded_length));

    BIO_free_all(bio);
    return result;
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

uint32_t random_mask() {
    uint32_t key = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&key), sizeof(key)) != 1) {
        // RNG failure still yields a valid (if predictable) mask
        key = 0x5A5A5A5A;
    }
    return key;
}

}  // namespace

std::string compute_accept_key(std::string_view sec_websocket_key) {
    std::string concat;
    concat.reserve(sec_websocket_key.size() + WEBSOCKET_GUID.size());
    concat.append(sec_websocket_key);
    concat.append(WEBSOCKET_GUID);

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);

    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string generate_websocket_key() {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        std::fill(std::begin(nonce), std::end(nonce), static_cast<unsigned char>(0x42));
    }
    return base64_encode(nonce, sizeof(nonce));
}

bool is_valid_upgrade_request(const HttpMessage& request) {
    // RFC 6455 §4.2.1: Client handshake requirements
    if (request.method != Method::GET) {
        return false;
    }
    if (!header_name_equals(request.get_header("Upgrade"), "websocket")) {
        return false;
    }
    if (!contains_ci(request.get_header("Connection"), "upgrade")) {
        return false;
    }
    if (request.get_header("Sec-WebSocket-Key").empty()) {
        return false;
    }
    // Only version 13 is supported
    return request.get_header("Sec-WebSocket-Version") == "13";
}

std::vector<uint8_t> create_upgrade_request(std::string_view target, std::string_view host,
                                            std::string_view key) {
    std::vector<Header> headers = {
        {"Upgrade", "websocket"},
        {"Connection", "Upgrade"},
        {"Sec-WebSocket-Key", std::string(key)},
        {"Sec-WebSocket-Version", "13"},
    };
    return serialize_request(Method::GET, target, host, headers, {});
}

std::vector<uint8_t> create_upgrade_response(std::string_view accept_key) {
    std::vector<Header> headers = {
        {"Upgrade", "websocket"},
        {"Connection", "Upgrade"},
        {"Sec-WebSocket-Accept", std::string(accept_key)},
    };
    return serialize_response(101, reason_phrase(101), headers, {});
}

void encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode, bool mask,
                         uint64_t payload_length, uint32_t masking_key) {
    // Byte 0: FIN + RSV1-3 + opcode
    buffer.push_back(static_cast<uint8_t>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    // Byte 1: MASK + payload length
    uint8_t byte1 = mask ? 0x80 : 0x00;
    if (payload_length <= 125) {
        buffer.push_back(static_cast<uint8_t>(byte1 | payload_length));
    } else if (payload_length <= 0xFFFF) {
        buffer.push_back(static_cast<uint8_t>(byte1 | 126));
        buffer.push_back(static_cast<uint8_t>(payload_length >> 8));
        buffer.push_back(static_cast<uint8_t>(payload_length & 0xFF));
    } else {
        buffer.push_back(static_cast<uint8_t>(byte1 | 127));
        for (int i = 7; i >= 0; --i) {
            buffer.push_back(static_cast<uint8_t>((payload_length >> (i * 8)) & 0xFF));
        }
    }

    if (mask) {
        buffer.push_back(static_cast<uint8_t>(masking_key >> 24));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 16));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 8));
        buffer.push_back(static_cast<uint8_t>(masking_key));
    }
}

std::vector<uint8_t> encode_frame(uint8_t opcode, std::span<const uint8_t> payload, bool mask) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);

    uint32_t key = mask ? random_mask() : 0;
    encode_frame_header(frame, true, opcode, mask, payload.size(), key);

    size_t offset = frame.size();
    frame.insert(frame.end(), payload.begin(), payload.end());
    if (mask) {
        apply_mask(std::span<uint8_t>(frame.data() + offset, payload.size()), key);
    }
    return frame;
}

std::vector<uint8_t> create_close_frame(uint16_t status_code, std::string_view reason,
                                        bool mask) {
    std::vector<uint8_t> payload;
    payload.reserve(2 + reason.size());
    payload.push_back(static_cast<uint8_t>(status_code >> 8));
    payload.push_back(static_cast<uint8_t>(status_code & 0xFF));
    append(payload, reason.substr(0, 123));  // Control payload limit is 125
    return encode_frame(WebSocketOpcode::CLOSE, payload, mask);
}

std::vector<uint8_t> create_pong_frame(std::span<const uint8_t> ping_payload, bool mask) {
    return encode_frame(WebSocketOpcode::PONG, ping_payload, mask);
}

void apply_mask(std::span<uint8_t> payload, uint32_t masking_key) noexcept {
    const uint8_t key[4] = {
        static_cast<uint8_t>(masking_key >> 24),
        static_cast<uint8_t>(masking_key >> 16),
        static_cast<uint8_t>(masking_key >> 8),
        static_cast<uint8_t>(masking_key),
    };
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] ^= key[i % 4];
    }
}

FrameResult decode_frame(std::span<const uint8_t> data, size_t max_payload, WebSocketFrame& out,
                         size_t& consumed) {
    consumed = 0;
    if (data.size() < 2) {
        return FrameResult::Incomplete;
    }

    bool fin = (data[0] & 0x80) != 0;
    uint8_t opcode = data[0] & 0x0F;
    bool masked = (data[1] & 0x80) != 0;
    uint64_t payload_length = data[1] & 0x7F;

    // Reserved bits without a negotiated extension
    if ((data[0] & 0x70) != 0) {
        return FrameResult::Error;
    }
    // Reserved opcodes
    if ((opcode > 0x2 && opcode < 0x8) || opcode > 0xA) {
        return FrameResult::Error;
    }
    // Control frames: not fragmented, payload <= 125
    if (opcode >= 0x8 && (!fin || payload_length > 125)) {
        return FrameResult::Error;
    }

    size_t header_size = 2;
    if (payload_length == 126) {
        if (data.size() < 4) {
            return FrameResult::Incomplete;
        }
        payload_length = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_size = 4;
    } else if (payload_length == 127) {
        if (data.size() < 10) {
            return FrameResult::Incomplete;
        }
        payload_length = 0;
        for (int i = 0; i < 8; ++i) {
            payload_length = (payload_length << 8) | data[2 + i];
        }
        // Most significant bit must be 0 (RFC 6455 §5.2)
        if (payload_length & (1ULL << 63)) {
            return FrameResult::Error;
        }
        header_size = 10;
    }

    if (payload_length > max_payload) {
        return FrameResult::Error;
    }

    uint32_t masking_key = 0;
    if (masked) {
        if (data.size() < header_size + 4) {
            return FrameResult::Incomplete;
        }
        masking_key = (static_cast<uint32_t>(data[header_size]) << 24) |
                      (static_cast<uint32_t>(data[header_size + 1]) << 16) |
                      (static_cast<uint32_t>(data[header_size + 2]) << 8) |
                      static_cast<uint32_t>(data[header_size + 3]);
        header_size += 4;
    }

    size_t total = header_size + static_cast<size_t>(payload_length);
    if (data.size() < total) {
        return FrameResult::Incomplete;
    }

    out.fin = fin;
    out.opcode = opcode;
    out.masked = masked;
    out.payload.assign(data.begin() + static_cast<ptrdiff_t>(header_size),
                       data.begin() + static_cast<ptrdiff_t>(total));
    if (masked) {
        apply_mask(out.payload, masking_key);
    }

    consumed = total;
    return FrameResult::Complete;
}

}  // namespace prism::http
