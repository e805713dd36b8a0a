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

// Prism Protocol - Implementation

#include "protocol.hpp"

#include <algorithm>
#include <cctype>

namespace prism::protocol {

std::optional<ProtocolKind> parse_protocol(std::string_view name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "http" || lower == "http1" || lower == "http/1.1") {
        return ProtocolKind::Http;
    }
    if (lower == "http2" || lower == "h2" || lower == "h2c" || lower == "http/2") {
        return ProtocolKind::Http2;
    }
    if (lower == "websocket" || lower == "ws") {
        return ProtocolKind::WebSocket;
    }
    if (lower == "tcp") {
        return ProtocolKind::Tcp;
    }
    if (lower == "udp") {
        return ProtocolKind::Udp;
    }
    return std::nullopt;
}

std::optional<std::string_view> Message::find_metadata(std::string_view name) const {
    for (const auto& [key, value] : metadata) {
        if (key.size() != name.size()) {
            continue;
        }
        bool equal = std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
        if (equal) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

Message Message::from_text(ProtocolKind protocol, std::string_view text) {
    Message message;
    message.protocol = protocol;
    message.payload = to_bytes(text);
    message.received_at = Clock::now();
    return message;
}

std::vector<uint8_t> to_bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

}  // namespace prism::protocol
