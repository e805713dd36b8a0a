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

// Prism HTTP Protocol - Header
// Owned HTTP/1.1 message types and wire serialization

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prism::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

[[nodiscard]] constexpr std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

[[nodiscard]] Method parse_method(std::string_view method) noexcept;

/// HTTP header (owned copy; parser input buffers are transient)
struct Header {
    std::string name;
    std::string value;
};

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Parsed HTTP/1.x request or response
struct HttpMessage {
    // Request line
    Method method = Method::UNKNOWN;
    std::string target;

    // Status line
    uint16_t status = 0;

    uint8_t version_major = 1;
    uint8_t version_minor = 1;

    std::vector<Header> headers;
    std::vector<uint8_t> body;

    bool keep_alive = true;
    bool upgrade = false;  // Connection upgrade requested/accepted

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;
};

/// Serialize a request with Content-Length framing
[[nodiscard]] std::vector<uint8_t> serialize_request(Method method, std::string_view target,
                                                     std::string_view host,
                                                     const std::vector<Header>& headers,
                                                     std::span<const uint8_t> body);

/// Serialize a response with Content-Length framing
[[nodiscard]] std::vector<uint8_t> serialize_response(uint16_t status, std::string_view reason,
                                                      const std::vector<Header>& headers,
                                                      std::span<const uint8_t> body);

/// Standard reason phrase for a status code
[[nodiscard]] std::string_view reason_phrase(uint16_t status) noexcept;

}  // namespace prism::http
