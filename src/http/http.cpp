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

// Prism HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace prism::http {

namespace {

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

Method parse_method(std::string_view method) noexcept {
    if (method == "GET") return Method::GET;
    if (method == "POST") return Method::POST;
    if (method == "PUT") return Method::PUT;
    if (method == "DELETE") return Method::DELETE;
    if (method == "HEAD") return Method::HEAD;
    if (method == "OPTIONS") return Method::OPTIONS;
    if (method == "PATCH") return Method::PATCH;
    if (method == "CONNECT") return Method::CONNECT;
    if (method == "TRACE") return Method::TRACE;
    return Method::UNKNOWN;
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

const Header* HttpMessage::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view HttpMessage::get_header(std::string_view name,
                                         std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view{header->value} : default_value;
}

std::vector<uint8_t> serialize_request(Method method, std::string_view target,
                                       std::string_view host, const std::vector<Header>& headers,
                                       std::span<const uint8_t> body) {
    std::vector<uint8_t> out;
    out.reserve(256 + body.size());

    append(out, fmt::format("{} {} HTTP/1.1\r\n", to_string(method), target));
    append(out, fmt::format("Host: {}\r\n", host));
    for (const auto& header : headers) {
        append(out, fmt::format("{}: {}\r\n", header.name, header.value));
    }
    if (!body.empty() || method == Method::POST || method == Method::PUT) {
        append(out, fmt::format("Content-Length: {}\r\n", body.size()));
    }
    append(out, "\r\n");
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::vector<uint8_t> serialize_response(uint16_t status, std::string_view reason,
                                        const std::vector<Header>& headers,
                                        std::span<const uint8_t> body) {
    std::vector<uint8_t> out;
    out.reserve(128 + body.size());

    append(out, fmt::format("HTTP/1.1 {} {}\r\n", status, reason));
    for (const auto& header : headers) {
        append(out, fmt::format("{}: {}\r\n", header.name, header.value));
    }
    // 101 carries no body framing
    if (status != 101) {
        append(out, fmt::format("Content-Length: {}\r\n", body.size()));
    }
    append(out, "\r\n");
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::string_view reason_phrase(uint16_t status) noexcept {
    switch (status) {
        case 101:
            return "Switching Protocols";
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 413:
            return "Payload Too Large";
        case 426:
            return "Upgrade Required";
        case 500:
            return "Internal Server Error";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Unknown";
    }
}

}  // namespace prism::http
