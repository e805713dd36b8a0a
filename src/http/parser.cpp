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

// Prism HTTP Parser - Implementation

#include "parser.hpp"

namespace prism::http {

Parser::Parser(ParserMode mode) : mode_(mode) {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    llhttp_init(&parser_, mode_ == ParserMode::Request ? HTTP_REQUEST : HTTP_RESPONSE,
                &settings_);
    parser_.data = this;
}

std::pair<ParseResult, size_t> Parser::feed(std::span<const uint8_t> data) {
    // Previous message not taken yet
    if (message_complete_) {
        return {ParseResult::Complete, 0};
    }
    if (error_ != HPE_OK) {
        return {ParseResult::Error, 0};
    }
    if (data.empty()) {
        return {ParseResult::Incomplete, 0};
    }

    const char* begin = reinterpret_cast<const char*>(data.data());
    llhttp_errno_t err = llhttp_execute(&parser_, begin, data.size());

    if (err == HPE_OK) {
        return {ParseResult::Incomplete, data.size()};
    }

    // Paused at the end of a message (or after an upgrade): stop there so
    // the remaining bytes belong to the next message or the new protocol
    if (err == HPE_PAUSED || err == HPE_PAUSED_UPGRADE) {
        const char* pos = llhttp_get_error_pos(&parser_);
        size_t consumed = pos ? static_cast<size_t>(pos - begin) : data.size();
        if (err == HPE_PAUSED_UPGRADE) {
            message_.upgrade = true;
            message_complete_ = true;
        }
        paused_ = true;
        return {ParseResult::Complete, consumed};
    }

    error_ = err;
    const char* pos = llhttp_get_error_pos(&parser_);
    size_t consumed = pos ? static_cast<size_t>(pos - begin) : 0;
    return {ParseResult::Error, consumed};
}

HttpMessage Parser::take_message() {
    HttpMessage out = std::move(message_);
    message_ = HttpMessage{};
    message_complete_ = false;

    if (paused_) {
        paused_ = false;
        llhttp_resume(&parser_);
    }
    return out;
}

void Parser::reset() {
    llhttp_init(&parser_, mode_ == ParserMode::Request ? HTTP_REQUEST : HTTP_RESPONSE,
                &settings_);
    parser_.data = this;
    message_ = HttpMessage{};
    current_field_.clear();
    current_value_.clear();
    in_value_ = false;
    message_complete_ = false;
    paused_ = false;
    error_ = HPE_OK;
}

std::string_view Parser::error_message() const noexcept {
    if (error_ == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(error_);
}

void Parser::flush_header() {
    if (!current_field_.empty()) {
        message_.headers.push_back(Header{std::move(current_field_), std::move(current_value_)});
    }
    current_field_.clear();
    current_value_.clear();
    in_value_ = false;
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* self = static_cast<Parser*>(parser->data);
    self->message_ = HttpMessage{};
    self->current_field_.clear();
    self->current_value_.clear();
    self->in_value_ = false;
    self->message_complete_ = false;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* self = static_cast<Parser*>(parser->data);
    self->message_.target.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* self = static_cast<Parser*>(parser->data);

    // A field after a value starts the next header
    if (self->in_value_) {
        self->flush_header();
    }
    self->current_field_.append(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* self = static_cast<Parser*>(parser->data);
    self->current_value_.append(at, length);
    self->in_value_ = true;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* self = static_cast<Parser*>(parser->data);
    self->flush_header();

    auto& message = self->message_;
    message.version_major = parser->http_major;
    message.version_minor = parser->http_minor;
    message.keep_alive = llhttp_should_keep_alive(parser) != 0;
    message.upgrade = parser->upgrade != 0;

    if (self->mode_ == ParserMode::Request) {
        message.method = parse_method(llhttp_method_name(static_cast<llhttp_method_t>(
            llhttp_get_method(parser))));
    } else {
        message.status = static_cast<uint16_t>(parser->status_code);
    }
    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* self = static_cast<Parser*>(parser->data);
    const auto* bytes = reinterpret_cast<const uint8_t*>(at);
    self->message_.body.insert(self->message_.body.end(), bytes, bytes + length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* self = static_cast<Parser*>(parser->data);
    self->message_complete_ = true;
    return HPE_PAUSED;
}

}  // namespace prism::http
