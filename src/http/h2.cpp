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

// Prism HTTP/2 - Implementation
// HTTP/2 session management using nghttp2

#include "h2.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>

#include "../core/errors.hpp"

namespace prism::http {

namespace {

nghttp2_nv make_nv(std::string_view name, std::string_view value) {
    return nghttp2_nv{
        reinterpret_cast<uint8_t*>(const_cast<char*>(name.data())),
        reinterpret_cast<uint8_t*>(const_cast<char*>(value.data())),
        name.size(),
        value.size(),
        NGHTTP2_NV_FLAG_NONE,
    };
}

}  // namespace

bool is_http2_connection(std::span<const uint8_t> data) noexcept {
    if (data.size() < HTTP2_PREFACE_LEN) {
        return false;
    }
    return std::memcmp(data.data(), HTTP2_PREFACE, HTTP2_PREFACE_LEN) == 0;
}

// H2Session

H2Session::H2Session(bool is_server) : is_server_(is_server) {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);

    nghttp2_session_callbacks_set_send_callback(callbacks, send_callback);
    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_callback);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_callback);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_callback);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks,
                                                              on_data_chunk_recv_callback);

    if (is_server_) {
        nghttp2_session_server_new(&session_, callbacks, this);
    } else {
        nghttp2_session_client_new(&session_, callbacks, this);
    }
    nghttp2_session_callbacks_del(callbacks);

    nghttp2_settings_entry settings[] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100},
        {NGHTTP2_SETTINGS_INITIAL_WINDOW_SIZE, 1 << 20},
        {NGHTTP2_SETTINGS_ENABLE_PUSH, 0},
    };
    if (session_) {
        nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, settings, 3);
    } else {
        should_close_ = true;
    }
}

H2Session::~H2Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

std::error_code H2Session::recv(std::span<const uint8_t> data, size_t& consumed) {
    consumed = 0;
    if (!session_) {
        return core::GatewayErrc::protocol_error;
    }

    ssize_t readlen = nghttp2_session_mem_recv(session_, data.data(), data.size());
    if (readlen < 0) {
        should_close_ = true;
        return core::GatewayErrc::protocol_error;
    }

    consumed = static_cast<size_t>(readlen);
    return {};
}

std::error_code H2Session::take_output(std::vector<uint8_t>& out) {
    if (!session_) {
        return core::GatewayErrc::protocol_error;
    }

    while (nghttp2_session_want_write(session_)) {
        size_t before = send_buffer_.size();
        if (int rv = nghttp2_session_send(session_); rv != 0) {
            should_close_ = true;
            return core::GatewayErrc::protocol_error;
        }
        // Flow control blocked: the rest goes out after a WINDOW_UPDATE
        if (send_buffer_.size() == before) {
            break;
        }
    }

    out = std::move(send_buffer_);
    send_buffer_.clear();
    return {};
}

std::error_code H2Session::submit_request(std::string_view authority, std::string_view path,
                                          std::span<const uint8_t> body, int32_t& stream_id) {
    if (is_server_ || !session_) {
        return core::GatewayErrc::invalid_argument;
    }

    auto stream = std::make_unique<H2Stream>();
    stream->outgoing.assign(body.begin(), body.end());

    std::string content_length = std::to_string(body.size());
    nghttp2_nv headers[] = {
        make_nv(":method", "POST"),
        make_nv(":scheme", "http"),
        make_nv(":authority", authority),
        make_nv(":path", path),
        make_nv("content-type", "application/octet-stream"),
        make_nv("content-length", content_length),
    };

    nghttp2_data_provider provider{};
    provider.source.ptr = stream.get();
    provider.read_callback = body_read_callback;

    int32_t sid = nghttp2_submit_request(session_, nullptr, headers, std::size(headers),
                                         &provider, nullptr);
    if (sid < 0) {
        return core::GatewayErrc::send_failed;
    }

    stream->stream_id = sid;
    streams_[sid] = std::move(stream);
    stream_id = sid;
    return {};
}

std::error_code H2Session::submit_response(int32_t stream_id, uint16_t status,
                                           std::span<const uint8_t> body) {
    if (!is_server_ || !session_) {
        return core::GatewayErrc::invalid_argument;
    }

    auto* stream = get_stream(stream_id);
    if (!stream || stream->state == H2StreamState::Closed) {
        return core::GatewayErrc::send_failed;
    }
    if (stream->response_submitted) {
        return core::GatewayErrc::send_failed;
    }

    stream->outgoing.assign(body.begin(), body.end());
    stream->outgoing_offset = 0;
    stream->status_storage = std::to_string(status);

    std::string content_length = std::to_string(body.size());
    nghttp2_nv headers[] = {
        make_nv(":status", stream->status_storage),
        make_nv("content-type", "application/octet-stream"),
        make_nv("content-length", content_length),
    };

    nghttp2_data_provider provider{};
    provider.source.ptr = stream;
    provider.read_callback = body_read_callback;

    if (nghttp2_submit_response(session_, stream_id, headers, std::size(headers), &provider) !=
        0) {
        return core::GatewayErrc::send_failed;
    }
    stream->response_submitted = true;
    return {};
}

void H2Session::submit_goaway() {
    if (session_) {
        nghttp2_submit_goaway(session_, NGHTTP2_FLAG_NONE,
                              nghttp2_session_get_last_proc_stream_id(session_), NGHTTP2_NO_ERROR,
                              nullptr, 0);
    }
}

std::optional<H2Message> H2Session::pop_completed() {
    if (completed_.empty()) {
        return std::nullopt;
    }
    H2Message message = std::move(completed_.front());
    completed_.pop_front();
    return message;
}

bool H2Session::want_write() const noexcept {
    return session_ && nghttp2_session_want_write(session_);
}

bool H2Session::should_close() const noexcept {
    if (should_close_ || !session_) {
        return true;
    }
    return !nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_);
}

H2Stream* H2Session::get_stream(int32_t stream_id) {
    auto it = streams_.find(stream_id);
    return it != streams_.end() ? it->second.get() : nullptr;
}

H2Stream& H2Session::get_or_create_stream(int32_t stream_id) {
    if (auto* stream = get_stream(stream_id)) {
        return *stream;
    }
    auto stream = std::make_unique<H2Stream>();
    stream->stream_id = stream_id;
    auto* ptr = stream.get();
    streams_[stream_id] = std::move(stream);
    return *ptr;
}

void H2Session::complete_stream(H2Stream& stream) {
    if (stream.state != H2StreamState::Open) {
        return;
    }
    stream.state = H2StreamState::Remote;

    H2Message message;
    message.stream_id = stream.stream_id;
    message.method = stream.method;
    message.path = stream.path;
    message.status = stream.status;
    message.headers = std::move(stream.headers);
    message.body = std::move(stream.body);
    stream.headers.clear();
    stream.body.clear();
    completed_.push_back(std::move(message));
}

// nghttp2 callbacks

ssize_t H2Session::send_callback(nghttp2_session* /*session*/, const uint8_t* data, size_t length,
                                 int /*flags*/, void* user_data) {
    auto* self = static_cast<H2Session*>(user_data);
    self->send_buffer_.insert(self->send_buffer_.end(), data, data + length);
    return static_cast<ssize_t>(length);
}

int H2Session::on_frame_recv_callback(nghttp2_session* /*session*/, const nghttp2_frame* frame,
                                      void* user_data) {
    auto* self = static_cast<H2Session*>(user_data);

    switch (frame->hd.type) {
        case NGHTTP2_HEADERS:
        case NGHTTP2_DATA:
            if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
                if (auto* stream = self->get_stream(frame->hd.stream_id)) {
                    self->complete_stream(*stream);
                }
            }
            break;

        case NGHTTP2_SETTINGS:
            if (!(frame->hd.flags & NGHTTP2_FLAG_ACK)) {
                self->remote_settings_ = true;
            }
            break;

        case NGHTTP2_GOAWAY:
            self->should_close_ = true;
            break;

        default:
            break;
    }
    return 0;
}

int H2Session::on_stream_close_callback(nghttp2_session* /*session*/, int32_t stream_id,
                                        uint32_t error_code, void* user_data) {
    auto* self = static_cast<H2Session*>(user_data);

    auto* stream = self->get_stream(stream_id);
    if (!stream) {
        return 0;
    }

    if (stream->state == H2StreamState::Open && error_code != NGHTTP2_NO_ERROR) {
        H2Message message;
        message.stream_id = stream_id;
        message.reset = true;
        self->completed_.push_back(std::move(message));
    }
    self->streams_.erase(stream_id);
    return 0;
}

int H2Session::on_header_callback(nghttp2_session* /*session*/, const nghttp2_frame* frame,
                                  const uint8_t* name, size_t namelen, const uint8_t* value,
                                  size_t valuelen, uint8_t /*flags*/, void* user_data) {
    auto* self = static_cast<H2Session*>(user_data);
    if (frame->hd.type != NGHTTP2_HEADERS) {
        return 0;
    }

    auto& stream = self->get_or_create_stream(frame->hd.stream_id);
    std::string_view name_sv(reinterpret_cast<const char*>(name), namelen);
    std::string_view value_sv(reinterpret_cast<const char*>(value), valuelen);

    if (name_sv == ":method") {
        stream.method = parse_method(value_sv);
    } else if (name_sv == ":path") {
        stream.path = std::string(value_sv);
    } else if (name_sv == ":status") {
        uint16_t status = 0;
        auto [ptr, ec] = std::from_chars(value_sv.data(), value_sv.data() + value_sv.size(), status);
        stream.status = ec == std::errc{} ? status : 0;
    } else if (!name_sv.empty() && name_sv[0] != ':') {
        stream.headers.push_back(Header{std::string(name_sv), std::string(value_sv)});
    }
    return 0;
}

int H2Session::on_data_chunk_recv_callback(nghttp2_session* /*session*/, uint8_t /*flags*/,
                                           int32_t stream_id, const uint8_t* data, size_t len,
                                           void* user_data) {
    auto* self = static_cast<H2Session*>(user_data);
    if (auto* stream = self->get_stream(stream_id)) {
        stream->body.insert(stream->body.end(), data, data + len);
    }
    return 0;
}

ssize_t H2Session::body_read_callback(nghttp2_session* /*session*/, int32_t /*stream_id*/,
                                      uint8_t* buf, size_t length, uint32_t* data_flags,
                                      nghttp2_data_source* source, void* /*user_data*/) {
    auto* stream = static_cast<H2Stream*>(source->ptr);

    size_t remaining = stream->outgoing.size() - stream->outgoing_offset;
    size_t to_copy = std::min(length, remaining);
    if (to_copy > 0) {
        std::memcpy(buf, stream->outgoing.data() + stream->outgoing_offset, to_copy);
        stream->outgoing_offset += to_copy;
    }
    if (stream->outgoing_offset >= stream->outgoing.size()) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    }
    return static_cast<ssize_t>(to_copy);
}

}  // namespace prism::http
