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

// Prism HTTP/2 - Header
// HTTP/2 session management and multiplexing (nghttp2, cleartext prior knowledge)

#pragma once

#include <nghttp2/nghttp2.h>

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "http.hpp"

namespace prism::http {

/// HTTP/2 connection preface (24 bytes)
/// "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n"
constexpr const char* HTTP2_PREFACE = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";
constexpr size_t HTTP2_PREFACE_LEN = 24;

/// Detect if data starts with HTTP/2 connection preface
[[nodiscard]] bool is_http2_connection(std::span<const uint8_t> data) noexcept;

/// HTTP/2 stream state
enum class H2StreamState : uint8_t {
    Open,    // Headers seen or submitted
    Remote,  // Peer ended its side (END_STREAM)
    Closed   // Stream fully closed
};

/// One stream's request/response pair
struct H2Stream {
    int32_t stream_id = -1;
    H2StreamState state = H2StreamState::Open;

    // Received from the peer
    Method method = Method::UNKNOWN;  // Server side
    std::string path;                 // Server side
    uint16_t status = 0;              // Client side
    std::vector<Header> headers;
    std::vector<uint8_t> body;

    // Body we send; must outlive nghttp2_session_send
    std::vector<uint8_t> outgoing;
    size_t outgoing_offset = 0;
    std::string status_storage;

    bool response_submitted = false;
};

/// A stream whose inbound half has finished (or that was reset)
struct H2Message {
    int32_t stream_id = -1;
    Method method = Method::UNKNOWN;
    std::string path;
    uint16_t status = 0;
    std::vector<Header> headers;
    std::vector<uint8_t> body;
    bool reset = false;  // RST_STREAM before completion
};

/// HTTP/2 session managing multiple streams over a single connection
class H2Session {
public:
    /// Create HTTP/2 session and queue the initial SETTINGS frame
    explicit H2Session(bool is_server);
    ~H2Session();

    H2Session(const H2Session&) = delete;
    H2Session& operator=(const H2Session&) = delete;

    /// Process incoming HTTP/2 frames. Returns number of bytes consumed.
    [[nodiscard]] std::error_code recv(std::span<const uint8_t> data, size_t& consumed);

    /// Serialize everything nghttp2 wants to write and hand it out
    [[nodiscard]] std::error_code take_output(std::vector<uint8_t>& out);

    /// Submit a POST request carrying `body` (client mode)
    [[nodiscard]] std::error_code submit_request(std::string_view authority, std::string_view path,
                                                 std::span<const uint8_t> body,
                                                 int32_t& stream_id);

    /// Answer a request stream (server mode)
    [[nodiscard]] std::error_code submit_response(int32_t stream_id, uint16_t status,
                                                  std::span<const uint8_t> body);

    /// Queue GOAWAY with NO_ERROR
    void submit_goaway();

    /// Next stream whose inbound half is complete
    [[nodiscard]] std::optional<H2Message> pop_completed();

    [[nodiscard]] bool is_server() const noexcept { return is_server_; }
    [[nodiscard]] bool want_write() const noexcept;
    [[nodiscard]] bool remote_settings_received() const noexcept { return remote_settings_; }

    /// Peer sent GOAWAY or the session can no longer make progress
    [[nodiscard]] bool should_close() const noexcept;

    [[nodiscard]] size_t active_streams() const noexcept { return streams_.size(); }

private:
    bool is_server_;
    nghttp2_session* session_ = nullptr;

    prism::core::fast_map<int32_t, std::unique_ptr<H2Stream>> streams_;
    std::deque<H2Message> completed_;
    std::vector<uint8_t> send_buffer_;

    bool should_close_ = false;
    bool remote_settings_ = false;

    H2Stream* get_stream(int32_t stream_id);
    H2Stream& get_or_create_stream(int32_t stream_id);
    void complete_stream(H2Stream& stream);

    // nghttp2 callbacks
    static ssize_t send_callback(nghttp2_session* session, const uint8_t* data, size_t length,
                                 int flags, void* user_data);

    static int on_frame_recv_callback(nghttp2_session* session, const nghttp2_frame* frame,
                                      void* user_data);

    static int on_stream_close_callback(nghttp2_session* session, int32_t stream_id,
                                        uint32_t error_code, void* user_data);

    static int on_header_callback(nghttp2_session* session, const nghttp2_frame* frame,
                                  const uint8_t* name, size_t namelen, const uint8_t* value,
                                  size_t valuelen, uint8_t flags, void* user_data);

    static int on_data_chunk_recv_callback(nghttp2_session* session, uint8_t flags,
                                           int32_t stream_id, const uint8_t* data, size_t len,
                                           void* user_data);

    static ssize_t body_read_callback(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                                      size_t length, uint32_t* data_flags,
                                      nghttp2_data_source* source, void* user_data);
};

}  // namespace prism::http
