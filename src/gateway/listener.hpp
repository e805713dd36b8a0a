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

// Prism Listener - Header
// Accept loop plus one worker thread per inbound connection

#pragma once

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "../protocol/adapter.hpp"

namespace quill {
class Logger;
}

namespace prism::gateway {

using protocol::Message;
using protocol::ProtocolKind;

/// Per-connection context handed to the delegate
struct InboundContext {
    ProtocolKind protocol = ProtocolKind::Http;
    uint64_t connection_id = 0;
    std::string peer;
    std::string session_id;  // Filled by the delegate on the first message
};

/// Receives inbound traffic from listeners
class InboundDelegate {
public:
    virtual ~InboundDelegate() = default;

    /// Produce the reply for one inbound message. On error the listener sends
    /// the error name back to the client.
    [[nodiscard]] virtual std::error_code on_message(InboundContext& context,
                                                     const Message& request, Message& reply) = 0;

    /// The inbound connection is gone
    virtual void on_disconnect(InboundContext& context) noexcept = 0;
};

struct ListenerOptions {
    std::chrono::milliseconds poll_interval{200};              // Accept/receive wake-up
    std::chrono::milliseconds connection_idle_timeout{60000};  // Close silent connections
};

class Listener {
public:
    Listener(protocol::ProtocolAdapter& adapter, std::unique_ptr<protocol::ProtocolAcceptor> acceptor,
             InboundDelegate& delegate, ListenerOptions options = {},
             quill::Logger* logger = nullptr);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /// Bind and start the accept thread. listener_failed when binding fails.
    [[nodiscard]] std::error_code start(std::string_view address, uint16_t port);

    /// Stop accepting, wait for workers to finish (idempotent)
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] ProtocolKind protocol() const noexcept { return adapter_.kind(); }
    [[nodiscard]] const std::string& address() const noexcept { return address_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] size_t active_connections() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void serve(protocol::Connection conn, std::shared_ptr<std::atomic<bool>> done);
    void reap_finished();

    protocol::ProtocolAdapter& adapter_;
    std::unique_ptr<protocol::ProtocolAcceptor> acceptor_;
    InboundDelegate& delegate_;
    ListenerOptions options_;
    quill::Logger* logger_;

    std::string address_;
    uint16_t port_ = 0;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

}  // namespace prism::gateway
