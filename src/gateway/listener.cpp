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

// Prism Listener - Implementation

#include "listener.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace prism::gateway {

Listener::Listener(protocol::ProtocolAdapter& adapter,
                   std::unique_ptr<protocol::ProtocolAcceptor> acceptor,
                   InboundDelegate& delegate, ListenerOptions options, quill::Logger* logger)
    : adapter_(adapter),
      acceptor_(std::move(acceptor)),
      delegate_(delegate),
      options_(options),
      logger_(logger ? logger : logging::get_logger()) {}

Listener::~Listener() {
    stop();
}

std::error_code Listener::start(std::string_view address, uint16_t port) {
    if (running()) {
        return {};
    }
    if (!acceptor_ || acceptor_->kind() != adapter_.kind()) {
        return core::GatewayErrc::invalid_argument;
    }

    if (auto ec = acceptor_->open(address, port); ec) {
        LOG_ERROR(logger_, "Listener bind failed: protocol={}, address={}:{}, error={}",
                  protocol::to_string(adapter_.kind()), address, port, ec.message());
        return core::GatewayErrc::listener_failed;
    }

    address_ = std::string(address);
    port_ = acceptor_->local_port();
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this] { accept_loop(); });

    LOG_INFO(logger_, "Listener started: protocol={}, address={}:{}",
             protocol::to_string(adapter_.kind()), address_, port_);
    return {};
}

void Listener::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    acceptor_->close();

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    LOG_INFO(logger_, "Listener stopped: protocol={}, address={}:{}",
             protocol::to_string(adapter_.kind()), address_, port_);
}

size_t Listener::active_connections() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load(std::memory_order_acquire)) {
            count++;
        }
    }
    return count;
}

void Listener::accept_loop() {
    while (running()) {
        reap_finished();

        protocol::Connection conn;
        auto ec = acceptor_->accept(core::deadline_after(options_.poll_interval), conn);
        if (ec == core::GatewayErrc::receive_timeout) {
            continue;
        }
        if (ec) {
            LOG_WARNING(logger_, "Accept failed: protocol={}, error={}",
                        protocol::to_string(adapter_.kind()), ec.message());
            continue;
        }

        LOG_DEBUG(logger_, "Connection accepted: protocol={}, peer={}, connection_id={}",
                  protocol::to_string(adapter_.kind()), conn.peer, conn.id);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{
            std::thread([this, c = std::move(conn), done]() mutable { serve(std::move(c), done); }),
            done});
    }
}

void Listener::serve(protocol::Connection conn, std::shared_ptr<std::atomic<bool>> done) {
    InboundContext context;
    context.protocol = adapter_.kind();
    context.connection_id = conn.id;
    context.peer = conn.peer;

    auto last_message = protocol::Clock::now();

    while (running() && adapter_.is_connected(conn)) {
        Message request;
        auto ec = adapter_.receive(conn, options_.poll_interval, request);
        if (ec == core::GatewayErrc::receive_timeout) {
            if (protocol::Clock::now() - last_message > options_.connection_idle_timeout) {
                LOG_DEBUG(logger_, "Inbound connection idle: peer={}, connection_id={}",
                          conn.peer, conn.id);
                break;
            }
            continue;
        }
        if (ec) {
            if (ec != core::GatewayErrc::connection_closed) {
                LOG_WARNING(logger_, "Inbound receive failed: protocol={}, peer={}, error={}",
                            protocol::to_string(adapter_.kind()), conn.peer, ec.message());
            }
            break;
        }
        last_message = protocol::Clock::now();

        Message reply;
        if (auto handle_ec = delegate_.on_message(context, request, reply); handle_ec) {
            reply.payload = protocol::to_bytes("error: " + handle_ec.message());
        }

        if (auto send_ec = adapter_.send(conn, reply.payload); send_ec) {
            LOG_WARNING(logger_, "Inbound reply failed: protocol={}, peer={}, error={}",
                        protocol::to_string(adapter_.kind()), conn.peer, send_ec.message());
            break;
        }
    }

    delegate_.on_disconnect(context);
    adapter_.disconnect(conn);
    done->store(true, std::memory_order_release);
}

void Listener::reap_finished() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace prism::gateway
