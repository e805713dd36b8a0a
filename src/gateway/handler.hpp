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

// Prism Message Handler - Header
// Business handler boundary

#pragma once

#include <chrono>
#include <functional>
#include <system_error>

#include "session.hpp"

namespace prism::gateway {

/// Business logic invoked for every inbound message.
/// Implementations must be thread-safe: workers call handle() concurrently
/// for different sessions.
class MessageHandler {
public:
    virtual ~MessageHandler() = default;

    [[nodiscard]] virtual std::error_code handle(const Message& request, Session& session,
                                                 Message& reply) = 0;
};

/// Forwards the payload over the session's backend connection and returns
/// the backend's reply
class ForwardingHandler final : public MessageHandler {
public:
    explicit ForwardingHandler(std::chrono::milliseconds receive_timeout)
        : receive_timeout_(receive_timeout) {}

    [[nodiscard]] std::error_code handle(const Message& request, Session& session,
                                         Message& reply) override;

private:
    std::chrono::milliseconds receive_timeout_;
};

using HandlerFunction = std::function<std::error_code(const Message&, Session&, Message&)>;

/// Adapts a callable. Exceptions thrown by the callable become handler_failed.
class FunctionHandler final : public MessageHandler {
public:
    explicit FunctionHandler(HandlerFunction fn) : fn_(std::move(fn)) {}

    [[nodiscard]] std::error_code handle(const Message& request, Session& session,
                                         Message& reply) override;

private:
    HandlerFunction fn_;
};

}  // namespace prism::gateway
