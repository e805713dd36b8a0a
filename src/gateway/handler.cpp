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

// Prism Message Handler - Implementation

#include "handler.hpp"

#include <exception>

#include "../core/errors.hpp"

namespace prism::gateway {

std::error_code ForwardingHandler::handle(const Message& request, Session& session,
                                          Message& reply) {
    return session.exchange(request.payload, receive_timeout_, reply);
}

std::error_code FunctionHandler::handle(const Message& request, Session& session,
                                        Message& reply) {
    if (!fn_) {
        return core::GatewayErrc::handler_failed;
    }
    try {
        return fn_(request, session, reply);
    } catch (const std::exception&) {
        return core::GatewayErrc::handler_failed;
    }
}

}  // namespace prism::gateway
