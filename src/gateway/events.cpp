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

// Prism Gateway Events - Implementation

#include "events.hpp"

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace prism::gateway {

std::optional<std::string_view> GatewayEvent::find(std::string_view name) const {
    for (const auto& [key, value] : attributes) {
        if (key == name) {
            return std::string_view{value};
        }
    }
    return std::nullopt;
}

LoggingEventSink::LoggingEventSink(quill::Logger* logger)
    : logger_(logger ? logger : logging::get_logger()) {}

void LoggingEventSink::emit(const GatewayEvent& event) noexcept {
    std::string rendered;
    for (const auto& [key, value] : event.attributes) {
        if (!rendered.empty()) {
            rendered += ", ";
        }
        rendered += fmt::format("{}={}", key, value);
    }

    if (event.type == EventType::HandlerFailed) {
        LOG_WARNING(logger_, "event={}, {}", to_string(event.type), rendered);
    } else {
        LOG_INFO(logger_, "event={}, {}", to_string(event.type), rendered);
    }
}

}  // namespace prism::gateway
