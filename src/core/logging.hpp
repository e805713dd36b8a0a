#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace prism::control {
struct LogConfig;
}

namespace prism::logging {

// Start the Quill backend thread (safe to call more than once)
void init_logging_system();

// Create the process logger from config: console when output is empty,
// otherwise a rotating text or JSON file under the output directory
quill::Logger* init_logger(const prism::control::LogConfig& config);

// Process logger; falls back to a console logger when init_logger() was never called
quill::Logger* get_logger();

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Session identifiers: {uuid-v4}#{counter}
std::string generate_session_id();

// Validate session identifier format
bool is_valid_session_id(std::string_view id);

// Session lifecycle logging
#define LOG_SESSION_EVENT(logger, event, session_id, protocol, state)                     \
    LOG_INFO(logger, "Session {}: session_id={}, protocol={}, state={}", event, session_id, \
             protocol, state)

// Endpoint events (selection, probe, lease)
#define LOG_ENDPOINT_EVENT(logger, event, endpoint_id, host, port, protocol)                   \
    LOG_INFO(logger, "Endpoint {}: endpoint_id={}, address={}:{}, protocol={}", event,          \
             endpoint_id, host, port, protocol)

// Error logging with session context
#define LOG_ERROR_CTX(logger, message, session_id, error_code, error_detail)                \
    LOG_ERROR(logger, "{}: session_id={}, error_code={}, error_detail={}", message, session_id, \
              error_code, error_detail)

}  // namespace prism::logging
