// Prism HTTP Parser - Header
// Incremental HTTP/1.x parser (wraps llhttp)

#pragma once

#include <llhttp.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "http.hpp"

namespace prism::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // One message fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// Which side of the exchange the parser reads
enum class ParserMode : uint8_t { Request, Response };

/// HTTP/1.x parser. Feed bytes as they arrive; each Complete result hands
/// out one message and stops at its last byte so pipelined bytes stay with
/// the caller. Fragmented callbacks are accumulated into owned storage.
class Parser {
public:
    explicit Parser(ParserMode mode = ParserMode::Request);
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to the settings)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Parse from buffer. Returns the result and bytes consumed. On Complete
    /// the message is available through take_message().
    [[nodiscard]] std::pair<ParseResult, size_t> feed(std::span<const uint8_t> data);

    /// Move out the completed message and prepare for the next one
    [[nodiscard]] HttpMessage take_message();

    /// Reset parser state
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    [[nodiscard]] ParserMode mode() const noexcept { return mode_; }

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    ParserMode mode_;
    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    HttpMessage message_;
    std::string current_field_;
    std::string current_value_;
    bool in_value_ = false;
    bool message_complete_ = false;
    bool paused_ = false;
    llhttp_errno_t error_ = HPE_OK;

    void flush_header();
};

}  // namespace prism::http
