#include "regex.hpp"

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace prism::core {

namespace {

/// Bound on backtracking so a hostile pattern cannot stall routing
constexpr uint32_t MATCH_LIMIT = 100000;

std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

}  // namespace

Regex::Regex(pcre2_real_code_8* code, std::string pattern)
    : code_(code), pattern_(std::move(pattern)) {}

Regex::Regex(Regex&& other) noexcept : code_(other.code_), pattern_(std::move(other.pattern_)) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    if (code_) {
        pcre2_code_free(code_);
    }
}

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string error_message;
    return compile(pattern, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code = 0;
    PCRE2_SIZE error_offset = 0;
    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), 0,
                               &error_code, &error_offset, nullptr);
    if (!code) {
        error_message = get_pcre2_error(error_code) + " (offset " + std::to_string(error_offset) +
                        ")";
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

bool Regex::matches(std::string_view subject) const {
    if (!code_) {
        return false;
    }

    // Metadata values come from the network: bound the backtracking
    auto* context = pcre2_match_context_create(nullptr);
    if (!context) {
        return false;
    }
    pcre2_set_match_limit(context, MATCH_LIMIT);

    auto* match_data = pcre2_match_data_create_from_pattern(code_, nullptr);
    int rc = -1;
    if (match_data) {
        rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(), 0, 0,
                         match_data, context);
        pcre2_match_data_free(match_data);
    }
    pcre2_match_context_free(context);
    return rc >= 0;
}

}  // namespace prism::core
