#pragma once

#include <optional>
#include <string>
#include <string_view>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace prism::core {

// PCRE2 wrapper used by routing conditions
// Thread-safe for matching after compilation
class Regex {
public:
    // Compile a pattern. Returns nullopt and fills error_message on failure.
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // True if the pattern matches anywhere in subject
    [[nodiscard]] bool matches(std::string_view subject) const;

    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;
};

}  // namespace prism::core
