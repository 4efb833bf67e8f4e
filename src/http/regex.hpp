#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace lattice::http {

/// Compile-time options for route regexes
struct RegexOptions {
    bool full_match = true;        // Pattern must match the entire subject
    bool case_insensitive = false;
    size_t max_program_size = 0;   // Reject when the compiled program is larger (0 = unbounded)
};

// PCRE2 wrapper for regex compilation and execution
// Thread-safe for read operations after compilation
class Regex {
public:
    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Compile with options; a program larger than options.max_program_size is an error
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      const RegexOptions& options,
                                                      std::string& error_message);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    // Delete copy operations
    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Check if pattern matches the subject string
    [[nodiscard]] bool matches(std::string_view subject) const;

    // Size in bytes of the compiled program, the cost bound checked against max_program_size
    [[nodiscard]] size_t program_size() const noexcept { return program_size_; }

    // Get the original pattern string
    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern, size_t program_size);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;      // Original pattern (for debugging)
    size_t program_size_;
};

/// Outcome of checking a route regex against the configured bounds
struct RegexCheck {
    bool valid = false;
    size_t program_size = 0;
    std::string error;  // Set when !valid
};

/// Compile once to validate syntax and program size without keeping the program
[[nodiscard]] RegexCheck check_regex(std::string_view pattern, size_t max_program_size);

}  // namespace lattice::http
