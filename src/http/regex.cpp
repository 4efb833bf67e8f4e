#include "regex.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <cstring>

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace lattice::http {

// Helper to convert error code to string
static std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

// Regex implementation

Regex::Regex(pcre2_real_code_8* code, std::string pattern, size_t program_size)
    : code_(code), pattern_(std::move(pattern)), program_size_(program_size) {}

Regex::Regex(Regex&& other) noexcept
    : code_(other.code_), pattern_(std::move(other.pattern_)), program_size_(other.program_size_) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        program_size_ = other.program_size_;
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
    return compile(pattern, RegexOptions{}, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, const RegexOptions& options,
                                    std::string& error_message) {
    int error_code;
    PCRE2_SIZE error_offset;

    uint32_t flags = 0;
    if (options.full_match) {
        flags |= PCRE2_ANCHORED | PCRE2_ENDANCHORED;
    }
    if (options.case_insensitive) {
        flags |= PCRE2_CASELESS;
    }

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), flags,
                               &error_code, &error_offset, nullptr);

    if (!code) {
        error_message = get_pcre2_error(error_code) + " at offset " + std::to_string(error_offset) +
                        " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    size_t size = 0;
    if (pcre2_pattern_info(code, PCRE2_INFO_SIZE, &size) != 0) {
        pcre2_code_free(code);
        error_message = "cannot determine program size of pattern: " + std::string(pattern);
        return std::nullopt;
    }

    if (options.max_program_size > 0 && size > options.max_program_size) {
        pcre2_code_free(code);
        error_message = fmt::format("regex program size {} exceeds maximum {} in pattern: {}", size,
                                    options.max_program_size, pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern), size);
}

bool Regex::matches(std::string_view subject) const {
    if (!code_) {
        return false;
    }

    auto* match_data = pcre2_match_data_create_from_pattern(code_, nullptr);
    if (!match_data) {
        return false;
    }

    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         0,  // start offset
                         0,  // options
                         match_data, nullptr);

    pcre2_match_data_free(match_data);

    return rc >= 0;  // >= 0 means match found
}

RegexCheck check_regex(std::string_view pattern, size_t max_program_size) {
    RegexCheck check;
    RegexOptions options;  // Unbounded, so an oversized program still reports its size

    std::string error;
    auto regex = Regex::compile(pattern, options, error);
    if (!regex) {
        check.error = std::move(error);
        return check;
    }

    check.program_size = regex->program_size();
    if (max_program_size > 0 && check.program_size > max_program_size) {
        check.error = fmt::format("regex program size {} exceeds maximum {}", check.program_size,
                                  max_program_size);
        return check;
    }

    check.valid = true;
    return check;
}

}  // namespace lattice::http
