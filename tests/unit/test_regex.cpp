// Lattice Regex Tests
// PCRE2 wrapper: anchoring, case folding and program size accounting

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/http/regex.hpp"

using namespace lattice::http;

TEST_CASE("Regex compilation", "[http][regex]") {
    SECTION("Valid pattern compiles") {
        auto regex = Regex::compile("/users/[0-9]+");
        REQUIRE(regex.has_value());
        REQUIRE(regex->pattern() == "/users/[0-9]+");
        REQUIRE(regex->program_size() > 0);
    }

    SECTION("Syntax errors report a message") {
        std::string error;
        auto regex = Regex::compile("/users/(", error);
        REQUIRE_FALSE(regex.has_value());
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("Regex matching is anchored by default", "[http][regex]") {
    auto regex = Regex::compile("/api/.*/status");
    REQUIRE(regex.has_value());

    REQUIRE(regex->matches("/api/v1/status"));
    REQUIRE_FALSE(regex->matches("/prefix/api/v1/status"));
    REQUIRE_FALSE(regex->matches("/api/v1/status/extra"));
}

TEST_CASE("Regex options", "[http][regex]") {
    SECTION("Unanchored search") {
        RegexOptions options;
        options.full_match = false;
        std::string error;
        auto regex = Regex::compile("needle", options, error);
        REQUIRE(regex.has_value());
        REQUIRE(regex->matches("haystack with a needle in it"));
    }

    SECTION("Case-insensitive") {
        RegexOptions options;
        options.case_insensitive = true;
        std::string error;
        auto regex = Regex::compile("application/json", options, error);
        REQUIRE(regex.has_value());
        REQUIRE(regex->matches("Application/JSON"));
    }

    SECTION("Program size bound") {
        RegexOptions options;
        options.max_program_size = 16;
        std::string error;
        auto regex = Regex::compile("(a|b|c|d|e|f|g)+x", options, error);
        REQUIRE_FALSE(regex.has_value());
        REQUIRE(error.find("program size") != std::string::npos);
    }
}

TEST_CASE("Regex move semantics", "[http][regex]") {
    auto first = Regex::compile("a+");
    REQUIRE(first.has_value());

    Regex moved = std::move(*first);
    REQUIRE(moved.matches("aaa"));
}

TEST_CASE("check_regex reports size without keeping the program", "[http][regex]") {
    SECTION("Valid within bounds") {
        auto check = check_regex("/a.*", 0);
        REQUIRE(check.valid);
        REQUIRE(check.program_size > 0);
    }

    SECTION("Oversized keeps the measured size") {
        auto check = check_regex("/(one|two|three|four|five)+", 8);
        REQUIRE_FALSE(check.valid);
        REQUIRE(check.program_size > 8);
        REQUIRE_FALSE(check.error.empty());
    }

    SECTION("Syntax error has no size") {
        auto check = check_regex("[", 0);
        REQUIRE_FALSE(check.valid);
        REQUIRE(check.program_size == 0);
    }
}
