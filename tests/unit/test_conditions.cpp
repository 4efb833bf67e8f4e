// Lattice Match Condition Tests

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../../src/dag/conditions.hpp"
#include "test_helpers.hpp"

using namespace lattice;
using namespace lattice::dag;
using lattice::testing::prefix;
using lattice::testing::request;

namespace {

source::MatchCondition exact_path(std::string value) {
    source::MatchCondition c;
    c.exact = std::move(value);
    return c;
}

source::MatchCondition regex_path(std::string value) {
    source::MatchCondition c;
    c.regex = std::move(value);
    return c;
}

source::MatchCondition header(source::HeaderMatchCondition h) {
    source::MatchCondition c;
    c.header = std::move(h);
    return c;
}

source::HeaderMatchCondition header_exact(std::string name, std::string value) {
    source::HeaderMatchCondition h;
    h.name = std::move(name);
    h.exact = std::move(value);
    return h;
}

source::HeaderMatchCondition header_not_exact(std::string name, std::string value) {
    source::HeaderMatchCondition h;
    h.name = std::move(name);
    h.not_exact = std::move(value);
    return h;
}

}  // namespace

// ============================
// Path matching
// ============================

TEST_CASE("Segment prefix respects path boundaries", "[conditions][path]") {
    auto m = PathMatch::prefix("/foo", PrefixMatchType::Segment);

    REQUIRE(m.matches("/foo"));
    REQUIRE(m.matches("/foo/"));
    REQUIRE(m.matches("/foo/bar"));
    REQUIRE_FALSE(m.matches("/foobar"));
    REQUIRE_FALSE(m.matches("/fo"));
}

TEST_CASE("String prefix matches raw prefixes", "[conditions][path]") {
    auto m = PathMatch::prefix("/foo", PrefixMatchType::String);

    REQUIRE(m.matches("/foobar"));
    REQUIRE(m.matches("/foo/bar"));
    REQUIRE_FALSE(m.matches("/fo"));
}

TEST_CASE("Prefix ending in slash matches everything below it", "[conditions][path]") {
    auto m = PathMatch::prefix("/", PrefixMatchType::Segment);
    REQUIRE(m.matches("/"));
    REQUIRE(m.matches("/anything/at/all"));
}

TEST_CASE("Exact and regex path matching", "[conditions][path]") {
    SECTION("Exact compares the whole path") {
        auto m = PathMatch::exact("/login");
        REQUIRE(m.matches("/login"));
        REQUIRE_FALSE(m.matches("/login/"));
    }

    SECTION("Regex must match the entire path") {
        auto m = PathMatch::regex("/api/v[0-9]+");
        REQUIRE(m.matches("/api/v2"));
        REQUIRE_FALSE(m.matches("/api/v2/users"));
    }
}

TEST_CASE("Path keys share space between prefix flavours", "[conditions][path]") {
    auto segment = PathMatch::prefix("/foo", PrefixMatchType::Segment);
    auto string = PathMatch::prefix("/foo", PrefixMatchType::String);

    REQUIRE(segment.str() == "prefix:/foo");
    REQUIRE(segment.str() == string.str());
    REQUIRE(PathMatch::exact("/foo").str() == "exact:/foo");
    REQUIRE(PathMatch::regex("/foo.*").str() == "regex:/foo.*");
}

// ============================
// Header and query predicates
// ============================

TEST_CASE("Header predicates", "[conditions][headers]") {
    auto req = request("example.com", "/");
    req.headers.emplace_back("X-Env", "staging-eu");

    SECTION("Header names compare case-insensitively") {
        HeaderMatch m{"x-env", MatchType::Exact, "staging-eu"};
        REQUIRE(m.matches(req));
    }

    SECTION("Contains and inverted contains") {
        HeaderMatch contains{"X-Env", MatchType::Contains, "staging"};
        HeaderMatch not_contains{"X-Env", MatchType::Contains, "staging", true};
        REQUIRE(contains.matches(req));
        REQUIRE_FALSE(not_contains.matches(req));
    }

    SECTION("Missing header only satisfies notpresent") {
        HeaderMatch present{"X-Missing", MatchType::Present};
        HeaderMatch not_present{"X-Missing", MatchType::Present, "", true};
        HeaderMatch not_exact{"X-Missing", MatchType::Exact, "a", true};
        REQUIRE_FALSE(present.matches(req));
        REQUIRE(not_present.matches(req));
        REQUIRE_FALSE(not_exact.matches(req));
    }

    SECTION("treatMissingAsEmpty lets negative forms match a missing header") {
        HeaderMatch not_exact{"X-Missing", MatchType::Exact, "a", true};
        not_exact.treat_missing_as_empty = true;
        REQUIRE(not_exact.matches(req));
    }

    SECTION("Ignore case applies to values") {
        HeaderMatch m{"X-Env", MatchType::Exact, "STAGING-EU"};
        REQUIRE_FALSE(m.matches(req));
        m.ignore_case = true;
        REQUIRE(m.matches(req));
    }
}

TEST_CASE("Query parameter predicates", "[conditions][query]") {
    auto req = request("example.com", "/search?q=hello%20world&page=2");

    QueryParamMatch exact{"q", MatchType::Exact, "hello world"};
    QueryParamMatch prefix_match{"page", MatchType::Prefix, "2"};
    QueryParamMatch missing{"lang", MatchType::Present};

    REQUIRE(exact.matches(req));
    REQUIRE(prefix_match.matches(req));
    REQUIRE_FALSE(missing.matches(req));
}

TEST_CASE("Match keys ignore predicate order", "[conditions][key]") {
    MatchConditions a;
    a.path = PathMatch::prefix("/api");
    a.headers = {HeaderMatch{"X-A", MatchType::Exact, "1"},
                 HeaderMatch{"X-B", MatchType::Exact, "2"}};

    MatchConditions b = a;
    std::swap(b.headers[0], b.headers[1]);
    REQUIRE(a.key() == b.key());

    b.method = "POST";
    REQUIRE(a.key() != b.key());
}

TEST_CASE("Method restriction", "[conditions][method]") {
    MatchConditions m;
    m.method = "POST";

    REQUIRE(m.matches(request("h", "/", http::Method::POST)));
    REQUIRE_FALSE(m.matches(request("h", "/", http::Method::GET)));
}

// ============================
// Validation
// ============================

TEST_CASE("Path condition validation", "[conditions][validation]") {
    RegexLimits limits;
    std::vector<std::string> warnings;

    SECTION("Prefixes must start with a slash") {
        auto err = path_conditions_error({prefix("api")}, true, limits, warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->reason == "PathMatchConditionsNotValid");
    }

    SECTION("Two prefixes in one block are rejected") {
        auto err = path_conditions_error({prefix("/a"), prefix("/b")}, true, limits, warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->message.find("more than one prefix") != std::string::npos);
    }

    SECTION("Prefix and exact together are rejected") {
        auto err = path_conditions_error({prefix("/a"), exact_path("/b")}, true, limits, warnings);
        REQUIRE(err.has_value());
    }

    SECTION("Includes accept prefixes only") {
        REQUIRE(path_conditions_error({exact_path("/a")}, false, limits, warnings).has_value());
        REQUIRE_FALSE(path_conditions_error({prefix("/a")}, false, limits, warnings).has_value());
    }

    SECTION("Invalid regex") {
        auto err = path_conditions_error({regex_path("/a(")}, true, limits, warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->reason == "PathMatchConditionsNotValid");
    }
}

TEST_CASE("Regex program size bounds", "[conditions][validation][regex]") {
    std::string big = "/(";
    for (int i = 0; i < 200; ++i) {
        big += "alpha" + std::to_string(i) + "|";
    }
    big += "omega)";

    SECTION("Oversized programs are rejected") {
        RegexLimits limits{64, 32};
        std::vector<std::string> warnings;
        auto err = check_regex_limits(big, "PathMatchConditionsNotValid", limits, warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->reason == "RegexProgramSizeExceeded");
    }

    SECTION("Programs between the bounds warn") {
        RegexLimits limits{1 << 20, 64};
        std::vector<std::string> warnings;
        auto err = check_regex_limits(big, "PathMatchConditionsNotValid", limits, warnings);
        REQUIRE_FALSE(err.has_value());
        REQUIRE(warnings.size() == 1);
    }

    SECTION("Small programs pass silently") {
        RegexLimits limits;
        std::vector<std::string> warnings;
        REQUIRE_FALSE(check_regex_limits("/a.*", "X", limits, warnings).has_value());
        REQUIRE(warnings.empty());
    }
}

TEST_CASE("Header condition validation", "[conditions][validation]") {
    RegexLimits limits;
    std::vector<std::string> warnings;

    SECTION("Duplicate exact matches on one header") {
        auto err = header_conditions_error(
            {header(header_exact("X-A", "1")), header(header_exact("x-a", "2"))}, limits, warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->reason == "HeaderMatchConditionsNotValid");
    }

    SECTION("Exact and notexact with the same value contradict") {
        auto err = header_conditions_error(
            {header(header_exact("X-A", "1")), header(header_not_exact("X-A", "1"))}, limits,
            warnings);
        REQUIRE(err.has_value());
        REQUIRE(err->message.find("contradictory") != std::string::npos);
    }

    SECTION("Exact and notexact with different values are fine") {
        auto err = header_conditions_error(
            {header(header_exact("X-A", "1")), header(header_not_exact("X-A", "2"))}, limits,
            warnings);
        REQUIRE_FALSE(err.has_value());
    }

    SECTION("Present and notpresent contradict") {
        source::HeaderMatchCondition present;
        present.name = "X-A";
        present.present = true;
        source::HeaderMatchCondition not_present;
        not_present.name = "X-A";
        not_present.not_present = true;
        REQUIRE(header_conditions_error({header(present), header(not_present)}, limits, warnings)
                    .has_value());
    }

    SECTION("treatMissingAsEmpty requires a negative form") {
        auto h = header_exact("X-A", "1");
        h.treat_missing_as_empty = true;
        REQUIRE(header_conditions_error({header(h)}, limits, warnings).has_value());
    }

    SECTION("A header needs exactly one match form") {
        source::HeaderMatchCondition h;
        h.name = "X-A";
        REQUIRE(header_conditions_error({header(h)}, limits, warnings).has_value());
    }
}

TEST_CASE("Query condition validation", "[conditions][validation]") {
    RegexLimits limits;
    std::vector<std::string> warnings;

    source::MatchCondition a;
    a.query_parameter = source::QueryParameterMatchCondition{};
    a.query_parameter->name = "q";
    a.query_parameter->exact = "1";
    auto b = a;
    b.query_parameter->exact = "2";

    auto err = query_conditions_error({a, b}, limits, warnings);
    REQUIRE(err.has_value());
    REQUIRE(err->reason == "QueryParameterMatchConditionsNotValid");
}

// ============================
// Merging
// ============================

TEST_CASE("Include prefixes concatenate", "[conditions][merge]") {
    SECTION("Runs of slashes collapse") {
        auto m = merge_path_conditions({prefix("/api/")}, {prefix("/v1")});
        REQUIRE(m.value == "/api/v1");
        REQUIRE(m.kind == PathMatchKind::Prefix);
    }

    SECTION("Route slash under a prefix adds nothing") {
        auto m = merge_path_conditions({prefix("/a")}, {prefix("/")});
        REQUIRE(m.value == "/a");
    }

    SECTION("Empty result is the root") {
        auto m = merge_path_conditions({}, {});
        REQUIRE(m.value == "/");
    }

    SECTION("Exact paths keep the inherited prefix") {
        auto m = merge_path_conditions({prefix("/api")}, {exact_path("/login")});
        REQUIRE(m.kind == PathMatchKind::Exact);
        REQUIRE(m.value == "/api/login");
    }

    SECTION("Regex paths escape the inherited prefix") {
        auto m = merge_path_conditions({prefix("/v1.0")}, {regex_path("/items/[0-9]+")});
        REQUIRE(m.kind == PathMatchKind::Regex);
        REQUIRE(m.value == "/v1\\.0/items/[0-9]+");
        REQUIRE(m.matches("/v1.0/items/42"));
        REQUIRE_FALSE(m.matches("/v1x0/items/42"));
    }
}

TEST_CASE("Include condition comparison", "[conditions][merge]") {
    REQUIRE(is_default_include({}));
    REQUIRE(is_default_include({prefix("/")}));
    REQUIRE_FALSE(is_default_include({prefix("/a")}));

    REQUIRE(include_conditions_identical({prefix("/a")}, {prefix("/a")}));
    REQUIRE_FALSE(include_conditions_identical({prefix("/a")}, {prefix("/b")}));
}

TEST_CASE("Wildcard authority regex", "[conditions][wildcard]") {
    auto pattern = wildcard_authority_regex("*.example.com");
    auto m = PathMatch::regex(pattern);

    REQUIRE(m.matches("foo.example.com"));
    REQUIRE_FALSE(m.matches("a.b.example.com"));
    REQUIRE_FALSE(m.matches("example.com"));
}
