// Lattice Route Policy Tests

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>

#include "../../src/dag/policy.hpp"

using namespace lattice;
using namespace lattice::dag;
using namespace std::chrono_literals;

TEST_CASE("Header policy layering", "[dag][policy][headers]") {
    HeadersPolicy base;
    base.set = {{"X-Default", "1"}, {"X-Shared", "base"}};
    base.remove = {"X-Internal"};

    HeadersPolicy specific;
    specific.set = {{"x-shared", "route"}, {"X-Internal", "keep"}};
    specific.remove = {"X-Default"};

    auto merged = merge_headers(base, specific);
    REQUIRE(merged.set.count("X-Default") == 0);
    REQUIRE(merged.set.at("x-shared") == "route");
    REQUIRE(merged.set.count("X-Shared") == 0);
    REQUIRE(merged.set.at("X-Internal") == "keep");
    REQUIRE(merged.remove == std::vector<std::string>{"X-Default"});
}

TEST_CASE("Checked header conversion", "[dag][policy][headers]") {
    std::optional<std::string> host;
    std::string error;

    SECTION("Host becomes a rewrite when allowed") {
        source::HeadersPolicy policy;
        policy.set = {{"Host", "internal.example.com"}, {"X-A", "1"}};
        auto out = checked_headers_from(policy, true, host, error);
        REQUIRE(out.has_value());
        REQUIRE(host == "internal.example.com");
        REQUIRE(out->set.count("Host") == 0);
    }

    SECTION("Host is rejected when not allowed") {
        source::HeadersPolicy policy;
        policy.set = {{"host", "x"}};
        REQUIRE_FALSE(checked_headers_from(policy, false, host, error).has_value());
        REQUIRE(error.find("Host") != std::string::npos);
    }

    SECTION("Duplicate names are rejected") {
        source::HeadersPolicy policy;
        policy.set = {{"X-A", "1"}, {"x-a", "2"}};
        REQUIRE_FALSE(checked_headers_from(policy, true, host, error).has_value());

        source::HeadersPolicy removals;
        removals.remove = {"X-A", "X-A"};
        REQUIRE_FALSE(checked_headers_from(removals, true, host, error).has_value());
    }
}

TEST_CASE("Prefix replacements", "[dag][policy][rewrite]") {
    std::vector<source::ReplacePrefix> replacements = {{"/api", "/"}, {"", "/default"}};
    REQUIRE_FALSE(prefix_replacement_error(replacements).has_value());
    REQUIRE(prefix_rewrite_for(replacements, "/api") == "/");
    REQUIRE(prefix_rewrite_for(replacements, "/other") == "/default");

    std::vector<source::ReplacePrefix> duplicate = {{"/api", "/a"}, {"/api", "/b"}};
    REQUIRE(prefix_replacement_error(duplicate)->reason == "DuplicateReplacement");

    std::vector<source::ReplacePrefix> ambiguous = {{"", "/a"}, {"", "/b"}};
    REQUIRE(prefix_replacement_error(ambiguous)->reason == "AmbiguousReplacement");
}

TEST_CASE("Redirect policy", "[dag][policy][redirect]") {
    std::string error;

    source::RequestRedirectPolicy policy;
    policy.scheme = "https";
    policy.status_code = 301;
    auto redirect = redirect_from(policy, error);
    REQUIRE(redirect.has_value());
    REQUIRE(redirect->status_code == 301);

    policy.status_code = 307;
    REQUIRE_FALSE(redirect_from(policy, error).has_value());

    policy.status_code = 302;
    policy.path = "/a";
    policy.prefix = "/b";
    REQUIRE_FALSE(redirect_from(policy, error).has_value());
}

TEST_CASE("Timeout and retry policies", "[dag][policy][timeout]") {
    std::string error;

    source::TimeoutPolicy timeouts;
    timeouts.response = "1m30s";
    timeouts.idle = "infinity";
    auto parsed = timeout_policy_from(timeouts, error);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->response == 90s);
    REQUIRE(parsed->idle == 0ms);

    timeouts.response = "soon";
    REQUIRE_FALSE(timeout_policy_from(timeouts, error).has_value());
    REQUIRE(error.find("timeoutPolicy.response") != std::string::npos);

    source::RetryPolicy retry;
    retry.count = 0;
    retry.retry_on = {"5xx", "gateway-error"};
    retry.per_try_timeout = "250ms";
    auto r = retry_policy_from(retry, error);
    REQUIRE(r.has_value());
    REQUIRE(r->num_retries == 1);
    REQUIRE(r->retry_on == "5xx,gateway-error");
    REQUIRE(r->per_try_timeout == 250ms);
}

TEST_CASE("Rate limit precedence", "[dag][policy][ratelimit]") {
    std::string error;
    control::GlobalRateLimitConfig global_default;
    global_default.extension_service = "infra/ratelimit";

    source::RateLimitPolicy vhost;
    vhost.local = source::LocalRateLimitPolicy{};
    vhost.local->requests = 100;
    vhost.local->unit = "minute";

    source::RateLimitPolicy route;
    route.global = source::GlobalRateLimitPolicy{};
    route.global->disabled = true;

    auto resolved = resolve_rate_limit(global_default, vhost, route, error);
    REQUIRE(error.empty());
    REQUIRE(resolved.local->requests == 100);
    REQUIRE(resolved.local->unit == std::chrono::seconds{60});
    REQUIRE_FALSE(resolved.global.has_value());

    auto inherited = resolve_rate_limit(global_default, vhost, std::nullopt, error);
    REQUIRE(inherited.global.has_value());

    vhost.local->unit = "fortnight";
    auto rejected = resolve_rate_limit(global_default, vhost, std::nullopt, error);
    REQUIRE_FALSE(error.empty());
    REQUIRE_FALSE(rejected.local.has_value());
}

TEST_CASE("Rate limit validation", "[dag][policy][ratelimit]") {
    std::string error;
    REQUIRE(validate_rate_limit(std::nullopt, error));
    REQUIRE(error.empty());

    source::RateLimitPolicy policy;
    policy.global = source::GlobalRateLimitPolicy{};
    REQUIRE(validate_rate_limit(policy, error));

    policy.local = source::LocalRateLimitPolicy{};
    policy.local->requests = 10;
    policy.local->unit = "second";
    REQUIRE(validate_rate_limit(policy, error));
    REQUIRE(error.empty());

    policy.local->unit = "fortnight";
    REQUIRE_FALSE(validate_rate_limit(policy, error));
    REQUIRE(error.find("fortnight") != std::string::npos);

    error.clear();
    policy.local->unit = "minute";
    policy.local->requests = 0;
    REQUIRE_FALSE(validate_rate_limit(policy, error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("Authorization precedence", "[dag][policy][auth]") {
    ExternalAuth server;
    server.service = {"auth", "extauth"};
    server.context = {{"tier", "vhost"}};

    REQUIRE_FALSE(resolve_auth(std::nullopt, std::nullopt).has_value());
    REQUIRE(resolve_auth(server, std::nullopt)->service.name == "extauth");

    source::AuthorizationPolicy disabled;
    disabled.disabled = true;
    REQUIRE_FALSE(resolve_auth(server, disabled).has_value());

    source::AuthorizationPolicy context;
    context.context = {{"tier", "route"}, {"extra", "1"}};
    auto merged = resolve_auth(server, context);
    REQUIRE(merged->context.at("tier") == "route");
    REQUIRE(merged->context.at("extra") == "1");
}

TEST_CASE("Default authorization from configuration", "[dag][policy][auth]") {
    control::PolicyConfig policy;
    REQUIRE_FALSE(default_auth(policy).has_value());

    policy.global_external_auth = control::ExternalAuthConfig{};
    policy.global_external_auth->extension_service = "auth/extauth";
    policy.global_external_auth->response_timeout_ms = 500;
    policy.global_external_auth->auth_policy.context = {{"tier", "global"}};
    auto auth = default_auth(policy);
    REQUIRE(auth->service == source::NamespacedName{"auth", "extauth"});
    REQUIRE(auth->response_timeout == 500ms);
    REQUIRE(auth->context.at("tier") == "global");
}

TEST_CASE("Filter chain ordering", "[dag][policy][filters]") {
    auto after = http_filter_order(false);
    auto before = http_filter_order(true);

    auto position = [](const std::vector<std::string>& chain, const std::string& name) {
        return std::find(chain.begin(), chain.end(), name) - chain.begin();
    };
    REQUIRE(position(after, "ext_authz") > position(after, "ratelimit"));
    REQUIRE(position(before, "ext_authz") < position(before, "local_ratelimit"));
    REQUIRE(after.back() == "router");
}

TEST_CASE("Load balancer strategies", "[dag][policy]") {
    REQUIRE(valid_load_balancer_strategy(""));
    REQUIRE(valid_load_balancer_strategy("Cookie"));
    REQUIRE_FALSE(valid_load_balancer_strategy("LeastConnections"));
}
