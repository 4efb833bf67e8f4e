// Lattice Ingress Processor Tests

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "../../src/dag/ingress_processor.hpp"
#include "test_helpers.hpp"

using namespace lattice;
using namespace lattice::testing;
using dag::PathMatchKind;
using dag::PrefixMatchType;
using source::Kind;

TEST_CASE("Ingress path types", "[dag][ingress]") {
    SECTION("Prefix is a segment match") {
        auto m = dag::ingress_path_match("/foo/", "Prefix");
        REQUIRE(m.kind == PathMatchKind::Prefix);
        REQUIRE(m.prefix_type == PrefixMatchType::Segment);
        REQUIRE(m.value == "/foo");
        REQUIRE(m.matches("/foo"));
        REQUIRE(m.matches("/foo/bar"));
        REQUIRE_FALSE(m.matches("/foobar"));
    }

    SECTION("Prefix / matches everything") {
        auto m = dag::ingress_path_match("/", "Prefix");
        REQUIRE(m.prefix_type == PrefixMatchType::String);
        REQUIRE(m.matches("/anything"));
    }

    SECTION("Exact") {
        auto m = dag::ingress_path_match("/foo", "Exact");
        REQUIRE(m.kind == PathMatchKind::Exact);
        REQUIRE_FALSE(m.matches("/foo/"));
    }

    SECTION("ImplementationSpecific") {
        auto plain = dag::ingress_path_match("/foo", "ImplementationSpecific");
        REQUIRE(plain.kind == PathMatchKind::Prefix);
        REQUIRE(plain.prefix_type == PrefixMatchType::String);
        REQUIRE(plain.matches("/foobar"));

        auto regex = dag::ingress_path_match("/foo/[a-z]+", "ImplementationSpecific");
        REQUIRE(regex.kind == PathMatchKind::Regex);
    }
}

TEST_CASE("Ingress hosts", "[dag][ingress]") {
    REQUIRE(dag::valid_ingress_host("*"));
    REQUIRE(dag::valid_ingress_host("*.example.com"));
    REQUIRE(dag::valid_ingress_host("www.example.com"));
    REQUIRE_FALSE(dag::valid_ingress_host("www.*.example.com"));
    REQUIRE_FALSE(dag::valid_ingress_host("10.0.0.1"));
}

TEST_CASE("Default backend becomes a catch-all rule", "[dag][ingress]") {
    source::Ingress ing;
    ing.metadata = meta("default", "web");
    ing.default_backend = source::IngressBackend{"web", 80, ""};

    auto rules = dag::rules_from_spec(ing);
    REQUIRE(rules.size() == 1);
    REQUIRE(rules.front().host.empty());

    auto result = build(cache_of(ing, service("default", "web")));
    const auto* vhost = find_vhost(*result.snapshot, "http-80", "*");
    REQUIRE(vhost != nullptr);
    REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/"});

    const auto* route = result.snapshot->select_route("http-80", request("anything.test", "/x"));
    REQUIRE(route != nullptr);
    REQUIRE(route->clusters.front().cluster == "default/web/80");
}

TEST_CASE("Ingress rules produce routes and Accepted status", "[dag][ingress]") {
    auto ing = ingress("default", "web", "example.com",
                       {ingress_path("/", "web"), ingress_path("/api", "api", 80, "Prefix")});

    auto result = build(cache_of(ing, service("default", "web"), service("default", "api")));

    const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
    REQUIRE(vhost != nullptr);
    REQUIRE(vhost->routes.size() == 2);

    const auto* route = result.snapshot->select_route("http-80", request("example.com", "/api/v1"));
    REQUIRE(route != nullptr);
    REQUIRE(route->clusters.front().cluster == "default/api/80");

    const auto* status = find_status(result, Kind::Ingress, "default", "web");
    REQUIRE(status != nullptr);
    const auto* accepted = find_condition(status->conditions, "Accepted");
    REQUIRE(accepted != nullptr);
    REQUIRE(accepted->status == dag::kConditionTrue);
}

TEST_CASE("Ingress TLS hosts", "[dag][ingress]") {
    auto ing = ingress("default", "web", "secure.example.com", {ingress_path("/", "web")});
    ing.tls.push_back(source::IngressTLS{{"secure.example.com"}, "cert"});

    SECTION("secure and insecure virtual hosts") {
        auto result = build(cache_of(ing, service("default", "web"), tls_secret("default", "cert")));
        const auto* secure = find_vhost(*result.snapshot, "https-443", "secure.example.com");
        REQUIRE(secure != nullptr);
        REQUIRE(secure->tls.has_value());
        REQUIRE(secure->tls->min_version == core::TlsVersion::V1_2);
        REQUIRE(find_vhost(*result.snapshot, "http-80", "secure.example.com") != nullptr);
    }

    SECTION("force-ssl-redirect") {
        ing.metadata.annotations.emplace(std::string(dag::kAnnotationForceSslRedirect), "true");
        auto result = build(cache_of(ing, service("default", "web"), tls_secret("default", "cert")));
        const auto* insecure = find_vhost(*result.snapshot, "http-80", "secure.example.com");
        REQUIRE(insecure != nullptr);
        REQUIRE(insecure->routes.front().https_redirect);
        const auto* secure = find_vhost(*result.snapshot, "https-443", "secure.example.com");
        REQUIRE_FALSE(secure->routes.front().https_redirect);
    }

    SECTION("allow-http false drops the insecure host") {
        ing.metadata.annotations.emplace(std::string(dag::kAnnotationAllowHttp), "false");
        auto result = build(cache_of(ing, service("default", "web"), tls_secret("default", "cert")));
        REQUIRE(find_vhost(*result.snapshot, "http-80", "secure.example.com") == nullptr);
        REQUIRE(find_vhost(*result.snapshot, "https-443", "secure.example.com") != nullptr);
    }

    SECTION("minimum TLS version annotation") {
        ing.metadata.annotations.emplace(std::string(dag::kAnnotationTlsMinimumVersion), "1.3");
        auto result = build(cache_of(ing, service("default", "web"), tls_secret("default", "cert")));
        const auto* secure = find_vhost(*result.snapshot, "https-443", "secure.example.com");
        REQUIRE(secure->tls->min_version == core::TlsVersion::V1_3);
    }

    SECTION("missing secret is reported on ResolvedRefs") {
        auto result = build(cache_of(ing, service("default", "web")));
        REQUIRE(find_vhost(*result.snapshot, "https-443", "secure.example.com") == nullptr);
        const auto* status = find_status(result, Kind::Ingress, "default", "web");
        const auto* refs = find_condition(status->conditions, "ResolvedRefs");
        REQUIRE(refs != nullptr);
        REQUIRE(refs->status == dag::kConditionFalse);
        REQUIRE(refs->reason == "SecretNotFound");
    }
}

TEST_CASE("Ingress annotations shape routes", "[dag][ingress]") {
    auto ing = ingress("default", "web", "example.com",
                       {ingress_path("/", "web"), ingress_path("/ws", "web")});
    auto& annotations = ing.metadata.annotations;
    annotations.emplace(std::string(dag::kAnnotationWebsocketRoutes), "/ws");
    annotations.emplace(std::string(dag::kAnnotationResponseTimeout), "10s");
    annotations.emplace(std::string(dag::kAnnotationRetryOn), "gateway-error");
    annotations.emplace(std::string(dag::kAnnotationNumRetries), "3");

    auto result = build(cache_of(ing, service("default", "web")));
    const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
    REQUIRE(vhost != nullptr);

    const auto* ws = find_path(*vhost, "prefix:/ws");
    REQUIRE(ws != nullptr);
    REQUIRE(ws->websocket);
    REQUIRE(ws->timeouts.response == std::chrono::milliseconds{10000});
    REQUIRE(ws->retry.has_value());
    REQUIRE(ws->retry->retry_on == "gateway-error");
    REQUIRE(ws->retry->num_retries == 3);

    const auto* root = find_path(*vhost, "prefix:/");
    REQUIRE(root != nullptr);
    REQUIRE_FALSE(root->websocket);
}

TEST_CASE("Unparseable response timeout disables the timeout", "[dag][ingress]") {
    auto ing = ingress("default", "web", "example.com", {ingress_path("/", "web")});
    ing.metadata.annotations.emplace(std::string(dag::kAnnotationResponseTimeout), "soon");

    auto result = build(cache_of(ing, service("default", "web")));
    const auto* route = result.snapshot->select_route("http-80", request("example.com", "/"));
    REQUIRE(route != nullptr);
    REQUIRE(route->timeouts.response == std::chrono::milliseconds{0});
}

TEST_CASE("Ingress with only broken rules is not accepted", "[dag][ingress]") {
    auto ing = ingress("default", "web", "example.com", {ingress_path("/", "absent")});

    auto result = build(cache_of(ing));
    REQUIRE(result.snapshot->listeners.empty());

    const auto* status = find_status(result, Kind::Ingress, "default", "web");
    REQUIRE(status != nullptr);
    const auto* accepted = find_condition(status->conditions, "Accepted");
    REQUIRE(accepted != nullptr);
    REQUIRE(accepted->status == dag::kConditionFalse);
    const auto* refs = find_condition(status->conditions, "ResolvedRefs");
    REQUIRE(refs != nullptr);
    REQUIRE(refs->reason == "ServiceUnresolvedReference");
}

TEST_CASE("Duplicate Ingress paths go to the older object", "[dag][ingress]") {
    auto older = ingress("default", "older", "example.com", {ingress_path("/", "a")}, 100);
    auto newer = ingress("default", "newer", "example.com", {ingress_path("/", "b")}, 200);

    auto result = build(cache_of(newer, older, service("default", "a"), service("default", "b")));

    const auto* route = result.snapshot->select_route("http-80", request("example.com", "/"));
    REQUIRE(route != nullptr);
    REQUIRE(route->source.name.name == "older");
    REQUIRE_FALSE(result.snapshot->clusters.contains("default/b/80"));

    const auto* status = find_status(result, Kind::Ingress, "default", "newer");
    REQUIRE(status != nullptr);
    REQUIRE(find_condition(status->conditions, "Conflicted") != nullptr);
    const auto* accepted = find_condition(status->conditions, "Accepted");
    REQUIRE(accepted != nullptr);
    REQUIRE(accepted->status == dag::kConditionFalse);
}

TEST_CASE("Ingress losing a TLS host keeps only plaintext routes", "[dag][ingress]") {
    auto older = ingress("default", "older", "secure.example.com", {ingress_path("/", "a")}, 100);
    older.tls.push_back(source::IngressTLS{{"secure.example.com"}, "cert-a"});
    auto newer =
        ingress("default", "newer", "secure.example.com", {ingress_path("/api", "b")}, 200);
    newer.tls.push_back(source::IngressTLS{{"secure.example.com"}, "cert-b"});

    auto result = build(cache_of(newer, older, service("default", "a"), service("default", "b"),
                                 tls_secret("default", "cert-a"), tls_secret("default", "cert-b")));

    const auto* secure = find_vhost(*result.snapshot, "https-443", "secure.example.com");
    REQUIRE(secure != nullptr);
    REQUIRE(secure->tls->secret == "default/cert-a");
    REQUIRE(route_paths(*secure) == std::vector<std::string>{"prefix:/"});

    const auto* insecure = find_vhost(*result.snapshot, "http-80", "secure.example.com");
    REQUIRE(insecure != nullptr);
    REQUIRE(find_path(*insecure, "prefix:/api") != nullptr);

    const auto* status = find_status(result, Kind::Ingress, "default", "newer");
    REQUIRE(status != nullptr);
    REQUIRE(find_condition(status->conditions, "Conflicted") != nullptr);
}
