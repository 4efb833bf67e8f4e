// Lattice Source Object Decoding Tests

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <variant>

#include "../../src/source/json.hpp"

using namespace lattice::source;

TEST_CASE("Decode an HTTPProxy", "[source][json]") {
    const char* json = R"({
        "items": [{
            "kind": "HTTPProxy",
            "metadata": {
                "name": "root",
                "namespace": "default",
                "resourceVersion": "42",
                "generation": 3,
                "creationTimestamp": "2024-01-02T03:04:05Z"
            },
            "spec": {
                "virtualhost": {"fqdn": "example.com", "tls": {"secretName": "cert"}},
                "routes": [{
                    "conditions": [
                        {"prefix": "/api"},
                        {"header": {"name": "X-Env", "notexact": "prod", "treatMissingAsEmpty": true}}
                    ],
                    "services": [{"name": "api", "port": 8080, "weight": 90}],
                    "timeoutPolicy": {"response": "5s"}
                }],
                "includes": [{"name": "child", "namespace": "team", "conditions": [{"prefix": "/team"}]}]
            }
        }]
    })";

    auto result = load_objects_from_json(json);
    REQUIRE(result.ok());
    REQUIRE(result.objects.size() == 1);

    const auto* proxy = std::get_if<HTTPProxy>(&result.objects.front());
    REQUIRE(proxy != nullptr);
    REQUIRE(proxy->metadata.key() == NamespacedName{"default", "root"});
    REQUIRE(proxy->metadata.resource_version == "42");
    REQUIRE(proxy->metadata.generation == 3);
    REQUIRE(proxy->metadata.creation_timestamp == 1704164645);
    REQUIRE(proxy->virtualhost->fqdn == "example.com");
    REQUIRE(proxy->virtualhost->tls->secret_name == "cert");

    const auto& route = proxy->routes.front();
    REQUIRE(route.conditions.size() == 2);
    REQUIRE(route.conditions[0].prefix == "/api");
    REQUIRE(route.conditions[1].header->not_exact == "prod");
    REQUIRE(route.conditions[1].header->treat_missing_as_empty);
    REQUIRE(route.services.front().port == 8080);
    REQUIRE(route.services.front().weight == 90);
    REQUIRE(route.timeout_policy->response == "5s");

    REQUIRE(proxy->includes.front().ns == "team");
    REQUIRE(proxy->includes.front().conditions.front().prefix == "/team");
}

TEST_CASE("Decode an Ingress", "[source][json]") {
    const char* json = R"([{
        "kind": "Ingress",
        "metadata": {"name": "web", "namespace": "default",
                     "annotations": {"projectcontour.io/response-timeout": "10s"}},
        "spec": {
            "tls": [{"hosts": ["web.example.com"], "secretName": "web-cert"}],
            "rules": [{
                "host": "web.example.com",
                "http": {"paths": [{
                    "path": "/",
                    "pathType": "Prefix",
                    "backend": {"service": {"name": "web", "port": {"number": 80}}}
                }]}
            }]
        }
    }])";

    auto result = load_objects_from_json(json);
    REQUIRE(result.ok());
    const auto& ingress = std::get<Ingress>(result.objects.front());
    REQUIRE(ingress.metadata.annotation("projectcontour.io/response-timeout") == "10s");
    REQUIRE(ingress.tls.front().secret_name == "web-cert");
    REQUIRE(ingress.rules.front().paths.front().path_type == "Prefix");
    REQUIRE(ingress.rules.front().paths.front().backend.service_name == "web");
    REQUIRE(ingress.rules.front().paths.front().backend.port_number == 80);
}

TEST_CASE("Decode Gateway API objects", "[source][json]") {
    const char* json = R"({"items": [
        {"kind": "GatewayClass", "metadata": {"name": "lattice"},
         "spec": {"controllerName": "projectcontour.io/gateway-controller"}},
        {"kind": "Gateway", "metadata": {"name": "gw", "namespace": "infra"},
         "spec": {"gatewayClassName": "lattice", "listeners": [
            {"name": "http", "port": 80, "protocol": "HTTP",
             "allowedRoutes": {"namespaces": {"from": "All"}}}]}},
        {"kind": "HTTPRoute", "metadata": {"name": "r", "namespace": "apps"},
         "spec": {"parentRefs": [{"name": "gw", "namespace": "infra", "sectionName": "http"}],
                  "hostnames": ["a.example.com"],
                  "rules": [{"matches": [{"path": {"type": "Exact", "value": "/x"}, "method": "GET"}],
                             "backendRefs": [{"name": "svc", "port": 8080, "weight": 3}]}]}}
    ]})";

    auto result = load_objects_from_json(json);
    REQUIRE(result.ok());
    REQUIRE(result.objects.size() == 3);

    const auto& gc = std::get<GatewayClass>(result.objects[0]);
    REQUIRE(gc.controller_name == "projectcontour.io/gateway-controller");

    const auto& gw = std::get<Gateway>(result.objects[1]);
    REQUIRE(gw.listeners.front().allowed_routes.from == "All");

    const auto& route = std::get<HTTPRoute>(result.objects[2]);
    REQUIRE(route.parent_refs.front().section_name == "http");
    REQUIRE(route.parent_refs.front().kind == "Gateway");
    REQUIRE(route.rules.front().matches.front().path->type == "Exact");
    REQUIRE(route.rules.front().matches.front().method == "GET");
    REQUIRE(route.rules.front().backend_refs.front().weight == 3);
    REQUIRE(route.rules.front().backend_refs.front().port == 8080);
}

TEST_CASE("Decode an ExtensionService", "[source][json]") {
    const char* json = R"({
        "items": [{
            "kind": "ExtensionService",
            "metadata": {"name": "extauth", "namespace": "auth"},
            "spec": {
                "services": [{"name": "authserver", "port": 9001, "weight": 3}],
                "protocol": "h2c",
                "timeoutPolicy": {"response": "1s"},
                "loadBalancerPolicy": {"strategy": "Random"}
            }
        }]
    })";

    auto result = load_objects_from_json(json);
    REQUIRE(result.ok());
    const auto* ext = std::get_if<ExtensionService>(&result.objects.front());
    REQUIRE(ext != nullptr);
    REQUIRE(kind_of(result.objects.front()) == Kind::ExtensionService);
    REQUIRE(ext->services.front().name == "authserver");
    REQUIRE(ext->services.front().weight == 3);
    REQUIRE(ext->protocol == "h2c");
    REQUIRE(ext->timeout_policy->response == "1s");
    REQUIRE(ext->load_balancer_policy->strategy == "Random");
}

TEST_CASE("Decode secrets", "[source][json]") {
    SECTION("Base64 data and stringData") {
        const char* json = R"([{"kind": "Secret", "metadata": {"name": "s", "namespace": "ns"},
            "type": "kubernetes.io/tls",
            "data": {"ca.crt": "aGVsbG8="},
            "stringData": {"tls.key": "plain"}}])";
        auto result = load_objects_from_json(json);
        REQUIRE(result.ok());
        const auto& secret = std::get<Secret>(result.objects.front());
        REQUIRE(secret.type == "kubernetes.io/tls");
        REQUIRE(secret.data.at("ca.crt") == "hello");
        REQUIRE(secret.data.at("tls.key") == "plain");
    }

    SECTION("Invalid base64 rejects only that object") {
        const char* json = R"([
            {"kind": "Secret", "metadata": {"name": "bad", "namespace": "ns"}, "data": {"k": "!!!"}},
            {"kind": "Service", "metadata": {"name": "ok", "namespace": "ns"},
             "spec": {"ports": [{"port": 80}]}}
        ])";
        auto result = load_objects_from_json(json);
        REQUIRE(result.objects.size() == 1);
        REQUIRE(result.errors.size() == 1);
        REQUIRE(result.errors.front().find("bad") != std::string::npos);
    }
}

TEST_CASE("Decoding errors", "[source][json]") {
    SECTION("Unknown kind") {
        auto result = load_objects_from_json(R"([{"kind": "Pod", "metadata": {"name": "p"}}])");
        REQUIRE(result.objects.empty());
        REQUIRE(result.errors.front().find("unsupported kind") != std::string::npos);
    }

    SECTION("Wrong field type") {
        auto result = load_objects_from_json(
            R"([{"kind": "Service", "metadata": {"name": "s"}, "spec": {"ports": "eighty"}}])");
        REQUIRE(result.objects.empty());
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Malformed document") {
        auto result = load_objects_from_json("{");
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Object without items") {
        auto result = load_objects_from_json(R"({"kind": "List"})");
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Missing file") {
        auto result = load_objects_from_file("/nonexistent/objects.json");
        REQUIRE_FALSE(result.ok());
    }
}

TEST_CASE("base64 decoding", "[source][json]") {
    REQUIRE(base64_decode("aGVsbG8gd29ybGQ=") == "hello world");
    REQUIRE(base64_decode("aGVs\nbG8=") == "hello");
    REQUIRE(base64_decode("") == "");
    REQUIRE_FALSE(base64_decode("abc").has_value());
}

TEST_CASE("RFC 3339 timestamps", "[source][json]") {
    REQUIRE(parse_rfc3339("1970-01-01T00:00:00Z") == 0);
    REQUIRE(parse_rfc3339("2024-01-02T03:04:05.123Z") == 1704164645);
    REQUIRE(parse_rfc3339("2024-01-02T04:04:05+01:00") == 1704164645);
    REQUIRE_FALSE(parse_rfc3339("2024-01-02").has_value());
    REQUIRE_FALSE(parse_rfc3339("2024-13-02T03:04:05Z").has_value());
}
