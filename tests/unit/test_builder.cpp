// Lattice Graph Builder Tests

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../src/dag/builder.hpp"
#include "../../src/dag/json.hpp"
#include "test_helpers.hpp"

using namespace lattice;
using namespace lattice::testing;
using source::Kind;

namespace {

bool has_error_reason(const dag::ObjectStatus& status, std::string_view reason) {
    for (const auto& e : status.errors) {
        if (e.reason == reason) {
            return true;
        }
    }
    return false;
}

/// Processor standing in for a builder defect
class ThrowingProcessor : public dag::Processor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "throwing"; }

    void run(dag::BuildContext&, dag::Dag&) override {
        throw std::logic_error("processor defect");
    }
};

/// Processor that emits one fixed route
class StaticProcessor : public dag::Processor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "static"; }

    void run(dag::BuildContext&, dag::Dag& fragment) override {
        auto& vhost = fragment.ensure_virtual_host(dag::Protocol::HTTP, 80, "static.test");
        dag::Route route;
        route.match.path = dag::PathMatch::prefix("/");
        route.direct_response = dag::DirectResponse{200, "ok"};
        route.source = source::ObjectRef{Kind::HTTPProxy, {"default", "static"}, 1, 0};
        (void)fragment.add_route(vhost, std::move(route));
    }
};

source::HTTPProxy proxy_with_routes(std::vector<std::string> paths) {
    auto root = root_proxy("default", "root", "example.com");
    for (auto& p : paths) {
        root.routes.push_back(proxy_route(std::move(p), "web"));
    }
    return root;
}

}  // namespace

TEST_CASE("Builds are deterministic regardless of arrival order", "[dag][builder]") {
    auto root = root_proxy("default", "root", "example.com");
    root.includes.push_back(include("blog", "/blog"));
    root.routes.push_back(proxy_route("/", "web"));
    auto blog = child_proxy("default", "blog");
    blog.routes.push_back(proxy_route("/", "web"));
    auto ing = ingress("default", "legacy", "legacy.example.com", {ingress_path("/", "web")});
    auto route = http_route("default", "gw-route", "contour", {"gw.example.com"}, "/", "web");
    auto gw = gateway("default", "contour", {gateway_listener("http", 80, "HTTP")});

    auto forward = cache_of(root, blog, ing, gateway_class(), gw, route, service("default", "web"));
    auto backward = cache_of(service("default", "web"), route, gw, gateway_class(), ing, blog, root);

    auto a = build(forward);
    auto b = build(backward);
    REQUIRE(dag::to_json(*a.snapshot, a.statuses).dump() ==
            dag::to_json(*b.snapshot, b.statuses).dump());
    REQUIRE(a.statuses == b.statuses);
}

TEST_CASE("Inclusion joins prefixes on segment boundaries", "[dag][builder]") {
    auto root = root_proxy("default", "root", "example.com");
    root.includes.push_back(include("child", "/a"));
    auto child = child_proxy("default", "child");
    child.routes.push_back(proxy_route("/b", "web"));

    auto result = build(cache_of(root, child, service("default", "web")));
    const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
    REQUIRE(vhost != nullptr);
    REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/a/b"});

    REQUIRE(result.snapshot->select_route("http-80", request("example.com", "/a/b/c")));
    REQUIRE(result.snapshot->select_route("http-80", request("example.com", "/ab")) == nullptr);
}

TEST_CASE("Duplicate include detection", "[dag][builder]") {
    auto first = child_proxy("default", "first");
    first.routes.push_back(proxy_route("/one", "web"));
    auto second = child_proxy("default", "second");
    second.routes.push_back(proxy_route("/two", "web"));
    auto third = child_proxy("default", "third");
    third.routes.push_back(proxy_route("/three", "web"));

    SECTION("default conditions are never duplicates") {
        auto root = root_proxy("default", "root", "example.com");
        root.includes.push_back(include("first"));
        root.includes.push_back(include("second", "/"));
        auto result = build(cache_of(root, first, second, service("default", "web")));

        const auto* status = find_status(result, Kind::HTTPProxy, "default", "root");
        REQUIRE_FALSE(has_error_reason(*status, "DuplicateMatchConditions"));
        const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
        REQUIRE(vhost->routes.size() == 2);
    }

    SECTION("identical conditions are duplicates; the rest still build") {
        auto root = root_proxy("default", "root", "example.com");
        root.includes.push_back(include("first", "/x"));
        root.includes.push_back(include("second", "/y"));
        root.includes.push_back(include("third", "/x"));
        auto result = build(cache_of(root, first, second, third, service("default", "web")));

        const auto* status = find_status(result, Kind::HTTPProxy, "default", "root");
        REQUIRE(has_error_reason(*status, "DuplicateMatchConditions"));

        const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
        REQUIRE(vhost != nullptr);
        REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/x/one", "prefix:/y/two"});

        const auto* orphan = find_status(result, Kind::HTTPProxy, "default", "third");
        REQUIRE(orphan->current_status == "orphaned");
    }
}

TEST_CASE("Route ordering", "[dag][builder]") {
    SECTION("longer matches first when sorting") {
        auto root = proxy_with_routes({"/foo", "/foo/bar"});
        auto result = build(cache_of(root, service("default", "web")));
        const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
        REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/foo/bar", "prefix:/foo"});
    }

    SECTION("declaration order when the root disables sorting") {
        auto root = proxy_with_routes({"/foo", "/foo/bar"});
        root.virtualhost->disable_route_sorting = true;
        auto result = build(cache_of(root, service("default", "web")));
        const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
        REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/foo", "prefix:/foo/bar"});
    }

    SECTION("configured default applies to non-proxy hosts") {
        auto config = test_config();
        config.dag.disable_route_sorting = true;
        auto ing = ingress("default", "web", "example.com",
                           {ingress_path("/foo", "web"), ingress_path("/foo/bar", "web")});
        auto result = build(cache_of(ing, service("default", "web")), config);
        const auto* vhost = find_vhost(*result.snapshot, "http-80", "example.com");
        REQUIRE(route_paths(*vhost) == std::vector<std::string>{"prefix:/foo", "prefix:/foo/bar"});
    }
}

TEST_CASE("Conflict tie-break", "[dag][builder]") {
    SECTION("older object wins") {
        auto older = ingress("default", "b", "example.com", {ingress_path("/", "web")}, 1000);
        auto newer = ingress("default", "a", "example.com", {ingress_path("/", "web")}, 1001);
        auto result = build(cache_of(newer, older, service("default", "web")));

        auto route = result.snapshot->select_route("http-80", request("example.com", "/"));
        REQUIRE(route->source.name.name == "b");
        const auto* status = find_status(result, Kind::Ingress, "default", "a");
        REQUIRE(find_condition(status->conditions, "Conflicted") != nullptr);
    }

    SECTION("equal age falls back to namespace/name") {
        auto a = ingress("ns-a", "route-a", "example.com", {ingress_path("/", "web")}, 1000);
        auto b = ingress("ns-b", "route-b", "example.com", {ingress_path("/", "web")}, 1000);
        auto result = build(cache_of(b, a, service("ns-a", "web"), service("ns-b", "web")));

        auto route = result.snapshot->select_route("http-80", request("example.com", "/"));
        REQUIRE(route->source.name.ns == "ns-a");
        const auto* loser = find_status(result, Kind::Ingress, "ns-b", "route-b");
        REQUIRE(find_condition(loser->conditions, "Conflicted") != nullptr);
        const auto* winner = find_status(result, Kind::Ingress, "ns-a", "route-a");
        REQUIRE(find_condition(winner->conditions, "Conflicted") == nullptr);
    }

    SECTION("partial loss marks the object partially invalid") {
        auto older = ingress("default", "older", "example.com", {ingress_path("/", "web")}, 1000);
        auto newer = ingress("default", "newer", "example.com",
                             {ingress_path("/", "web"), ingress_path("/own", "web")}, 2000);
        auto result = build(cache_of(older, newer, service("default", "web")));

        const auto* status = find_status(result, Kind::Ingress, "default", "newer");
        const auto* partial = find_condition(status->conditions, "PartiallyInvalid");
        REQUIRE(partial != nullptr);
        REQUIRE(partial->status == dag::kConditionTrue);
        REQUIRE(find_condition(status->conditions, "Accepted")->status == dag::kConditionTrue);
    }
}

TEST_CASE("Cross-schema collisions", "[dag][builder]") {
    auto ing = ingress("default", "legacy", "example.com", {ingress_path("/", "web")}, 1000);
    auto proxy = proxy_with_routes({"/"});
    proxy.metadata.creation_timestamp = 2000;

    SECTION("oldest wins by default") {
        auto result = build(cache_of(ing, proxy, service("default", "web")));
        auto route = result.snapshot->select_route("http-80", request("example.com", "/"));
        REQUIRE(route->source.kind == Kind::Ingress);

        const auto* status = find_status(result, Kind::HTTPProxy, "default", "root");
        REQUIRE(has_error_reason(*status, "RouteConflict"));
        REQUIRE(status->current_status == "invalid");
        REQUIRE(status->errors.front().message.find("Ingress default/legacy") !=
                std::string::npos);
    }

    SECTION("schema precedence") {
        auto config = test_config();
        config.dag.cross_schema_conflict_policy = "schema-precedence";
        auto result = build(cache_of(ing, proxy, service("default", "web")), config);
        auto route = result.snapshot->select_route("http-80", request("example.com", "/"));
        REQUIRE(route->source.kind == Kind::HTTPProxy);

        const auto* status = find_status(result, Kind::Ingress, "default", "legacy");
        REQUIRE(find_condition(status->conditions, "Conflicted") != nullptr);
    }

    SECTION("cross_schema_wins") {
        auto config = test_config();
        source::ObjectRef a{Kind::Ingress, {"default", "x"}, 1, 100};
        source::ObjectRef b{Kind::HTTPProxy, {"default", "x"}, 1, 200};
        REQUIRE(dag::cross_schema_wins(a, b, config.dag));
        config.dag.cross_schema_conflict_policy = "schema-precedence";
        REQUIRE(dag::cross_schema_wins(b, a, config.dag));
    }
}

TEST_CASE("Include cycles do not stop siblings", "[dag][builder]") {
    auto root = root_proxy("default", "root", "example.com");
    root.includes.push_back(include("loop", "/loop"));
    root.includes.push_back(include("fine", "/fine"));
    auto loop = child_proxy("default", "loop");
    loop.includes.push_back(include("loop", "/again"));
    auto fine = child_proxy("default", "fine");
    fine.routes.push_back(proxy_route("/", "web"));

    auto result = build(cache_of(root, loop, fine, service("default", "web")));

    const auto* status = find_status(result, Kind::HTTPProxy, "default", "loop");
    REQUIRE(has_error_reason(*status, "IncludeCreatesCycle"));
    REQUIRE(result.snapshot->select_route("http-80", request("example.com", "/fine")) != nullptr);
}

TEST_CASE("Secrets are validated only when referenced", "[dag][builder]") {
    auto root = proxy_with_routes({"/"});

    SECTION("unreferenced broken secret is silent") {
        auto result = build(cache_of(root, service("default", "web"),
                                     broken_secret("default", "broken")));
        REQUIRE(result.secrets_validated == 0);
        REQUIRE(find_status(result, Kind::Secret, "default", "broken") == nullptr);
        for (const auto& status : result.statuses) {
            REQUIRE(status.errors.empty());
        }
    }

    SECTION("referenced broken secret is reported on the referrer") {
        root.virtualhost->tls.emplace();
        root.virtualhost->tls->secret_name = "broken";
        auto result = build(cache_of(root, service("default", "web"),
                                     broken_secret("default", "broken")));
        REQUIRE(result.secrets_validated == 1);
        REQUIRE(find_status(result, Kind::Secret, "default", "broken") == nullptr);
        const auto* status = find_status(result, Kind::HTTPProxy, "default", "root");
        REQUIRE(has_error_reason(*status, "SecretNotValid"));
    }
}

TEST_CASE("Pruning drops unreferenced entries", "[dag][builder]") {
    dag::Dag graph;
    (void)graph.ensure_virtual_host(dag::Protocol::HTTP, 80, "empty.test");
    auto& vhost = graph.ensure_virtual_host(dag::Protocol::HTTP, 8080, "used.test");
    dag::Cluster used;
    used.name = "default/used/80";
    dag::Cluster unused;
    unused.name = "default/unused/80";
    dag::Route route;
    route.clusters.push_back({graph.add_cluster(used), 1, {}, {}});
    (void)graph.add_route(vhost, std::move(route));
    (void)graph.add_cluster(unused);

    dag::prune(graph);

    REQUIRE(graph.find_listener("http-80") == nullptr);
    REQUIRE(graph.find_listener("http-8080") != nullptr);
    REQUIRE(graph.clusters.size() == 1);
    REQUIRE(graph.clusters.contains("default/used/80"));
}

TEST_CASE("A defective processor publishes nothing", "[dag][builder]") {
    std::vector<std::unique_ptr<dag::Processor>> processors;
    processors.push_back(std::make_unique<StaticProcessor>());
    processors.push_back(std::make_unique<ThrowingProcessor>());
    dag::Builder builder(std::move(processors), nullptr);
    REQUIRE(builder.processor_count() == 2);

    source::ObjectCache cache;
    cache.mark_synced();
    REQUIRE_THROWS_AS(builder.build(cache, test_config(), 1), std::logic_error);
}

TEST_CASE("Custom processor sets assemble", "[dag][builder]") {
    std::vector<std::unique_ptr<dag::Processor>> processors;
    processors.push_back(std::make_unique<StaticProcessor>());
    dag::Builder builder(std::move(processors), nullptr);

    source::ObjectCache cache;
    auto result = builder.build(cache, test_config(), 7);
    REQUIRE(result.snapshot->sequence == 7);
    REQUIRE(result.snapshot->route_count() == 1);
    const auto* route = result.snapshot->select_route("http-80", request("static.test", "/"));
    REQUIRE(route != nullptr);
    REQUIRE(route->direct_response->body == "ok");
}
