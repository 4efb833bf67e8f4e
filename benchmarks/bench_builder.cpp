// Lattice Builder Benchmark
// Measures full rebuild time over synthetic clusters of increasing size

#include "../src/control/config.hpp"
#include "../src/core/logging.hpp"
#include "../src/dag/builder.hpp"
#include "../src/source/cache.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <quill/Logger.h>

using namespace lattice;

namespace {

source::ObjectMeta make_meta(const std::string& ns, const std::string& name, int64_t created) {
    source::ObjectMeta m;
    m.ns = ns;
    m.name = name;
    m.creation_timestamp = created;
    return m;
}

source::Service make_service(const std::string& ns, const std::string& name) {
    source::Service svc;
    svc.metadata = make_meta(ns, name, 1000);
    source::ServicePort port;
    port.name = "http";
    port.port = 80;
    svc.ports.push_back(port);
    return svc;
}

source::ProxyRoute make_proxy_route(const std::string& path, const std::string& service) {
    source::ProxyRoute route;
    source::MatchCondition condition;
    condition.prefix = path;
    route.conditions.push_back(condition);
    source::ProxyService backend;
    backend.name = service;
    backend.port = 80;
    route.services.push_back(backend);
    return route;
}

// Every tenant namespace gets a root HTTPProxy with an included child, an
// Ingress on its own host and an HTTPRoute attached to a shared Gateway.
source::ObjectCache make_cache(size_t tenants, size_t routes_per_object) {
    source::ObjectCache cache;

    source::GatewayClass gc;
    gc.metadata = make_meta("", "lattice", 1000);
    gc.controller_name = "projectcontour.io/gateway-controller";
    cache.insert(gc);

    source::Gateway gw;
    gw.metadata = make_meta("infra", "shared", 1000);
    gw.gateway_class_name = "lattice";
    source::GatewayListener listener;
    listener.name = "http";
    listener.port = 80;
    listener.protocol = "HTTP";
    listener.allowed_routes.from = "All";
    gw.listeners.push_back(listener);
    cache.insert(gw);

    for (size_t t = 0; t < tenants; ++t) {
        std::string ns = "tenant-" + std::to_string(t);
        auto created = static_cast<int64_t>(1000 + t);
        cache.insert(make_service(ns, "web"));
        cache.insert(make_service(ns, "api"));

        source::HTTPProxy root;
        root.metadata = make_meta(ns, "root", created);
        root.virtualhost.emplace();
        root.virtualhost->fqdn = ns + ".proxy.example.com";
        for (size_t r = 0; r < routes_per_object; ++r) {
            root.routes.push_back(make_proxy_route("/r" + std::to_string(r), "web"));
        }
        source::Include inc;
        inc.name = "child";
        source::MatchCondition blog;
        blog.prefix = "/blog";
        inc.conditions.push_back(blog);
        root.includes.push_back(inc);
        cache.insert(root);

        source::HTTPProxy child;
        child.metadata = make_meta(ns, "child", created);
        child.routes.push_back(make_proxy_route("/", "api"));
        child.routes.push_back(make_proxy_route("/admin", "api"));
        cache.insert(child);

        source::Ingress ing;
        ing.metadata = make_meta(ns, "legacy", created);
        source::IngressRule rule;
        rule.host = ns + ".ingress.example.com";
        for (size_t r = 0; r < routes_per_object; ++r) {
            source::IngressPath path;
            path.path = "/p" + std::to_string(r);
            path.path_type = "Prefix";
            path.backend.service_name = "web";
            path.backend.port_number = 80;
            rule.paths.push_back(path);
        }
        ing.rules.push_back(rule);
        cache.insert(ing);

        source::HTTPRoute route;
        route.metadata = make_meta(ns, "route", created);
        source::ParentReference parent;
        parent.ns = "infra";
        parent.name = "shared";
        route.parent_refs.push_back(parent);
        route.hostnames.push_back(ns + ".gateway.example.com");
        for (size_t r = 0; r < routes_per_object; ++r) {
            source::HTTPRouteRule route_rule;
            source::HTTPRouteMatch match;
            match.path = source::HTTPPathMatch{"PathPrefix", "/g" + std::to_string(r)};
            route_rule.matches.push_back(match);
            source::BackendRef backend;
            backend.name = "api";
            backend.port = 80;
            route_rule.backend_refs.push_back(backend);
            route.rules.push_back(route_rule);
        }
        cache.insert(route);
    }

    cache.mark_synced();
    return cache;
}

void benchmark_rebuild() {
    std::cout << "\n=== Full Rebuild Benchmark ===\n";

    control::Config config;
    dag::Builder builder;
    const size_t iterations = 20;
    std::vector<size_t> tenant_counts = {10, 100, 500, 1000};

    std::cout << std::setw(10) << "Tenants"
              << std::setw(12) << "Objects"
              << std::setw(12) << "Routes"
              << std::setw(15) << "Build (ms)" << "\n";
    std::cout << std::string(49, '-') << "\n";

    for (size_t tenants : tenant_counts) {
        auto cache = make_cache(tenants, 10);

        size_t routes = 0;
        auto start = std::chrono::steady_clock::now();
        for (size_t i = 0; i < iterations; i++) {
            auto result = builder.build(cache, config, i + 1);
            routes = result.snapshot->route_count();
        }
        auto end = std::chrono::steady_clock::now();
        auto total = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        double per_build_ms = static_cast<double>(total.count()) / 1000.0 / iterations;

        std::cout << std::setw(10) << tenants
                  << std::setw(12) << cache.size()
                  << std::setw(12) << routes
                  << std::setw(15) << std::fixed << std::setprecision(2) << per_build_ms << "\n";
    }
}

}  // namespace

int main() {
    std::cout << "Lattice Builder Performance Benchmark\n";
    std::cout << "=====================================\n";

    // Per-object warnings would dominate the timings
    logging::get_current_logger()->set_log_level(quill::LogLevel::Error);

    benchmark_rebuild();

    std::cout << "\n";
    return 0;
}
