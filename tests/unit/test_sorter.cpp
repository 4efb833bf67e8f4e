// Lattice Route Ordering Tests

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../../src/dag/sorter.hpp"

using namespace lattice::dag;

namespace {

Route route_for(PathMatch path) {
    Route r;
    r.match.path = std::move(path);
    return r;
}

std::vector<std::string> keys(const std::vector<Route>& routes) {
    std::vector<std::string> out;
    for (const auto& r : routes) {
        out.push_back(r.match.key());
    }
    return out;
}

}  // namespace

TEST_CASE("Exact before regex before prefix", "[dag][sorter]") {
    std::vector<Route> routes = {
        route_for(PathMatch::prefix("/a/very/long/prefix")),
        route_for(PathMatch::regex("/r.*")),
        route_for(PathMatch::exact("/e")),
    };
    sort_routes(routes);

    REQUIRE(routes[0].match.path.kind == PathMatchKind::Exact);
    REQUIRE(routes[1].match.path.kind == PathMatchKind::Regex);
    REQUIRE(routes[2].match.path.kind == PathMatchKind::Prefix);
}

TEST_CASE("Longer paths first within a kind", "[dag][sorter]") {
    std::vector<Route> routes = {
        route_for(PathMatch::prefix("/")),
        route_for(PathMatch::prefix("/api")),
        route_for(PathMatch::prefix("/api/v1")),
        route_for(PathMatch::prefix("/abc")),
    };
    sort_routes(routes);

    std::vector<std::string> values;
    for (const auto& r : routes) {
        values.push_back(r.match.path.value);
    }
    // Equal lengths fall back to lexicographic order
    REQUIRE(values == std::vector<std::string>{"/api/v1", "/abc", "/api", "/"});
}

TEST_CASE("More header predicates first at an equal path", "[dag][sorter]") {
    Route plain = route_for(PathMatch::prefix("/"));
    Route one = plain;
    one.match.headers.push_back(HeaderMatch{"x-a", MatchType::Exact, "1"});
    Route two = one;
    two.match.headers.push_back(HeaderMatch{"x-b", MatchType::Exact, "2"});
    Route query = plain;
    query.match.query_params.push_back(QueryParamMatch{"q", MatchType::Exact, "1"});

    std::vector<Route> routes = {plain, query, one, two};
    sort_routes(routes);

    REQUIRE(routes[0].match.headers.size() == 2);
    REQUIRE(routes[1].match.headers.size() == 1);
    REQUIRE(routes[2].match.query_params.size() == 1);
    REQUIRE(routes[3].match.key() == plain.match.key());
}

TEST_CASE("Method matches first when method priority is set", "[dag][sorter]") {
    Route any = route_for(PathMatch::prefix("/"));
    any.method_priority = true;
    Route with_header = any;
    with_header.match.headers.push_back(HeaderMatch{"x-a", MatchType::Exact, "1"});
    Route post = any;
    post.match.method = "POST";

    std::vector<Route> routes = {with_header, any, post};
    sort_routes(routes);

    REQUIRE(routes[0].match.method == "POST");
    REQUIRE(routes[1].match.headers.size() == 1);
}

TEST_CASE("Sorting is deterministic regardless of input order", "[dag][sorter]") {
    std::vector<Route> a = {
        route_for(PathMatch::prefix("/b")),
        route_for(PathMatch::exact("/x")),
        route_for(PathMatch::prefix("/a")),
        route_for(PathMatch::regex("/.*")),
    };
    std::vector<Route> b(a.rbegin(), a.rend());

    sort_routes(a);
    sort_routes(b);
    REQUIRE(keys(a) == keys(b));
}

TEST_CASE("Disabled hosts keep declaration order", "[dag][sorter]") {
    Dag dag;
    auto& sorted = dag.ensure_virtual_host(Protocol::HTTP, kInsecurePort, "sorted.example.com");
    auto& unsorted = dag.ensure_virtual_host(Protocol::HTTP, kInsecurePort, "raw.example.com");
    unsorted.sorting_disabled = true;

    for (auto* vhost : {&sorted, &unsorted}) {
        vhost->routes.push_back(route_for(PathMatch::prefix("/")));
        vhost->routes.push_back(route_for(PathMatch::prefix("/long/path")));
    }
    sort_dag(dag);

    REQUIRE(sorted.routes.front().match.path.value == "/long/path");
    REQUIRE(unsorted.routes.front().match.path.value == "/");
}
