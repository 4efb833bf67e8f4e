/*
 * Copyright 2025 Lattice Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Lattice DAG - Header
// Routing graph: listeners, virtual hosts, ordered routes, clusters and secrets

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/tls.hpp"
#include "../http/http.hpp"
#include "../source/objects.hpp"
#include "conditions.hpp"

namespace lattice::dag {

/// Listener ports used by HTTPProxy and Ingress objects
inline constexpr int32_t kInsecurePort = 80;
inline constexpr int32_t kSecurePort = 443;

enum class Protocol : uint8_t {
    HTTP,
    HTTPS,  // TLS termination and SNI passthrough
    TCP,
};

[[nodiscard]] std::string_view to_string(Protocol protocol) noexcept;

/// "http-80", "https-443", "tcp-9000"
[[nodiscard]] std::string listener_name(Protocol protocol, int32_t port);

/// Backend reference; endpoints are resolved elsewhere
struct Service {
    source::NamespacedName name;
    int32_t port = 0;
    std::string port_name;
    std::string external_name;  // Set for ExternalName services
};

struct UpstreamValidation {
    std::string ca_secret;  // Key into Dag::secrets
    std::string subject_name;
};

struct Cluster {
    std::string name;
    Service service;
    std::string protocol;  // "", h2, h2c, tls
    std::string load_balancer_strategy;
    std::optional<UpstreamValidation> upstream_validation;
};

/// Header mutations
struct HeadersPolicy {
    std::map<std::string, std::string> set;
    std::map<std::string, std::string> add;
    std::vector<std::string> remove;

    [[nodiscard]] bool empty() const noexcept { return set.empty() && add.empty() && remove.empty(); }
};

struct WeightedCluster {
    std::string cluster;  // Key into Dag::clusters
    uint32_t weight = 0;
    HeadersPolicy request_headers;
    HeadersPolicy response_headers;
};

struct TimeoutPolicy {
    std::optional<std::chrono::milliseconds> response;  // 0 = disabled
    std::optional<std::chrono::milliseconds> idle;
};

struct RetryPolicy {
    uint32_t num_retries = 1;
    std::string retry_on = "5xx";
    std::optional<std::chrono::milliseconds> per_try_timeout;
};

struct LocalRateLimit {
    uint32_t requests = 0;
    std::chrono::seconds unit{1};
    uint32_t burst = 0;
};

struct GlobalRateLimit {
    std::vector<std::string> descriptors;
};

/// Effective rate limiting after level precedence
struct RateLimitPolicy {
    std::optional<LocalRateLimit> local;
    std::optional<GlobalRateLimit> global;  // Absent when disabled at a more specific level
};

struct ExternalAuth {
    source::NamespacedName service;
    std::string cluster;  // Key into Dag::extensions
    bool fail_open = false;
    std::optional<std::chrono::milliseconds> response_timeout;
    std::map<std::string, std::string> context;
};

struct Redirect {
    std::optional<std::string> scheme;
    std::optional<std::string> hostname;
    std::optional<int32_t> port;
    std::optional<std::string> path;
    std::optional<std::string> prefix;
    int32_t status_code = 302;
};

struct DirectResponse {
    int32_t status_code = 0;
    std::string body;
};

struct CORSPolicy {
    std::vector<std::string> allow_origin;
    std::vector<std::string> allow_methods;
    std::vector<std::string> allow_headers;
    std::vector<std::string> expose_headers;
    bool allow_credentials = false;
    std::string max_age;
};

struct Route {
    MatchConditions match;

    // Action: clusters, a redirect or a direct response
    std::vector<WeightedCluster> clusters;
    std::optional<Redirect> redirect;
    std::optional<DirectResponse> direct_response;
    bool https_redirect = false;  // Insecure copy of a secure route

    std::vector<std::string> mirrors;  // Cluster names
    bool websocket = false;
    std::optional<std::string> prefix_rewrite;
    std::optional<std::string> full_path_rewrite;
    std::optional<std::string> host_rewrite;
    TimeoutPolicy timeouts;
    std::optional<RetryPolicy> retry;
    HeadersPolicy request_headers;
    HeadersPolicy response_headers;
    RateLimitPolicy rate_limit;
    std::optional<ExternalAuth> external_auth;  // Absent = no authorization for this route

    source::ObjectRef source;     // Object that declared the route
    bool method_priority = false;  // Method matches sort ahead at equal path (Gateway API)
};

struct TCPProxy {
    std::vector<WeightedCluster> clusters;
    source::ObjectRef source;
};

struct ClientValidation {
    std::string ca_secret;   // Key into Dag::secrets, empty when skipped
    std::string crl_secret;  // Key into Dag::secrets, may be empty
    bool skip_verification = false;
    bool optional_certificate = false;
};

struct TlsSettings {
    std::string secret;  // Key into Dag::secrets; empty for passthrough
    core::TlsVersion min_version = core::TlsVersion::V1_2;
    core::TlsVersion max_version = core::TlsVersion::V1_3;
    std::string fallback_secret;
    std::optional<ClientValidation> client_validation;
};

/// Result of inserting a route whose match is already taken
struct RouteCollision {
    source::ObjectRef winner;
    source::ObjectRef loser;
    std::string key;
    std::string hostname;
};

struct VirtualHost {
    std::string hostname;
    std::vector<Route> routes;  // Declaration order until the assembler sorts

    std::optional<TlsSettings> tls;
    std::optional<TCPProxy> tcp_proxy;  // SNI passthrough or terminated TCP proxy
    std::optional<ExternalAuth> external_auth;
    std::optional<CORSPolicy> cors;
    std::vector<std::string> http_filters;  // Ordered filter chain
    bool sorting_disabled = false;

    source::ObjectRef source;  // Owner of the host-level settings

    /// Insert a route. An identical match is resolved with the tie-break
    /// (same object: first declared wins); the loser is reported.
    std::optional<RouteCollision> add_route(Route route);

    [[nodiscard]] const Route* find_route(std::string_view key) const;
};

struct Listener {
    std::string name;
    int32_t port = 0;
    Protocol protocol = Protocol::HTTP;
    std::map<std::string, VirtualHost> virtual_hosts;
    std::optional<TCPProxy> tcp_proxy;  // Plain TCP listeners
};

/// Validated secret referenced from the graph. Key material never leaves the
/// snapshot through the JSON rendering.
struct Secret {
    source::NamespacedName name;
    std::string usage;  // tls, ca, crl
    core::SecretData data;
};

/// Cluster for an authorization or rate limit server, built from an
/// ExtensionService
struct ExtensionCluster {
    std::string name;  // "extension/<namespace>/<name>"
    source::NamespacedName source;
    std::string protocol = "h2";
    std::string load_balancer_strategy;
    std::optional<std::chrono::milliseconds> response_timeout;
    std::vector<WeightedCluster> upstreams;
};

struct Dag {
    std::map<std::string, Listener> listeners;
    std::map<std::string, Cluster> clusters;
    std::map<std::string, Secret> secrets;
    std::map<std::string, ExtensionCluster> extensions;
    std::string global_rate_limit;  // Key into Dag::extensions; empty when not configured
    uint64_t sequence = 0;

    // Route collisions seen while filling this graph; the assembler turns
    // them into conflict conditions
    std::vector<RouteCollision> collisions;

    Listener& ensure_listener(Protocol protocol, int32_t port);
    VirtualHost& ensure_virtual_host(Protocol protocol, int32_t port, const std::string& hostname);

    /// Add a route to a virtual host, keeping any collision for the assembler.
    /// Returns false when the route lost.
    bool add_route(VirtualHost& vhost, Route route);

    /// Register a cluster (idempotent) and return its name
    std::string add_cluster(Cluster cluster);

    [[nodiscard]] const Listener* find_listener(std::string_view name) const;

    /// Virtual host for an authority: exact host, then the closest "*." wildcard,
    /// then the "*" catch-all
    [[nodiscard]] const VirtualHost* find_virtual_host(std::string_view listener,
                                                       std::string_view authority) const;

    /// First route (in final order) whose match accepts the request
    [[nodiscard]] const Route* select_route(std::string_view listener,
                                            const http::Request& request) const;

    [[nodiscard]] size_t route_count() const noexcept;
};

/// Immutable, published graph
using Snapshot = std::shared_ptr<const Dag>;

/// Cluster name for a service port and upstream protocol
[[nodiscard]] std::string cluster_name(const source::NamespacedName& service, int32_t port,
                                       std::string_view protocol);

}  // namespace lattice::dag
