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

// Lattice Source Objects - Header
// In-memory model of the cluster objects the graph builder consumes

#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../core/tls.hpp"

namespace lattice::source {

/// Object kinds held by the cache
enum class Kind : uint8_t {
    HTTPProxy,
    Ingress,
    Gateway,
    GatewayClass,
    HTTPRoute,
    GRPCRoute,
    TLSRoute,
    TCPRoute,
    ReferenceGrant,
    Secret,
    Service,
    Namespace,
    TLSCertificateDelegation,
    ExtensionService,
    Unknown
};

[[nodiscard]] std::string_view to_string(Kind kind) noexcept;
[[nodiscard]] Kind parse_kind(std::string_view kind) noexcept;

inline constexpr std::string_view kGatewayGroup = "gateway.networking.k8s.io";
inline constexpr std::string_view kContourGroup = "projectcontour.io";

/// namespace/name pair
struct NamespacedName {
    std::string ns;
    std::string name;

    [[nodiscard]] std::string str() const { return ns + "/" + name; }
    [[nodiscard]] bool empty() const noexcept { return name.empty(); }

    auto operator<=>(const NamespacedName&) const = default;
    bool operator==(const NamespacedName&) const = default;
};

/// Hash for NamespacedName keys in core::fast_map / fast_set
struct NamespacedNameHash {
    using is_avalanching = void;
    [[nodiscard]] uint64_t operator()(const NamespacedName& n) const noexcept;
};

/// Parse "namespace/name"; a bare name takes default_ns
[[nodiscard]] NamespacedName parse_namespaced_name(std::string_view value,
                                                   std::string_view default_ns);

/// Common object metadata
struct ObjectMeta {
    std::string name;
    std::string ns;
    std::string resource_version;  // Opaque; equal non-empty versions mean unchanged
    int64_t generation = 1;
    int64_t creation_timestamp = 0;  // Seconds since the epoch
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;

    [[nodiscard]] NamespacedName key() const { return {ns, name}; }
    [[nodiscard]] std::string_view annotation(std::string_view key) const;
};

/// Identity of a source object, used for status and conflict attribution
struct ObjectRef {
    Kind kind = Kind::Unknown;
    NamespacedName name;
    int64_t generation = 0;
    int64_t creation_timestamp = 0;

    [[nodiscard]] static ObjectRef of(Kind kind, const ObjectMeta& meta) {
        return ObjectRef{kind, meta.key(), meta.generation, meta.creation_timestamp};
    }

    /// "Kind ns/name"
    [[nodiscard]] std::string str() const;

    // Identity only; generation and timestamp do not participate
    [[nodiscard]] bool operator==(const ObjectRef& other) const noexcept {
        return kind == other.kind && name == other.name;
    }
    [[nodiscard]] bool operator<(const ObjectRef& other) const noexcept {
        if (kind != other.kind) {
            return kind < other.kind;
        }
        return name < other.name;
    }
};

/// Conflict tie-break: the older object wins; equal timestamps fall back to the
/// lexicographically smaller namespace/name.
[[nodiscard]] bool wins_tie_break(const ObjectRef& a, const ObjectRef& b) noexcept;

// ============================
// HTTPProxy
// ============================

struct HeaderMatchCondition {
    std::string name;
    bool present = false;
    bool not_present = false;
    std::optional<std::string> contains;
    std::optional<std::string> not_contains;
    std::optional<std::string> exact;
    std::optional<std::string> not_exact;
    std::optional<std::string> regex;
    bool ignore_case = false;
    bool treat_missing_as_empty = false;
};

struct QueryParameterMatchCondition {
    std::string name;
    std::optional<std::string> exact;
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
    std::optional<std::string> regex;
    std::optional<std::string> contains;
    bool present = false;
    bool ignore_case = false;
};

/// One element of a proxy route or include condition list
struct MatchCondition {
    std::optional<std::string> prefix;
    std::optional<std::string> exact;
    std::optional<std::string> regex;
    std::optional<HeaderMatchCondition> header;
    std::optional<QueryParameterMatchCondition> query_parameter;
};

struct HeaderValue {
    std::string name;
    std::string value;
};

struct HeadersPolicy {
    std::vector<HeaderValue> set;
    std::vector<std::string> remove;
};

struct UpstreamValidation {
    std::string ca_secret;
    std::string subject_name;
};

struct ProxyService {
    std::string name;
    int32_t port = 0;
    uint32_t weight = 0;  // 0 = unset
    std::string protocol;  // h2, h2c, tls
    bool mirror = false;
    std::optional<UpstreamValidation> validation;
    std::optional<HeadersPolicy> request_headers_policy;
    std::optional<HeadersPolicy> response_headers_policy;
};

struct TimeoutPolicy {
    std::string response;  // Duration, or "infinity"
    std::string idle;
};

struct RetryPolicy {
    uint32_t count = 1;
    std::string per_try_timeout;
    std::vector<std::string> retry_on;
};

struct ReplacePrefix {
    std::string prefix;
    std::string replacement;
};

struct PathRewritePolicy {
    std::vector<ReplacePrefix> replace_prefix;
};

struct LocalRateLimitPolicy {
    uint32_t requests = 0;
    std::string unit;  // second, minute, hour
    uint32_t burst = 0;
};

struct GlobalRateLimitPolicy {
    bool disabled = false;
    std::vector<std::string> descriptors;
};

struct RateLimitPolicy {
    std::optional<LocalRateLimitPolicy> local;
    std::optional<GlobalRateLimitPolicy> global;
};

struct AuthorizationPolicy {
    bool disabled = false;
    std::map<std::string, std::string> context;
};

struct RequestRedirectPolicy {
    std::optional<std::string> scheme;
    std::optional<std::string> hostname;
    std::optional<int32_t> port;
    int32_t status_code = 302;
    std::optional<std::string> path;
    std::optional<std::string> prefix;
};

struct DirectResponsePolicy {
    int32_t status_code = 0;
    std::string body;
};

struct LoadBalancerPolicy {
    std::string strategy;  // RoundRobin, WeightedLeastRequest, Random, Cookie, RequestHash
};

struct ProxyRoute {
    std::vector<MatchCondition> conditions;
    std::vector<ProxyService> services;
    bool enable_websockets = false;
    bool permit_insecure = false;
    std::optional<AuthorizationPolicy> auth_policy;
    std::optional<TimeoutPolicy> timeout_policy;
    std::optional<RetryPolicy> retry_policy;
    std::optional<PathRewritePolicy> path_rewrite_policy;
    std::optional<HeadersPolicy> request_headers_policy;
    std::optional<HeadersPolicy> response_headers_policy;
    std::optional<RateLimitPolicy> rate_limit_policy;
    std::optional<RequestRedirectPolicy> request_redirect_policy;
    std::optional<DirectResponsePolicy> direct_response_policy;
    std::optional<LoadBalancerPolicy> load_balancer_policy;
};

struct ClientValidation {
    std::string ca_secret;
    std::string crl_secret;
    bool skip_client_cert_validation = false;
    bool optional_client_certificate = false;
};

struct ProxyTLS {
    std::string secret_name;
    std::string minimum_protocol_version;
    std::string maximum_protocol_version;
    bool passthrough = false;
    bool enable_fallback_certificate = false;
    std::optional<ClientValidation> client_validation;
};

struct AuthorizationServer {
    NamespacedName extension_ref;
    std::optional<AuthorizationPolicy> auth_policy;
    bool fail_open = false;
    std::string response_timeout;
};

struct CORSPolicy {
    std::vector<std::string> allow_origin;
    std::vector<std::string> allow_methods;
    std::vector<std::string> allow_headers;
    std::vector<std::string> expose_headers;
    bool allow_credentials = false;
    std::string max_age;
};

struct ProxyVirtualHost {
    std::string fqdn;
    std::optional<ProxyTLS> tls;
    std::optional<AuthorizationServer> authorization;
    std::optional<RateLimitPolicy> rate_limit_policy;
    std::optional<CORSPolicy> cors_policy;
    std::optional<bool> disable_route_sorting;  // Overrides the configured default
};

struct Include {
    std::string name;
    std::string ns;  // Empty = the including proxy's namespace
    std::vector<MatchCondition> conditions;
};

struct TCPProxyInclude {
    std::string name;
    std::string ns;
};

struct TCPProxy {
    std::vector<ProxyService> services;
    std::optional<TCPProxyInclude> include;
    std::optional<LoadBalancerPolicy> load_balancer_policy;
};

struct HTTPProxy {
    ObjectMeta metadata;
    std::optional<ProxyVirtualHost> virtualhost;
    std::vector<ProxyRoute> routes;
    std::vector<Include> includes;
    std::optional<TCPProxy> tcpproxy;
};

// ============================
// Ingress
// ============================

struct IngressBackend {
    std::string service_name;
    int32_t port_number = 0;
    std::string port_name;
};

struct IngressPath {
    std::string path;
    std::string path_type = "ImplementationSpecific";  // Exact, Prefix, ImplementationSpecific
    IngressBackend backend;
};

struct IngressRule {
    std::string host;
    std::vector<IngressPath> paths;
};

struct IngressTLS {
    std::vector<std::string> hosts;
    std::string secret_name;
};

struct Ingress {
    ObjectMeta metadata;
    std::optional<IngressBackend> default_backend;
    std::vector<IngressTLS> tls;
    std::vector<IngressRule> rules;
};

// ============================
// Gateway API
// ============================

struct LabelSelectorRequirement {
    std::string key;
    std::string op;  // In, NotIn, Exists, DoesNotExist
    std::vector<std::string> values;
};

struct LabelSelector {
    std::map<std::string, std::string> match_labels;
    std::vector<LabelSelectorRequirement> match_expressions;

    [[nodiscard]] bool matches(const std::map<std::string, std::string>& labels) const;
};

struct ParentReference {
    std::string group = std::string(kGatewayGroup);
    std::string kind = "Gateway";
    std::string ns;  // Empty = the route's namespace
    std::string name;
    std::string section_name;
    std::optional<int32_t> port;
};

struct BackendRef {
    std::string group;
    std::string kind = "Service";
    std::string name;
    std::string ns;  // Empty = the route's namespace
    std::optional<int32_t> port;
    int32_t weight = 1;
};

struct SecretObjectReference {
    std::string group;
    std::string kind = "Secret";
    std::string name;
    std::string ns;  // Empty = the gateway's namespace
};

struct RouteGroupKind {
    std::string group = std::string(kGatewayGroup);
    std::string kind;
};

struct AllowedRoutes {
    std::string from = "Same";  // Same, All, Selector
    std::optional<LabelSelector> selector;
    std::vector<RouteGroupKind> kinds;  // Empty = protocol defaults
};

struct GatewayTLSConfig {
    std::string mode = "Terminate";  // Terminate, Passthrough
    std::vector<SecretObjectReference> certificate_refs;
};

struct GatewayListener {
    std::string name;
    std::string hostname;
    int32_t port = 0;
    std::string protocol;  // HTTP, HTTPS, TLS, TCP
    std::optional<GatewayTLSConfig> tls;
    AllowedRoutes allowed_routes;
};

struct Gateway {
    ObjectMeta metadata;
    std::string gateway_class_name;
    std::vector<GatewayListener> listeners;
};

struct GatewayClass {
    ObjectMeta metadata;
    std::string controller_name;
};

struct HTTPPathMatch {
    std::string type = "PathPrefix";  // Exact, PathPrefix, RegularExpression
    std::string value = "/";
};

struct HTTPHeaderMatch {
    std::string type = "Exact";  // Exact, RegularExpression
    std::string name;
    std::string value;
};

struct HTTPQueryParamMatch {
    std::string type = "Exact";  // Exact, RegularExpression
    std::string name;
    std::string value;
};

struct HTTPRouteMatch {
    std::optional<HTTPPathMatch> path;
    std::vector<HTTPHeaderMatch> headers;
    std::vector<HTTPQueryParamMatch> query_params;
    std::string method;  // Empty = any
};

struct HTTPHeaderFilter {
    std::vector<HeaderValue> set;
    std::vector<HeaderValue> add;
    std::vector<std::string> remove;
};

struct HTTPPathModifier {
    std::string type;  // ReplaceFullPath, ReplacePrefixMatch
    std::string replace_full_path;
    std::string replace_prefix_match;
};

struct HTTPRequestRedirectFilter {
    std::optional<std::string> scheme;
    std::optional<std::string> hostname;
    std::optional<HTTPPathModifier> path;
    std::optional<int32_t> port;
    int32_t status_code = 302;
};

struct HTTPURLRewriteFilter {
    std::optional<std::string> hostname;
    std::optional<HTTPPathModifier> path;
};

struct HTTPRequestMirrorFilter {
    BackendRef backend_ref;
};

struct HTTPRouteFilter {
    std::string type;  // RequestHeaderModifier, ResponseHeaderModifier, RequestRedirect, URLRewrite, RequestMirror
    std::optional<HTTPHeaderFilter> request_header_modifier;
    std::optional<HTTPHeaderFilter> response_header_modifier;
    std::optional<HTTPRequestRedirectFilter> request_redirect;
    std::optional<HTTPURLRewriteFilter> url_rewrite;
    std::optional<HTTPRequestMirrorFilter> request_mirror;
};

struct HTTPRouteTimeouts {
    std::string request;
    std::string backend_request;
};

struct HTTPRouteRule {
    std::vector<HTTPRouteMatch> matches;
    std::vector<HTTPRouteFilter> filters;
    std::vector<BackendRef> backend_refs;
    std::optional<HTTPRouteTimeouts> timeouts;
};

struct HTTPRoute {
    ObjectMeta metadata;
    std::vector<ParentReference> parent_refs;
    std::vector<std::string> hostnames;
    std::vector<HTTPRouteRule> rules;
};

struct GRPCMethodMatch {
    std::string type = "Exact";
    std::string service;
    std::string method;
};

struct GRPCRouteMatch {
    std::optional<GRPCMethodMatch> method;
    std::vector<HTTPHeaderMatch> headers;
};

struct GRPCRouteRule {
    std::vector<GRPCRouteMatch> matches;
    std::vector<HTTPRouteFilter> filters;
    std::vector<BackendRef> backend_refs;
};

struct GRPCRoute {
    ObjectMeta metadata;
    std::vector<ParentReference> parent_refs;
    std::vector<std::string> hostnames;
    std::vector<GRPCRouteRule> rules;
};

/// Rule of a TLSRoute or TCPRoute: backends only
struct L4RouteRule {
    std::vector<BackendRef> backend_refs;
};

struct TLSRoute {
    ObjectMeta metadata;
    std::vector<ParentReference> parent_refs;
    std::vector<std::string> hostnames;
    std::vector<L4RouteRule> rules;
};

struct TCPRoute {
    ObjectMeta metadata;
    std::vector<ParentReference> parent_refs;
    std::vector<L4RouteRule> rules;
};

struct ReferenceGrantFrom {
    std::string group;
    std::string kind;
    std::string ns;
};

struct ReferenceGrantTo {
    std::string group;
    std::string kind;
    std::string name;  // Empty = every object of the kind
};

struct ReferenceGrant {
    ObjectMeta metadata;
    std::vector<ReferenceGrantFrom> from;
    std::vector<ReferenceGrantTo> to;
};

// ============================
// Core objects
// ============================

struct Secret {
    ObjectMeta metadata;
    std::string type = std::string(core::kSecretTypeOpaque);
    core::SecretData data;
};

struct ServicePort {
    std::string name;
    int32_t port = 0;
    std::string protocol = "TCP";
    std::string app_protocol;
};

struct Service {
    ObjectMeta metadata;
    std::string type = "ClusterIP";
    std::string external_name;
    std::vector<ServicePort> ports;
};

struct Namespace {
    ObjectMeta metadata;
};

struct CertificateDelegation {
    std::string secret_name;
    std::vector<std::string> target_namespaces;  // "*" = every namespace
};

struct TLSCertificateDelegation {
    ObjectMeta metadata;
    std::vector<CertificateDelegation> delegations;
};

/// Authorization or rate limit server. Services must live in the
/// ExtensionService's own namespace.
struct ExtensionService {
    ObjectMeta metadata;
    std::vector<ProxyService> services;
    std::string protocol;  // h2 (default) or h2c
    std::optional<TimeoutPolicy> timeout_policy;
    std::optional<LoadBalancerPolicy> load_balancer_policy;
};

/// Any object the cache accepts
using Object = std::variant<HTTPProxy, Ingress, Gateway, GatewayClass, HTTPRoute, GRPCRoute,
                            TLSRoute, TCPRoute, ReferenceGrant, Secret, Service, Namespace,
                            TLSCertificateDelegation, ExtensionService>;

[[nodiscard]] Kind kind_of(const Object& object) noexcept;
[[nodiscard]] const ObjectMeta& meta_of(const Object& object) noexcept;

}  // namespace lattice::source
