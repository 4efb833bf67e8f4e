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

// Lattice Source JSON - Implementation

#include "json.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

namespace lattice::source {

namespace {

std::optional<std::string> opt_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

std::optional<int32_t> opt_int(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<int32_t>();
}

template <typename T>
std::vector<T> list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    return j.at(key).get<std::vector<T>>();
}

template <typename T>
std::optional<T> opt(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

const nlohmann::json& spec_of(const nlohmann::json& j) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (j.contains("spec") && j.at("spec").is_object()) {
        return j.at("spec");
    }
    return kEmpty;
}

}  // namespace

// Object metadata

void from_json(const nlohmann::json& j, ObjectMeta& m) {
    m.name = j.value("name", std::string());
    m.ns = j.value("namespace", std::string());
    m.resource_version = j.value("resourceVersion", std::string());
    m.generation = j.value("generation", int64_t{1});
    if (j.contains("creationTimestamp")) {
        const auto& ts = j.at("creationTimestamp");
        if (ts.is_number_integer()) {
            m.creation_timestamp = ts.get<int64_t>();
        } else {
            auto parsed = parse_rfc3339(ts.get<std::string>());
            if (!parsed) {
                throw std::invalid_argument("metadata.creationTimestamp is not RFC 3339");
            }
            m.creation_timestamp = *parsed;
        }
    }
    m.labels = j.value("labels", std::map<std::string, std::string>{});
    m.annotations = j.value("annotations", std::map<std::string, std::string>{});
}

// HTTPProxy

void from_json(const nlohmann::json& j, HeaderMatchCondition& h) {
    h.name = j.value("name", std::string());
    h.present = j.value("present", false);
    h.not_present = j.value("notpresent", false);
    h.contains = opt_string(j, "contains");
    h.not_contains = opt_string(j, "notcontains");
    h.exact = opt_string(j, "exact");
    h.not_exact = opt_string(j, "notexact");
    h.regex = opt_string(j, "regex");
    h.ignore_case = j.value("ignoreCase", false);
    h.treat_missing_as_empty = j.value("treatMissingAsEmpty", false);
}

void from_json(const nlohmann::json& j, QueryParameterMatchCondition& q) {
    q.name = j.value("name", std::string());
    q.exact = opt_string(j, "exact");
    q.prefix = opt_string(j, "prefix");
    q.suffix = opt_string(j, "suffix");
    q.regex = opt_string(j, "regex");
    q.contains = opt_string(j, "contains");
    q.present = j.value("present", false);
    q.ignore_case = j.value("ignoreCase", false);
}

void from_json(const nlohmann::json& j, MatchCondition& c) {
    c.prefix = opt_string(j, "prefix");
    c.exact = opt_string(j, "exact");
    c.regex = opt_string(j, "regex");
    c.header = opt<HeaderMatchCondition>(j, "header");
    c.query_parameter = opt<QueryParameterMatchCondition>(j, "queryParameter");
}

void from_json(const nlohmann::json& j, HeaderValue& h) {
    h.name = j.value("name", std::string());
    h.value = j.value("value", std::string());
}

void from_json(const nlohmann::json& j, HeadersPolicy& h) {
    h.set = list<HeaderValue>(j, "set");
    h.remove = list<std::string>(j, "remove");
}

void from_json(const nlohmann::json& j, UpstreamValidation& v) {
    v.ca_secret = j.value("caSecret", std::string());
    v.subject_name = j.value("subjectName", std::string());
}

void from_json(const nlohmann::json& j, ProxyService& s) {
    s.name = j.value("name", std::string());
    s.port = j.value("port", 0);
    s.weight = j.value("weight", 0u);
    s.protocol = j.value("protocol", std::string());
    s.mirror = j.value("mirror", false);
    s.validation = opt<UpstreamValidation>(j, "validation");
    s.request_headers_policy = opt<HeadersPolicy>(j, "requestHeadersPolicy");
    s.response_headers_policy = opt<HeadersPolicy>(j, "responseHeadersPolicy");
}

void from_json(const nlohmann::json& j, TimeoutPolicy& t) {
    t.response = j.value("response", std::string());
    t.idle = j.value("idle", std::string());
}

void from_json(const nlohmann::json& j, RetryPolicy& r) {
    r.count = j.value("count", 1u);
    r.per_try_timeout = j.value("perTryTimeout", std::string());
    r.retry_on = list<std::string>(j, "retryOn");
}

void from_json(const nlohmann::json& j, ReplacePrefix& r) {
    r.prefix = j.value("prefix", std::string());
    r.replacement = j.value("replacement", std::string());
}

void from_json(const nlohmann::json& j, PathRewritePolicy& p) {
    p.replace_prefix = list<ReplacePrefix>(j, "replacePrefix");
}

void from_json(const nlohmann::json& j, LocalRateLimitPolicy& l) {
    l.requests = j.value("requests", 0u);
    l.unit = j.value("unit", std::string());
    l.burst = j.value("burst", 0u);
}

void from_json(const nlohmann::json& j, GlobalRateLimitPolicy& g) {
    g.disabled = j.value("disabled", false);
    g.descriptors = list<std::string>(j, "descriptors");
}

void from_json(const nlohmann::json& j, RateLimitPolicy& r) {
    r.local = opt<LocalRateLimitPolicy>(j, "local");
    r.global = opt<GlobalRateLimitPolicy>(j, "global");
}

void from_json(const nlohmann::json& j, AuthorizationPolicy& a) {
    a.disabled = j.value("disabled", false);
    a.context = j.value("context", std::map<std::string, std::string>{});
}

void from_json(const nlohmann::json& j, RequestRedirectPolicy& r) {
    r.scheme = opt_string(j, "scheme");
    r.hostname = opt_string(j, "hostname");
    r.port = opt_int(j, "port");
    r.status_code = j.value("statusCode", 302);
    r.path = opt_string(j, "path");
    r.prefix = opt_string(j, "prefix");
}

void from_json(const nlohmann::json& j, DirectResponsePolicy& d) {
    d.status_code = j.value("statusCode", 0);
    d.body = j.value("body", std::string());
}

void from_json(const nlohmann::json& j, LoadBalancerPolicy& l) {
    l.strategy = j.value("strategy", std::string());
}

void from_json(const nlohmann::json& j, ProxyRoute& r) {
    r.conditions = list<MatchCondition>(j, "conditions");
    r.services = list<ProxyService>(j, "services");
    r.enable_websockets = j.value("enableWebsockets", false);
    r.permit_insecure = j.value("permitInsecure", false);
    r.auth_policy = opt<AuthorizationPolicy>(j, "authPolicy");
    r.timeout_policy = opt<TimeoutPolicy>(j, "timeoutPolicy");
    r.retry_policy = opt<RetryPolicy>(j, "retryPolicy");
    r.path_rewrite_policy = opt<PathRewritePolicy>(j, "pathRewritePolicy");
    r.request_headers_policy = opt<HeadersPolicy>(j, "requestHeadersPolicy");
    r.response_headers_policy = opt<HeadersPolicy>(j, "responseHeadersPolicy");
    r.rate_limit_policy = opt<RateLimitPolicy>(j, "rateLimitPolicy");
    r.request_redirect_policy = opt<RequestRedirectPolicy>(j, "requestRedirectPolicy");
    r.direct_response_policy = opt<DirectResponsePolicy>(j, "directResponsePolicy");
    r.load_balancer_policy = opt<LoadBalancerPolicy>(j, "loadBalancerPolicy");
}

void from_json(const nlohmann::json& j, ClientValidation& c) {
    c.ca_secret = j.value("caSecret", std::string());
    c.crl_secret = j.value("crlSecret", std::string());
    c.skip_client_cert_validation = j.value("skipClientCertValidation", false);
    c.optional_client_certificate = j.value("optionalClientCertificate", false);
}

void from_json(const nlohmann::json& j, ProxyTLS& t) {
    t.secret_name = j.value("secretName", std::string());
    t.minimum_protocol_version = j.value("minimumProtocolVersion", std::string());
    t.maximum_protocol_version = j.value("maximumProtocolVersion", std::string());
    t.passthrough = j.value("passthrough", false);
    t.enable_fallback_certificate = j.value("enableFallbackCertificate", false);
    t.client_validation = opt<ClientValidation>(j, "clientValidation");
}

void from_json(const nlohmann::json& j, AuthorizationServer& a) {
    if (j.contains("extensionRef")) {
        const auto& ref = j.at("extensionRef");
        a.extension_ref.ns = ref.value("namespace", std::string());
        a.extension_ref.name = ref.value("name", std::string());
    }
    a.auth_policy = opt<AuthorizationPolicy>(j, "authPolicy");
    a.fail_open = j.value("failOpen", false);
    a.response_timeout = j.value("responseTimeout", std::string());
}

void from_json(const nlohmann::json& j, CORSPolicy& c) {
    c.allow_origin = list<std::string>(j, "allowOrigin");
    c.allow_methods = list<std::string>(j, "allowMethods");
    c.allow_headers = list<std::string>(j, "allowHeaders");
    c.expose_headers = list<std::string>(j, "exposeHeaders");
    c.allow_credentials = j.value("allowCredentials", false);
    c.max_age = j.value("maxAge", std::string());
}

void from_json(const nlohmann::json& j, ProxyVirtualHost& v) {
    v.fqdn = j.value("fqdn", std::string());
    v.tls = opt<ProxyTLS>(j, "tls");
    v.authorization = opt<AuthorizationServer>(j, "authorization");
    v.rate_limit_policy = opt<RateLimitPolicy>(j, "rateLimitPolicy");
    v.cors_policy = opt<CORSPolicy>(j, "corsPolicy");
    if (j.contains("disableRouteSorting")) {
        v.disable_route_sorting = j.at("disableRouteSorting").get<bool>();
    }
}

void from_json(const nlohmann::json& j, Include& i) {
    i.name = j.value("name", std::string());
    i.ns = j.value("namespace", std::string());
    i.conditions = list<MatchCondition>(j, "conditions");
}

void from_json(const nlohmann::json& j, TCPProxyInclude& i) {
    i.name = j.value("name", std::string());
    i.ns = j.value("namespace", std::string());
}

void from_json(const nlohmann::json& j, TCPProxy& t) {
    t.services = list<ProxyService>(j, "services");
    t.include = opt<TCPProxyInclude>(j, "include");
    t.load_balancer_policy = opt<LoadBalancerPolicy>(j, "loadBalancerPolicy");
}

void from_json(const nlohmann::json& j, HTTPProxy& p) {
    const auto& spec = spec_of(j);
    p.virtualhost = opt<ProxyVirtualHost>(spec, "virtualhost");
    p.routes = list<ProxyRoute>(spec, "routes");
    p.includes = list<Include>(spec, "includes");
    p.tcpproxy = opt<TCPProxy>(spec, "tcpproxy");
}

// Ingress

void from_json(const nlohmann::json& j, IngressBackend& b) {
    if (j.contains("service")) {
        const auto& svc = j.at("service");
        b.service_name = svc.value("name", std::string());
        if (svc.contains("port")) {
            const auto& port = svc.at("port");
            b.port_number = port.value("number", 0);
            b.port_name = port.value("name", std::string());
        }
    }
}

void from_json(const nlohmann::json& j, IngressPath& p) {
    p.path = j.value("path", std::string());
    p.path_type = j.value("pathType", std::string("ImplementationSpecific"));
    if (j.contains("backend")) {
        j.at("backend").get_to(p.backend);
    }
}

void from_json(const nlohmann::json& j, IngressRule& r) {
    r.host = j.value("host", std::string());
    if (j.contains("http")) {
        r.paths = list<IngressPath>(j.at("http"), "paths");
    }
}

void from_json(const nlohmann::json& j, IngressTLS& t) {
    t.hosts = list<std::string>(j, "hosts");
    t.secret_name = j.value("secretName", std::string());
}

void from_json(const nlohmann::json& j, Ingress& i) {
    const auto& spec = spec_of(j);
    i.default_backend = opt<IngressBackend>(spec, "defaultBackend");
    i.tls = list<IngressTLS>(spec, "tls");
    i.rules = list<IngressRule>(spec, "rules");
}

// Gateway API

void from_json(const nlohmann::json& j, LabelSelectorRequirement& r) {
    r.key = j.value("key", std::string());
    r.op = j.value("operator", std::string());
    r.values = list<std::string>(j, "values");
}

void from_json(const nlohmann::json& j, LabelSelector& s) {
    s.match_labels = j.value("matchLabels", std::map<std::string, std::string>{});
    s.match_expressions = list<LabelSelectorRequirement>(j, "matchExpressions");
}

void from_json(const nlohmann::json& j, ParentReference& p) {
    p.group = j.value("group", std::string(kGatewayGroup));
    p.kind = j.value("kind", std::string("Gateway"));
    p.ns = j.value("namespace", std::string());
    p.name = j.value("name", std::string());
    p.section_name = j.value("sectionName", std::string());
    p.port = opt_int(j, "port");
}

void from_json(const nlohmann::json& j, BackendRef& b) {
    b.group = j.value("group", std::string());
    b.kind = j.value("kind", std::string("Service"));
    b.name = j.value("name", std::string());
    b.ns = j.value("namespace", std::string());
    b.port = opt_int(j, "port");
    b.weight = j.value("weight", 1);
}

void from_json(const nlohmann::json& j, SecretObjectReference& s) {
    s.group = j.value("group", std::string());
    s.kind = j.value("kind", std::string("Secret"));
    s.name = j.value("name", std::string());
    s.ns = j.value("namespace", std::string());
}

void from_json(const nlohmann::json& j, RouteGroupKind& k) {
    k.group = j.value("group", std::string(kGatewayGroup));
    k.kind = j.value("kind", std::string());
}

void from_json(const nlohmann::json& j, AllowedRoutes& a) {
    a.kinds = list<RouteGroupKind>(j, "kinds");
    if (j.contains("namespaces")) {
        const auto& ns = j.at("namespaces");
        a.from = ns.value("from", std::string("Same"));
        a.selector = opt<LabelSelector>(ns, "selector");
    }
}

void from_json(const nlohmann::json& j, GatewayTLSConfig& t) {
    t.mode = j.value("mode", std::string("Terminate"));
    t.certificate_refs = list<SecretObjectReference>(j, "certificateRefs");
}

void from_json(const nlohmann::json& j, GatewayListener& l) {
    l.name = j.value("name", std::string());
    l.hostname = j.value("hostname", std::string());
    l.port = j.value("port", 0);
    l.protocol = j.value("protocol", std::string());
    l.tls = opt<GatewayTLSConfig>(j, "tls");
    if (j.contains("allowedRoutes")) {
        j.at("allowedRoutes").get_to(l.allowed_routes);
    }
}

void from_json(const nlohmann::json& j, Gateway& g) {
    const auto& spec = spec_of(j);
    g.gateway_class_name = spec.value("gatewayClassName", std::string());
    g.listeners = list<GatewayListener>(spec, "listeners");
}

void from_json(const nlohmann::json& j, GatewayClass& g) {
    g.controller_name = spec_of(j).value("controllerName", std::string());
}

void from_json(const nlohmann::json& j, HTTPPathMatch& p) {
    p.type = j.value("type", std::string("PathPrefix"));
    p.value = j.value("value", std::string("/"));
}

void from_json(const nlohmann::json& j, HTTPHeaderMatch& h) {
    h.type = j.value("type", std::string("Exact"));
    h.name = j.value("name", std::string());
    h.value = j.value("value", std::string());
}

void from_json(const nlohmann::json& j, HTTPQueryParamMatch& q) {
    q.type = j.value("type", std::string("Exact"));
    q.name = j.value("name", std::string());
    q.value = j.value("value", std::string());
}

void from_json(const nlohmann::json& j, HTTPRouteMatch& m) {
    m.path = opt<HTTPPathMatch>(j, "path");
    m.headers = list<HTTPHeaderMatch>(j, "headers");
    m.query_params = list<HTTPQueryParamMatch>(j, "queryParams");
    m.method = j.value("method", std::string());
}

void from_json(const nlohmann::json& j, HTTPHeaderFilter& h) {
    h.set = list<HeaderValue>(j, "set");
    h.add = list<HeaderValue>(j, "add");
    h.remove = list<std::string>(j, "remove");
}

void from_json(const nlohmann::json& j, HTTPPathModifier& p) {
    p.type = j.value("type", std::string());
    p.replace_full_path = j.value("replaceFullPath", std::string());
    p.replace_prefix_match = j.value("replacePrefixMatch", std::string());
}

void from_json(const nlohmann::json& j, HTTPRequestRedirectFilter& r) {
    r.scheme = opt_string(j, "scheme");
    r.hostname = opt_string(j, "hostname");
    r.path = opt<HTTPPathModifier>(j, "path");
    r.port = opt_int(j, "port");
    r.status_code = j.value("statusCode", 302);
}

void from_json(const nlohmann::json& j, HTTPURLRewriteFilter& r) {
    r.hostname = opt_string(j, "hostname");
    r.path = opt<HTTPPathModifier>(j, "path");
}

void from_json(const nlohmann::json& j, HTTPRequestMirrorFilter& m) {
    if (j.contains("backendRef")) {
        j.at("backendRef").get_to(m.backend_ref);
    }
}

void from_json(const nlohmann::json& j, HTTPRouteFilter& f) {
    f.type = j.value("type", std::string());
    f.request_header_modifier = opt<HTTPHeaderFilter>(j, "requestHeaderModifier");
    f.response_header_modifier = opt<HTTPHeaderFilter>(j, "responseHeaderModifier");
    f.request_redirect = opt<HTTPRequestRedirectFilter>(j, "requestRedirect");
    f.url_rewrite = opt<HTTPURLRewriteFilter>(j, "urlRewrite");
    f.request_mirror = opt<HTTPRequestMirrorFilter>(j, "requestMirror");
}

void from_json(const nlohmann::json& j, HTTPRouteTimeouts& t) {
    t.request = j.value("request", std::string());
    t.backend_request = j.value("backendRequest", std::string());
}

void from_json(const nlohmann::json& j, HTTPRouteRule& r) {
    r.matches = list<HTTPRouteMatch>(j, "matches");
    r.filters = list<HTTPRouteFilter>(j, "filters");
    r.backend_refs = list<BackendRef>(j, "backendRefs");
    r.timeouts = opt<HTTPRouteTimeouts>(j, "timeouts");
}

void from_json(const nlohmann::json& j, HTTPRoute& r) {
    const auto& spec = spec_of(j);
    r.parent_refs = list<ParentReference>(spec, "parentRefs");
    r.hostnames = list<std::string>(spec, "hostnames");
    r.rules = list<HTTPRouteRule>(spec, "rules");
}

void from_json(const nlohmann::json& j, GRPCMethodMatch& m) {
    m.type = j.value("type", std::string("Exact"));
    m.service = j.value("service", std::string());
    m.method = j.value("method", std::string());
}

void from_json(const nlohmann::json& j, GRPCRouteMatch& m) {
    m.method = opt<GRPCMethodMatch>(j, "method");
    m.headers = list<HTTPHeaderMatch>(j, "headers");
}

void from_json(const nlohmann::json& j, GRPCRouteRule& r) {
    r.matches = list<GRPCRouteMatch>(j, "matches");
    r.filters = list<HTTPRouteFilter>(j, "filters");
    r.backend_refs = list<BackendRef>(j, "backendRefs");
}

void from_json(const nlohmann::json& j, GRPCRoute& r) {
    const auto& spec = spec_of(j);
    r.parent_refs = list<ParentReference>(spec, "parentRefs");
    r.hostnames = list<std::string>(spec, "hostnames");
    r.rules = list<GRPCRouteRule>(spec, "rules");
}

void from_json(const nlohmann::json& j, L4RouteRule& r) {
    r.backend_refs = list<BackendRef>(j, "backendRefs");
}

void from_json(const nlohmann::json& j, TLSRoute& r) {
    const auto& spec = spec_of(j);
    r.parent_refs = list<ParentReference>(spec, "parentRefs");
    r.hostnames = list<std::string>(spec, "hostnames");
    r.rules = list<L4RouteRule>(spec, "rules");
}

void from_json(const nlohmann::json& j, TCPRoute& r) {
    const auto& spec = spec_of(j);
    r.parent_refs = list<ParentReference>(spec, "parentRefs");
    r.rules = list<L4RouteRule>(spec, "rules");
}

void from_json(const nlohmann::json& j, ReferenceGrantFrom& f) {
    f.group = j.value("group", std::string());
    f.kind = j.value("kind", std::string());
    f.ns = j.value("namespace", std::string());
}

void from_json(const nlohmann::json& j, ReferenceGrantTo& t) {
    t.group = j.value("group", std::string());
    t.kind = j.value("kind", std::string());
    t.name = j.value("name", std::string());
}

void from_json(const nlohmann::json& j, ReferenceGrant& g) {
    const auto& spec = spec_of(j);
    g.from = list<ReferenceGrantFrom>(spec, "from");
    g.to = list<ReferenceGrantTo>(spec, "to");
}

// Core objects

void from_json(const nlohmann::json& j, Secret& s) {
    s.type = j.value("type", std::string(core::kSecretTypeOpaque));
    if (j.contains("data")) {
        for (const auto& [key, value] : j.at("data").items()) {
            auto decoded = base64_decode(value.get<std::string>());
            if (!decoded) {
                throw std::invalid_argument(fmt::format("data.{} is not valid base64", key));
            }
            s.data[key] = std::move(*decoded);
        }
    }
    // stringData wins over data for the same key
    if (j.contains("stringData")) {
        for (const auto& [key, value] : j.at("stringData").items()) {
            s.data[key] = value.get<std::string>();
        }
    }
}

void from_json(const nlohmann::json& j, ServicePort& p) {
    p.name = j.value("name", std::string());
    p.port = j.value("port", 0);
    p.protocol = j.value("protocol", std::string("TCP"));
    p.app_protocol = j.value("appProtocol", std::string());
}

void from_json(const nlohmann::json& j, Service& s) {
    const auto& spec = spec_of(j);
    s.type = spec.value("type", std::string("ClusterIP"));
    s.external_name = spec.value("externalName", std::string());
    s.ports = list<ServicePort>(spec, "ports");
}

void from_json(const nlohmann::json& /*j*/, Namespace& /*n*/) {}

void from_json(const nlohmann::json& j, CertificateDelegation& d) {
    d.secret_name = j.value("secretName", std::string());
    d.target_namespaces = list<std::string>(j, "targetNamespaces");
}

void from_json(const nlohmann::json& j, TLSCertificateDelegation& t) {
    t.delegations = list<CertificateDelegation>(spec_of(j), "delegations");
}

void from_json(const nlohmann::json& j, ExtensionService& e) {
    const auto& spec = spec_of(j);
    e.services = list<ProxyService>(spec, "services");
    e.protocol = spec.value("protocol", std::string());
    e.timeout_policy = opt<TimeoutPolicy>(spec, "timeoutPolicy");
    e.load_balancer_policy = opt<LoadBalancerPolicy>(spec, "loadBalancerPolicy");
}

namespace {

template <typename T>
Object decode_as(const nlohmann::json& j) {
    T object;
    from_json(j, object);
    if (j.contains("metadata")) {
        j.at("metadata").get_to(object.metadata);
    }
    return Object{std::move(object)};
}

}  // namespace

std::optional<Object> decode_object(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "object is not a JSON object";
        return std::nullopt;
    }

    std::string kind_name = j.value("kind", std::string());
    std::string name = j.contains("metadata") ? j.at("metadata").value("name", std::string()) : "";

    try {
        switch (parse_kind(kind_name)) {
            case Kind::HTTPProxy:
                return decode_as<HTTPProxy>(j);
            case Kind::Ingress:
                return decode_as<Ingress>(j);
            case Kind::Gateway:
                return decode_as<Gateway>(j);
            case Kind::GatewayClass:
                return decode_as<GatewayClass>(j);
            case Kind::HTTPRoute:
                return decode_as<HTTPRoute>(j);
            case Kind::GRPCRoute:
                return decode_as<GRPCRoute>(j);
            case Kind::TLSRoute:
                return decode_as<TLSRoute>(j);
            case Kind::TCPRoute:
                return decode_as<TCPRoute>(j);
            case Kind::ReferenceGrant:
                return decode_as<ReferenceGrant>(j);
            case Kind::Secret:
                return decode_as<Secret>(j);
            case Kind::Service:
                return decode_as<Service>(j);
            case Kind::Namespace:
                return decode_as<Namespace>(j);
            case Kind::TLSCertificateDelegation:
                return decode_as<TLSCertificateDelegation>(j);
            case Kind::ExtensionService:
                return decode_as<ExtensionService>(j);
            case Kind::Unknown:
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        error = fmt::format("{} '{}': {}", kind_name, name, e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        error = fmt::format("{} '{}': {}", kind_name, name, e.what());
        return std::nullopt;
    }

    error = fmt::format("unsupported kind '{}' for '{}'", kind_name, name);
    return std::nullopt;
}

LoadResult load_objects_from_json(std::string_view json) {
    LoadResult result;

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("JSON parsing error: {}", e.what()));
        return result;
    }

    const nlohmann::json* items = &root;
    if (root.is_object()) {
        if (!root.contains("items") || !root.at("items").is_array()) {
            result.errors.emplace_back("object list must have an \"items\" array");
            return result;
        }
        items = &root.at("items");
    } else if (!root.is_array()) {
        result.errors.emplace_back("object list must be an array or {\"items\": [...]}");
        return result;
    }

    for (const auto& item : *items) {
        std::string error;
        auto object = decode_object(item, error);
        if (object) {
            result.objects.push_back(std::move(*object));
        } else {
            result.errors.push_back(std::move(error));
        }
    }
    return result;
}

LoadResult load_objects_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        LoadResult result;
        result.errors.push_back("Cannot open object file: " + path_str);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_objects_from_json(buffer.str());
}

std::optional<std::string> base64_decode(std::string_view input) {
    std::string compact;
    compact.reserve(input.size());
    for (char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string out(compact.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as output bytes
    size_t padding = 0;
    if (compact.back() == '=') {
        ++padding;
        if (compact[compact.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::optional<int64_t> parse_rfc3339(std::string_view value) {
    // YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
    if (value.size() < 20) {
        return std::nullopt;
    }
    std::string text{value};
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }

    int64_t offset = 0;
    if (text[pos] == 'Z' || text[pos] == 'z') {
        if (pos + 1 != text.size()) {
            return std::nullopt;
        }
    } else if (text[pos] == '+' || text[pos] == '-') {
        int hours = 0;
        int minutes = 0;
        if (text.size() - pos != 6 ||
            std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
            return std::nullopt;
        }
        offset = (hours * 3600 + minutes * 60) * (text[pos] == '+' ? 1 : -1);
    } else {
        return std::nullopt;
    }

    return static_cast<int64_t>(timegm(&tm)) - offset;
}

}  // namespace lattice::source
