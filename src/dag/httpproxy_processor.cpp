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


// Lattice HTTPProxy Processor - Implementation

#include "httpproxy_processor.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "extensions.hpp"
#include "policy.hpp"

namespace lattice::dag {

namespace {

constexpr std::string_view kRegexWarning = "RegexProgramSizeWarning";

bool is_blank(std::string_view s) {
    return core::trim(s).empty();
}

std::vector<source::MatchCondition> concat(const std::vector<source::MatchCondition>& a,
                                           const std::vector<source::MatchCondition>& b) {
    std::vector<source::MatchCondition> out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

std::string visited_path(const std::vector<const source::HTTPProxy*>& visited,
                         const source::HTTPProxy& next) {
    std::vector<std::string> path;
    path.reserve(visited.size() + 1);
    for (const auto* hp : visited) {
        path.push_back(hp->metadata.key().str());
    }
    path.push_back(next.metadata.key().str());
    return core::join(path, " -> ");
}

bool contains_proxy(const std::vector<const source::HTTPProxy*>& visited,
                    const source::HTTPProxy& proxy) {
    return std::any_of(visited.begin(), visited.end(), [&](const source::HTTPProxy* hp) {
        return hp->metadata.key() == proxy.metadata.key();
    });
}

source::ObjectRef ref_of(const source::HTTPProxy& proxy) {
    return source::ObjectRef::of(source::Kind::HTTPProxy, proxy.metadata);
}

std::optional<CORSPolicy> cors_from(const std::optional<source::CORSPolicy>& policy,
                                    std::string& error) {
    if (!policy) {
        return std::nullopt;
    }
    if (!policy->max_age.empty() && policy->max_age != "0" &&
        !core::parse_duration(policy->max_age)) {
        error = fmt::format("invalid max age value \"{}\"", policy->max_age);
        return std::nullopt;
    }
    if (std::find(policy->allow_origin.begin(), policy->allow_origin.end(), "*") !=
            policy->allow_origin.end() &&
        policy->allow_origin.size() > 1) {
        error = "wildcard origin must be the only allowed origin";
        return std::nullopt;
    }
    return CORSPolicy{policy->allow_origin,  policy->allow_methods,     policy->allow_headers,
                      policy->expose_headers, policy->allow_credentials, policy->max_age};
}

}  // namespace

// ============================
// Run
// ============================

void HTTPProxyProcessor::run(BuildContext& ctx, Dag& fragment) {
    ctx_ = &ctx;
    fragment_ = &fragment;
    orphaned_.clear();

    for (const auto& [key, proxy] : ctx.cache.all<source::HTTPProxy>()) {
        if (!proxy.virtualhost) {
            orphaned_.insert(key);
        }
    }

    for (const auto* root : valid_roots()) {
        compute_proxy(*root);
    }

    for (const auto& key : orphaned_) {
        const auto* proxy = ctx.cache.get<source::HTTPProxy>(key);
        if (!proxy) {
            continue;
        }
        ctx.status.orphan(ref_of(*proxy));
        if (ctx.logger) {
            LOG_OBJECT_ERROR(ctx.logger, "HTTPProxy", key.ns, key.name, kOrphanedMessage);
        }
    }

    ctx_ = nullptr;
    fragment_ = nullptr;
}

std::vector<const source::HTTPProxy*> HTTPProxyProcessor::valid_roots() {
    std::vector<const source::HTTPProxy*> valid;
    std::map<std::string, std::vector<const source::HTTPProxy*>> by_fqdn;

    for (const auto& [key, proxy] : ctx_->cache.all<source::HTTPProxy>()) {
        if (!proxy.virtualhost) {
            continue;
        }
        if (is_blank(proxy.virtualhost->fqdn)) {
            valid.push_back(&proxy);
            continue;
        }
        by_fqdn[core::to_lower(proxy.virtualhost->fqdn)].push_back(&proxy);
    }

    for (const auto& [fqdn, proxies] : by_fqdn) {
        if (proxies.size() == 1) {
            valid.push_back(proxies.front());
            continue;
        }
        std::vector<std::string> conflicting;
        for (const auto* proxy : proxies) {
            conflicting.push_back(proxy->metadata.key().str());
        }
        std::sort(conflicting.begin(), conflicting.end());
        auto msg = fmt::format("fqdn \"{}\" is used in multiple HTTPProxies: {}", fqdn,
                               core::join(conflicting, ", "));
        for (const auto* proxy : proxies) {
            reject(*proxy, status_of(*proxy), kVirtualHostError, "DuplicateVhost", msg);
        }
    }

    // Cache order keeps the walk independent of fqdn grouping
    std::sort(valid.begin(), valid.end(), [](const auto* a, const auto* b) {
        return a->metadata.key() < b->metadata.key();
    });
    return valid;
}

// ============================
// Roots
// ============================

void HTTPProxyProcessor::compute_proxy(const source::HTTPProxy& proxy) {
    auto& status = status_of(proxy);
    const auto& vh = *proxy.virtualhost;
    const auto& config = ctx_->config;

    if (is_blank(vh.fqdn)) {
        reject(proxy, status, kVirtualHostError, "FQDNNotSpecified",
               "Spec.VirtualHost.Fqdn must be specified");
        return;
    }
    std::string host = core::to_lower(vh.fqdn);
    if (!valid_hostname(host)) {
        reject(proxy, status, kVirtualHostError, "FQDNNotValid",
               fmt::format("Spec.VirtualHost.Fqdn \"{}\" is not a valid hostname", vh.fqdn));
        return;
    }

    if (!root_allowed(proxy.metadata.ns)) {
        reject(proxy, status, kRootNamespaceError, "RootProxyNotAllowedInNamespace",
               "root HTTPProxy cannot be defined in this namespace");
        return;
    }

    if (proxy.routes.empty() && proxy.includes.empty() && !proxy.tcpproxy) {
        reject(proxy, status, kSpecError, "NothingDefined",
               "HTTPProxy.Spec must have at least one Route, Include, or a TCPProxy");
        return;
    }

    if (!vh.tls && vh.authorization && !vh.authorization->extension_ref.name.empty()) {
        reject(proxy, status, kAuthError, "AuthNotPermitted",
               "Spec.VirtualHost.Authorization.ExtensionServiceRef can only be defined for root "
               "HTTPProxies that terminate TLS");
        return;
    }

    RootContext root;
    root.proxy = &proxy;

    std::optional<TlsSettings> tls;
    if (vh.tls) {
        if (!compute_tls(proxy, status, tls)) {
            return;
        }
        root.tls_enabled = true;
    }

    if (!compute_authorization(proxy, status, root)) {
        return;
    }

    std::optional<TCPProxy> tcp;
    if (proxy.tcpproxy) {
        if (!root.tls_enabled) {
            reject(proxy, status, kTcpProxyError, "TLSMustBeConfigured",
                   "Spec.TCPProxy requires that either Spec.TLS.Passthrough or "
                   "Spec.TLS.SecretName be set");
            return;
        }
        TCPProxy target;
        if (!compute_tcp_proxy(proxy, status, {}, target)) {
            return;
        }
        tcp = std::move(target);
    }

    std::string error;
    if (!validate_rate_limit(vh.rate_limit_policy, error)) {
        reject(proxy, status, kVirtualHostError, "RateLimitPolicyNotValid",
               fmt::format("Spec.VirtualHost.RateLimitPolicy is invalid: {}", error));
        return;
    }

    auto cors = cors_from(vh.cors_policy, error);
    if (!error.empty()) {
        reject(proxy, status, kCorsError, "PolicyDidNotParse",
               fmt::format("Spec.VirtualHost.CORSPolicy: {}", error));
        return;
    }

    auto routes = compute_routes(root, proxy, status, {}, {});

    auto configure = [&](VirtualHost& vhost) {
        vhost.source = ref_of(proxy);
        vhost.cors = cors;
        vhost.external_auth = root.auth;
        vhost.http_filters = http_filter_order(config.policy.auth_before_rate_limit);
        vhost.sorting_disabled = vh.disable_route_sorting.value_or(config.dag.disable_route_sorting);
    };

    if (!routes.empty()) {
        auto& insecure = fragment_->ensure_virtual_host(Protocol::HTTP, kInsecurePort, host);
        configure(insecure);
        for (const auto& route : routes) {
            (void)fragment_->add_route(insecure, route);
        }
    }

    if (tcp) {
        auto& secure = fragment_->ensure_virtual_host(Protocol::HTTPS, kSecurePort, host);
        configure(secure);
        secure.tls = tls;
        secure.tcp_proxy = std::move(tcp);
        return;
    }

    if (tls && !routes.empty()) {
        auto& secure = fragment_->ensure_virtual_host(Protocol::HTTPS, kSecurePort, host);
        configure(secure);
        secure.tls = tls;
        for (auto& route : routes) {
            route.https_redirect = false;
            (void)fragment_->add_route(secure, std::move(route));
        }
    }
}

bool HTTPProxyProcessor::compute_tls(const source::HTTPProxy& proxy, ObjectStatus& status,
                                     std::optional<TlsSettings>& out) {
    const auto& vh = *proxy.virtualhost;
    const auto& tls = *vh.tls;
    const auto& ns = proxy.metadata.ns;

    if (tls.passthrough && tls.enable_fallback_certificate) {
        reject(proxy, status, kTlsError, "TLSIncompatibleFeatures",
               "Spec.VirtualHost.TLS: both Passthrough and enableFallbackCertificate were "
               "specified");
    }
    if (!is_blank(tls.secret_name) && tls.passthrough) {
        reject(proxy, status, kTlsError, "TLSConfigNotValid",
               "Spec.VirtualHost.TLS: both Passthrough and SecretName were specified");
        return false;
    }
    if (is_blank(tls.secret_name) && !tls.passthrough) {
        reject(proxy, status, kTlsError, "TLSConfigNotValid",
               "Spec.VirtualHost.TLS: neither Passthrough nor SecretName were specified");
        return false;
    }
    if (tls.passthrough && tls.client_validation) {
        reject(proxy, status, kTlsError, "TLSIncompatibleFeatures",
               "Spec.VirtualHost.TLS passthrough cannot be combined with tls.clientValidation");
        return false;
    }
    if (tls.passthrough) {
        // SNI passthrough: no termination settings
        return true;
    }

    TlsSettings settings;
    auto secret = source::parse_namespaced_name(tls.secret_name, ns);
    auto ec = ctx_->secrets.resolve(secret, SecretUsage::Tls, ns, *fragment_, settings.secret);
    if (ec == core::SecretError::DelegationNotPermitted) {
        reject(proxy, status, kTlsError, "DelegationNotPermitted",
               fmt::format("Spec.VirtualHost.TLS Secret \"{}\" certificate delegation not "
                           "permitted",
                           tls.secret_name));
        return false;
    }
    if (ec == core::SecretError::NotFound) {
        reject(proxy, status, kTlsError, "SecretNotFound",
               fmt::format("Spec.VirtualHost.TLS Secret \"{}\" not found", tls.secret_name));
        return false;
    }
    if (ec) {
        reject(proxy, status, kTlsError, "SecretNotValid",
               fmt::format("Spec.VirtualHost.TLS Secret \"{}\" is invalid: {}", tls.secret_name,
                           ec.message()));
        return false;
    }

    auto min_version = core::parse_tls_version(tls.minimum_protocol_version);
    auto max_version = core::parse_tls_version(tls.maximum_protocol_version);
    if (!min_version || !max_version) {
        reject(proxy, status, kTlsError, "TLSConfigNotValid",
               "Spec.VirtualHost.TLS protocol versions must be 1.2 or 1.3");
        return false;
    }
    if (*min_version != core::TlsVersion::Unspecified) {
        settings.min_version = *min_version;
    }
    if (*max_version != core::TlsVersion::Unspecified) {
        settings.max_version = *max_version;
    }
    if (settings.max_version < settings.min_version) {
        reject(proxy, status, kTlsError, "TLSConfigNotValid",
               "Spec.Virtualhost.TLS the minimum protocol version is greater than the maximum "
               "protocol version");
        return false;
    }

    if (tls.enable_fallback_certificate && tls.client_validation) {
        reject(proxy, status, kTlsError, "TLSIncompatibleFeatures",
               "Spec.Virtualhost.TLS fallback & client validation are incompatible");
        return false;
    }
    bool authorization_configured =
        vh.authorization && !vh.authorization->extension_ref.name.empty();
    if (tls.enable_fallback_certificate && authorization_configured) {
        reject(proxy, status, kTlsError, "TLSIncompatibleFeatures",
               "Spec.Virtualhost.TLS fallback & client authorization are incompatible");
        return false;
    }

    if (tls.enable_fallback_certificate) {
        const auto& fallback = ctx_->config.dag.fallback_certificate;
        if (fallback.empty()) {
            reject(proxy, status, kTlsError, "FallbackNotPresent",
                   "Spec.Virtualhost.TLS enabled fallback but the fallback Certificate Secret is "
                   "not configured in the configuration file");
            return false;
        }
        auto name = source::parse_namespaced_name(fallback, "");
        ec = ctx_->secrets.resolve(name, SecretUsage::Tls, ns, *fragment_,
                                   settings.fallback_secret);
        if (ec == core::SecretError::DelegationNotPermitted) {
            reject(proxy, status, kTlsError, "FallbackNotDelegated",
                   fmt::format("Spec.VirtualHost.TLS Secret \"{}\" is not configured for "
                               "certificate delegation",
                               fallback));
            return false;
        }
        if (ec) {
            reject(proxy, status, kTlsError, "FallbackNotValid",
                   fmt::format("Spec.Virtualhost.TLS Secret \"{}\" fallback certificate is "
                               "invalid: {}",
                               fallback, ec.message()));
            return false;
        }
    }

    if (tls.client_validation) {
        const auto& cv = *tls.client_validation;
        ClientValidation validation;
        validation.skip_verification = cv.skip_client_cert_validation;
        validation.optional_certificate = cv.optional_client_certificate;

        if (!cv.ca_secret.empty()) {
            auto name = source::parse_namespaced_name(cv.ca_secret, ns);
            ec = ctx_->secrets.resolve(name, SecretUsage::Ca, ns, *fragment_,
                                       validation.ca_secret);
            if (ec == core::SecretError::DelegationNotPermitted) {
                reject(proxy, status, kTlsError, "DelegationNotPermitted",
                       fmt::format("Spec.VirtualHost.TLS CA Secret \"{}\" is invalid: {}",
                                   cv.ca_secret, ec.message()));
                return false;
            }
            if (ec) {
                reject(proxy, status, kTlsError, "ClientValidationInvalid",
                       fmt::format("Spec.VirtualHost.TLS client validation is invalid: invalid "
                                   "CA Secret \"{}\": {}",
                                   name.str(), ec.message()));
                return false;
            }
        } else if (!cv.skip_client_cert_validation) {
            reject(proxy, status, kTlsError, "ClientValidationInvalid",
                   "Spec.VirtualHost.TLS client validation is invalid: CA Secret must be "
                   "specified");
        }

        if (!cv.crl_secret.empty()) {
            auto name = source::parse_namespaced_name(cv.crl_secret, ns);
            ec = ctx_->secrets.resolve(name, SecretUsage::Crl, ns, *fragment_,
                                       validation.crl_secret);
            if (ec == core::SecretError::DelegationNotPermitted) {
                reject(proxy, status, kTlsError, "DelegationNotPermitted",
                       fmt::format("Spec.VirtualHost.TLS CRL Secret \"{}\" is invalid: {}",
                                   cv.crl_secret, ec.message()));
                return false;
            }
            if (ec) {
                reject(proxy, status, kTlsError, "ClientValidationInvalid",
                       fmt::format("Spec.VirtualHost.TLS client validation is invalid: invalid "
                                   "CRL Secret \"{}\": {}",
                                   name.str(), ec.message()));
                return false;
            }
        }
        settings.client_validation = std::move(validation);
    }

    out = std::move(settings);
    return true;
}

bool HTTPProxyProcessor::compute_authorization(const source::HTTPProxy& proxy,
                                               ObjectStatus& status, RootContext& root) {
    const auto& vh = *proxy.virtualhost;
    const auto& global = ctx_->config.policy.global_external_auth;

    // Route policy overrides the virtual host, which overrides the global default
    if (global) {
        root.auth_disabled = global->auth_policy.disabled;
    }
    if (vh.authorization && vh.authorization->auth_policy) {
        root.auth_disabled = vh.authorization->auth_policy->disabled;
    }

    if (vh.authorization && !vh.authorization->extension_ref.name.empty()) {
        const auto& server = *vh.authorization;
        ExternalAuth auth;
        auth.service = server.extension_ref;
        if (auth.service.ns.empty()) {
            auth.service.ns = proxy.metadata.ns;
        }
        auto ec = ctx_->extensions.resolve(auth.service, *fragment_, auth.cluster);
        if (ec == ExtensionError::NotFound) {
            reject(proxy, status, kAuthError, "ExtensionServiceNotFound",
                   fmt::format("Spec.Virtualhost.Authorization.ServiceRef extension service "
                               "\"{}\" not found",
                               auth.service.str()));
            return false;
        }
        if (ec) {
            reject(proxy, status, kAuthError, "ExtensionServiceNotValid",
                   fmt::format("Spec.Virtualhost.Authorization.ServiceRef extension service "
                               "\"{}\" is invalid, see its status for details",
                               auth.service.str()));
            return false;
        }
        auth.fail_open = server.fail_open;
        if (!server.response_timeout.empty()) {
            if (server.response_timeout == "infinity") {
                auth.response_timeout = std::chrono::milliseconds{0};
            } else {
                auth.response_timeout = core::parse_duration(server.response_timeout);
                if (!auth.response_timeout) {
                    reject(proxy, status, kAuthError, "AuthResponseTimeoutInvalid",
                           fmt::format("Spec.Virtualhost.Authorization.ResponseTimeout is "
                                       "invalid: \"{}\"",
                                       server.response_timeout));
                    return false;
                }
            }
        } else {
            auth.response_timeout = fragment_->extensions.at(auth.cluster).response_timeout;
        }
        if (server.auth_policy) {
            auth.context = server.auth_policy->context;
        }
        root.auth = std::move(auth);
        return true;
    }

    root.auth = default_auth(ctx_->config.policy);
    if (!root.auth) {
        return true;
    }
    auto ec = ctx_->extensions.resolve(root.auth->service, *fragment_, root.auth->cluster);
    if (ec) {
        reject(proxy, status, kAuthError,
               ec == ExtensionError::NotFound ? "ExtensionServiceNotFound"
                                              : "ExtensionServiceNotValid",
               fmt::format("policy.global_external_auth extension service \"{}\": {}",
                           root.auth->service.str(), ec.message()));
        return false;
    }
    if (!root.auth->response_timeout) {
        const auto& extension = fragment_->extensions.at(root.auth->cluster);
        root.auth->response_timeout = extension.response_timeout;
    }
    return true;
}

// ============================
// Includes and routes
// ============================

std::vector<Route> HTTPProxyProcessor::compute_routes(const RootContext& root,
                                                      const source::HTTPProxy& proxy,
                                                      ObjectStatus& status,
                                                      const Conditions& inherited,
                                                      Visited visited) {
    if (contains_proxy(visited, proxy)) {
        reject(proxy, status, kIncludeError, "IncludeCreatesCycle",
               fmt::format("include creates an include cycle: {}", visited_path(visited, proxy)));
        return {};
    }
    visited.push_back(&proxy);

    std::vector<Route> routes;
    std::vector<const Conditions*> seen;
    const auto& limits = ctx_->regex_limits;

    for (const auto& include : proxy.includes) {
        std::string ns = include.ns.empty() ? proxy.metadata.ns : include.ns;
        std::vector<std::string> warnings;

        if (auto err = path_conditions_error(include.conditions, false, limits, warnings)) {
            reject(proxy, status, kIncludeError, err->reason,
                   fmt::format("include: {}", err->message));
            continue;
        }
        if (auto err = header_conditions_error(include.conditions, limits, warnings)) {
            reject(proxy, status, kRouteError, err->reason, err->message);
            continue;
        }
        if (auto err = query_conditions_error(include.conditions, limits, warnings)) {
            reject(proxy, status, kRouteError, err->reason, err->message);
            continue;
        }
        for (const auto& w : warnings) {
            status.add_warning(kIncludeError, kRegexWarning, w);
        }

        // Whole-set comparison against every earlier include of this proxy
        if (!is_default_include(include.conditions)) {
            bool duplicate = std::any_of(seen.begin(), seen.end(), [&](const Conditions* s) {
                return include_conditions_identical(*s, include.conditions);
            });
            if (duplicate) {
                reject(proxy, status, kIncludeError, "DuplicateMatchConditions",
                       "duplicate conditions defined on an include");
                continue;
            }
            seen.push_back(&include.conditions);
        }

        auto merged = concat(inherited, include.conditions);

        const auto* child = ctx_->cache.get<source::HTTPProxy>({ns, include.name});
        if (!child) {
            reject(proxy, status, kIncludeError, "IncludeNotFound",
                   fmt::format("include {}/{} not found", ns, include.name));
            if (!include.conditions.empty()) {
                routes.push_back(bad_gateway_route(merged, proxy));
            }
            continue;
        }
        if (child->virtualhost) {
            reject(proxy, status, kIncludeError, "RootIncludesRoot",
                   fmt::format("root httpproxy cannot include another root httpproxy ({}/{})",
                               child->metadata.ns, child->metadata.name));
            if (!include.conditions.empty()) {
                routes.push_back(bad_gateway_route(merged, proxy));
            }
            continue;
        }

        auto child_routes = compute_routes(root, *child, status_of(*child), merged, visited);
        std::move(child_routes.begin(), child_routes.end(), std::back_inserter(routes));

        orphaned_.erase(child->metadata.key());
    }

    for (const auto& spec : proxy.routes) {
        Route route;
        if (!compute_route(root, proxy, status, inherited, spec, route)) {
            return {};
        }
        routes.push_back(std::move(route));
    }

    return expand_prefix_matches(std::move(routes));
}

bool HTTPProxyProcessor::compute_route(const RootContext& root, const source::HTTPProxy& proxy,
                                       ObjectStatus& status, const Conditions& inherited,
                                       const source::ProxyRoute& spec, Route& route) {
    const auto& config = ctx_->config;
    const auto& limits = ctx_->regex_limits;
    const auto& vh = *root.proxy->virtualhost;

    int actions = (spec.services.empty() ? 0 : 1) + (spec.request_redirect_policy ? 1 : 0) +
                  (spec.direct_response_policy ? 1 : 0);
    if (actions != 1) {
        reject(proxy, status, kRouteError, "RouteActionCountNotValid",
               "must set exactly one of route.services or route.requestRedirectPolicy or "
               "route.directResponsePolicy");
        return false;
    }

    std::vector<std::string> warnings;
    if (auto err = path_conditions_error(spec.conditions, true, limits, warnings)) {
        reject(proxy, status, kRouteError, err->reason, fmt::format("route: {}", err->message));
        return false;
    }

    auto conditions = concat(inherited, spec.conditions);
    if (auto err = header_conditions_error(conditions, limits, warnings)) {
        reject(proxy, status, kRouteError, err->reason, err->message);
        return false;
    }
    if (auto err = query_conditions_error(conditions, limits, warnings)) {
        reject(proxy, status, kRouteError, err->reason, err->message);
        return false;
    }
    for (const auto& w : warnings) {
        status.add_warning(kRouteError, kRegexWarning, w);
    }

    std::string error;
    HeadersPolicy request_headers;
    if (spec.request_headers_policy) {
        auto policy = checked_headers_from(*spec.request_headers_policy, true, route.host_rewrite,
                                           error);
        if (!policy) {
            reject(proxy, status, kRouteError, "RequestHeadersPolicyInvalid",
                   fmt::format("{} on request headers", error));
            return false;
        }
        request_headers = std::move(*policy);
    }
    HeadersPolicy response_headers;
    if (spec.response_headers_policy) {
        std::optional<std::string> unused;
        auto policy = checked_headers_from(*spec.response_headers_policy, false, unused, error);
        if (!policy) {
            reject(proxy, status, kRouteError, "ResponseHeaderPolicyInvalid",
                   fmt::format("{} on response headers", error));
            return false;
        }
        response_headers = std::move(*policy);
    }

    if (spec.timeout_policy) {
        auto timeouts = timeout_policy_from(*spec.timeout_policy, error);
        if (!timeouts) {
            reject(proxy, status, kRouteError, "TimeoutPolicyNotValid",
                   fmt::format("route.timeoutPolicy failed to parse: {}", error));
            return false;
        }
        route.timeouts = *timeouts;
    }
    if (spec.retry_policy) {
        route.retry = retry_policy_from(*spec.retry_policy, error);
        if (!route.retry) {
            reject(proxy, status, kRouteError, "RetryPolicyNotValid",
                   fmt::format("route.retryPolicy failed to parse: {}", error));
            return false;
        }
    }

    error.clear();
    route.rate_limit = resolve_rate_limit(config.policy.global_rate_limit, vh.rate_limit_policy,
                                          spec.rate_limit_policy, error);
    if (!error.empty()) {
        reject(proxy, status, kRouteError, "RateLimitPolicyNotValid",
               fmt::format("route.rateLimitPolicy is invalid: {}", error));
        return false;
    }

    std::string strategy;
    if (spec.load_balancer_policy) {
        strategy = spec.load_balancer_policy->strategy;
        if (!valid_load_balancer_strategy(strategy)) {
            status.add_warning(kSpecError, "IgnoredField",
                               fmt::format("ignoring field \"Spec.Route.LoadBalancerPolicy\"; "
                                           "unknown strategy \"{}\"",
                                           strategy));
            strategy.clear();
        }
    }

    if (spec.request_redirect_policy) {
        route.redirect = redirect_from(*spec.request_redirect_policy, error);
        if (!route.redirect) {
            reject(proxy, status, kRouteError, "RequestRedirectPolicy",
                   fmt::format("route.requestRedirectPolicy is invalid: {}", error));
            return false;
        }
    }
    if (spec.direct_response_policy) {
        route.direct_response = DirectResponse{spec.direct_response_policy->status_code,
                                               spec.direct_response_policy->body};
    }

    route.match.path = merge_path_conditions(inherited, spec.conditions);
    route.match.headers = header_matches_from(conditions);
    route.match.query_params = query_matches_from(conditions);
    route.websocket = spec.enable_websockets;
    route.https_redirect = root.tls_enabled && !spec.permit_insecure;
    route.request_headers = merge_headers(headers_from(config.policy.request_headers),
                                          request_headers);
    route.response_headers = merge_headers(headers_from(config.policy.response_headers),
                                           response_headers);
    route.source = ref_of(proxy);

    if (root.auth) {
        bool disabled = spec.auth_policy ? spec.auth_policy->disabled : root.auth_disabled;
        if (!disabled) {
            route.external_auth = resolve_auth(root.auth, spec.auth_policy);
        }
    }

    if (spec.path_rewrite_policy && !spec.path_rewrite_policy->replace_prefix.empty()) {
        const auto& replacements = spec.path_rewrite_policy->replace_prefix;
        if (route.match.path.kind != PathMatchKind::Prefix) {
            reject(proxy, status, kPrefixReplaceError, "MustHavePrefix",
                   "cannot specify prefix replacements without a prefix condition");
            return false;
        }
        if (auto err = prefix_replacement_error(replacements)) {
            reject(proxy, status, kPrefixReplaceError, err->reason, err->message);
            return false;
        }
        route.prefix_rewrite = prefix_rewrite_for(replacements, route.match.path.value);
    }

    for (const auto& svc : spec.services) {
        if (svc.port < 1 || svc.port > 65535) {
            reject(proxy, status, kServiceError, "ServicePortInvalid",
                   fmt::format("service \"{}\": port must be in the range 1-65535", svc.name));
            return false;
        }

        auto service = lookup_service(ctx_->cache, {proxy.metadata.ns, svc.name}, svc.port, "",
                                      config.dag.enable_external_name_service, error);
        if (!service) {
            reject(proxy, status, kServiceError, "ServiceUnresolvedReference",
                   fmt::format("Spec.Routes unresolved service reference: {}", error));
            continue;
        }

        std::string protocol = svc.protocol;
        if (protocol.empty()) {
            protocol = upstream_protocol(ctx_->cache, *service);
        } else if (protocol != "h2" && protocol != "h2c" && protocol != "tls") {
            reject(proxy, status, kServiceError, "UnsupportedProtocol",
                   fmt::format("unsupported protocol: {}", protocol));
            return false;
        }

        std::optional<UpstreamValidation> validation;
        if ((protocol == "tls" || protocol == "h2") && svc.validation) {
            if (!compute_upstream_validation(proxy, status, svc, validation)) {
                return false;
            }
        }

        WeightedCluster weighted;
        weighted.weight = svc.weight;
        if (svc.request_headers_policy) {
            std::optional<std::string> host_rewrite;
            auto policy =
                checked_headers_from(*svc.request_headers_policy, true, host_rewrite, error);
            if (!policy) {
                reject(proxy, status, kServiceError, "RequestHeadersPolicyInvalid",
                       fmt::format("{} on request headers", error));
                return false;
            }
            weighted.request_headers = std::move(*policy);
        }
        if (svc.response_headers_policy) {
            std::optional<std::string> unused;
            auto policy = checked_headers_from(*svc.response_headers_policy, false, unused, error);
            if (!policy) {
                reject(proxy, status, kServiceError, "ResponseHeadersPolicyInvalid",
                       fmt::format("{} on response headers", error));
                return false;
            }
            weighted.response_headers = std::move(*policy);
        }

        Cluster cluster;
        cluster.name = cluster_name(service->name, service->port, protocol);
        cluster.service = *service;
        cluster.protocol = protocol;
        cluster.load_balancer_strategy = strategy;
        cluster.upstream_validation = std::move(validation);
        weighted.cluster = fragment_->add_cluster(std::move(cluster));

        if (svc.mirror) {
            if (!route.mirrors.empty()) {
                reject(proxy, status, kServiceError, "OnlyOneMirror",
                       "only one service per route may be nominated as mirror");
                return false;
            }
            route.mirrors.push_back(weighted.cluster);
        } else {
            route.clusters.push_back(std::move(weighted));
        }
    }

    if (route.clusters.empty() && !route.redirect && !route.direct_response) {
        route.direct_response = DirectResponse{503, ""};
    }

    // Virtual host wildcards match any number of labels; pin it to one
    if (vh.fqdn.starts_with("*.")) {
        HeaderMatch authority;
        authority.name = ":authority";
        authority.type = MatchType::Regex;
        authority.value = wildcard_authority_regex(core::to_lower(vh.fqdn));
        route.match.headers.push_back(std::move(authority));
    }
    return true;
}

bool HTTPProxyProcessor::compute_upstream_validation(const source::HTTPProxy& proxy,
                                                     ObjectStatus& status,
                                                     const source::ProxyService& service,
                                                     std::optional<UpstreamValidation>& out) {
    const auto& ns = proxy.metadata.ns;
    auto ca = source::parse_namespaced_name(service.validation->ca_secret, ns);
    UpstreamValidation validation;
    validation.subject_name = service.validation->subject_name;

    auto ec = ctx_->secrets.resolve(ca, SecretUsage::Ca, ns, *fragment_, validation.ca_secret);
    if (ec == core::SecretError::DelegationNotPermitted) {
        reject(proxy, status, kTlsError, "CACertificateNotDelegated",
               fmt::format("service.UpstreamValidation.CACertificate Secret \"{}\" is not "
                           "configured for certificate delegation",
                           ca.str()));
        return false;
    }
    if (ec) {
        reject(proxy, status, kServiceError, "TLSUpstreamValidation",
               fmt::format("Service [{}:{}] TLS upstream validation policy error: {}",
                           service.name, service.port, ec.message()));
        return false;
    }
    out = std::move(validation);
    return true;
}

// ============================
// TCP proxying
// ============================

bool HTTPProxyProcessor::compute_tcp_proxy(const source::HTTPProxy& proxy, ObjectStatus& status,
                                           Visited visited, TCPProxy& tcp) {
    const auto& spec = *proxy.tcpproxy;
    const auto& config = ctx_->config;

    if (!spec.services.empty() && spec.include) {
        reject(proxy, status, kTcpProxyError, "NoServicesAndInclude",
               "cannot specify services and include in the same httpproxy");
        return false;
    }

    std::string strategy;
    if (spec.load_balancer_policy) {
        strategy = spec.load_balancer_policy->strategy;
        if (strategy == "Cookie" || strategy == "RequestHash" ||
            !valid_load_balancer_strategy(strategy)) {
            status.add_warning(kTcpProxyError, "IgnoredField",
                               fmt::format("ignoring field \"Spec.TCPProxy.LoadBalancerPolicy\"; "
                                           "{} load balancer policy is not supported for "
                                           "TCPProxies",
                                           strategy));
            strategy.clear();
        }
    }

    if (!spec.services.empty()) {
        for (const auto& svc : spec.services) {
            std::string error;
            auto service = lookup_service(ctx_->cache, {proxy.metadata.ns, svc.name}, svc.port,
                                          "", config.dag.enable_external_name_service, error);
            if (!service) {
                reject(proxy, status, kTcpProxyError, "ServiceUnresolvedReference",
                       fmt::format("Spec.TCPProxy unresolved service reference: {}", error));
                return false;
            }

            std::string protocol = svc.protocol;
            if (protocol.empty()) {
                protocol = upstream_protocol(ctx_->cache, *service);
            } else if (protocol != "h2" && protocol != "h2c" && protocol != "tls") {
                reject(proxy, status, kServiceError, "UnsupportedProtocol",
                       fmt::format("unsupported protocol: {}", protocol));
                return false;
            }

            std::optional<UpstreamValidation> validation;
            if ((protocol == "tls" || protocol == "h2") && svc.validation) {
                if (!compute_upstream_validation(proxy, status, svc, validation)) {
                    return false;
                }
            }

            Cluster cluster;
            cluster.name = cluster_name(service->name, service->port, protocol);
            cluster.service = *service;
            cluster.protocol = protocol;
            cluster.load_balancer_strategy = strategy;
            cluster.upstream_validation = std::move(validation);

            WeightedCluster weighted;
            weighted.weight = svc.weight;
            weighted.cluster = fragment_->add_cluster(std::move(cluster));
            tcp.clusters.push_back(std::move(weighted));
        }
        tcp.source = ref_of(proxy);
        return true;
    }

    if (!spec.include) {
        reject(proxy, status, kTcpProxyError, "NothingDefined",
               "either services or inclusion must be specified");
        return false;
    }

    std::string ns = spec.include->ns.empty() ? proxy.metadata.ns : spec.include->ns;
    const auto* dest = ctx_->cache.get<source::HTTPProxy>({ns, spec.include->name});
    if (!dest) {
        reject(proxy, status, kTcpProxyIncludeError, "IncludeNotFound",
               fmt::format("include {}/{} not found", ns, spec.include->name));
        return false;
    }
    if (dest->virtualhost) {
        reject(proxy, status, kTcpProxyIncludeError, "RootIncludesRoot",
               fmt::format("root httpproxy cannot include another root httpproxy ({}/{})",
                           dest->metadata.ns, dest->metadata.name));
        return false;
    }

    orphaned_.erase(dest->metadata.key());

    visited.push_back(&proxy);
    if (contains_proxy(visited, *dest)) {
        reject(proxy, status, kTcpProxyIncludeError, "IncludeCreatesCycle",
               fmt::format("include creates a cycle: {}", visited_path(visited, *dest)));
        return false;
    }

    auto& dest_status = status_of(*dest);
    if (!dest->tcpproxy) {
        reject(*dest, dest_status, kTcpProxyError, "NothingDefined",
               "either services or inclusion must be specified");
        return false;
    }
    return compute_tcp_proxy(*dest, dest_status, std::move(visited), tcp);
}

Route HTTPProxyProcessor::bad_gateway_route(const Conditions& conditions,
                                            const source::HTTPProxy& proxy) const {
    Route route;
    route.match.path = merge_path_conditions(conditions, {});
    route.match.headers = header_matches_from(conditions);
    route.match.query_params = query_matches_from(conditions);
    route.direct_response = DirectResponse{502, ""};
    route.source = ref_of(proxy);
    return route;
}

// ============================
// Helpers
// ============================

bool HTTPProxyProcessor::root_allowed(std::string_view ns) const {
    const auto& roots = ctx_->config.dag.root_namespaces;
    return roots.empty() || std::find(roots.begin(), roots.end(), ns) != roots.end();
}

ObjectStatus& HTTPProxyProcessor::status_of(const source::HTTPProxy& proxy) {
    return ctx_->status.at(ref_of(proxy));
}

void HTTPProxyProcessor::reject(const source::HTTPProxy& proxy, ObjectStatus& status,
                                std::string_view type, std::string_view reason,
                                std::string_view message) {
    status.add_error(type, reason, message);
    if (ctx_->logger) {
        LOG_OBJECT_ERROR(ctx_->logger, "HTTPProxy", proxy.metadata.ns, proxy.metadata.name,
                         fmt::format("{}: {}", reason, message));
    }
}

std::vector<Route> expand_prefix_matches(std::vector<Route> routes) {
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < routes.size(); ++i) {
        const auto& path = routes[i].match.path;
        if (path.kind != PathMatchKind::Prefix) {
            continue;
        }
        std::string prefix = path.value;
        if (prefix != "/") {
            while (prefix.size() > 1 && prefix.back() == '/') {
                prefix.pop_back();
            }
        }
        groups[prefix].push_back(i);
    }

    std::map<size_t, Route> variants;
    for (const auto& [prefix, members] : groups) {
        // Both /foo and /foo/ are already routed explicitly
        if (members.size() != 1) {
            continue;
        }
        auto& route = routes[members.front()];
        if (!route.prefix_rewrite || route.match.path.value == "/") {
            continue;
        }

        std::string rewrite = *route.prefix_rewrite;
        while (!rewrite.empty() && rewrite.back() == '/') {
            rewrite.pop_back();
        }

        Route variant = route;
        variant.match.path.value = prefix + "/";
        variant.prefix_rewrite = rewrite + "/";

        route.match.path.value = prefix;
        route.prefix_rewrite = rewrite.empty() ? std::string("/") : rewrite;
        variants.emplace(members.front(), std::move(variant));
    }

    if (variants.empty()) {
        return routes;
    }

    std::vector<Route> out;
    out.reserve(routes.size() + variants.size());
    for (size_t i = 0; i < routes.size(); ++i) {
        out.push_back(std::move(routes[i]));
        if (auto it = variants.find(i); it != variants.end()) {
            out.push_back(std::move(it->second));
        }
    }
    return out;
}

}  // namespace lattice::dag
