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


// Lattice Ingress Processor - Implementation

#include "ingress_processor.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "policy.hpp"

namespace lattice::dag {

namespace {

constexpr std::string_view kAccepted = "Accepted";
constexpr std::string_view kResolvedRefs = "ResolvedRefs";
constexpr std::string_view kPartiallyInvalid = "PartiallyInvalid";

source::ObjectRef ref_of(const source::Ingress& ingress) {
    return source::ObjectRef::of(source::Kind::Ingress, ingress.metadata);
}

std::string_view secret_reason(std::error_code ec) {
    if (ec == core::SecretError::DelegationNotPermitted) {
        return "DelegationNotPermitted";
    }
    if (ec == core::SecretError::NotFound) {
        return "SecretNotFound";
    }
    return "SecretNotValid";
}

uint32_t parse_uint32(std::string_view value) {
    uint32_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return 0;
    }
    return out;
}

}  // namespace

void IngressProcessor::run(BuildContext& ctx, Dag& fragment) {
    ctx_ = &ctx;
    fragment_ = &fragment;
    secure_hosts_.clear();
    tls_losers_.clear();

    std::vector<const source::Ingress*> ingresses;
    for (const auto& [key, ingress] : ctx.cache.all<source::Ingress>()) {
        ingresses.push_back(&ingress);
    }
    // Older objects first so that shared virtual host settings follow the tie-break
    std::stable_sort(ingresses.begin(), ingresses.end(),
                     [](const source::Ingress* a, const source::Ingress* b) {
                         return source::wins_tie_break(ref_of(*a), ref_of(*b));
                     });

    for (const auto* ingress : ingresses) {
        status_of(*ingress).set_condition(kAccepted, kConditionTrue, "Accepted", "Valid Ingress");
    }
    for (const auto* ingress : ingresses) {
        compute_secure_virtual_hosts(*ingress);
    }
    for (const auto* ingress : ingresses) {
        compute_rules(*ingress);
    }

    ctx_ = nullptr;
    fragment_ = nullptr;
}

void IngressProcessor::compute_secure_virtual_hosts(const source::Ingress& ingress) {
    const auto& ns = ingress.metadata.ns;

    auto min_version = core::TlsVersion::V1_2;
    auto annotated =
        core::parse_tls_version(ingress.metadata.annotation(kAnnotationTlsMinimumVersion));
    if (!annotated) {
        reject(ingress, kPartiallyInvalid, "TLSVersionNotValid",
               fmt::format("annotation {} must be 1.2 or 1.3", kAnnotationTlsMinimumVersion));
    } else if (*annotated != core::TlsVersion::Unspecified) {
        min_version = *annotated;
    }

    for (const auto& tls : ingress.tls) {
        if (tls.secret_name.empty()) {
            continue;
        }
        auto name = source::parse_namespaced_name(tls.secret_name, ns);
        std::string key;
        auto ec = ctx_->secrets.resolve(name, SecretUsage::Tls, ns, *fragment_, key);
        if (ec) {
            reject(ingress, kResolvedRefs, secret_reason(ec),
                   fmt::format("TLS Secret \"{}\": {}", name.str(), ec.message()));
            continue;
        }

        for (const auto& raw : tls.hosts) {
            std::string host = core::to_lower(raw);
            if (host == "*" || !valid_ingress_host(host)) {
                continue;
            }
            auto& vhost = fragment_->ensure_virtual_host(Protocol::HTTPS, kSecurePort, host);
            if (!vhost.tls) {
                TlsSettings settings;
                settings.secret = key;
                settings.min_version = min_version;
                vhost.tls = std::move(settings);
                vhost.source = ref_of(ingress);
                vhost.http_filters = http_filter_order(ctx_->config.policy.auth_before_rate_limit);
            } else if (vhost.tls->secret != key) {
                // First (oldest) claimant keeps the host
                fragment_->collisions.push_back(
                    RouteCollision{vhost.source, ref_of(ingress), "tls", host});
                tls_losers_.emplace(ingress.metadata.key(), host);
                continue;
            }
            secure_hosts_.insert(host);
        }
    }
}

void IngressProcessor::compute_rules(const source::Ingress& ingress) {
    const auto& meta = ingress.metadata;
    bool force_ssl = meta.annotation(kAnnotationForceSslRedirect) == "true";
    bool allow_http = meta.annotation(kAnnotationAllowHttp) != "false";

    size_t emitted = 0;
    size_t rejected = 0;

    for (const auto& rule : rules_from_spec(ingress)) {
        std::string host = rule.host.empty() ? std::string("*") : core::to_lower(rule.host);
        if (!valid_ingress_host(host)) {
            reject(ingress, kPartiallyInvalid, "HostNotValid",
                   fmt::format("host \"{}\" is not a valid hostname", rule.host));
            ++rejected;
            continue;
        }

        for (const auto& path : rule.paths) {
            auto route = compute_route(ingress, host, path);
            if (!route) {
                ++rejected;
                continue;
            }

            if (force_ssl || allow_http) {
                auto& vhost = fragment_->ensure_virtual_host(Protocol::HTTP, kInsecurePort, host);
                if (vhost.source.name.empty()) {
                    vhost.source = ref_of(ingress);
                    vhost.http_filters =
                        http_filter_order(ctx_->config.policy.auth_before_rate_limit);
                }
                Route insecure = *route;
                insecure.https_redirect = force_ssl;
                (void)fragment_->add_route(vhost, std::move(insecure));
            }

            if (secure_hosts_.contains(host) &&
                !tls_losers_.contains({meta.key(), host})) {
                auto& vhost = fragment_->ensure_virtual_host(Protocol::HTTPS, kSecurePort, host);
                route->https_redirect = false;
                (void)fragment_->add_route(vhost, std::move(*route));
            }
            ++emitted;
        }
    }

    if (emitted == 0 && rejected > 0) {
        status_of(ingress).set_condition(kAccepted, kConditionFalse, "NoValidRules",
                                         "no rule of this Ingress produced a route");
    }
}

std::optional<Route> IngressProcessor::compute_route(const source::Ingress& ingress,
                                                     const std::string& host,
                                                     const source::IngressPath& path) {
    const auto& meta = ingress.metadata;
    const auto& config = ctx_->config;
    std::string value = path.path.empty() ? std::string("/") : path.path;

    if (path.path_type != "Prefix" && path.path_type != "Exact" &&
        path.path_type != "ImplementationSpecific" && !path.path_type.empty()) {
        reject(ingress, kPartiallyInvalid, "PathTypeNotValid",
               fmt::format("path \"{}\": unsupported pathType \"{}\"", value, path.path_type));
        return std::nullopt;
    }
    if (path.path_type != "ImplementationSpecific" && !path.path_type.empty() &&
        !value.starts_with("/")) {
        reject(ingress, kPartiallyInvalid, "PathNotValid",
               fmt::format("path \"{}\" must start with '/'", value));
        return std::nullopt;
    }

    Route route;
    route.match.path = ingress_path_match(value, path.path_type);

    if (route.match.path.kind == PathMatchKind::Regex) {
        std::vector<std::string> warnings;
        if (auto err = check_regex_limits(route.match.path.value, "PathNotValid",
                                          ctx_->regex_limits, warnings)) {
            reject(ingress, kPartiallyInvalid, err->reason, err->message);
            return std::nullopt;
        }
        for (const auto& w : warnings) {
            status_of(ingress).add_condition("Warning", kConditionTrue,
                                             "RegexProgramSizeWarning", w);
        }
    }

    std::string error;
    const auto& backend = path.backend;
    auto service = lookup_service(ctx_->cache, {meta.ns, backend.service_name},
                                  backend.port_number, backend.port_name,
                                  config.dag.enable_external_name_service, error);
    if (!service) {
        reject(ingress, kResolvedRefs, "ServiceUnresolvedReference", error);
        return std::nullopt;
    }

    Cluster cluster;
    cluster.protocol = upstream_protocol(ctx_->cache, *service);
    cluster.name = cluster_name(service->name, service->port, cluster.protocol);
    cluster.service = std::move(*service);

    WeightedCluster weighted;
    weighted.cluster = fragment_->add_cluster(std::move(cluster));
    route.clusters.push_back(std::move(weighted));

    auto websocket_paths = core::split(meta.annotation(kAnnotationWebsocketRoutes), ',');
    route.websocket =
        std::find(websocket_paths.begin(), websocket_paths.end(), value) != websocket_paths.end();

    if (auto timeout = meta.annotation(kAnnotationResponseTimeout); !timeout.empty()) {
        auto parsed = timeout == "infinity"
                          ? std::optional<std::chrono::milliseconds>{std::chrono::milliseconds{0}}
                          : core::parse_duration(timeout);
        if (!parsed) {
            // Unparseable timeouts disable the timeout rather than fall back to a default
            if (ctx_->logger) {
                LOG_OBJECT_ERROR(ctx_->logger, "Ingress", meta.ns, meta.name,
                                 fmt::format("response timeout \"{}\" is not a duration", timeout));
            }
            parsed = std::chrono::milliseconds{0};
        }
        route.timeouts.response = parsed;
    }

    if (auto retry_on = meta.annotation(kAnnotationRetryOn); !retry_on.empty()) {
        RetryPolicy retry;
        retry.retry_on = std::string(retry_on);
        if (auto count = parse_uint32(meta.annotation(kAnnotationNumRetries)); count > 0) {
            retry.num_retries = count;
        }
        if (auto per_try = meta.annotation(kAnnotationPerTryTimeout); !per_try.empty()) {
            retry.per_try_timeout = core::parse_duration(per_try);
        }
        route.retry = std::move(retry);
    }

    route.request_headers = headers_from(config.policy.request_headers);
    route.response_headers = headers_from(config.policy.response_headers);
    route.source = ref_of(ingress);

    if (host.starts_with("*.")) {
        HeaderMatch authority;
        authority.name = ":authority";
        authority.type = MatchType::Regex;
        authority.value = wildcard_authority_regex(host);
        route.match.headers.push_back(std::move(authority));
    }
    return route;
}

ObjectStatus& IngressProcessor::status_of(const source::Ingress& ingress) {
    return ctx_->status.at(ref_of(ingress));
}

void IngressProcessor::reject(const source::Ingress& ingress, std::string_view type,
                              std::string_view reason, std::string_view message) {
    // PartiallyInvalid is asserted; ResolvedRefs is denied
    auto status = type == kPartiallyInvalid ? kConditionTrue : kConditionFalse;
    status_of(ingress).add_condition(type, status, reason, message);
    if (ctx_->logger) {
        LOG_OBJECT_ERROR(ctx_->logger, "Ingress", ingress.metadata.ns, ingress.metadata.name,
                         fmt::format("{}: {}", reason, message));
    }
}

// ============================
// Helpers
// ============================

std::vector<source::IngressRule> rules_from_spec(const source::Ingress& ingress) {
    std::vector<source::IngressRule> rules;
    rules.reserve(ingress.rules.size() + 1);
    if (ingress.default_backend) {
        source::IngressRule rule;
        rule.paths.push_back(source::IngressPath{"", "ImplementationSpecific",
                                                 *ingress.default_backend});
        rules.push_back(std::move(rule));
    }
    rules.insert(rules.end(), ingress.rules.begin(), ingress.rules.end());
    return rules;
}

PathMatch ingress_path_match(std::string_view path, std::string_view path_type) {
    if (path_type == "Prefix") {
        std::string trimmed(path);
        while (!trimmed.empty() && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        if (trimmed.empty()) {
            return PathMatch::prefix("/", PrefixMatchType::String);
        }
        return PathMatch::prefix(std::move(trimmed), PrefixMatchType::Segment);
    }
    if (path_type == "Exact") {
        return PathMatch::exact(std::string(path));
    }
    if (path.find_first_of("^+*[]%") != std::string_view::npos) {
        return PathMatch::regex(std::string(path));
    }
    return PathMatch::prefix(std::string(path), PrefixMatchType::String);
}

bool valid_ingress_host(std::string_view host) {
    if (host == "*") {
        return true;
    }
    size_t from = host.starts_with("*.") ? 1 : 0;
    if (host.find('*', from) != std::string_view::npos) {
        return false;
    }
    return !is_ip_address(host) && valid_hostname(host);
}

}  // namespace lattice::dag
