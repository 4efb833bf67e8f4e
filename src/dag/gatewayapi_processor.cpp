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


// Lattice Gateway API Processor - Implementation

#include "gatewayapi_processor.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "policy.hpp"

namespace lattice::dag {

namespace {

constexpr std::string_view kAccepted = "Accepted";
constexpr std::string_view kResolvedRefs = "ResolvedRefs";
constexpr std::string_view kUnsupportedValue = "UnsupportedValue";

void set_parent_condition(ParentStatus& status, int64_t generation, std::string_view type,
                          std::string_view value, std::string_view reason,
                          std::string_view message) {
    for (auto& c : status.conditions) {
        if (c.type != type) {
            continue;
        }
        // A failure already recorded keeps its place; further failures append
        if (c.status == kConditionFalse && value == kConditionFalse) {
            if (c.message.find(message) == std::string::npos) {
                c.message += ", ";
                c.message += message;
            }
            return;
        }
        c = Condition{std::string(type), std::string(value), std::string(reason),
                      std::string(message), generation};
        return;
    }
    status.conditions.push_back(Condition{std::string(type), std::string(value),
                                          std::string(reason), std::string(message),
                                          generation});
}

template <typename T>
std::vector<const T*> oldest_first(const source::ObjectCache::Store<T>& store, source::Kind kind) {
    std::vector<const T*> out;
    out.reserve(store.size());
    for (const auto& [key, object] : store) {
        out.push_back(&object);
    }
    std::stable_sort(out.begin(), out.end(), [kind](const T* a, const T* b) {
        return source::wins_tie_break(source::ObjectRef::of(kind, a->metadata),
                                      source::ObjectRef::of(kind, b->metadata));
    });
    return out;
}

bool is_core_group(std::string_view group) {
    return group.empty() || group == "core";
}

/// Header predicates of a route match; only Exact and RegularExpression
std::optional<std::string> convert_headers(const std::vector<source::HTTPHeaderMatch>& headers,
                                           std::string_view kind, const RegexLimits& limits,
                                           std::vector<HeaderMatch>& out,
                                           std::vector<std::string>& warnings) {
    std::set<std::string> seen;
    for (const auto& h : headers) {
        // Repeated names: the first entry applies
        if (!seen.insert(core::to_lower(h.name)).second) {
            continue;
        }
        HeaderMatch match;
        match.name = h.name;
        match.value = h.value;
        if (h.type == "Exact") {
            match.type = MatchType::Exact;
        } else if (h.type == "RegularExpression") {
            if (auto err = check_regex_limits(h.value, kUnsupportedValue, limits, warnings)) {
                return err->message;
            }
            match.type = MatchType::Regex;
        } else {
            return fmt::format("{}.Spec.Rules.HeaderMatch: Only Exact match type and "
                               "RegularExpression match type are supported.",
                               kind);
        }
        out.push_back(std::move(match));
    }
    return std::nullopt;
}

std::optional<std::string> convert_http_match(const source::HTTPRouteMatch& m,
                                              const RegexLimits& limits, MatchConditions& out,
                                              std::vector<std::string>& warnings) {
    auto path = m.path.value_or(source::HTTPPathMatch{});
    if (path.type == "PathPrefix" || path.type == "Exact") {
        if (!path.value.starts_with("/")) {
            return fmt::format("HTTPRoute.Spec.Rules.PathMatch: value \"{}\" must start with '/'",
                               path.value);
        }
        if (path.type == "Exact") {
            out.path = PathMatch::exact(path.value);
        } else {
            std::string value = path.value;
            while (value.size() > 1 && value.back() == '/') {
                value.pop_back();
            }
            out.path = PathMatch::prefix(std::move(value), PrefixMatchType::Segment);
        }
    } else if (path.type == "RegularExpression") {
        if (auto err = check_regex_limits(path.value, kUnsupportedValue, limits, warnings)) {
            return err->message;
        }
        out.path = PathMatch::regex(path.value);
    } else {
        return "HTTPRoute.Spec.Rules.PathMatch: Only Exact, PathPrefix and RegularExpression "
               "match types are supported.";
    }

    if (auto err = convert_headers(m.headers, "HTTPRoute", limits, out.headers, warnings)) {
        return err;
    }

    std::set<std::string> seen;
    for (const auto& q : m.query_params) {
        if (!seen.insert(q.name).second) {
            continue;
        }
        QueryParamMatch match;
        match.name = q.name;
        match.value = q.value;
        if (q.type == "Exact") {
            match.type = MatchType::Exact;
        } else if (q.type == "RegularExpression") {
            if (auto err = check_regex_limits(q.value, kUnsupportedValue, limits, warnings)) {
                return err->message;
            }
            match.type = MatchType::Regex;
        } else {
            return "HTTPRoute.Spec.Rules.QueryParamMatch: Only Exact and RegularExpression match "
                   "types are supported.";
        }
        out.query_params.push_back(std::move(match));
    }

    out.method = m.method;
    return std::nullopt;
}

HeadersPolicy headers_from_filter(const source::HTTPHeaderFilter& filter,
                                  std::optional<std::string>* host_rewrite) {
    HeadersPolicy out;
    for (const auto& h : filter.set) {
        if (host_rewrite && core::iequals(h.name, "host")) {
            *host_rewrite = h.value;
            continue;
        }
        out.set[h.name] = h.value;
    }
    for (const auto& h : filter.add) {
        out.add[h.name] = h.value;
    }
    out.remove = filter.remove;
    return out;
}

std::optional<std::chrono::milliseconds> parse_route_timeout(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return core::parse_duration(value);
}

}  // namespace

// ============================
// Run
// ============================

void GatewayAPIProcessor::run(BuildContext& ctx, Dag& fragment) {
    ctx_ = &ctx;
    fragment_ = &fragment;
    listeners_.clear();

    gateway_ = select_gateway();
    if (gateway_) {
        gateway_ref_ = source::ObjectRef::of(source::Kind::Gateway, gateway_->metadata);
        auto& status = ctx.status.at(gateway_ref_);
        listeners_ = compute_listeners(*gateway_, status, ctx, fragment);

        status.set_condition(kAccepted, kConditionTrue, "Accepted", "Gateway is accepted");
        bool programmed = std::any_of(listeners_.begin(), listeners_.end(),
                                      [](const ListenerInfo& l) { return l.valid; });
        if (programmed) {
            status.set_condition("Programmed", kConditionTrue, "Programmed",
                                 "Gateway is programmed");
        } else {
            status.set_condition("Programmed", kConditionFalse, "ListenersNotValid",
                                 "Listeners are not valid");
        }

        const auto& cache = ctx.cache;
        for (const auto* route : oldest_first(cache.all<source::HTTPRoute>(),
                                              source::Kind::HTTPRoute)) {
            process_http_route(*route);
        }
        for (const auto* route : oldest_first(cache.all<source::GRPCRoute>(),
                                              source::Kind::GRPCRoute)) {
            process_grpc_route(*route);
        }
        for (const auto* route : oldest_first(cache.all<source::TLSRoute>(),
                                              source::Kind::TLSRoute)) {
            process_tls_route(*route);
        }
        for (const auto* route : oldest_first(cache.all<source::TCPRoute>(),
                                              source::Kind::TCPRoute)) {
            process_tcp_route(*route);
        }
    }

    gateway_ = nullptr;
    ctx_ = nullptr;
    fragment_ = nullptr;
}

const source::Gateway* GatewayAPIProcessor::select_gateway() {
    const auto& controller = ctx_->config.gateway.controller_name;

    std::set<std::string> classes;
    for (const auto& [key, gc] : ctx_->cache.all<source::GatewayClass>()) {
        if (gc.controller_name != controller) {
            continue;
        }
        classes.insert(gc.metadata.name);
        ctx_->status.at(source::ObjectRef::of(source::Kind::GatewayClass, gc.metadata))
            .set_condition(kAccepted, kConditionTrue, "Accepted",
                           "GatewayClass is accepted by this controller");
    }

    std::vector<const source::Gateway*> candidates;
    for (const auto* gw : oldest_first(ctx_->cache.all<source::Gateway>(),
                                       source::Kind::Gateway)) {
        if (classes.contains(gw->gateway_class_name)) {
            candidates.push_back(gw);
        }
    }
    if (candidates.empty()) {
        return nullptr;
    }

    const auto* selected = candidates.front();
    for (size_t i = 1; i < candidates.size(); ++i) {
        const auto& meta = candidates[i]->metadata;
        ctx_->status.at(source::ObjectRef::of(source::Kind::Gateway, meta))
            .set_condition(kAccepted, kConditionFalse, "NotReconciled",
                           fmt::format("Gateway is not reconciled: {} takes precedence",
                                       selected->metadata.key().str()));
        if (ctx_->logger) {
            LOG_OBJECT_ERROR(ctx_->logger, "Gateway", meta.ns, meta.name,
                             "ignored in favour of an older Gateway of the same class");
        }
    }
    return selected;
}

// ============================
// Attachment
// ============================

template <typename Emit>
void GatewayAPIProcessor::attach_parents(const source::ObjectMeta& meta, source::Kind kind,
                                         const std::vector<source::ParentReference>& parents,
                                         const std::vector<std::string>& hostnames,
                                         Emit&& emit) {
    auto ref = source::ObjectRef::of(kind, meta);
    for (const auto& parent : parents) {
        if (!targets_gateway(parent, meta.ns)) {
            continue;
        }
        auto& ps = ctx_->status.at(ref).parent(gateway_->metadata.key(), parent.section_name,
                                               ctx_->config.gateway.controller_name);
        set_parent_condition(ps, meta.generation, kAccepted, kConditionTrue, "Accepted",
                             fmt::format("Accepted {}", source::to_string(kind)));
        set_parent_condition(ps, meta.generation, kResolvedRefs, kConditionTrue, "ResolvedRefs",
                             "References resolved");

        auto attachments = attach(parent, meta, kind, hostnames, ps);
        if (attachments.empty()) {
            if (ctx_->logger) {
                LOG_OBJECT_ERROR(ctx_->logger, source::to_string(kind), meta.ns, meta.name,
                                 "not attached to any listener");
            }
            continue;
        }
        emit(attachments, ps);
        count_attachment(attachments);
    }
}

bool GatewayAPIProcessor::targets_gateway(const source::ParentReference& parent,
                                          std::string_view route_ns) const {
    const auto& gw = gateway_->metadata;
    std::string_view ns = parent.ns.empty() ? route_ns : std::string_view(parent.ns);
    return parent.group == source::kGatewayGroup && parent.kind == "Gateway" && ns == gw.ns &&
           parent.name == gw.name;
}

std::vector<GatewayAPIProcessor::Attachment> GatewayAPIProcessor::attach(
    const source::ParentReference& parent, const source::ObjectMeta& meta, source::Kind kind,
    const std::vector<std::string>& hostnames, ParentStatus& status) {
    std::string kind_name(source::to_string(kind));

    bool named = false;
    std::vector<const ListenerInfo*> candidates;
    for (const auto& listener : listeners_) {
        if (!parent.section_name.empty() && listener.name != parent.section_name) {
            continue;
        }
        if (parent.port && listener.port != *parent.port) {
            continue;
        }
        named = true;
        if (listener.valid) {
            candidates.push_back(&listener);
        }
    }
    if (!named) {
        set_parent_condition(status, meta.generation, kAccepted, kConditionFalse,
                             "NoMatchingParent", "No listeners match this parent ref");
        return {};
    }

    std::vector<const ListenerInfo*> allowed;
    for (const auto* listener : candidates) {
        bool kind_ok = std::find(listener->kinds.begin(), listener->kinds.end(), kind_name) !=
                       listener->kinds.end();
        if (kind_ok && namespace_allowed(*listener, gateway_->metadata.ns, meta.ns, ctx_->cache)) {
            allowed.push_back(listener);
        }
    }
    if (allowed.empty()) {
        set_parent_condition(status, meta.generation, kAccepted, kConditionFalse,
                             "NotAllowedByListeners",
                             "No listeners included by this parent ref allowed this attachment.");
        return {};
    }

    std::vector<Attachment> out;
    for (const auto* listener : allowed) {
        if (kind == source::Kind::TCPRoute) {
            out.push_back(Attachment{listener, {}});
            continue;
        }
        auto hosts = hosts_on(*listener, hostnames);
        if (!hosts.empty()) {
            out.push_back(Attachment{listener, std::move(hosts)});
        }
    }
    if (out.empty()) {
        set_parent_condition(status, meta.generation, kAccepted, kConditionFalse,
                             "NoMatchingListenerHostname",
                             "No intersecting hostnames were found between the listener and the "
                             "route.");
    }
    return out;
}

std::vector<std::string> GatewayAPIProcessor::hosts_on(
    const ListenerInfo& listener, const std::vector<std::string>& hostnames) const {
    std::vector<std::string> requested;
    for (const auto& h : hostnames) {
        requested.push_back(core::to_lower(h));
    }
    if (requested.empty()) {
        requested.push_back(listener.hostname.empty() ? std::string("*") : listener.hostname);
    }

    std::vector<std::string> out;
    for (const auto& host : requested) {
        if (host == "*") {
            if (listener.hostname.empty()) {
                out.push_back(host);
            }
            continue;
        }
        if (is_ip_address(host) || !valid_hostname(host)) {
            continue;
        }
        auto resolved = intersect_hostnames(listener.hostname, host);
        if (!resolved) {
            continue;
        }

        // A more specific listener on the same port owns the host
        auto own = hostname_specificity(listener.hostname);
        bool claimed = std::any_of(listeners_.begin(), listeners_.end(), [&](const ListenerInfo& l) {
            return l.valid && &l != &listener && l.port == listener.port &&
                   l.dag_protocol == listener.dag_protocol && !l.hostname.empty() &&
                   hostname_specificity(l.hostname) > own &&
                   (l.hostname == *resolved || hostname_matches(l.hostname, *resolved));
        });
        if (claimed) {
            continue;
        }
        if (std::find(out.begin(), out.end(), *resolved) == out.end()) {
            out.push_back(std::move(*resolved));
        }
    }
    return out;
}

void GatewayAPIProcessor::count_attachment(const std::vector<Attachment>& attachments) {
    auto& status = ctx_->status.at(gateway_ref_);
    std::set<std::string> counted;
    for (const auto& attachment : attachments) {
        if (counted.insert(attachment.listener->name).second) {
            ++status.listener(attachment.listener->name).attached_routes;
        }
    }
}

void GatewayAPIProcessor::apply_problems(ParentStatus& status, int64_t generation,
                                         const std::vector<Problem>& problems) const {
    for (const auto& p : problems) {
        set_parent_condition(status, generation, p.type, kConditionFalse, p.reason, p.message);
    }
}

// ============================
// Route kinds
// ============================

void GatewayAPIProcessor::process_http_route(const source::HTTPRoute& route) {
    std::optional<std::vector<Route>> routes;
    std::vector<Problem> problems;
    attach_parents(route.metadata, source::Kind::HTTPRoute, route.parent_refs, route.hostnames,
                   [&](const std::vector<Attachment>& attachments, ParentStatus& status) {
                       if (!routes) {
                           routes = compute_http_routes(route, problems);
                       }
                       apply_problems(status, route.metadata.generation, problems);
                       emit_routes(attachments, *routes);
                   });
}

void GatewayAPIProcessor::process_grpc_route(const source::GRPCRoute& route) {
    std::optional<std::vector<Route>> routes;
    std::vector<Problem> problems;
    attach_parents(route.metadata, source::Kind::GRPCRoute, route.parent_refs, route.hostnames,
                   [&](const std::vector<Attachment>& attachments, ParentStatus& status) {
                       if (!routes) {
                           routes = compute_grpc_routes(route, problems);
                       }
                       apply_problems(status, route.metadata.generation, problems);
                       emit_routes(attachments, *routes);
                   });
}

void GatewayAPIProcessor::process_tls_route(const source::TLSRoute& route) {
    std::optional<TCPProxy> proxy;
    std::vector<Problem> problems;
    attach_parents(route.metadata, source::Kind::TLSRoute, route.parent_refs, route.hostnames,
                   [&](const std::vector<Attachment>& attachments, ParentStatus& status) {
                       if (!proxy) {
                           proxy.emplace();
                           proxy->source =
                               source::ObjectRef::of(source::Kind::TLSRoute, route.metadata);
                           for (const auto& rule : route.rules) {
                               auto clusters =
                                   compute_backends(rule.backend_refs, source::Kind::TLSRoute,
                                                    route.metadata, "", problems);
                               std::move(clusters.begin(), clusters.end(),
                                         std::back_inserter(proxy->clusters));
                           }
                       }
                       apply_problems(status, route.metadata.generation, problems);
                       if (!proxy->clusters.empty()) {
                           emit_tcp_proxy(attachments, *proxy);
                       }
                   });
}

void GatewayAPIProcessor::process_tcp_route(const source::TCPRoute& route) {
    std::optional<TCPProxy> proxy;
    std::vector<Problem> problems;
    attach_parents(route.metadata, source::Kind::TCPRoute, route.parent_refs, {},
                   [&](const std::vector<Attachment>& attachments, ParentStatus& status) {
                       if (!proxy) {
                           proxy.emplace();
                           proxy->source =
                               source::ObjectRef::of(source::Kind::TCPRoute, route.metadata);
                           for (const auto& rule : route.rules) {
                               auto clusters =
                                   compute_backends(rule.backend_refs, source::Kind::TCPRoute,
                                                    route.metadata, "", problems);
                               std::move(clusters.begin(), clusters.end(),
                                         std::back_inserter(proxy->clusters));
                           }
                       }
                       apply_problems(status, route.metadata.generation, problems);
                       if (!proxy->clusters.empty()) {
                           emit_tcp_proxy(attachments, *proxy);
                       }
                   });
}

std::vector<Route> GatewayAPIProcessor::compute_http_routes(const source::HTTPRoute& route,
                                                            std::vector<Problem>& problems) {
    const auto& meta = route.metadata;
    const auto& config = ctx_->config;
    auto ref = source::ObjectRef::of(source::Kind::HTTPRoute, meta);
    std::vector<Route> out;
    std::vector<std::string> warnings;

    for (const auto& rule : route.rules) {
        Route base;
        base.source = ref;
        base.method_priority = true;
        base.request_headers = headers_from(config.policy.request_headers);
        base.response_headers = headers_from(config.policy.response_headers);

        if (!apply_filters(rule.filters, source::Kind::HTTPRoute, meta, base, problems)) {
            continue;
        }

        if (rule.timeouts) {
            auto request = parse_route_timeout(rule.timeouts->request);
            auto backend = parse_route_timeout(rule.timeouts->backend_request);
            if ((!rule.timeouts->request.empty() && !request) ||
                (!rule.timeouts->backend_request.empty() && !backend)) {
                problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                                    "HTTPRoute.Spec.Rules.Timeouts: invalid duration"});
                continue;
            }
            if (request && backend && request->count() != 0 && *backend > *request) {
                problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                                    "HTTPRoute.Spec.Rules.Timeouts: backendRequest timeout must "
                                    "not exceed the request timeout"});
                continue;
            }
            base.timeouts.response = request ? request : backend;
        }

        base.clusters = compute_backends(rule.backend_refs, source::Kind::HTTPRoute, meta, "",
                                         problems);
        bool weighted = std::any_of(base.clusters.begin(), base.clusters.end(),
                                    [](const WeightedCluster& c) { return c.weight > 0; });
        if (!base.redirect && !weighted) {
            base.clusters.clear();
            base.direct_response = DirectResponse{500, ""};
        }

        auto matches = rule.matches;
        if (matches.empty()) {
            matches.emplace_back();
        }
        for (const auto& m : matches) {
            Route r = base;
            if (auto err = convert_http_match(m, ctx_->regex_limits, r.match, warnings)) {
                problems.push_back(
                    {std::string(kAccepted), std::string(kUnsupportedValue), std::move(*err)});
                continue;
            }
            bool prefix_modifier = r.prefix_rewrite || (r.redirect && r.redirect->prefix);
            if (prefix_modifier && r.match.path.kind != PathMatchKind::Prefix) {
                problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                                    "ReplacePrefixMatch is only supported with a PathPrefix "
                                    "match"});
                continue;
            }
            out.push_back(std::move(r));
        }
    }

    for (const auto& w : warnings) {
        ctx_->status.at(ref).add_condition("Warning", kConditionTrue, "RegexProgramSizeWarning", w);
    }
    return out;
}

std::vector<Route> GatewayAPIProcessor::compute_grpc_routes(const source::GRPCRoute& route,
                                                            std::vector<Problem>& problems) {
    const auto& meta = route.metadata;
    const auto& config = ctx_->config;
    auto ref = source::ObjectRef::of(source::Kind::GRPCRoute, meta);
    std::vector<Route> out;
    std::vector<std::string> warnings;

    for (const auto& rule : route.rules) {
        Route base;
        base.source = ref;
        base.method_priority = true;
        base.request_headers = headers_from(config.policy.request_headers);
        base.response_headers = headers_from(config.policy.response_headers);

        if (!apply_filters(rule.filters, source::Kind::GRPCRoute, meta, base, problems)) {
            continue;
        }

        base.clusters = compute_backends(rule.backend_refs, source::Kind::GRPCRoute, meta, "h2c",
                                         problems);
        bool weighted = std::any_of(base.clusters.begin(), base.clusters.end(),
                                    [](const WeightedCluster& c) { return c.weight > 0; });
        if (!weighted) {
            base.clusters.clear();
            base.direct_response = DirectResponse{500, ""};
        }

        auto matches = rule.matches;
        if (matches.empty()) {
            matches.emplace_back();
        }
        for (const auto& m : matches) {
            Route r = base;
            if (m.method) {
                const auto& method = *m.method;
                if (method.type != "Exact" && method.type != "RegularExpression") {
                    problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                                        "GRPCRoute.Spec.Rules.Matches.Method: Only Exact and "
                                        "RegularExpression match types are supported."});
                    continue;
                }
                if (method.service.empty() && method.method.empty()) {
                    problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                                        "GRPCRoute.Spec.Rules.Matches.Method: service or method "
                                        "must be specified"});
                    continue;
                }
                r.match.path = grpc_path_match(method);
                if (r.match.path.kind == PathMatchKind::Regex) {
                    if (auto err = check_regex_limits(r.match.path.value, kUnsupportedValue,
                                                      ctx_->regex_limits, warnings)) {
                        problems.push_back({std::string(kAccepted),
                                            std::string(kUnsupportedValue), err->message});
                        continue;
                    }
                }
            } else {
                r.match.path = PathMatch::prefix("/");
            }
            if (auto err = convert_headers(m.headers, "GRPCRoute", ctx_->regex_limits,
                                           r.match.headers, warnings)) {
                problems.push_back(
                    {std::string(kAccepted), std::string(kUnsupportedValue), std::move(*err)});
                continue;
            }
            out.push_back(std::move(r));
        }
    }

    for (const auto& w : warnings) {
        ctx_->status.at(ref).add_condition("Warning", kConditionTrue, "RegexProgramSizeWarning", w);
    }
    return out;
}

// ============================
// Filters and backends
// ============================

bool GatewayAPIProcessor::apply_filters(const std::vector<source::HTTPRouteFilter>& filters,
                                        source::Kind kind, const source::ObjectMeta& meta,
                                        Route& route, std::vector<Problem>& problems) {
    bool http = kind == source::Kind::HTTPRoute;
    std::string_view protocol = http ? "" : "h2c";
    bool rewrite = false;

    auto unsupported = [&](std::string message) {
        problems.push_back({std::string(kAccepted), std::string(kUnsupportedValue),
                            std::move(message)});
        return false;
    };

    for (const auto& f : filters) {
        if (f.type == "RequestHeaderModifier" && f.request_header_modifier) {
            auto policy = headers_from_filter(*f.request_header_modifier, &route.host_rewrite);
            route.request_headers = merge_headers(route.request_headers, policy);
        } else if (f.type == "ResponseHeaderModifier" && f.response_header_modifier) {
            auto policy = headers_from_filter(*f.response_header_modifier, nullptr);
            route.response_headers = merge_headers(route.response_headers, policy);
        } else if (f.type == "RequestMirror" && f.request_mirror) {
            if (auto cluster =
                    resolve_backend(f.request_mirror->backend_ref, kind, meta, protocol, problems)) {
                route.mirrors.push_back(std::move(*cluster));
            }
        } else if (http && f.type == "RequestRedirect" && f.request_redirect) {
            const auto& spec = *f.request_redirect;
            if (spec.status_code != 301 && spec.status_code != 302) {
                return unsupported(fmt::format(
                    "HTTPRoute.Spec.Rules.Filters.RequestRedirect: status code {} is not "
                    "supported",
                    spec.status_code));
            }
            Redirect redirect;
            redirect.scheme = spec.scheme;
            redirect.hostname = spec.hostname;
            redirect.port = spec.port;
            redirect.status_code = spec.status_code;
            if (spec.path) {
                if (spec.path->type == "ReplaceFullPath") {
                    redirect.path = spec.path->replace_full_path;
                } else if (spec.path->type == "ReplacePrefixMatch") {
                    redirect.prefix = spec.path->replace_prefix_match;
                } else {
                    return unsupported("HTTPRoute.Spec.Rules.Filters.RequestRedirect.Path.Type: "
                                       "Only ReplaceFullPath and ReplacePrefixMatch are "
                                       "supported.");
                }
            }
            route.redirect = std::move(redirect);
        } else if (http && f.type == "URLRewrite" && f.url_rewrite) {
            const auto& spec = *f.url_rewrite;
            rewrite = true;
            if (spec.hostname) {
                route.host_rewrite = spec.hostname;
            }
            if (spec.path) {
                if (spec.path->type == "ReplaceFullPath") {
                    route.full_path_rewrite = spec.path->replace_full_path;
                } else if (spec.path->type == "ReplacePrefixMatch") {
                    route.prefix_rewrite = spec.path->replace_prefix_match;
                } else {
                    return unsupported("HTTPRoute.Spec.Rules.Filters.URLRewrite.Path.Type: Only "
                                       "ReplaceFullPath and ReplacePrefixMatch are supported.");
                }
            }
        } else if (http) {
            return unsupported("HTTPRoute.Spec.Rules.Filters: Only RequestHeaderModifier, "
                               "ResponseHeaderModifier, RequestRedirect, RequestMirror and "
                               "URLRewrite filters are supported.");
        } else {
            return unsupported("GRPCRoute.Spec.Rules.Filters: Only RequestHeaderModifier, "
                               "ResponseHeaderModifier and RequestMirror filters are supported.");
        }
    }

    if (rewrite && route.redirect) {
        return unsupported("HTTPRoute.Spec.Rules.Filters: RequestRedirect and URLRewrite may not "
                           "be used together");
    }
    return true;
}

std::vector<WeightedCluster> GatewayAPIProcessor::compute_backends(
    const std::vector<source::BackendRef>& refs, source::Kind kind,
    const source::ObjectMeta& meta, std::string_view protocol, std::vector<Problem>& problems) {
    std::vector<WeightedCluster> out;
    for (const auto& ref : refs) {
        auto cluster = resolve_backend(ref, kind, meta, protocol, problems);
        if (!cluster) {
            continue;
        }
        WeightedCluster weighted;
        weighted.cluster = std::move(*cluster);
        weighted.weight = ref.weight < 0 ? 0 : static_cast<uint32_t>(ref.weight);
        out.push_back(std::move(weighted));
    }
    return out;
}

std::optional<std::string> GatewayAPIProcessor::resolve_backend(const source::BackendRef& ref,
                                                                source::Kind kind,
                                                                const source::ObjectMeta& meta,
                                                                std::string_view protocol,
                                                                std::vector<Problem>& problems) {
    auto fail = [&](std::string_view reason, std::string message) {
        problems.push_back({std::string(kResolvedRefs), std::string(reason), std::move(message)});
        return std::nullopt;
    };

    if (!is_core_group(ref.group) || ref.kind != "Service") {
        return fail("InvalidKind",
                    fmt::format("Spec.Rules.BackendRef has invalid kind \"{}\", only Service is "
                                "supported",
                                ref.kind));
    }
    if (!ref.port) {
        return fail("BackendNotFound", "Spec.Rules.BackendRef.Port must be specified");
    }

    source::NamespacedName name{ref.ns.empty() ? meta.ns : ref.ns, ref.name};
    if (!ctx_->cache.reference_permitted(source::kGatewayGroup, source::to_string(kind), meta.ns,
                                         "", "Service", name)) {
        return fail("RefNotPermitted",
                    fmt::format("Spec.Rules.BackendRef.Namespace must match the route's "
                                "namespace or be covered by a ReferenceGrant: {}",
                                name.str()));
    }

    std::string error;
    auto service = lookup_service(ctx_->cache, name, *ref.port, "",
                                  ctx_->config.dag.enable_external_name_service, error);
    if (!service) {
        return fail("BackendNotFound", error);
    }

    Cluster cluster;
    cluster.protocol =
        protocol.empty() ? upstream_protocol(ctx_->cache, *service) : std::string(protocol);
    cluster.name = cluster_name(service->name, service->port, cluster.protocol);
    cluster.service = std::move(*service);
    return fragment_->add_cluster(std::move(cluster));
}

// ============================
// Emission
// ============================

void GatewayAPIProcessor::emit_routes(const std::vector<Attachment>& attachments,
                                      const std::vector<Route>& routes) {
    for (const auto& attachment : attachments) {
        const auto& listener = *attachment.listener;
        for (const auto& host : attachment.hosts) {
            auto& vhost = fragment_->ensure_virtual_host(listener.dag_protocol, listener.port, host);
            if (vhost.source.name.empty()) {
                vhost.source = gateway_ref_;
                vhost.http_filters = http_filter_order(ctx_->config.policy.auth_before_rate_limit);
            }
            if (listener.dag_protocol == Protocol::HTTPS && !vhost.tls &&
                !listener.tls_secret.empty()) {
                TlsSettings tls;
                tls.secret = listener.tls_secret;
                vhost.tls = std::move(tls);
            }
            for (const auto& route : routes) {
                Route copy = route;
                if (host.starts_with("*.")) {
                    HeaderMatch authority;
                    authority.name = ":authority";
                    authority.type = MatchType::Regex;
                    authority.value = wildcard_authority_regex(host);
                    copy.match.headers.push_back(std::move(authority));
                }
                fragment_->add_route(vhost, std::move(copy));
            }
        }
    }
}

void GatewayAPIProcessor::emit_tcp_proxy(const std::vector<Attachment>& attachments,
                                         const TCPProxy& proxy) {
    for (const auto& attachment : attachments) {
        const auto& listener = *attachment.listener;
        if (listener.dag_protocol == Protocol::TCP) {
            auto& target = fragment_->ensure_listener(Protocol::TCP, listener.port);
            if (target.tcp_proxy) {
                if (!(target.tcp_proxy->source == proxy.source)) {
                    fragment_->collisions.push_back(RouteCollision{
                        target.tcp_proxy->source, proxy.source, "tcp", target.name});
                }
                continue;
            }
            target.tcp_proxy = proxy;
            continue;
        }
        for (const auto& host : attachment.hosts) {
            auto& vhost = fragment_->ensure_virtual_host(Protocol::HTTPS, listener.port, host);
            if (vhost.tcp_proxy) {
                if (!(vhost.tcp_proxy->source == proxy.source)) {
                    fragment_->collisions.push_back(
                        RouteCollision{vhost.tcp_proxy->source, proxy.source, "tls", host});
                }
                continue;
            }
            if (vhost.source.name.empty()) {
                vhost.source = gateway_ref_;
            }
            // Terminated TLSRoute on an HTTPS listener
            if (listener.protocol == "HTTPS" && !vhost.tls && !listener.tls_secret.empty()) {
                TlsSettings tls;
                tls.secret = listener.tls_secret;
                vhost.tls = std::move(tls);
            }
            vhost.tcp_proxy = proxy;
        }
    }
}

PathMatch grpc_path_match(const source::GRPCMethodMatch& match) {
    if (match.type == "RegularExpression") {
        return PathMatch::regex(fmt::format("/{}/{}", match.service.empty() ? "[^/]+" : match.service,
                                            match.method.empty() ? "[^/]+" : match.method));
    }
    if (!match.service.empty() && !match.method.empty()) {
        return PathMatch::exact(fmt::format("/{}/{}", match.service, match.method));
    }
    if (!match.service.empty()) {
        return PathMatch::prefix(fmt::format("/{}", match.service), PrefixMatchType::Segment);
    }
    return PathMatch::regex(fmt::format("/[^/]+/{}", regex_escape(match.method)));
}

}  // namespace lattice::dag
