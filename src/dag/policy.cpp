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

// Lattice Policy - Implementation

#include "policy.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace lattice::dag {

namespace {

std::optional<std::chrono::milliseconds> parse_timeout(const std::string& value,
                                                       std::string_view field,
                                                       std::string& error) {
    if (value == "infinity" || value == "infinite") {
        return std::chrono::milliseconds{0};
    }
    auto parsed = core::parse_duration(value);
    if (!parsed) {
        error = fmt::format("{} \"{}\" is not a valid duration", field, value);
    }
    return parsed;
}

void erase_name(std::map<std::string, std::string>& headers, const std::string& name) {
    for (auto it = headers.begin(); it != headers.end();) {
        if (core::iequals(it->first, name)) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace

HeadersPolicy headers_from(const source::HeadersPolicy& policy) {
    HeadersPolicy out;
    for (const auto& h : policy.set) {
        out.set[h.name] = h.value;
    }
    out.remove = policy.remove;
    return out;
}

HeadersPolicy headers_from(const control::HeaderPolicyConfig& policy) {
    HeadersPolicy out;
    out.set = policy.set;
    out.remove = policy.remove;
    return out;
}

HeadersPolicy merge_headers(const HeadersPolicy& base, const HeadersPolicy& more_specific) {
    HeadersPolicy out = base;
    for (const auto& [name, value] : more_specific.set) {
        erase_name(out.set, name);
        out.set[name] = value;
    }
    for (const auto& [name, value] : more_specific.add) {
        erase_name(out.add, name);
        out.add[name] = value;
    }
    for (const auto& name : more_specific.remove) {
        erase_name(out.set, name);
        erase_name(out.add, name);
        bool present = std::any_of(out.remove.begin(), out.remove.end(),
                                   [&](const std::string& r) { return core::iequals(r, name); });
        if (!present) {
            out.remove.push_back(name);
        }
    }
    // A name set at the specific level is no longer removed by the base
    std::erase_if(out.remove, [&](const std::string& r) {
        return std::any_of(more_specific.set.begin(), more_specific.set.end(),
                           [&](const auto& kv) { return core::iequals(kv.first, r); });
    });
    return out;
}

std::optional<HeadersPolicy> checked_headers_from(const source::HeadersPolicy& policy,
                                                 bool allow_host_rewrite,
                                                 std::optional<std::string>& host_rewrite,
                                                 std::string& error) {
    HeadersPolicy out;
    for (const auto& h : policy.set) {
        bool seen = std::any_of(out.set.begin(), out.set.end(),
                                [&](const auto& kv) { return core::iequals(kv.first, h.name); });
        if (seen || (host_rewrite && core::iequals(h.name, "host"))) {
            error = fmt::format("duplicate header addition: \"{}\"", h.name);
            return std::nullopt;
        }
        if (h.name.empty()) {
            error = "invalid set header \"\": name must not be empty";
            return std::nullopt;
        }
        if (core::iequals(h.name, "host")) {
            if (!allow_host_rewrite) {
                error = "rewriting \"Host\" header is not supported";
                return std::nullopt;
            }
            host_rewrite = h.value;
            continue;
        }
        out.set[h.name] = h.value;
    }
    for (const auto& name : policy.remove) {
        bool seen = std::any_of(out.remove.begin(), out.remove.end(),
                                [&](const std::string& r) { return core::iequals(r, name); });
        if (seen) {
            error = fmt::format("duplicate header removal: \"{}\"", name);
            return std::nullopt;
        }
        out.remove.push_back(name);
    }
    return out;
}

std::optional<ConditionError> prefix_replacement_error(
    const std::vector<source::ReplacePrefix>& replacements) {
    std::vector<std::string_view> seen;
    for (const auto& r : replacements) {
        if (std::find(seen.begin(), seen.end(), r.prefix) != seen.end()) {
            if (!r.prefix.empty()) {
                return ConditionError{"DuplicateReplacement",
                                      fmt::format("duplicate replacement prefix '{}'", r.prefix)};
            }
            return ConditionError{"AmbiguousReplacement", "ambiguous prefix replacement"};
        }
        seen.push_back(r.prefix);
    }
    return std::nullopt;
}

std::optional<std::string> prefix_rewrite_for(
    const std::vector<source::ReplacePrefix>& replacements, std::string_view routing_prefix) {
    for (const auto& r : replacements) {
        if (!r.prefix.empty() && r.prefix == routing_prefix) {
            return r.replacement;
        }
    }
    for (const auto& r : replacements) {
        if (r.prefix.empty()) {
            return r.replacement;
        }
    }
    return std::nullopt;
}

std::optional<Redirect> redirect_from(const source::RequestRedirectPolicy& policy,
                                      std::string& error) {
    if (policy.path && policy.prefix) {
        error = "cannot specify both redirect path and redirect prefix";
        return std::nullopt;
    }
    if (policy.status_code != 301 && policy.status_code != 302) {
        error = fmt::format("status code {} is not supported, use 301 or 302", policy.status_code);
        return std::nullopt;
    }
    Redirect out;
    out.scheme = policy.scheme;
    out.hostname = policy.hostname;
    out.port = policy.port;
    out.path = policy.path;
    out.prefix = policy.prefix;
    out.status_code = policy.status_code;
    return out;
}

std::optional<TimeoutPolicy> timeout_policy_from(const source::TimeoutPolicy& policy,
                                                 std::string& error) {
    TimeoutPolicy out;
    if (!policy.response.empty()) {
        out.response = parse_timeout(policy.response, "timeoutPolicy.response", error);
        if (!out.response) {
            return std::nullopt;
        }
    }
    if (!policy.idle.empty()) {
        out.idle = parse_timeout(policy.idle, "timeoutPolicy.idle", error);
        if (!out.idle) {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<RetryPolicy> retry_policy_from(const source::RetryPolicy& policy,
                                             std::string& error) {
    RetryPolicy out;
    out.num_retries = policy.count == 0 ? 1 : policy.count;
    if (!policy.retry_on.empty()) {
        out.retry_on = core::join(policy.retry_on, ",");
    }
    if (!policy.per_try_timeout.empty()) {
        out.per_try_timeout =
            parse_timeout(policy.per_try_timeout, "retryPolicy.perTryTimeout", error);
        if (!out.per_try_timeout) {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<LocalRateLimit> local_rate_limit_from(const source::LocalRateLimitPolicy& policy,
                                                    std::string& error) {
    if (policy.requests == 0) {
        error = "local rate limit requests must be greater than zero";
        return std::nullopt;
    }
    LocalRateLimit out;
    out.requests = policy.requests;
    out.burst = policy.burst;
    if (policy.unit == "second") {
        out.unit = std::chrono::seconds{1};
    } else if (policy.unit == "minute") {
        out.unit = std::chrono::seconds{60};
    } else if (policy.unit == "hour") {
        out.unit = std::chrono::seconds{3600};
    } else {
        error = fmt::format("local rate limit unit \"{}\" must be second, minute or hour",
                            policy.unit);
        return std::nullopt;
    }
    return out;
}

bool validate_rate_limit(const std::optional<source::RateLimitPolicy>& policy,
                         std::string& error) {
    if (!policy || !policy->local) {
        return true;
    }
    return local_rate_limit_from(*policy->local, error).has_value();
}

RateLimitPolicy resolve_rate_limit(
    const std::optional<control::GlobalRateLimitConfig>& default_global,
    const std::optional<source::RateLimitPolicy>& vhost,
    const std::optional<source::RateLimitPolicy>& route, std::string& error) {
    RateLimitPolicy out;

    if (default_global) {
        out.global = GlobalRateLimit{{default_global->domain}};
    }

    for (const auto* level : {&vhost, &route}) {
        if (!level->has_value()) {
            continue;
        }
        const auto& policy = level->value();
        if (policy.local) {
            auto local = local_rate_limit_from(*policy.local, error);
            if (!local) {
                return out;
            }
            out.local = *local;
        }
        if (policy.global) {
            if (policy.global->disabled) {
                out.global.reset();
            } else {
                out.global = GlobalRateLimit{policy.global->descriptors};
            }
        }
    }
    return out;
}

std::optional<ExternalAuth> resolve_auth(const std::optional<ExternalAuth>& vhost,
                                         const std::optional<source::AuthorizationPolicy>& route) {
    if (!vhost) {
        return std::nullopt;
    }
    if (!route) {
        return vhost;
    }
    if (route->disabled) {
        return std::nullopt;
    }
    ExternalAuth out = *vhost;
    for (const auto& [key, value] : route->context) {
        out.context[key] = value;
    }
    return out;
}

std::optional<ExternalAuth> default_auth(const control::PolicyConfig& policy) {
    if (!policy.global_external_auth) {
        return std::nullopt;
    }
    const auto& cfg = *policy.global_external_auth;
    ExternalAuth out;
    out.service = source::parse_namespaced_name(cfg.extension_service, "");
    out.fail_open = cfg.fail_open;
    out.context = cfg.auth_policy.context;
    if (cfg.response_timeout_ms > 0) {
        out.response_timeout = std::chrono::milliseconds{cfg.response_timeout_ms};
    }
    return out;
}

std::vector<std::string> http_filter_order(bool auth_before_rate_limit) {
    if (auth_before_rate_limit) {
        return {"cors", "ext_authz", "local_ratelimit", "ratelimit", "router"};
    }
    return {"cors", "local_ratelimit", "ratelimit", "ext_authz", "router"};
}

bool valid_load_balancer_strategy(std::string_view strategy) noexcept {
    return strategy.empty() || strategy == "RoundRobin" || strategy == "WeightedLeastRequest" ||
           strategy == "Random" || strategy == "Cookie" || strategy == "RequestHash";
}

}  // namespace lattice::dag
