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

// Lattice Policy - Header
// Route policies and their precedence: route over virtual host over default

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../control/config.hpp"
#include "../source/objects.hpp"
#include "conditions.hpp"
#include "dag.hpp"

namespace lattice::dag {

[[nodiscard]] HeadersPolicy headers_from(const source::HeadersPolicy& policy);
[[nodiscard]] HeadersPolicy headers_from(const control::HeaderPolicyConfig& policy);

/// Layer a more specific policy over a less specific one. Set and add entries
/// replace entries of the same (case-insensitive) name; a header set at one
/// level and removed at a more specific one is removed.
[[nodiscard]] HeadersPolicy merge_headers(const HeadersPolicy& base,
                                          const HeadersPolicy& more_specific);

/// Checked conversion of a route or service header policy. Duplicate set or
/// remove names are rejected. A Host entry becomes host_rewrite when allowed,
/// otherwise it is an error.
[[nodiscard]] std::optional<HeadersPolicy> checked_headers_from(
    const source::HeadersPolicy& policy, bool allow_host_rewrite,
    std::optional<std::string>& host_rewrite, std::string& error);

/// At most one replacement per prefix and one default (empty prefix)
/// replacement. The error reason is DuplicateReplacement or AmbiguousReplacement.
[[nodiscard]] std::optional<ConditionError> prefix_replacement_error(
    const std::vector<source::ReplacePrefix>& replacements);

/// Rewrite for a routing prefix: the replacement naming that exact prefix,
/// else the default replacement
[[nodiscard]] std::optional<std::string> prefix_rewrite_for(
    const std::vector<source::ReplacePrefix>& replacements, std::string_view routing_prefix);

[[nodiscard]] std::optional<Redirect> redirect_from(const source::RequestRedirectPolicy& policy,
                                                    std::string& error);

/// "infinity" disables the timeout; otherwise a duration. nullopt with error set
/// when malformed.
[[nodiscard]] std::optional<TimeoutPolicy> timeout_policy_from(const source::TimeoutPolicy& policy,
                                                               std::string& error);

[[nodiscard]] std::optional<RetryPolicy> retry_policy_from(const source::RetryPolicy& policy,
                                                           std::string& error);

[[nodiscard]] std::optional<LocalRateLimit> local_rate_limit_from(
    const source::LocalRateLimitPolicy& policy, std::string& error);

/// False with error set when one level's policy cannot be used
[[nodiscard]] bool validate_rate_limit(const std::optional<source::RateLimitPolicy>& policy,
                                       std::string& error);

/// Effective rate limiting for a route. The local limit comes from the most
/// specific level declaring one. The global limit starts from the configured
/// default and each more specific level may replace or disable it.
[[nodiscard]] RateLimitPolicy resolve_rate_limit(
    const std::optional<control::GlobalRateLimitConfig>& default_global,
    const std::optional<source::RateLimitPolicy>& vhost,
    const std::optional<source::RateLimitPolicy>& route, std::string& error);

/// Effective external authorization for a route: the virtual host server (or
/// the configured default), disabled or re-contextualised by the route.
[[nodiscard]] std::optional<ExternalAuth> resolve_auth(
    const std::optional<ExternalAuth>& vhost,
    const std::optional<source::AuthorizationPolicy>& route);

/// Default authorization server from configuration
[[nodiscard]] std::optional<ExternalAuth> default_auth(const control::PolicyConfig& policy);

/// HTTP filter chain of a virtual host. Authorization runs after rate
/// limiting unless auth_before_rate_limit is set.
[[nodiscard]] std::vector<std::string> http_filter_order(bool auth_before_rate_limit);

/// RoundRobin, WeightedLeastRequest, Random, Cookie, RequestHash
[[nodiscard]] bool valid_load_balancer_strategy(std::string_view strategy) noexcept;

}  // namespace lattice::dag
