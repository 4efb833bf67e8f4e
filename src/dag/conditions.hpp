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

// Lattice DAG Conditions - Header
// Path, header and query matching shared by every processor

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"
#include "../source/objects.hpp"

namespace lattice::dag {

/// How a prefix compares against a request path
enum class PrefixMatchType : uint8_t {
    String,   // Raw string prefix: /foo matches /foobar
    Segment,  // Segment boundary: /foo matches /foo and /foo/bar, not /foobar
};

enum class PathMatchKind : uint8_t {
    Exact,
    Regex,
    Prefix,
};

struct PathMatch {
    PathMatchKind kind = PathMatchKind::Prefix;
    std::string value = "/";
    PrefixMatchType prefix_type = PrefixMatchType::Segment;

    [[nodiscard]] static PathMatch prefix(std::string value,
                                          PrefixMatchType type = PrefixMatchType::Segment);
    [[nodiscard]] static PathMatch exact(std::string value);
    [[nodiscard]] static PathMatch regex(std::string value);

    [[nodiscard]] bool matches(std::string_view path) const;

    /// "prefix:/foo", "exact:/foo", "regex:/foo.*"
    [[nodiscard]] std::string str() const;

    auto operator<=>(const PathMatch&) const = default;
    bool operator==(const PathMatch&) const = default;
};

enum class MatchType : uint8_t {
    Exact,
    Prefix,
    Suffix,
    Contains,
    Regex,
    Present,
};

[[nodiscard]] std::string_view to_string(MatchType type) noexcept;

/// Header predicate. Negative forms set invert; a missing header only matches
/// an inverted Present check unless treat_missing_as_empty is set.
struct HeaderMatch {
    std::string name;
    MatchType type = MatchType::Exact;
    std::string value;
    bool invert = false;
    bool ignore_case = false;
    bool treat_missing_as_empty = false;

    [[nodiscard]] bool matches(const http::Request& request) const;
    [[nodiscard]] std::string str() const;

    auto operator<=>(const HeaderMatch&) const = default;
    bool operator==(const HeaderMatch&) const = default;
};

struct QueryParamMatch {
    std::string name;
    MatchType type = MatchType::Exact;
    std::string value;
    bool ignore_case = false;

    [[nodiscard]] bool matches(const http::Request& request) const;
    [[nodiscard]] std::string str() const;

    auto operator<=>(const QueryParamMatch&) const = default;
    bool operator==(const QueryParamMatch&) const = default;
};

/// Complete effective match of a route
struct MatchConditions {
    PathMatch path;
    std::vector<HeaderMatch> headers;
    std::vector<QueryParamMatch> query_params;
    std::string method;  // Empty = any

    [[nodiscard]] bool matches(const http::Request& request) const;

    /// Canonical form: two routes collide when their keys are equal.
    /// Header and query predicates are order-insensitive.
    [[nodiscard]] std::string key() const;
};

/// Bounds applied to every regex a route carries
struct RegexLimits {
    size_t max_program_size = 4096;
    size_t warn_program_size = 1024;
};

/// Validation failure carrying the condition reason it maps to
struct ConditionError {
    std::string reason;
    std::string message;
};

/// Check a regex against the limits. A syntax error reports invalid_reason, an
/// oversized program RegexProgramSizeExceeded. Programs above the warning size
/// append a message to warnings.
[[nodiscard]] std::optional<ConditionError> check_regex_limits(std::string_view pattern,
                                                               std::string_view invalid_reason,
                                                               const RegexLimits& limits,
                                                               std::vector<std::string>& warnings);

// ============================
// HTTPProxy condition lists
// ============================

/// Path rules for a condition block: at most one path condition, each element
/// sets at most one of prefix/exact/regex, prefix and exact start with '/'.
/// Include blocks (allow_exact_and_regex = false) accept prefixes only.
[[nodiscard]] std::optional<ConditionError> path_conditions_error(
    const std::vector<source::MatchCondition>& conditions, bool allow_exact_and_regex,
    const RegexLimits& limits, std::vector<std::string>& warnings);

/// Header rules: a name and exactly one match form per element, no duplicate
/// exact matches for one header, no contradictory pairs (present/notpresent,
/// exact/notexact, contains/notcontains with equal values), treatMissingAsEmpty
/// only on negative forms, regexes within the limits.
[[nodiscard]] std::optional<ConditionError> header_conditions_error(
    const std::vector<source::MatchCondition>& conditions, const RegexLimits& limits,
    std::vector<std::string>& warnings);

/// Query rules: a name and exactly one match form per element, no duplicate
/// exact matches for one parameter, regexes within the limits.
[[nodiscard]] std::optional<ConditionError> query_conditions_error(
    const std::vector<source::MatchCondition>& conditions, const RegexLimits& limits,
    std::vector<std::string>& warnings);

/// Concatenate the inherited include prefixes with the route's own path
/// condition. Runs of '/' collapse to one; an empty result is "/". A route
/// path of "/" under a non-root prefix adds nothing, so /a + / is /a.
[[nodiscard]] PathMatch merge_path_conditions(const std::vector<source::MatchCondition>& inherited,
                                              const std::vector<source::MatchCondition>& own);

[[nodiscard]] std::vector<HeaderMatch> header_matches_from(
    const std::vector<source::MatchCondition>& conditions);

[[nodiscard]] std::vector<QueryParamMatch> query_matches_from(
    const std::vector<source::MatchCondition>& conditions);

/// Whole-set comparison used for duplicate include detection. Element order
/// does not matter.
[[nodiscard]] bool include_conditions_identical(const std::vector<source::MatchCondition>& a,
                                                const std::vector<source::MatchCondition>& b);

/// Empty condition list, or only "/" prefixes: never a duplicate include
[[nodiscard]] bool is_default_include(const std::vector<source::MatchCondition>& conditions);

/// Escape regex metacharacters so the text matches literally
[[nodiscard]] std::string regex_escape(std::string_view text);

/// Regex matching a single DNS label in place of a leading "*." wildcard
[[nodiscard]] std::string wildcard_authority_regex(std::string_view fqdn);

}  // namespace lattice::dag
