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

// Lattice DAG Conditions - Implementation

#include "conditions.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "../core/string_utils.hpp"
#include "../http/regex.hpp"

namespace lattice::dag {

namespace {

constexpr std::string_view kPathInvalid = "PathMatchConditionsNotValid";
constexpr std::string_view kHeaderInvalid = "HeaderMatchConditionsNotValid";
constexpr std::string_view kQueryInvalid = "QueryParameterMatchConditionsNotValid";

bool regex_matches(const std::string& pattern, std::string_view subject, bool ignore_case) {
    http::RegexOptions options;
    options.case_insensitive = ignore_case;
    std::string error;
    auto regex = http::Regex::compile(pattern, options, error);
    return regex && regex->matches(subject);
}

bool string_matches(MatchType type, std::string_view subject, std::string_view value,
                    bool ignore_case) {
    std::string lowered_subject;
    std::string lowered_value;
    if (ignore_case && type != MatchType::Regex) {
        lowered_subject = core::to_lower(subject);
        lowered_value = core::to_lower(value);
        subject = lowered_subject;
        value = lowered_value;
    }
    switch (type) {
        case MatchType::Exact:
            return subject == value;
        case MatchType::Prefix:
            return subject.starts_with(value);
        case MatchType::Suffix:
            return subject.ends_with(value);
        case MatchType::Contains:
            return subject.find(value) != std::string_view::npos;
        case MatchType::Regex:
            return regex_matches(std::string(value), subject, ignore_case);
        case MatchType::Present:
            return true;
    }
    return false;
}

std::string collapse_slashes(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

int path_form_count(const source::MatchCondition& c) {
    return static_cast<int>(c.prefix.has_value()) + static_cast<int>(c.exact.has_value()) +
           static_cast<int>(c.regex.has_value());
}

std::string join_sorted(std::vector<std::string> parts) {
    std::sort(parts.begin(), parts.end());
    return core::join(parts, ",");
}

}  // namespace

// ============================
// PathMatch
// ============================

PathMatch PathMatch::prefix(std::string value, PrefixMatchType type) {
    return PathMatch{PathMatchKind::Prefix, std::move(value), type};
}

PathMatch PathMatch::exact(std::string value) {
    return PathMatch{PathMatchKind::Exact, std::move(value), PrefixMatchType::String};
}

PathMatch PathMatch::regex(std::string value) {
    return PathMatch{PathMatchKind::Regex, std::move(value), PrefixMatchType::String};
}

bool PathMatch::matches(std::string_view path) const {
    switch (kind) {
        case PathMatchKind::Exact:
            return path == value;
        case PathMatchKind::Regex:
            return regex_matches(value, path, false);
        case PathMatchKind::Prefix:
            break;
    }

    if (!path.starts_with(value)) {
        return false;
    }
    if (prefix_type == PrefixMatchType::String || value.empty() || value.back() == '/') {
        return true;
    }
    return path.size() == value.size() || path[value.size()] == '/';
}

std::string PathMatch::str() const {
    switch (kind) {
        case PathMatchKind::Exact:
            return "exact:" + value;
        case PathMatchKind::Regex:
            return "regex:" + value;
        case PathMatchKind::Prefix:
            break;
    }
    // String and segment prefixes claim the same route space
    return "prefix:" + value;
}

// ============================
// Header and query predicates
// ============================

std::string_view to_string(MatchType type) noexcept {
    switch (type) {
        case MatchType::Exact:
            return "exact";
        case MatchType::Prefix:
            return "prefix";
        case MatchType::Suffix:
            return "suffix";
        case MatchType::Contains:
            return "contains";
        case MatchType::Regex:
            return "regex";
        case MatchType::Present:
            return "present";
    }
    return "unknown";
}

bool HeaderMatch::matches(const http::Request& request) const {
    auto header = request.header(name);
    if (!header && !treat_missing_as_empty) {
        return type == MatchType::Present && invert;
    }

    bool matched = type == MatchType::Present
                       ? header.has_value()
                       : string_matches(type, header.value_or(std::string_view{}), value,
                                        ignore_case);
    return matched != invert;
}

std::string HeaderMatch::str() const {
    return fmt::format("{}:{}{}{}={}{}", core::to_lower(name), invert ? "!" : "", to_string(type),
                       ignore_case ? "/i" : "", value,
                       treat_missing_as_empty ? "/missing-as-empty" : "");
}

bool QueryParamMatch::matches(const http::Request& request) const {
    auto param = request.query_param(name);
    if (!param) {
        return false;
    }
    return string_matches(type, *param, value, ignore_case);
}

std::string QueryParamMatch::str() const {
    return fmt::format("{}:{}{}={}", name, to_string(type), ignore_case ? "/i" : "", value);
}

bool MatchConditions::matches(const http::Request& request) const {
    if (!method.empty() && http::to_string(request.method) != method) {
        return false;
    }
    if (!path.matches(request.path)) {
        return false;
    }
    for (const auto& h : headers) {
        if (!h.matches(request)) {
            return false;
        }
    }
    for (const auto& q : query_params) {
        if (!q.matches(request)) {
            return false;
        }
    }
    return true;
}

std::string MatchConditions::key() const {
    std::vector<std::string> header_keys;
    header_keys.reserve(headers.size());
    for (const auto& h : headers) {
        header_keys.push_back(h.str());
    }
    std::vector<std::string> query_keys;
    query_keys.reserve(query_params.size());
    for (const auto& q : query_params) {
        query_keys.push_back(q.str());
    }
    return fmt::format("{}|method={}|headers={}|query={}", path.str(), method,
                       join_sorted(std::move(header_keys)), join_sorted(std::move(query_keys)));
}

// ============================
// Validation
// ============================

std::optional<ConditionError> check_regex_limits(std::string_view pattern,
                                                 std::string_view invalid_reason,
                                                 const RegexLimits& limits,
                                                 std::vector<std::string>& warnings) {
    auto check = http::check_regex(pattern, limits.max_program_size);
    if (!check.valid) {
        if (check.program_size > 0) {
            return ConditionError{"RegexProgramSizeExceeded",
                                  fmt::format("regex \"{}\": {}", pattern, check.error)};
        }
        return ConditionError{std::string(invalid_reason),
                              fmt::format("invalid regex \"{}\": {}", pattern, check.error)};
    }
    if (limits.warn_program_size > 0 && check.program_size > limits.warn_program_size) {
        warnings.push_back(fmt::format("regex \"{}\" program size {} is above the warning "
                                       "threshold {}",
                                       pattern, check.program_size, limits.warn_program_size));
    }
    return std::nullopt;
}

std::optional<ConditionError> path_conditions_error(
    const std::vector<source::MatchCondition>& conditions, bool allow_exact_and_regex,
    const RegexLimits& limits, std::vector<std::string>& warnings) {
    int prefix_count = 0;
    int path_count = 0;

    for (const auto& c : conditions) {
        int forms = path_form_count(c);
        if (forms > 1) {
            return ConditionError{std::string(kPathInvalid),
                                  "a condition may specify only one of prefix, exact or regex"};
        }
        if (forms == 0) {
            continue;
        }
        ++path_count;

        if (c.prefix) {
            ++prefix_count;
            if (c.prefix->empty() || c.prefix->front() != '/') {
                return ConditionError{
                    std::string(kPathInvalid),
                    fmt::format("prefix conditions must start with /, {} was supplied", *c.prefix)};
            }
        }
        if ((c.exact || c.regex) && !allow_exact_and_regex) {
            return ConditionError{std::string(kPathInvalid),
                                  "include conditions may only use prefix path matching"};
        }
        if (c.exact && (c.exact->empty() || c.exact->front() != '/')) {
            return ConditionError{
                std::string(kPathInvalid),
                fmt::format("exact conditions must start with /, {} was supplied", *c.exact)};
        }
        if (c.regex) {
            if (auto err = check_regex_limits(*c.regex, kPathInvalid, limits, warnings)) {
                return err;
            }
        }
    }

    if (prefix_count > 1) {
        return ConditionError{std::string(kPathInvalid),
                              "more than one prefix is not allowed in a condition block"};
    }
    if (path_count > 1) {
        return ConditionError{std::string(kPathInvalid),
                              "more than one path match is not allowed in a condition block"};
    }
    return std::nullopt;
}

std::optional<ConditionError> header_conditions_error(
    const std::vector<source::MatchCondition>& conditions, const RegexLimits& limits,
    std::vector<std::string>& warnings) {
    std::set<std::string> seen;
    std::set<std::string> exact_headers;

    auto contradiction = [](std::string_view a, std::string_view b) {
        return ConditionError{
            std::string(kHeaderInvalid),
            fmt::format("cannot specify contradictory '{}' and '{}' conditions for the same route "
                        "and header",
                        a, b)};
    };

    for (const auto& c : conditions) {
        if (!c.header) {
            continue;
        }
        const auto& h = *c.header;
        if (h.name.empty()) {
            return ConditionError{std::string(kHeaderInvalid),
                                  "header match conditions must specify a header name"};
        }
        int forms = static_cast<int>(h.present) + static_cast<int>(h.not_present) +
                    static_cast<int>(h.contains.has_value()) +
                    static_cast<int>(h.not_contains.has_value()) +
                    static_cast<int>(h.exact.has_value()) +
                    static_cast<int>(h.not_exact.has_value()) +
                    static_cast<int>(h.regex.has_value());
        if (forms != 1) {
            return ConditionError{
                std::string(kHeaderInvalid),
                fmt::format("header condition for \"{}\" must specify exactly one match type",
                            h.name)};
        }
        bool negative = h.not_contains.has_value() || h.not_exact.has_value();
        if (h.treat_missing_as_empty && !negative) {
            return ConditionError{std::string(kHeaderInvalid),
                                  fmt::format("treatMissingAsEmpty on header \"{}\" is only "
                                              "valid with notcontains or notexact",
                                              h.name)};
        }

        std::string name = core::to_lower(h.name);
        std::string key;
        if (h.present) {
            if (seen.contains(name + "|notpresent")) {
                return contradiction("present", "notpresent");
            }
            key = name + "|present";
        } else if (h.not_present) {
            if (seen.contains(name + "|present")) {
                return contradiction("present", "notpresent");
            }
            key = name + "|notpresent";
        } else if (h.exact) {
            if (!exact_headers.insert(name).second) {
                return ConditionError{
                    std::string(kHeaderInvalid),
                    "cannot specify duplicate header 'exact match' conditions in the same route"};
            }
            if (seen.contains(name + "|notexact|" + *h.exact)) {
                return contradiction("exact", "notexact");
            }
            key = name + "|exact|" + *h.exact;
        } else if (h.not_exact) {
            if (seen.contains(name + "|exact|" + *h.not_exact)) {
                return contradiction("exact", "notexact");
            }
            key = name + "|notexact|" + *h.not_exact;
        } else if (h.contains) {
            if (seen.contains(name + "|notcontains|" + *h.contains)) {
                return contradiction("contains", "notcontains");
            }
            key = name + "|contains|" + *h.contains;
        } else if (h.not_contains) {
            if (seen.contains(name + "|contains|" + *h.not_contains)) {
                return contradiction("contains", "notcontains");
            }
            key = name + "|notcontains|" + *h.not_contains;
        } else if (h.regex) {
            if (auto err = check_regex_limits(*h.regex, kHeaderInvalid, limits, warnings)) {
                return err;
            }
            key = name + "|regex|" + *h.regex;
        }
        seen.insert(std::move(key));
    }
    return std::nullopt;
}

std::optional<ConditionError> query_conditions_error(
    const std::vector<source::MatchCondition>& conditions, const RegexLimits& limits,
    std::vector<std::string>& warnings) {
    std::set<std::string> exact_params;

    for (const auto& c : conditions) {
        if (!c.query_parameter) {
            continue;
        }
        const auto& q = *c.query_parameter;
        if (q.name.empty()) {
            return ConditionError{std::string(kQueryInvalid),
                                  "query parameter match conditions must specify a name"};
        }
        int forms = static_cast<int>(q.present) + static_cast<int>(q.exact.has_value()) +
                    static_cast<int>(q.prefix.has_value()) +
                    static_cast<int>(q.suffix.has_value()) +
                    static_cast<int>(q.regex.has_value()) +
                    static_cast<int>(q.contains.has_value());
        if (forms != 1) {
            return ConditionError{
                std::string(kQueryInvalid),
                fmt::format("query parameter condition for \"{}\" must specify exactly one match "
                            "type",
                            q.name)};
        }
        if (q.exact && !exact_params.insert(q.name).second) {
            return ConditionError{std::string(kQueryInvalid),
                                  "cannot specify duplicate query parameter 'exact match' "
                                  "conditions in the same route"};
        }
        if (q.regex) {
            if (auto err = check_regex_limits(*q.regex, kQueryInvalid, limits, warnings)) {
                return err;
            }
        }
    }
    return std::nullopt;
}

// ============================
// Merging
// ============================

PathMatch merge_path_conditions(const std::vector<source::MatchCondition>& inherited,
                                const std::vector<source::MatchCondition>& own) {
    std::string prefix;
    for (const auto& c : inherited) {
        if (c.prefix) {
            prefix += *c.prefix;
        }
    }

    const source::MatchCondition* path = nullptr;
    for (const auto& c : own) {
        if (path_form_count(c) > 0) {
            path = &c;
            break;
        }
    }

    if (path && path->exact) {
        return PathMatch::exact(collapse_slashes(prefix + *path->exact));
    }
    if (path && path->regex) {
        std::string base = collapse_slashes(prefix);
        if (!base.empty() && base.back() == '/' && path->regex->starts_with('/')) {
            base.pop_back();
        }
        return PathMatch::regex(regex_escape(base) + *path->regex);
    }

    std::string own_prefix = path ? *path->prefix : std::string();
    if (own_prefix == "/" && !prefix.empty()) {
        own_prefix.clear();
    }
    std::string merged = collapse_slashes(prefix + own_prefix);
    if (merged.empty()) {
        merged = "/";
    }
    return PathMatch::prefix(std::move(merged), PrefixMatchType::Segment);
}

std::vector<HeaderMatch> header_matches_from(const std::vector<source::MatchCondition>& conditions) {
    std::vector<HeaderMatch> out;
    for (const auto& c : conditions) {
        if (!c.header) {
            continue;
        }
        const auto& h = *c.header;
        HeaderMatch m;
        m.name = h.name;
        m.ignore_case = h.ignore_case;
        m.treat_missing_as_empty = h.treat_missing_as_empty;
        if (h.present) {
            m.type = MatchType::Present;
        } else if (h.not_present) {
            m.type = MatchType::Present;
            m.invert = true;
        } else if (h.contains) {
            m.type = MatchType::Contains;
            m.value = *h.contains;
        } else if (h.not_contains) {
            m.type = MatchType::Contains;
            m.value = *h.not_contains;
            m.invert = true;
        } else if (h.exact) {
            m.type = MatchType::Exact;
            m.value = *h.exact;
        } else if (h.not_exact) {
            m.type = MatchType::Exact;
            m.value = *h.not_exact;
            m.invert = true;
        } else if (h.regex) {
            m.type = MatchType::Regex;
            m.value = *h.regex;
        } else {
            continue;
        }
        out.push_back(std::move(m));
    }
    return out;
}

std::vector<QueryParamMatch> query_matches_from(
    const std::vector<source::MatchCondition>& conditions) {
    std::vector<QueryParamMatch> out;
    for (const auto& c : conditions) {
        if (!c.query_parameter) {
            continue;
        }
        const auto& q = *c.query_parameter;
        QueryParamMatch m;
        m.name = q.name;
        m.ignore_case = q.ignore_case;
        if (q.present) {
            m.type = MatchType::Present;
        } else if (q.exact) {
            m.type = MatchType::Exact;
            m.value = *q.exact;
        } else if (q.prefix) {
            m.type = MatchType::Prefix;
            m.value = *q.prefix;
        } else if (q.suffix) {
            m.type = MatchType::Suffix;
            m.value = *q.suffix;
        } else if (q.regex) {
            m.type = MatchType::Regex;
            m.value = *q.regex;
        } else if (q.contains) {
            m.type = MatchType::Contains;
            m.value = *q.contains;
        } else {
            continue;
        }
        out.push_back(std::move(m));
    }
    return out;
}

bool include_conditions_identical(const std::vector<source::MatchCondition>& a,
                                  const std::vector<source::MatchCondition>& b) {
    auto canonical = [](const std::vector<source::MatchCondition>& conditions) {
        MatchConditions m;
        m.path = merge_path_conditions(conditions, {});
        m.headers = header_matches_from(conditions);
        m.query_params = query_matches_from(conditions);
        return m.key();
    };
    return canonical(a) == canonical(b);
}

bool is_default_include(const std::vector<source::MatchCondition>& conditions) {
    return std::all_of(conditions.begin(), conditions.end(), [](const auto& c) {
        return !c.header && !c.query_parameter && !c.exact && !c.regex &&
               (!c.prefix || *c.prefix == "/");
    });
}

std::string regex_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::string_view("\\.^$|?*+()[]{}").find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string wildcard_authority_regex(std::string_view fqdn) {
    // "*.example.com" -> one DNS label followed by ".example.com"
    std::string_view suffix = fqdn.starts_with("*") ? fqdn.substr(1) : fqdn;
    return "[a-z0-9]([-a-z0-9]*[a-z0-9])?" + regex_escape(suffix);
}

}  // namespace lattice::dag
