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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "../core/string_utils.hpp"

namespace lattice::control {

namespace {

/// RFC 1123 label: lower-case alphanumerics and '-', alphanumeric at both ends, <= 63 chars
[[nodiscard]] bool is_dns1123_label(std::string_view name) {
    if (name.empty() || name.size() > 63) {
        return false;
    }
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '-')) {
            return false;
        }
    }
    return name.front() != '-' && name.back() != '-';
}

}  // namespace

const std::vector<std::string>& ConfigValidator::known_kinds() {
    static const std::vector<std::string> kinds = {"HTTPProxy", "HTTPRoute", "GRPCRoute",
                                                   "TLSRoute",  "TCPRoute",  "Ingress"};
    return kinds;
}

const std::vector<std::string>& ConfigValidator::known_conflict_policies() {
    static const std::vector<std::string> policies = {"oldest-wins", "schema-precedence"};
    return policies;
}

ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;

    validate_conflict_policy(config, result);
    validate_namespaces(config, result);
    validate_logging(config, result);

    return result;
}

void ConfigValidator::validate_conflict_policy(const Config& config, ValidationResult& result) {
    const auto& policy = config.dag.cross_schema_conflict_policy;
    const auto& policies = known_conflict_policies();
    if (std::find(policies.begin(), policies.end(), policy) == policies.end()) {
        result.add_error("Unknown dag.cross_schema_conflict_policy '" + policy + "'" +
                         suggest(policy, policies));
    }

    const auto& kinds = known_kinds();
    std::set<std::string> seen;
    for (const auto& kind : config.dag.schema_precedence) {
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
            result.add_error("Unknown kind '" + kind + "' in dag.schema_precedence" +
                             suggest(kind, kinds));
            continue;
        }
        if (!seen.insert(kind).second) {
            result.add_error("Duplicate kind '" + kind + "' in dag.schema_precedence");
        }
    }

    if (policy == "schema-precedence") {
        for (const auto& kind : kinds) {
            if (!seen.contains(kind)) {
                result.add_warning("Kind '" + kind +
                                   "' missing from dag.schema_precedence; it ranks last");
            }
        }
    }
}

void ConfigValidator::validate_namespaces(const Config& config, ValidationResult& result) {
    for (const auto& ns : config.dag.root_namespaces) {
        if (!is_dns1123_label(ns)) {
            result.add_error("Invalid namespace '" + ns + "' in dag.root_namespaces");
        }
    }
    for (const auto& ns : config.dag.watched_namespaces) {
        if (!is_dns1123_label(ns)) {
            result.add_error("Invalid namespace '" + ns + "' in dag.watched_namespaces");
        }
    }

    // Roots outside the watched set can never be seen
    if (!config.dag.watched_namespaces.empty()) {
        const auto& watched = config.dag.watched_namespaces;
        for (const auto& ns : config.dag.root_namespaces) {
            if (std::find(watched.begin(), watched.end(), ns) == watched.end()) {
                result.add_warning("Root namespace '" + ns + "' is not watched");
            }
        }
    }
}

void ConfigValidator::validate_logging(const Config& config, ValidationResult& result) {
    static const std::vector<std::string> levels = {"debug", "info", "warning", "warn", "error"};
    static const std::vector<std::string> formats = {"json", "text"};

    auto level = core::to_lower(config.logging.level);
    if (std::find(levels.begin(), levels.end(), level) == levels.end()) {
        result.add_warning("Unknown logging.level '" + config.logging.level +
                           "', using 'info'" + suggest(level, levels));
    }
    if (std::find(formats.begin(), formats.end(), config.logging.format) == formats.end()) {
        result.add_error("Unknown logging.format '" + config.logging.format + "'" +
                         suggest(config.logging.format, formats));
    }
}

std::string ConfigValidator::suggest(const std::string& typo,
                                     const std::vector<std::string>& candidates) {
    auto similar = core::find_similar_strings(typo, candidates, 3);
    if (similar.empty()) {
        return "";
    }
    return " (did you mean '" + similar.front() + "'?)";
}

}  // namespace lattice::control
