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

// Configuration Validator - Enumerated values and typo detection

#pragma once

#include <string>
#include <vector>

#include "config.hpp"

namespace lattice::control {

/// Checks enumerated string settings and suggests the closest valid value on typos
class ConfigValidator {
public:
    /// Validate enumerated settings and namespace names
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Kinds accepted in dag.schema_precedence
    [[nodiscard]] static const std::vector<std::string>& known_kinds();

    /// Values accepted in dag.cross_schema_conflict_policy
    [[nodiscard]] static const std::vector<std::string>& known_conflict_policies();

private:
    /// Validate the cross-schema conflict policy and its precedence list
    static void validate_conflict_policy(const Config& config, ValidationResult& result);

    /// Validate namespace restriction lists
    static void validate_namespaces(const Config& config, ValidationResult& result);

    /// Validate logging level and format
    static void validate_logging(const Config& config, ValidationResult& result);

    /// " (did you mean 'x'?)" or empty
    [[nodiscard]] static std::string suggest(const std::string& typo,
                                             const std::vector<std::string>& candidates);
};

}  // namespace lattice::control
