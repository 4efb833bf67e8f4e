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


// Lattice Extension Resolver - Header
// Lazy validation of ExtensionServices referenced by authorization and rate
// limit settings

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include "../source/cache.hpp"
#include "dag.hpp"
#include "status.hpp"

namespace lattice::dag {

enum class ExtensionError {
    NotFound = 1,
    Invalid,  // Details are on the ExtensionService's status
};

class ExtensionErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "extension";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const ExtensionErrorCategory& extension_category() noexcept;

[[nodiscard]] std::error_code make_error_code(ExtensionError e) noexcept;

/// "extension/<namespace>/<name>"
[[nodiscard]] std::string extension_cluster_name(const source::NamespacedName& name);

/// Builds the ExtensionCluster of an ExtensionService the first time something
/// references it and reports problems on the ExtensionService's own status.
/// Unreferenced ExtensionServices are never looked at.
class ExtensionResolver {
public:
    ExtensionResolver(const source::ObjectCache& cache, StatusCache& status)
        : cache_(cache), status_(status) {}

    ExtensionResolver(const ExtensionResolver&) = delete;
    ExtensionResolver& operator=(const ExtensionResolver&) = delete;

    /// On success the extension and its upstream clusters are registered in
    /// the fragment and key receives the Dag::extensions key.
    [[nodiscard]] std::error_code resolve(const source::NamespacedName& name, Dag& fragment,
                                          std::string& key);

    /// Number of ExtensionServices actually built
    [[nodiscard]] size_t validated_count() const noexcept { return validated_; }

private:
    struct Resolved {
        std::error_code error;
        ExtensionCluster extension;
        std::vector<Cluster> clusters;
    };

    Resolved build(const source::ExtensionService& ext);

    const source::ObjectCache& cache_;
    StatusCache& status_;
    std::map<source::NamespacedName, Resolved> results_;
    size_t validated_ = 0;
};

}  // namespace lattice::dag

namespace std {
template <>
struct is_error_code_enum<lattice::dag::ExtensionError> : true_type {};
}  // namespace std
