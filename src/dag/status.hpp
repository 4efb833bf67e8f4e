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

// Lattice Status - Header
// Conditions computed during a build, keyed by source object

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../source/objects.hpp"

namespace lattice::dag {

inline constexpr std::string_view kConditionTrue = "True";
inline constexpr std::string_view kConditionFalse = "False";

// HTTPProxy detailed-condition error types
inline constexpr std::string_view kIncludeError = "IncludeError";
inline constexpr std::string_view kRouteError = "RouteError";
inline constexpr std::string_view kServiceError = "ServiceError";
inline constexpr std::string_view kSpecError = "SpecError";
inline constexpr std::string_view kTlsError = "TLSError";
inline constexpr std::string_view kVirtualHostError = "VirtualHostError";
inline constexpr std::string_view kTcpProxyError = "TCPProxyError";
inline constexpr std::string_view kTcpProxyIncludeError = "TCPProxyIncludeError";
inline constexpr std::string_view kAuthError = "AuthError";
inline constexpr std::string_view kPrefixReplaceError = "PrefixReplaceError";
inline constexpr std::string_view kRootNamespaceError = "RootNamespaceError";
inline constexpr std::string_view kCorsError = "CORSError";
inline constexpr std::string_view kOrphanedError = "Orphaned";

inline constexpr std::string_view kOrphanedMessage =
    "this HTTPProxy is not part of a delegation chain from a root HTTPProxy";

struct Condition {
    std::string type;
    std::string status;
    std::string reason;
    std::string message;
    int64_t observed_generation = 0;

    bool operator==(const Condition&) const = default;
};

/// Error or warning detail of an HTTPProxy Valid condition
struct SubCondition {
    std::string type;
    std::string reason;
    std::string message;

    bool operator==(const SubCondition&) const = default;
};

/// Per-parent status of a Gateway API route
struct ParentStatus {
    source::NamespacedName gateway;
    std::string section_name;
    std::string controller_name;
    std::vector<Condition> conditions;

    bool operator==(const ParentStatus&) const = default;
};

/// Per-listener status of a Gateway
struct ListenerStatus {
    std::string name;
    int32_t attached_routes = 0;
    std::vector<std::string> supported_kinds;
    std::vector<Condition> conditions;

    bool operator==(const ListenerStatus&) const = default;
};

/// Status of one source object after a build
struct ObjectStatus {
    source::ObjectRef object;
    std::vector<Condition> conditions;

    // HTTPProxy: Valid condition details
    std::string current_status;  // valid, invalid, orphaned
    std::string description;
    std::vector<SubCondition> errors;
    std::vector<SubCondition> warnings;

    // Gateway API
    std::vector<ParentStatus> parents;
    std::vector<ListenerStatus> listeners;

    bool operator==(const ObjectStatus& other) const {
        return object == other.object && object.generation == other.object.generation &&
               conditions == other.conditions && current_status == other.current_status &&
               description == other.description && errors == other.errors &&
               warnings == other.warnings && parents == other.parents &&
               listeners == other.listeners;
    }

    /// Add an error to the Valid condition. Errors of the same type merge:
    /// messages join with ", ", differing reasons become MultipleReasons.
    void add_error(std::string_view type, std::string_view reason, std::string_view message);
    void add_warning(std::string_view type, std::string_view reason, std::string_view message);

    [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool has_error(std::string_view type) const;

    /// Replace the condition of this type
    void set_condition(std::string_view type, std::string_view status, std::string_view reason,
                       std::string_view message);

    /// Add or update a condition; an existing condition of the same type takes
    /// the new status and reason and appends the message after ", "
    void add_condition(std::string_view type, std::string_view status, std::string_view reason,
                       std::string_view message);

    [[nodiscard]] const Condition* find_condition(std::string_view type) const;

    /// Parent status for a route parent reference, created on first use
    ParentStatus& parent(const source::NamespacedName& gateway, std::string_view section_name,
                         std::string_view controller_name);

    ListenerStatus& listener(std::string_view name);
};

/// Every status computed during one build
class StatusCache {
public:
    /// Status entry for an object, created on first use
    ObjectStatus& at(const source::ObjectRef& ref);

    [[nodiscard]] const ObjectStatus* find(const source::ObjectRef& ref) const;
    [[nodiscard]] bool contains(const source::ObjectRef& ref) const;

    /// Mark an HTTPProxy orphaned
    void orphan(const source::ObjectRef& ref);

    /// Report that a route of loser lost against winner. full = every route of
    /// the loser lost, otherwise the object is partially invalid.
    void record_conflict(const source::ObjectRef& loser, const source::ObjectRef& winner,
                         bool full, std::string_view detail);

    /// Finalize derived fields (HTTPProxy Valid condition and current status)
    /// and return the statuses ordered by object identity
    [[nodiscard]] std::vector<ObjectStatus> finalize() const;

    [[nodiscard]] size_t size() const noexcept { return statuses_.size(); }

private:
    std::map<source::ObjectRef, ObjectStatus> statuses_;
};

[[nodiscard]] nlohmann::json to_json(const ObjectStatus& status);

}  // namespace lattice::dag
