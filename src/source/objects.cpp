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

// Lattice Source Objects - Implementation

#include "objects.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "../core/containers.hpp"

namespace lattice::source {

namespace {

constexpr std::array<std::pair<Kind, std::string_view>, 14> kKindNames = {{
    {Kind::HTTPProxy, "HTTPProxy"},
    {Kind::Ingress, "Ingress"},
    {Kind::Gateway, "Gateway"},
    {Kind::GatewayClass, "GatewayClass"},
    {Kind::HTTPRoute, "HTTPRoute"},
    {Kind::GRPCRoute, "GRPCRoute"},
    {Kind::TLSRoute, "TLSRoute"},
    {Kind::TCPRoute, "TCPRoute"},
    {Kind::ReferenceGrant, "ReferenceGrant"},
    {Kind::Secret, "Secret"},
    {Kind::Service, "Service"},
    {Kind::Namespace, "Namespace"},
    {Kind::TLSCertificateDelegation, "TLSCertificateDelegation"},
    {Kind::ExtensionService, "ExtensionService"},
}};

}  // namespace

std::string_view to_string(Kind kind) noexcept {
    for (const auto& [k, name] : kKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "Unknown";
}

Kind parse_kind(std::string_view kind) noexcept {
    for (const auto& [k, name] : kKindNames) {
        if (name == kind) {
            return k;
        }
    }
    return Kind::Unknown;
}

uint64_t NamespacedNameHash::operator()(const NamespacedName& n) const noexcept {
    return core::hash_combine(core::hash_string(n.ns), core::hash_string(n.name));
}

NamespacedName parse_namespaced_name(std::string_view value, std::string_view default_ns) {
    auto slash = value.find('/');
    if (slash == std::string_view::npos) {
        return {std::string(default_ns), std::string(value)};
    }
    return {std::string(value.substr(0, slash)), std::string(value.substr(slash + 1))};
}

std::string_view ObjectMeta::annotation(std::string_view key) const {
    auto it = annotations.find(std::string(key));
    if (it == annotations.end()) {
        return {};
    }
    return it->second;
}

std::string ObjectRef::str() const {
    std::string out(to_string(kind));
    out += ' ';
    out += name.str();
    return out;
}

bool wins_tie_break(const ObjectRef& a, const ObjectRef& b) noexcept {
    if (a.creation_timestamp != b.creation_timestamp) {
        return a.creation_timestamp < b.creation_timestamp;
    }
    return a.name < b.name;
}

bool LabelSelector::matches(const std::map<std::string, std::string>& labels) const {
    for (const auto& [key, value] : match_labels) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
            return false;
        }
    }
    for (const auto& req : match_expressions) {
        auto it = labels.find(req.key);
        bool has = it != labels.end();
        bool in_values =
            has && std::find(req.values.begin(), req.values.end(), it->second) != req.values.end();
        if (req.op == "In" && !in_values) {
            return false;
        }
        if (req.op == "NotIn" && in_values) {
            return false;
        }
        if (req.op == "Exists" && !has) {
            return false;
        }
        if (req.op == "DoesNotExist" && has) {
            return false;
        }
        if (req.op != "In" && req.op != "NotIn" && req.op != "Exists" &&
            req.op != "DoesNotExist") {
            // Unknown operators select nothing
            return false;
        }
    }
    return true;
}

Kind kind_of(const Object& object) noexcept {
    // Variant alternatives are declared in Kind order
    return static_cast<Kind>(object.index());
}

const ObjectMeta& meta_of(const Object& object) noexcept {
    return std::visit([](const auto& o) -> const ObjectMeta& { return o.metadata; }, object);
}

}  // namespace lattice::source
