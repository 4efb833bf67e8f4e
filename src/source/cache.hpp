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

// Lattice Object Cache - Header
// Point-in-time view of the objects the graph builder reads

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "objects.hpp"

namespace lattice::source {

/// Keyed store of every object kind the builder consumes.
///
/// Not thread-safe: the rebuild loop owns the cache and applies inserts and
/// removals on its own thread between builds, so a build always reads a
/// consistent view. Stores are ordered by namespace/name, which makes every
/// iteration independent of arrival order.
class ObjectCache {
public:
    template <typename T>
    using Store = std::map<NamespacedName, T>;

    ObjectCache() = default;
    explicit ObjectCache(std::vector<std::string> watched_namespaces);

    /// Add or replace an object. Returns false when the object is outside the
    /// watched namespaces or an identical resource version is already stored.
    bool insert(Object object);

    /// Remove an object. Returns false when nothing was stored under the key.
    bool remove(Kind kind, const NamespacedName& name);

    /// Replace the full contents. Returns true when anything was stored before
    /// or after (the view is treated as changed).
    bool replace_all(std::vector<Object> objects);

    void clear();

    [[nodiscard]] size_t size() const noexcept;

    /// Whether objects in this namespace are visible to the builder
    [[nodiscard]] bool watches(std::string_view ns) const;

    template <typename T>
    [[nodiscard]] const Store<T>& all() const noexcept {
        return std::get<Store<T>>(stores_);
    }

    /// Lookup by key; nullptr when absent
    template <typename T>
    [[nodiscard]] const T* get(const NamespacedName& name) const {
        const auto& store = all<T>();
        auto it = store.find(name);
        return it == store.end() ? nullptr : &it->second;
    }

    /// A secret in another namespace may be used from target_ns only when a
    /// TLSCertificateDelegation in the secret's namespace names target_ns (or "*").
    [[nodiscard]] bool delegation_permitted(const NamespacedName& secret,
                                            std::string_view target_ns) const;

    /// Gateway API cross-namespace reference check. The grant must live in the
    /// target namespace, list the referrer in "from" and the target in "to".
    [[nodiscard]] bool reference_permitted(std::string_view from_group, std::string_view from_kind,
                                           std::string_view from_ns, std::string_view to_group,
                                           std::string_view to_kind,
                                           const NamespacedName& to) const;

    /// Labels of a Namespace object; empty when the namespace is unknown
    [[nodiscard]] const std::map<std::string, std::string>& namespace_labels(
        std::string_view ns) const;

    /// Initial listing delivered to this cache
    void mark_synced() noexcept { synced_ = true; }
    [[nodiscard]] bool synced() const noexcept { return synced_; }

private:
    std::vector<std::string> watched_namespaces_;
    bool synced_ = false;

    std::tuple<Store<HTTPProxy>, Store<Ingress>, Store<Gateway>, Store<GatewayClass>,
               Store<HTTPRoute>, Store<GRPCRoute>, Store<TLSRoute>, Store<TCPRoute>,
               Store<ReferenceGrant>, Store<Secret>, Store<Service>, Store<Namespace>,
               Store<TLSCertificateDelegation>, Store<ExtensionService>>
        stores_;
};

}  // namespace lattice::source
