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

// Lattice Object Cache - Implementation

#include "cache.hpp"

#include <algorithm>
#include <utility>

namespace lattice::source {

namespace {

// Cluster-scoped kinds are never filtered by namespace
bool cluster_scoped(Kind kind) noexcept {
    return kind == Kind::GatewayClass || kind == Kind::Namespace;
}

bool group_matches(std::string_view a, std::string_view b) noexcept {
    // "core" and "" both name the core API group
    auto norm = [](std::string_view g) { return g == "core" ? std::string_view{} : g; };
    return norm(a) == norm(b);
}

}  // namespace

ObjectCache::ObjectCache(std::vector<std::string> watched_namespaces)
    : watched_namespaces_(std::move(watched_namespaces)) {}

bool ObjectCache::watches(std::string_view ns) const {
    if (watched_namespaces_.empty()) {
        return true;
    }
    return std::find(watched_namespaces_.begin(), watched_namespaces_.end(), ns) !=
           watched_namespaces_.end();
}

bool ObjectCache::insert(Object object) {
    Kind kind = kind_of(object);
    const auto& meta = meta_of(object);
    if (!cluster_scoped(kind) && !watches(meta.ns)) {
        return false;
    }

    return std::visit(
        [this](auto&& o) {
            using T = std::decay_t<decltype(o)>;
            auto& store = std::get<Store<T>>(stores_);
            auto key = o.metadata.key();
            auto it = store.find(key);
            if (it != store.end() && !o.metadata.resource_version.empty() &&
                it->second.metadata.resource_version == o.metadata.resource_version) {
                return false;
            }
            store.insert_or_assign(std::move(key), std::move(o));
            return true;
        },
        std::move(object));
}

bool ObjectCache::remove(Kind kind, const NamespacedName& name) {
    auto erase = [&name](auto& store) { return store.erase(name) > 0; };
    switch (kind) {
        case Kind::HTTPProxy:
            return erase(std::get<Store<HTTPProxy>>(stores_));
        case Kind::Ingress:
            return erase(std::get<Store<Ingress>>(stores_));
        case Kind::Gateway:
            return erase(std::get<Store<Gateway>>(stores_));
        case Kind::GatewayClass:
            return erase(std::get<Store<GatewayClass>>(stores_));
        case Kind::HTTPRoute:
            return erase(std::get<Store<HTTPRoute>>(stores_));
        case Kind::GRPCRoute:
            return erase(std::get<Store<GRPCRoute>>(stores_));
        case Kind::TLSRoute:
            return erase(std::get<Store<TLSRoute>>(stores_));
        case Kind::TCPRoute:
            return erase(std::get<Store<TCPRoute>>(stores_));
        case Kind::ReferenceGrant:
            return erase(std::get<Store<ReferenceGrant>>(stores_));
        case Kind::Secret:
            return erase(std::get<Store<Secret>>(stores_));
        case Kind::Service:
            return erase(std::get<Store<Service>>(stores_));
        case Kind::Namespace:
            return erase(std::get<Store<Namespace>>(stores_));
        case Kind::TLSCertificateDelegation:
            return erase(std::get<Store<TLSCertificateDelegation>>(stores_));
        case Kind::ExtensionService:
            return erase(std::get<Store<ExtensionService>>(stores_));
        case Kind::Unknown:
            break;
    }
    return false;
}

bool ObjectCache::replace_all(std::vector<Object> objects) {
    bool changed = size() > 0;
    clear();
    for (auto& object : objects) {
        changed = insert(std::move(object)) || changed;
    }
    return changed;
}

void ObjectCache::clear() {
    std::apply([](auto&... store) { (store.clear(), ...); }, stores_);
}

size_t ObjectCache::size() const noexcept {
    return std::apply([](const auto&... store) { return (store.size() + ...); }, stores_);
}

bool ObjectCache::delegation_permitted(const NamespacedName& secret,
                                       std::string_view target_ns) const {
    if (secret.ns == target_ns) {
        return true;
    }
    for (const auto& [key, delegation] : all<TLSCertificateDelegation>()) {
        if (key.ns != secret.ns) {
            continue;
        }
        for (const auto& d : delegation.delegations) {
            if (d.secret_name != secret.name) {
                continue;
            }
            for (const auto& ns : d.target_namespaces) {
                if (ns == "*" || ns == target_ns) {
                    return true;
                }
            }
        }
    }
    return false;
}

bool ObjectCache::reference_permitted(std::string_view from_group, std::string_view from_kind,
                                      std::string_view from_ns, std::string_view to_group,
                                      std::string_view to_kind, const NamespacedName& to) const {
    if (from_ns == to.ns) {
        return true;
    }
    for (const auto& [key, grant] : all<ReferenceGrant>()) {
        if (key.ns != to.ns) {
            continue;
        }
        bool from_ok = std::any_of(grant.from.begin(), grant.from.end(), [&](const auto& f) {
            return group_matches(f.group, from_group) && f.kind == from_kind && f.ns == from_ns;
        });
        if (!from_ok) {
            continue;
        }
        bool to_ok = std::any_of(grant.to.begin(), grant.to.end(), [&](const auto& t) {
            return group_matches(t.group, to_group) && t.kind == to_kind &&
                   (t.name.empty() || t.name == to.name);
        });
        if (to_ok) {
            return true;
        }
    }
    return false;
}

const std::map<std::string, std::string>& ObjectCache::namespace_labels(
    std::string_view ns) const {
    static const std::map<std::string, std::string> kNoLabels;
    const auto* object = get<Namespace>(NamespacedName{"", std::string(ns)});
    return object ? object->metadata.labels : kNoLabels;
}

}  // namespace lattice::source
