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

// Lattice DAG - Implementation

#include "dag.hpp"

#include <utility>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace lattice::dag {

std::string_view to_string(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::HTTP:
            return "http";
        case Protocol::HTTPS:
            return "https";
        case Protocol::TCP:
            return "tcp";
    }
    return "unknown";
}

std::string listener_name(Protocol protocol, int32_t port) {
    return fmt::format("{}-{}", to_string(protocol), port);
}

std::string cluster_name(const source::NamespacedName& service, int32_t port,
                         std::string_view protocol) {
    if (protocol.empty()) {
        return fmt::format("{}/{}/{}", service.ns, service.name, port);
    }
    return fmt::format("{}/{}/{}/{}", service.ns, service.name, port, protocol);
}

std::optional<RouteCollision> VirtualHost::add_route(Route route) {
    auto key = route.match.key();
    for (auto& existing : routes) {
        if (existing.match.key() != key) {
            continue;
        }
        if (existing.source == route.source ||
            source::wins_tie_break(existing.source, route.source)) {
            return RouteCollision{existing.source, route.source, std::move(key), hostname};
        }
        RouteCollision collision{route.source, existing.source, std::move(key), hostname};
        existing = std::move(route);
        return collision;
    }
    routes.push_back(std::move(route));
    return std::nullopt;
}

const Route* VirtualHost::find_route(std::string_view key) const {
    for (const auto& route : routes) {
        if (route.match.key() == key) {
            return &route;
        }
    }
    return nullptr;
}

Listener& Dag::ensure_listener(Protocol protocol, int32_t port) {
    auto name = listener_name(protocol, port);
    auto [it, inserted] = listeners.try_emplace(name);
    if (inserted) {
        it->second.name = name;
        it->second.port = port;
        it->second.protocol = protocol;
    }
    return it->second;
}

VirtualHost& Dag::ensure_virtual_host(Protocol protocol, int32_t port,
                                      const std::string& hostname) {
    auto& listener = ensure_listener(protocol, port);
    auto [it, inserted] = listener.virtual_hosts.try_emplace(hostname);
    if (inserted) {
        it->second.hostname = hostname;
    }
    return it->second;
}

bool Dag::add_route(VirtualHost& vhost, Route route) {
    auto loser_candidate = route.source;
    auto collision = vhost.add_route(std::move(route));
    if (!collision) {
        return true;
    }
    bool lost = collision->loser == loser_candidate;
    if (!(collision->winner == collision->loser)) {
        collisions.push_back(std::move(*collision));
    }
    return !lost;
}

std::string Dag::add_cluster(Cluster cluster) {
    std::string name = cluster.name;
    clusters.try_emplace(name, std::move(cluster));
    return name;
}

const Listener* Dag::find_listener(std::string_view name) const {
    auto it = listeners.find(std::string(name));
    return it == listeners.end() ? nullptr : &it->second;
}

const VirtualHost* Dag::find_virtual_host(std::string_view listener,
                                          std::string_view authority) const {
    const auto* l = find_listener(listener);
    if (!l) {
        return nullptr;
    }

    std::string host = core::to_lower(authority);
    auto colon = host.rfind(':');
    if (colon != std::string::npos && host.find(']') == std::string::npos) {
        host.resize(colon);
    }

    if (auto it = l->virtual_hosts.find(host); it != l->virtual_hosts.end()) {
        return &it->second;
    }
    for (size_t dot = host.find('.'); dot != std::string::npos; dot = host.find('.', dot + 1)) {
        if (auto it = l->virtual_hosts.find("*" + host.substr(dot)); it != l->virtual_hosts.end()) {
            return &it->second;
        }
    }
    if (auto it = l->virtual_hosts.find("*"); it != l->virtual_hosts.end()) {
        return &it->second;
    }
    return nullptr;
}

const Route* Dag::select_route(std::string_view listener, const http::Request& request) const {
    const auto* vhost = find_virtual_host(listener, request.authority);
    if (!vhost) {
        return nullptr;
    }
    for (const auto& route : vhost->routes) {
        if (route.match.matches(request)) {
            return &route;
        }
    }
    return nullptr;
}

size_t Dag::route_count() const noexcept {
    size_t count = 0;
    for (const auto& [name, listener] : listeners) {
        for (const auto& [host, vhost] : listener.virtual_hosts) {
            count += vhost.routes.size();
        }
    }
    return count;
}

}  // namespace lattice::dag
