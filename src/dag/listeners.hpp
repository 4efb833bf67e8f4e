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


// Lattice Gateway Listeners - Header
// Listener validation and hostname intersection for Gateway API attachment

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "processor.hpp"

namespace lattice::dag {

/// A Gateway listener after validation
struct ListenerInfo {
    std::string name;
    int32_t port = 0;
    std::string protocol;  // HTTP, HTTPS, TLS, TCP
    std::string hostname;  // Empty = any host
    Protocol dag_protocol = Protocol::HTTP;
    std::string tls_secret;  // HTTPS: Dag::secrets key of the serving certificate
    std::vector<std::string> kinds;  // Route kinds that may attach
    const source::AllowedRoutes* allowed_routes = nullptr;
    bool valid = false;

    [[nodiscard]] std::string dag_listener() const { return listener_name(dag_protocol, port); }
};

/// Validate every listener of a gateway and record listener conditions on
/// the gateway status. Per-port protocols must be compatible (HTTP alone,
/// HTTPS with TLS, TCP alone) and hostnames unique; TLS mode must fit the
/// protocol; certificate references must resolve.
[[nodiscard]] std::vector<ListenerInfo> compute_listeners(const source::Gateway& gateway,
                                                          ObjectStatus& status,
                                                          BuildContext& ctx, Dag& fragment);

/// Whether a listener admits routes from the namespace (Same, All, Selector)
[[nodiscard]] bool namespace_allowed(const ListenerInfo& listener, std::string_view gateway_ns,
                                     std::string_view route_ns, const source::ObjectCache& cache);

/// "*.example.com" covers any name ending in ".example.com"; other patterns
/// match themselves only
[[nodiscard]] bool hostname_matches(std::string_view pattern, std::string_view host);

/// Host a route hostname resolves to on a listener: the more specific of the
/// two when one covers the other, nullopt when they are disjoint. An empty
/// listener hostname accepts any route hostname.
[[nodiscard]] std::optional<std::string> intersect_hostnames(std::string_view listener_host,
                                                             std::string_view route_host);

/// Rank for choosing among listeners that both cover a host: exact names over
/// wildcards, longer wildcards over shorter, anything over an empty hostname
[[nodiscard]] size_t hostname_specificity(std::string_view hostname) noexcept;

}  // namespace lattice::dag
