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


// Lattice HTTPProxy Processor - Header
// Delegating proxies: roots, include trees, route policies and orphans

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "processor.hpp"

namespace lattice::dag {

/// Walks every root HTTPProxy (one declaring a virtual host) depth-first
/// through its includes. Each include ANDs its conditions onto everything the
/// child produces. Proxies never reached from a valid include are orphaned.
class HTTPProxyProcessor : public Processor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "httpproxy"; }

    void run(BuildContext& ctx, Dag& fragment) override;

private:
    using Conditions = std::vector<source::MatchCondition>;
    using Visited = std::vector<const source::HTTPProxy*>;

    /// Settings of the root being walked that its routes inherit
    struct RootContext {
        const source::HTTPProxy* proxy = nullptr;
        bool tls_enabled = false;
        std::optional<ExternalAuth> auth;  // Virtual host server, else the configured default
        bool auth_disabled = false;        // Route default when auth is set
    };

    /// Roots with a unique fqdn; duplicates are reported on every claimant
    [[nodiscard]] std::vector<const source::HTTPProxy*> valid_roots();

    void compute_proxy(const source::HTTPProxy& proxy);

    [[nodiscard]] bool compute_tls(const source::HTTPProxy& proxy, ObjectStatus& status,
                                   std::optional<TlsSettings>& tls);

    [[nodiscard]] bool compute_authorization(const source::HTTPProxy& proxy,
                                             ObjectStatus& status, RootContext& root);

    /// Routes of proxy and everything it includes. A route error drops every
    /// route of the proxy; include errors skip only that include.
    std::vector<Route> compute_routes(const RootContext& root, const source::HTTPProxy& proxy,
                                      ObjectStatus& status, const Conditions& inherited,
                                      Visited visited);

    [[nodiscard]] bool compute_route(const RootContext& root, const source::HTTPProxy& proxy,
                                     ObjectStatus& status, const Conditions& inherited,
                                     const source::ProxyRoute& spec, Route& route);

    [[nodiscard]] bool compute_tcp_proxy(const source::HTTPProxy& proxy, ObjectStatus& status,
                                         Visited visited, TCPProxy& tcp);

    /// Upstream validation context for a TLS service; false on error
    [[nodiscard]] bool compute_upstream_validation(const source::HTTPProxy& proxy,
                                                   ObjectStatus& status,
                                                   const source::ProxyService& service,
                                                   std::optional<UpstreamValidation>& out);

    /// 502 route standing in for an include that cannot be followed
    [[nodiscard]] Route bad_gateway_route(const Conditions& conditions,
                                          const source::HTTPProxy& proxy) const;

    [[nodiscard]] bool root_allowed(std::string_view ns) const;

    ObjectStatus& status_of(const source::HTTPProxy& proxy);

    void reject(const source::HTTPProxy& proxy, ObjectStatus& status, std::string_view type,
                std::string_view reason, std::string_view message);

    BuildContext* ctx_ = nullptr;
    Dag* fragment_ = nullptr;
    core::fast_set<source::NamespacedName, source::NamespacedNameHash> orphaned_;
};

/// Prefix rewrites behave differently for /foo and /foo/. A lone prefix
/// route with a rewrite is split into both forms with consistent slashes.
[[nodiscard]] std::vector<Route> expand_prefix_matches(std::vector<Route> routes);

}  // namespace lattice::dag
