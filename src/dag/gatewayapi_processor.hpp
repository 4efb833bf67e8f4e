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


// Lattice Gateway API Processor - Header
// Gateways, listeners and the HTTP/GRPC/TLS/TCP routes attaching to them

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "listeners.hpp"
#include "processor.hpp"

namespace lattice::dag {

/// Reconciles the oldest Gateway whose class names the configured controller.
/// Routes attach through parent references to its listeners; each attachment
/// is isolated to the most specific listener covering the hostname.
class GatewayAPIProcessor : public Processor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "gatewayapi"; }

    void run(BuildContext& ctx, Dag& fragment) override;

private:
    /// Route-level condition to copy onto every accepted parent
    struct Problem {
        std::string type;
        std::string reason;
        std::string message;
    };

    /// A listener a route attached to, with the hosts it contributes there
    struct Attachment {
        const ListenerInfo* listener = nullptr;
        std::vector<std::string> hosts;
    };

    [[nodiscard]] const source::Gateway* select_gateway();

    void process_http_route(const source::HTTPRoute& route);
    void process_grpc_route(const source::GRPCRoute& route);
    void process_tls_route(const source::TLSRoute& route);
    void process_tcp_route(const source::TCPRoute& route);

    /// Walk the parent references of a route that name the reconciled gateway.
    /// emit(attachments, parent_status) runs for each accepted reference.
    template <typename Emit>
    void attach_parents(const source::ObjectMeta& meta, source::Kind kind,
                        const std::vector<source::ParentReference>& parents,
                        const std::vector<std::string>& hostnames, Emit&& emit);

    [[nodiscard]] bool targets_gateway(const source::ParentReference& parent,
                                       std::string_view route_ns) const;

    /// Listeners of the reconciled gateway that accept the route through one
    /// parent reference. Rejections are recorded on the parent status.
    std::vector<Attachment> attach(const source::ParentReference& parent,
                                   const source::ObjectMeta& meta, source::Kind kind,
                                   const std::vector<std::string>& hostnames,
                                   ParentStatus& status);

    /// Hosts a route contributes on one listener, excluding hosts a more
    /// specific listener on the same port claims
    [[nodiscard]] std::vector<std::string> hosts_on(const ListenerInfo& listener,
                                                    const std::vector<std::string>& hostnames) const;

    std::vector<Route> compute_http_routes(const source::HTTPRoute& route,
                                           std::vector<Problem>& problems);
    std::vector<Route> compute_grpc_routes(const source::GRPCRoute& route,
                                           std::vector<Problem>& problems);

    /// Apply a rule's filters. False when a filter is unsupported or invalid.
    [[nodiscard]] bool apply_filters(const std::vector<source::HTTPRouteFilter>& filters,
                                     source::Kind kind, const source::ObjectMeta& meta,
                                     Route& route, std::vector<Problem>& problems);

    /// Weighted clusters for a rule's backends; unresolvable backends are
    /// reported and skipped
    std::vector<WeightedCluster> compute_backends(const std::vector<source::BackendRef>& refs,
                                                  source::Kind kind,
                                                  const source::ObjectMeta& meta,
                                                  std::string_view protocol,
                                                  std::vector<Problem>& problems);

    [[nodiscard]] std::optional<std::string> resolve_backend(const source::BackendRef& ref,
                                                             source::Kind kind,
                                                             const source::ObjectMeta& meta,
                                                             std::string_view protocol,
                                                             std::vector<Problem>& problems);

    /// Add route copies for every host of every attachment
    void emit_routes(const std::vector<Attachment>& attachments, const std::vector<Route>& routes);

    /// Place an L4 target (TLS passthrough or TCP) on every attachment
    void emit_tcp_proxy(const std::vector<Attachment>& attachments, const TCPProxy& proxy);

    void apply_problems(ParentStatus& status, int64_t generation,
                        const std::vector<Problem>& problems) const;

    void count_attachment(const std::vector<Attachment>& attachments);

    BuildContext* ctx_ = nullptr;
    Dag* fragment_ = nullptr;
    const source::Gateway* gateway_ = nullptr;
    source::ObjectRef gateway_ref_;
    std::vector<ListenerInfo> listeners_;
};

/// "/service/method" path match of a GRPC method match
[[nodiscard]] PathMatch grpc_path_match(const source::GRPCMethodMatch& match);

}  // namespace lattice::dag
