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


// Lattice Ingress Processor - Header
// Legacy Ingress objects: one virtual host per rule host, no inclusion

#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "processor.hpp"

namespace lattice::dag {

// Annotations honoured on Ingress objects
inline constexpr std::string_view kAnnotationForceSslRedirect =
    "ingress.kubernetes.io/force-ssl-redirect";
inline constexpr std::string_view kAnnotationAllowHttp = "kubernetes.io/ingress.allow-http";
inline constexpr std::string_view kAnnotationWebsocketRoutes = "projectcontour.io/websocket-routes";
inline constexpr std::string_view kAnnotationTlsMinimumVersion =
    "projectcontour.io/tls-minimum-protocol-version";
inline constexpr std::string_view kAnnotationResponseTimeout = "projectcontour.io/response-timeout";
inline constexpr std::string_view kAnnotationNumRetries = "projectcontour.io/num-retries";
inline constexpr std::string_view kAnnotationRetryOn = "projectcontour.io/retry-on";
inline constexpr std::string_view kAnnotationPerTryTimeout = "projectcontour.io/per-try-timeout";

/// Translates Ingress rules into routes. Secure virtual hosts are set up first
/// from spec.tls so the set of TLS hosts is stable while rules are walked.
/// Duplicate host+path pairs across objects are left to the tie-break.
class IngressProcessor : public Processor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "ingress"; }

    void run(BuildContext& ctx, Dag& fragment) override;

private:
    void compute_secure_virtual_hosts(const source::Ingress& ingress);
    void compute_rules(const source::Ingress& ingress);

    /// Route for one path; nullopt (with a condition) when the path is unusable
    [[nodiscard]] std::optional<Route> compute_route(const source::Ingress& ingress,
                                                     const std::string& host,
                                                     const source::IngressPath& path);

    ObjectStatus& status_of(const source::Ingress& ingress);

    void reject(const source::Ingress& ingress, std::string_view type, std::string_view reason,
                std::string_view message);

    BuildContext* ctx_ = nullptr;
    Dag* fragment_ = nullptr;
    std::set<std::string> secure_hosts_;
    // (ingress, host) pairs whose TLS claim lost to an older Ingress
    std::set<std::pair<source::NamespacedName, std::string>> tls_losers_;
};

/// Ingress rules with the default backend prepended as a "/" rule for any host
[[nodiscard]] std::vector<source::IngressRule> rules_from_spec(const source::Ingress& ingress);

/// Path match for an Ingress path and pathType. Prefix paths are segment
/// matches except "/" (every path); ImplementationSpecific paths are string
/// prefixes, or regexes when they contain regex metacharacters.
[[nodiscard]] PathMatch ingress_path_match(std::string_view path, std::string_view path_type);

/// Hostname usable as an Ingress rule host: "*", a leading "*." wildcard or a
/// plain DNS name
[[nodiscard]] bool valid_ingress_host(std::string_view host);

}  // namespace lattice::dag
