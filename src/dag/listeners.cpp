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


// Lattice Gateway Listeners - Implementation

#include "listeners.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace lattice::dag {

namespace {

constexpr std::string_view kAccepted = "Accepted";
constexpr std::string_view kResolvedRefs = "ResolvedRefs";
constexpr std::string_view kProgrammed = "Programmed";
constexpr std::string_view kConflicted = "Conflicted";

void set_condition(ListenerStatus& status, int64_t generation, std::string_view type,
                   std::string_view value, std::string_view reason, std::string_view message) {
    Condition cond{std::string(type), std::string(value), std::string(reason),
                   std::string(message), generation};
    for (auto& c : status.conditions) {
        if (c.type == type) {
            c = std::move(cond);
            return;
        }
    }
    status.conditions.push_back(std::move(cond));
}

bool has_condition(const ListenerStatus& status, std::string_view type) {
    return std::any_of(status.conditions.begin(), status.conditions.end(),
                       [type](const Condition& c) { return c.type == type; });
}

std::vector<std::string> default_kinds(std::string_view protocol) {
    if (protocol == "HTTP" || protocol == "HTTPS") {
        return {"HTTPRoute", "GRPCRoute"};
    }
    if (protocol == "TLS") {
        return {"TLSRoute"};
    }
    if (protocol == "TCP") {
        return {"TCPRoute"};
    }
    return {};
}

/// Protocols that may share a port
std::string_view port_group(std::string_view protocol) {
    if (protocol == "HTTPS" || protocol == "TLS") {
        return "tls";
    }
    if (protocol == "HTTP") {
        return "http";
    }
    return "tcp";
}

bool is_core_group(std::string_view group) {
    return group.empty() || group == "core";
}

}  // namespace

std::vector<ListenerInfo> compute_listeners(const source::Gateway& gateway, ObjectStatus& status,
                                            BuildContext& ctx, Dag& fragment) {
    const auto& ns = gateway.metadata.ns;
    const auto generation = gateway.metadata.generation;
    std::vector<ListenerInfo> out;
    out.reserve(gateway.listeners.size());

    for (const auto& listener : gateway.listeners) {
        ListenerInfo info;
        info.name = listener.name;
        info.port = listener.port;
        info.protocol = listener.protocol;
        info.hostname = core::to_lower(listener.hostname);
        info.allowed_routes = &listener.allowed_routes;
        info.valid = true;

        auto& ls = status.listener(listener.name);
        ls.conditions.clear();
        ls.attached_routes = 0;

        auto invalid = [&](std::string_view type, std::string_view value, std::string_view reason,
                           std::string_view message) {
            set_condition(ls, generation, type, value, reason, message);
            info.valid = false;
        };

        if (listener.protocol == "HTTP") {
            info.dag_protocol = Protocol::HTTP;
        } else if (listener.protocol == "HTTPS" || listener.protocol == "TLS") {
            info.dag_protocol = Protocol::HTTPS;
        } else if (listener.protocol == "TCP") {
            info.dag_protocol = Protocol::TCP;
            info.hostname.clear();
        } else {
            invalid(kAccepted, kConditionFalse, "UnsupportedProtocol",
                    fmt::format("Listener protocol \"{}\" is not supported", listener.protocol));
        }

        if (listener.port < 1 || listener.port > 65535) {
            invalid(kAccepted, kConditionFalse, "PortUnavailable",
                    "Listener port must be in the range 1-65535");
        }

        if (!info.hostname.empty() && (is_ip_address(info.hostname) ||
                                       !valid_hostname(info.hostname))) {
            invalid(kProgrammed, kConditionFalse, "Invalid",
                    fmt::format("invalid hostname \"{}\": must be a DNS name, not an IP address",
                                listener.hostname));
        }

        // TLS mode must fit the protocol
        if (listener.protocol == "HTTPS") {
            if (!listener.tls) {
                invalid(kProgrammed, kConditionFalse, "Invalid",
                        "Listener.TLS is required when protocol is \"HTTPS\"");
            } else if (listener.tls->mode != "Terminate") {
                invalid(kProgrammed, kConditionFalse, "Invalid",
                        "Listener.TLS.Mode must be \"Terminate\" when protocol is \"HTTPS\"");
            } else if (listener.tls->certificate_refs.empty()) {
                invalid(kResolvedRefs, kConditionFalse, "InvalidCertificateRef",
                        "Listener.TLS.CertificateRefs must not be empty");
            } else {
                const auto& ref = listener.tls->certificate_refs.front();
                source::NamespacedName secret{ref.ns.empty() ? ns : ref.ns, ref.name};
                if (ref.kind != "Secret" || !is_core_group(ref.group)) {
                    invalid(kResolvedRefs, kConditionFalse, "InvalidCertificateRef",
                            fmt::format("Listener.TLS.CertificateRefs \"{}\" must be a Secret",
                                        ref.name));
                } else if (!ctx.cache.reference_permitted(source::kGatewayGroup, "Gateway", ns,
                                                          "", "Secret", secret)) {
                    invalid(kResolvedRefs, kConditionFalse, "RefNotPermitted",
                            fmt::format("Certificate ref to secret {} not permitted by any "
                                        "ReferenceGrant",
                                        secret.str()));
                } else if (auto ec = ctx.secrets.resolve_trusted(secret, SecretUsage::Tls, fragment,
                                                                 info.tls_secret)) {
                    invalid(kResolvedRefs, kConditionFalse, "InvalidCertificateRef",
                            fmt::format("Secret \"{}\": {}", secret.str(), ec.message()));
                }
            }
        } else if (listener.protocol == "TLS") {
            if (!listener.tls || listener.tls->mode != "Passthrough") {
                invalid(kProgrammed, kConditionFalse, "Invalid",
                        "Listener.TLS.Mode must be \"Passthrough\" when protocol is \"TLS\"");
            }
        } else if (listener.tls) {
            invalid(kProgrammed, kConditionFalse, "Invalid",
                    fmt::format("Listener.TLS is not allowed when protocol is \"{}\"",
                                listener.protocol));
        }

        auto supported = default_kinds(listener.protocol);
        if (listener.allowed_routes.kinds.empty()) {
            info.kinds = supported;
        } else {
            for (const auto& k : listener.allowed_routes.kinds) {
                bool ok = k.group == source::kGatewayGroup &&
                          std::find(supported.begin(), supported.end(), k.kind) != supported.end();
                if (ok) {
                    if (std::find(info.kinds.begin(), info.kinds.end(), k.kind) ==
                        info.kinds.end()) {
                        info.kinds.push_back(k.kind);
                    }
                    continue;
                }
                set_condition(ls, generation, kResolvedRefs, kConditionFalse, "InvalidRouteKinds",
                              fmt::format("Kind \"{}\" is not supported, kind must be one of {}",
                                          k.kind, core::join(supported, ", ")));
            }
        }
        ls.supported_kinds = info.kinds;

        out.push_back(std::move(info));
    }

    // Per-port compatibility
    std::map<int32_t, std::vector<size_t>> by_port;
    for (size_t i = 0; i < out.size(); ++i) {
        by_port[out[i].port].push_back(i);
    }
    for (const auto& [port, members] : by_port) {
        std::set<std::string_view> groups;
        for (auto i : members) {
            groups.insert(port_group(out[i].protocol));
        }
        if (groups.size() > 1) {
            for (auto i : members) {
                auto& ls = status.listener(out[i].name);
                set_condition(ls, generation, kConflicted, kConditionTrue, "ProtocolConflict",
                              "All Listener protocols for a given port must be compatible");
                out[i].valid = false;
            }
            continue;
        }
        std::map<std::string, size_t> hostnames;
        for (auto i : members) {
            ++hostnames[out[i].hostname];
        }
        for (auto i : members) {
            if (hostnames[out[i].hostname] > 1) {
                auto& ls = status.listener(out[i].name);
                set_condition(ls, generation, kConflicted, kConditionTrue, "HostnameConflict",
                              "All Listener hostnames for a given port must be unique");
                out[i].valid = false;
            }
        }
    }

    for (const auto& info : out) {
        auto& ls = status.listener(info.name);
        if (!has_condition(ls, kAccepted)) {
            set_condition(ls, generation, kAccepted, kConditionTrue, "Accepted",
                          "Listener accepted");
        }
        if (!has_condition(ls, kResolvedRefs)) {
            set_condition(ls, generation, kResolvedRefs, kConditionTrue, "ResolvedRefs",
                          "Listener references resolved");
        }
        if (!has_condition(ls, kConflicted)) {
            set_condition(ls, generation, kConflicted, kConditionFalse, "NoConflicts",
                          "No conflicts");
        }
        if (info.valid) {
            set_condition(ls, generation, kProgrammed, kConditionTrue, "Programmed",
                          "Valid listener");
        } else if (!has_condition(ls, kProgrammed)) {
            set_condition(ls, generation, kProgrammed, kConditionFalse, "Invalid",
                          "Invalid listener, see other listener conditions for details");
        }
    }
    return out;
}

bool namespace_allowed(const ListenerInfo& listener, std::string_view gateway_ns,
                       std::string_view route_ns, const source::ObjectCache& cache) {
    const auto& allowed = *listener.allowed_routes;
    if (allowed.from == "All") {
        return true;
    }
    if (allowed.from == "Selector") {
        return allowed.selector && allowed.selector->matches(cache.namespace_labels(route_ns));
    }
    return route_ns == gateway_ns;
}

bool hostname_matches(std::string_view pattern, std::string_view host) {
    if (pattern.starts_with("*.")) {
        auto suffix = pattern.substr(1);
        return host.size() > suffix.size() && host.ends_with(suffix);
    }
    return pattern == host;
}

std::optional<std::string> intersect_hostnames(std::string_view listener_host,
                                               std::string_view route_host) {
    if (listener_host.empty() || listener_host == route_host) {
        return std::string(route_host);
    }
    if (hostname_matches(listener_host, route_host)) {
        return std::string(route_host);
    }
    if (hostname_matches(route_host, listener_host)) {
        return std::string(listener_host);
    }
    return std::nullopt;
}

size_t hostname_specificity(std::string_view hostname) noexcept {
    if (hostname.empty()) {
        return 0;
    }
    if (hostname.starts_with("*.")) {
        return hostname.size();
    }
    return (size_t{1} << 16) + hostname.size();
}

}  // namespace lattice::dag
