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


// Lattice Processor - Implementation

#include "processor.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace lattice::dag {

namespace {

const source::ServicePort* find_port(const source::Service& svc, int32_t port,
                                     std::string_view port_name) {
    for (const auto& p : svc.ports) {
        if ((port != 0 && p.port == port) || (!port_name.empty() && p.name == port_name)) {
            return &p;
        }
    }
    return nullptr;
}

std::string protocol_from_app_protocol(std::string_view app_protocol) {
    if (app_protocol == "h2" || app_protocol == "kubernetes.io/h2") {
        return "h2";
    }
    if (app_protocol == "h2c" || app_protocol == "kubernetes.io/h2c") {
        return "h2c";
    }
    if (app_protocol == "tls" || app_protocol == "https") {
        return "tls";
    }
    return "";
}

bool valid_label(std::string_view label) {
    if (label.empty() || label.size() > 63) {
        return false;
    }
    if (!std::isalnum(static_cast<unsigned char>(label.front())) ||
        !std::isalnum(static_cast<unsigned char>(label.back()))) {
        return false;
    }
    for (char c : label) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc) || c == '-')) {
            return false;
        }
    }
    return true;
}

}  // namespace

RegexLimits regex_limits_from(const control::DagConfig& config) noexcept {
    return RegexLimits{config.max_regex_program_size, config.regex_program_size_warning};
}

std::optional<Service> lookup_service(const source::ObjectCache& cache,
                                      const source::NamespacedName& name, int32_t port,
                                      std::string_view port_name, bool enable_external_name,
                                      std::string& error) {
    const auto* svc = cache.get<source::Service>(name);
    if (!svc) {
        error = fmt::format("service \"{}\" not found", name.str());
        return std::nullopt;
    }

    const auto* p = find_port(*svc, port, port_name);
    if (!p) {
        error = fmt::format("port \"{}\" on service \"{}\" not matched",
                            port != 0 ? std::to_string(port) : std::string(port_name), name.str());
        return std::nullopt;
    }
    if (!p->protocol.empty() && p->protocol != "TCP") {
        error = fmt::format("unsupported service protocol \"{}\"", p->protocol);
        return std::nullopt;
    }

    if (svc->type == "ExternalName" || !svc->external_name.empty()) {
        if (!enable_external_name) {
            error = fmt::format(
                "{} is an ExternalName service, these are not currently enabled. See the "
                "dag.enable_external_name_service config file setting",
                name.str());
            return std::nullopt;
        }
    }

    return Service{name, p->port, p->name, svc->external_name};
}

std::string upstream_protocol(const source::ObjectCache& cache, const Service& service) {
    const auto* svc = cache.get<source::Service>(service.name);
    if (!svc) {
        return "";
    }
    const auto* p = find_port(*svc, service.port, service.port_name);
    if (p && !p->app_protocol.empty()) {
        return protocol_from_app_protocol(p->app_protocol);
    }

    // projectcontour.io/upstream-protocol.h2: "80,https"
    for (std::string_view proto : {"h2", "h2c", "tls"}) {
        auto value = svc->metadata.annotation(fmt::format("projectcontour.io/upstream-protocol.{}",
                                                          proto));
        for (const auto& entry : core::split(value, ',')) {
            if (entry == std::to_string(service.port) ||
                (!service.port_name.empty() && entry == service.port_name)) {
                return std::string(proto);
            }
        }
    }
    return "";
}

bool valid_hostname(std::string_view hostname) {
    if (hostname.empty() || hostname.size() > 253) {
        return false;
    }
    if (hostname.starts_with("*.")) {
        hostname.remove_prefix(2);
    }
    size_t start = 0;
    while (start <= hostname.size()) {
        size_t end = hostname.find('.', start);
        if (end == std::string_view::npos) {
            end = hostname.size();
        }
        if (!valid_label(hostname.substr(start, end - start))) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

bool is_ip_address(std::string_view host) {
    std::string h(host);
    in_addr v4{};
    in6_addr v6{};
    return inet_pton(AF_INET, h.c_str(), &v4) == 1 || inet_pton(AF_INET6, h.c_str(), &v6) == 1;
}

}  // namespace lattice::dag
