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


// Lattice Extension Resolver - Implementation

#include "extensions.hpp"

#include <utility>

#include <fmt/format.h>

#include "../core/string_utils.hpp"
#include "processor.hpp"

namespace lattice::dag {

std::string ExtensionErrorCategory::message(int ev) const {
    switch (static_cast<ExtensionError>(ev)) {
        case ExtensionError::NotFound:
            return "extension service not found";
        case ExtensionError::Invalid:
            return "extension service is invalid";
    }
    return "unknown extension error";
}

const ExtensionErrorCategory& extension_category() noexcept {
    static ExtensionErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ExtensionError e) noexcept {
    return std::error_code(static_cast<int>(e), extension_category());
}

std::string extension_cluster_name(const source::NamespacedName& name) {
    return fmt::format("extension/{}/{}", name.ns, name.name);
}

std::error_code ExtensionResolver::resolve(const source::NamespacedName& name, Dag& fragment,
                                           std::string& key) {
    const auto* ext = cache_.get<source::ExtensionService>(name);
    if (!ext) {
        return ExtensionError::NotFound;
    }

    auto it = results_.find(name);
    if (it == results_.end()) {
        ++validated_;
        it = results_.emplace(name, build(*ext)).first;
    }
    const auto& resolved = it->second;
    if (resolved.error) {
        return resolved.error;
    }

    for (const auto& cluster : resolved.clusters) {
        fragment.add_cluster(cluster);
    }
    key = resolved.extension.name;
    fragment.extensions.try_emplace(key, resolved.extension);
    return {};
}

ExtensionResolver::Resolved ExtensionResolver::build(const source::ExtensionService& ext) {
    auto& status = status_.at(source::ObjectRef::of(source::Kind::ExtensionService, ext.metadata));
    const auto self = ext.metadata.key();

    Resolved out;
    out.extension.name = extension_cluster_name(self);
    out.extension.source = self;

    if (ext.timeout_policy) {
        const auto& response = ext.timeout_policy->response;
        if (response == "infinity") {
            out.extension.response_timeout = std::chrono::milliseconds{0};
        } else if (!response.empty()) {
            out.extension.response_timeout = core::parse_duration(response);
            if (!out.extension.response_timeout) {
                status.add_error(kSpecError, "TimeoutPolicyNotValid",
                                 fmt::format("spec.timeoutPolicy failed to parse: invalid "
                                             "duration \"{}\"",
                                             response));
            }
        }
        if (!ext.timeout_policy->idle.empty()) {
            status.add_warning(kSpecError, "IgnoredField",
                               "ignoring field \".Spec.TimeoutPolicy.Idle\"; idle timeouts are "
                               "not supported for ExtensionClusters");
        }
    }

    if (ext.load_balancer_policy) {
        const auto& strategy = ext.load_balancer_policy->strategy;
        if (strategy == "Cookie" || strategy == "RequestHash") {
            status.add_warning(kSpecError, "IgnoredField",
                               fmt::format("ignoring field \".Spec.LoadBalancerPolicy\"; {} load "
                                           "balancer policy is not supported for "
                                           "ExtensionClusters",
                                           strategy));
        } else {
            out.extension.load_balancer_strategy = strategy;
        }
    }

    if (!ext.protocol.empty()) {
        if (ext.protocol != "h2" && ext.protocol != "h2c") {
            status.add_error(kSpecError, "UnsupportedProtocol",
                             fmt::format("unsupported protocol \"{}\", must be h2 or h2c",
                                         ext.protocol));
        } else {
            out.extension.protocol = ext.protocol;
        }
    }

    // Only Services in the ExtensionService's own namespace are reachable
    for (const auto& target : ext.services) {
        const source::NamespacedName svc_name{self.ns, target.name};
        std::string error;
        auto svc = lookup_service(cache_, svc_name, target.port, "", true, error);
        if (!svc) {
            status.add_error(kServiceError, "ServiceUnresolvedReference",
                             fmt::format("unresolved service \"{}\": {}", svc_name.str(), error));
            continue;
        }
        if (!svc->external_name.empty()) {
            status.add_error(kServiceError, "UnsupportedServiceType",
                             fmt::format("Service \"{}\" is of unsupported type \"ExternalName\".",
                                         svc_name.str()));
            continue;
        }

        Cluster cluster;
        cluster.name = cluster_name(svc_name, svc->port, out.extension.protocol);
        cluster.service = std::move(*svc);
        cluster.protocol = out.extension.protocol;
        cluster.load_balancer_strategy = out.extension.load_balancer_strategy;

        WeightedCluster upstream;
        upstream.cluster = cluster.name;
        upstream.weight = target.weight;
        out.extension.upstreams.push_back(std::move(upstream));
        out.clusters.push_back(std::move(cluster));
    }

    if (status.has_errors()) {
        out.error = ExtensionError::Invalid;
    }
    return out;
}

}  // namespace lattice::dag
