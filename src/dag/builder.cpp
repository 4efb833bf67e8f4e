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


// Lattice Graph Builder - Implementation

#include "builder.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "gatewayapi_processor.hpp"
#include "httpproxy_processor.hpp"
#include "ingress_processor.hpp"
#include "extensions.hpp"
#include "secrets.hpp"
#include "sorter.hpp"

namespace lattice::dag {

namespace {

size_t schema_rank(source::Kind kind, const control::DagConfig& config) {
    auto name = source::to_string(kind);
    auto it = std::find(config.schema_precedence.begin(), config.schema_precedence.end(), name);
    return static_cast<size_t>(std::distance(config.schema_precedence.begin(), it));
}

void merge_tcp_proxy(std::optional<TCPProxy>& existing, TCPProxy incoming, std::string_view key,
                     const std::string& hostname, std::vector<RouteCollision>& collisions,
                     const control::DagConfig& config) {
    if (!existing) {
        existing = std::move(incoming);
        return;
    }
    if (existing->source == incoming.source) {
        return;
    }
    if (cross_schema_wins(incoming.source, existing->source, config)) {
        collisions.push_back(RouteCollision{incoming.source, existing->source, std::string(key),
                                            hostname});
        existing = std::move(incoming);
    } else {
        collisions.push_back(RouteCollision{existing->source, incoming.source, std::string(key),
                                            hostname});
    }
}

/// Every route and L4 target of a virtual host that lost to winner
void record_dropped(const VirtualHost& loser, const source::ObjectRef& winner,
                    std::vector<RouteCollision>& collisions) {
    for (const auto& route : loser.routes) {
        collisions.push_back(
            RouteCollision{winner, route.source, route.match.key(), loser.hostname});
    }
    if (loser.tcp_proxy) {
        collisions.push_back(RouteCollision{winner, loser.tcp_proxy->source, "tls", loser.hostname});
    }
    if (loser.routes.empty() && !loser.tcp_proxy) {
        collisions.push_back(RouteCollision{winner, loser.source, "tls", loser.hostname});
    }
}

void merge_virtual_host(VirtualHost& existing, VirtualHost incoming,
                        std::vector<RouteCollision>& collisions,
                        const control::DagConfig& config) {
    // Two owners serving different certificates for one name cannot share it
    if (existing.tls && incoming.tls && existing.tls->secret != incoming.tls->secret) {
        if (cross_schema_wins(incoming.source, existing.source, config)) {
            record_dropped(existing, incoming.source, collisions);
            existing = std::move(incoming);
        } else {
            record_dropped(incoming, existing.source, collisions);
        }
        return;
    }

    if (existing.source.name.empty()) {
        existing.source = incoming.source;
    }
    if (!existing.tls && incoming.tls) {
        existing.tls = std::move(incoming.tls);
    }
    if (!existing.external_auth && incoming.external_auth) {
        existing.external_auth = std::move(incoming.external_auth);
    }
    if (!existing.cors && incoming.cors) {
        existing.cors = std::move(incoming.cors);
    }
    if (existing.http_filters.empty()) {
        existing.http_filters = std::move(incoming.http_filters);
    }
    if (incoming.tcp_proxy) {
        merge_tcp_proxy(existing.tcp_proxy, std::move(*incoming.tcp_proxy), "tls",
                        existing.hostname, collisions, config);
    }

    for (auto& route : incoming.routes) {
        auto key = route.match.key();
        auto it = std::find_if(existing.routes.begin(), existing.routes.end(),
                               [&key](const Route& r) { return r.match.key() == key; });
        if (it == existing.routes.end()) {
            existing.routes.push_back(std::move(route));
            continue;
        }
        if (it->source == route.source) {
            continue;
        }
        if (cross_schema_wins(route.source, it->source, config)) {
            collisions.push_back(RouteCollision{route.source, it->source, key, existing.hostname});
            *it = std::move(route);
        } else {
            collisions.push_back(RouteCollision{it->source, route.source, key, existing.hostname});
        }
    }
}

void collect_sources(const Dag& dag, std::set<source::ObjectRef>& out) {
    for (const auto& [name, listener] : dag.listeners) {
        if (listener.tcp_proxy) {
            out.insert(listener.tcp_proxy->source);
        }
        for (const auto& [host, vhost] : listener.virtual_hosts) {
            if (vhost.tcp_proxy) {
                out.insert(vhost.tcp_proxy->source);
            }
            for (const auto& route : vhost.routes) {
                out.insert(route.source);
            }
        }
    }
}

std::string collision_detail(const RouteCollision& c) {
    if (c.key == "tcp" || c.key == "tls") {
        return fmt::format("{} target on {} is already claimed", c.key, c.hostname);
    }
    return fmt::format("route {} on host {} is already claimed", c.key, c.hostname);
}

}  // namespace

bool cross_schema_wins(const source::ObjectRef& a, const source::ObjectRef& b,
                       const control::DagConfig& config) {
    if (config.cross_schema_conflict_policy == "schema-precedence") {
        auto rank_a = schema_rank(a.kind, config);
        auto rank_b = schema_rank(b.kind, config);
        if (rank_a != rank_b) {
            return rank_a < rank_b;
        }
    }
    if (source::wins_tie_break(a, b)) {
        return true;
    }
    if (source::wins_tie_break(b, a)) {
        return false;
    }
    // Same age and name in different schemas
    return a.kind < b.kind;
}

// ============================
// Merge
// ============================

void merge_fragment(Dag& merged, Dag fragment, const control::DagConfig& config) {
    for (auto& [key, cluster] : fragment.clusters) {
        merged.clusters.try_emplace(key, std::move(cluster));
    }
    for (auto& [key, secret] : fragment.secrets) {
        merged.secrets.try_emplace(key, std::move(secret));
    }
    for (auto& [key, extension] : fragment.extensions) {
        merged.extensions.try_emplace(key, std::move(extension));
    }
    if (merged.global_rate_limit.empty()) {
        merged.global_rate_limit = std::move(fragment.global_rate_limit);
    }
    std::move(fragment.collisions.begin(), fragment.collisions.end(),
              std::back_inserter(merged.collisions));

    for (auto& [name, listener] : fragment.listeners) {
        auto [it, inserted] = merged.listeners.try_emplace(name);
        auto& target = it->second;
        if (inserted) {
            target = std::move(listener);
            continue;
        }
        if (listener.tcp_proxy) {
            merge_tcp_proxy(target.tcp_proxy, std::move(*listener.tcp_proxy), "tcp", target.name,
                            merged.collisions, config);
        }
        for (auto& [host, vhost] : listener.virtual_hosts) {
            auto [vit, vinserted] = target.virtual_hosts.try_emplace(host);
            if (vinserted) {
                vit->second = std::move(vhost);
            } else {
                merge_virtual_host(vit->second, std::move(vhost), merged.collisions, config);
            }
        }
    }
}

void prune(Dag& dag) {
    for (auto lit = dag.listeners.begin(); lit != dag.listeners.end();) {
        auto& hosts = lit->second.virtual_hosts;
        std::erase_if(hosts, [](const auto& entry) {
            return entry.second.routes.empty() && !entry.second.tcp_proxy;
        });
        if (hosts.empty() && !lit->second.tcp_proxy) {
            lit = dag.listeners.erase(lit);
        } else {
            ++lit;
        }
    }

    std::set<std::string> clusters;
    std::set<std::string> secrets;
    std::set<std::string> extensions;
    if (!dag.global_rate_limit.empty()) {
        extensions.insert(dag.global_rate_limit);
    }
    auto use_auth = [&extensions](const std::optional<ExternalAuth>& auth) {
        if (auth) {
            extensions.insert(auth->cluster);
        }
    };
    auto use_clusters = [&clusters](const std::vector<WeightedCluster>& weighted) {
        for (const auto& w : weighted) {
            clusters.insert(w.cluster);
        }
    };
    for (const auto& [name, listener] : dag.listeners) {
        if (listener.tcp_proxy) {
            use_clusters(listener.tcp_proxy->clusters);
        }
        for (const auto& [host, vhost] : listener.virtual_hosts) {
            if (vhost.tcp_proxy) {
                use_clusters(vhost.tcp_proxy->clusters);
            }
            use_auth(vhost.external_auth);
            for (const auto& route : vhost.routes) {
                use_clusters(route.clusters);
                clusters.insert(route.mirrors.begin(), route.mirrors.end());
                use_auth(route.external_auth);
            }
            if (vhost.tls) {
                secrets.insert(vhost.tls->secret);
                secrets.insert(vhost.tls->fallback_secret);
                if (vhost.tls->client_validation) {
                    secrets.insert(vhost.tls->client_validation->ca_secret);
                    secrets.insert(vhost.tls->client_validation->crl_secret);
                }
            }
        }
    }

    std::erase_if(dag.extensions, [&extensions](const auto& entry) {
        return !extensions.contains(entry.first);
    });
    for (const auto& [name, extension] : dag.extensions) {
        use_clusters(extension.upstreams);
    }

    std::erase_if(dag.clusters, [&clusters](const auto& entry) {
        return !clusters.contains(entry.first);
    });
    for (const auto& [name, cluster] : dag.clusters) {
        if (cluster.upstream_validation) {
            secrets.insert(cluster.upstream_validation->ca_secret);
        }
    }
    std::erase_if(dag.secrets, [&secrets](const auto& entry) {
        return !secrets.contains(entry.first);
    });
}

// ============================
// Builder
// ============================

Builder::Builder(quill::Logger* logger) : logger_(logger) {
    processors_.push_back(std::make_unique<HTTPProxyProcessor>());
    processors_.push_back(std::make_unique<IngressProcessor>());
    processors_.push_back(std::make_unique<GatewayAPIProcessor>());
}

Builder::Builder(std::vector<std::unique_ptr<Processor>> processors, quill::Logger* logger)
    : processors_(std::move(processors)), logger_(logger) {}

BuildResult Builder::build(const source::ObjectCache& cache, const control::Config& config,
                           uint64_t sequence) {
    auto start = std::chrono::steady_clock::now();

    StatusCache status;
    SecretResolver secrets(cache);
    ExtensionResolver extensions(cache, status);
    BuildContext ctx{cache, config, status, secrets, extensions,
                     regex_limits_from(config.dag), logger_};

    Dag merged;
    for (const auto& processor : processors_) {
        Dag fragment;
        processor->run(ctx, fragment);
        merge_fragment(merged, std::move(fragment), config.dag);
    }

    if (const auto& rls = config.policy.global_rate_limit) {
        auto name = source::parse_namespaced_name(rls->extension_service, "");
        Dag fragment;
        auto ec = extensions.resolve(name, fragment, fragment.global_rate_limit);
        if (ec) {
            if (logger_) {
                LOG_WARNING(logger_, "Global rate limit service {} unusable: {}", name.str(),
                            ec.message());
            }
        } else {
            merge_fragment(merged, std::move(fragment), config.dag);
        }
    }

    // Only proxies choose their own sorting; every other owner takes the default
    for (auto& [name, listener] : merged.listeners) {
        for (auto& [host, vhost] : listener.virtual_hosts) {
            if (vhost.source.kind != source::Kind::HTTPProxy) {
                vhost.sorting_disabled = config.dag.disable_route_sorting;
            }
        }
    }
    sort_dag(merged);
    prune(merged);

    std::set<source::ObjectRef> live;
    collect_sources(merged, live);

    std::set<std::tuple<source::ObjectRef, source::ObjectRef, std::string, std::string>> seen;
    for (const auto& c : merged.collisions) {
        if (c.winner == c.loser || !seen.emplace(c.loser, c.winner, c.key, c.hostname).second) {
            continue;
        }
        auto detail = collision_detail(c);
        status.record_conflict(c.loser, c.winner, !live.contains(c.loser), detail);
        if (logger_) {
            LOG_OBJECT_ERROR(logger_, source::to_string(c.loser.kind), c.loser.name.ns,
                             c.loser.name.name,
                             fmt::format("{}, winner {}", detail, c.winner.str()));
        }
    }
    merged.collisions.clear();
    merged.sequence = sequence;

    BuildResult result;
    result.statuses = status.finalize();
    result.secrets_validated = secrets.validated_count();
    result.extensions_validated = extensions.validated_count();
    result.snapshot = std::make_shared<const Dag>(std::move(merged));

    if (logger_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        LOG_DEBUG(logger_, "Build {} finished: listeners={}, routes={}, statuses={}, took {}us",
                  sequence, result.snapshot->listeners.size(), result.snapshot->route_count(),
                  result.statuses.size(), elapsed.count());
    }
    return result;
}

}  // namespace lattice::dag
