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


// Lattice DAG JSON - Implementation

#include "json.hpp"

#include "../core/tls.hpp"

namespace lattice::dag {

namespace {

using json = nlohmann::json;

json headers_json(const HeadersPolicy& policy) {
    json j = json::object();
    if (!policy.set.empty()) {
        j["set"] = policy.set;
    }
    if (!policy.add.empty()) {
        j["add"] = policy.add;
    }
    if (!policy.remove.empty()) {
        j["remove"] = policy.remove;
    }
    return j;
}

json clusters_json(const std::vector<WeightedCluster>& clusters) {
    json out = json::array();
    for (const auto& c : clusters) {
        json j{{"cluster", c.cluster}, {"weight", c.weight}};
        if (!c.request_headers.empty()) {
            j["request_headers"] = headers_json(c.request_headers);
        }
        if (!c.response_headers.empty()) {
            j["response_headers"] = headers_json(c.response_headers);
        }
        out.push_back(std::move(j));
    }
    return out;
}

json tcp_proxy_json(const TCPProxy& proxy) {
    return json{{"clusters", clusters_json(proxy.clusters)}, {"source", proxy.source.str()}};
}

json auth_json(const ExternalAuth& auth) {
    json j{{"service", auth.service.str()},
           {"cluster", auth.cluster},
           {"fail_open", auth.fail_open}};
    if (auth.response_timeout) {
        j["response_timeout_ms"] = auth.response_timeout->count();
    }
    if (!auth.context.empty()) {
        j["context"] = auth.context;
    }
    return j;
}

json tls_json(const TlsSettings& tls) {
    json j{{"secret", tls.secret},
           {"min_version", std::string(core::to_string(tls.min_version))},
           {"max_version", std::string(core::to_string(tls.max_version))}};
    if (!tls.fallback_secret.empty()) {
        j["fallback_secret"] = tls.fallback_secret;
    }
    if (tls.client_validation) {
        const auto& cv = *tls.client_validation;
        j["client_validation"] = json{{"ca_secret", cv.ca_secret},
                                      {"crl_secret", cv.crl_secret},
                                      {"skip_verification", cv.skip_verification},
                                      {"optional_certificate", cv.optional_certificate}};
    }
    return j;
}

json virtual_host_json(const VirtualHost& vhost) {
    json j{{"hostname", vhost.hostname}, {"source", vhost.source.str()}};
    if (vhost.tls) {
        j["tls"] = tls_json(*vhost.tls);
    }
    if (vhost.tcp_proxy) {
        j["tcp_proxy"] = tcp_proxy_json(*vhost.tcp_proxy);
    }
    if (vhost.external_auth) {
        j["external_auth"] = auth_json(*vhost.external_auth);
    }
    if (vhost.cors) {
        const auto& cors = *vhost.cors;
        j["cors"] = json{{"allow_origin", cors.allow_origin},
                         {"allow_methods", cors.allow_methods},
                         {"allow_headers", cors.allow_headers},
                         {"expose_headers", cors.expose_headers},
                         {"allow_credentials", cors.allow_credentials},
                         {"max_age", cors.max_age}};
    }
    if (!vhost.http_filters.empty()) {
        j["http_filters"] = vhost.http_filters;
    }
    json routes = json::array();
    for (const auto& route : vhost.routes) {
        routes.push_back(to_json(route));
    }
    j["routes"] = std::move(routes);
    return j;
}

}  // namespace

json to_json(const Route& route) {
    json match{{"path", route.match.path.str()}};
    if (!route.match.headers.empty()) {
        json headers = json::array();
        for (const auto& h : route.match.headers) {
            headers.push_back(h.str());
        }
        match["headers"] = std::move(headers);
    }
    if (!route.match.query_params.empty()) {
        json params = json::array();
        for (const auto& q : route.match.query_params) {
            params.push_back(q.str());
        }
        match["query_params"] = std::move(params);
    }
    if (!route.match.method.empty()) {
        match["method"] = route.match.method;
    }

    json j{{"match", std::move(match)}, {"source", route.source.str()}};
    if (!route.clusters.empty()) {
        j["clusters"] = clusters_json(route.clusters);
    }
    if (route.redirect) {
        const auto& r = *route.redirect;
        json redirect{{"status_code", r.status_code}};
        if (r.scheme) {
            redirect["scheme"] = *r.scheme;
        }
        if (r.hostname) {
            redirect["hostname"] = *r.hostname;
        }
        if (r.port) {
            redirect["port"] = *r.port;
        }
        if (r.path) {
            redirect["path"] = *r.path;
        }
        if (r.prefix) {
            redirect["prefix"] = *r.prefix;
        }
        j["redirect"] = std::move(redirect);
    }
    if (route.direct_response) {
        j["direct_response"] = json{{"status_code", route.direct_response->status_code},
                                    {"body", route.direct_response->body}};
    }
    if (route.https_redirect) {
        j["https_redirect"] = true;
    }
    if (!route.mirrors.empty()) {
        j["mirrors"] = route.mirrors;
    }
    if (route.websocket) {
        j["websocket"] = true;
    }
    if (route.prefix_rewrite) {
        j["prefix_rewrite"] = *route.prefix_rewrite;
    }
    if (route.full_path_rewrite) {
        j["full_path_rewrite"] = *route.full_path_rewrite;
    }
    if (route.host_rewrite) {
        j["host_rewrite"] = *route.host_rewrite;
    }
    if (route.timeouts.response) {
        j["response_timeout_ms"] = route.timeouts.response->count();
    }
    if (route.timeouts.idle) {
        j["idle_timeout_ms"] = route.timeouts.idle->count();
    }
    if (route.retry) {
        json retry{{"num_retries", route.retry->num_retries}, {"retry_on", route.retry->retry_on}};
        if (route.retry->per_try_timeout) {
            retry["per_try_timeout_ms"] = route.retry->per_try_timeout->count();
        }
        j["retry"] = std::move(retry);
    }
    if (!route.request_headers.empty()) {
        j["request_headers"] = headers_json(route.request_headers);
    }
    if (!route.response_headers.empty()) {
        j["response_headers"] = headers_json(route.response_headers);
    }
    if (route.rate_limit.local) {
        const auto& local = *route.rate_limit.local;
        j["local_rate_limit"] = json{
            {"requests", local.requests}, {"unit_s", local.unit.count()}, {"burst", local.burst}};
    }
    if (route.rate_limit.global) {
        j["global_rate_limit"] = json{{"descriptors", route.rate_limit.global->descriptors}};
    }
    if (route.external_auth) {
        j["external_auth"] = auth_json(*route.external_auth);
    }
    return j;
}

json to_json(const Dag& dag) {
    json listeners = json::array();
    for (const auto& [name, listener] : dag.listeners) {
        json l{{"name", listener.name},
               {"port", listener.port},
               {"protocol", std::string(to_string(listener.protocol))}};
        if (listener.tcp_proxy) {
            l["tcp_proxy"] = tcp_proxy_json(*listener.tcp_proxy);
        }
        json hosts = json::array();
        for (const auto& [host, vhost] : listener.virtual_hosts) {
            hosts.push_back(virtual_host_json(vhost));
        }
        l["virtual_hosts"] = std::move(hosts);
        listeners.push_back(std::move(l));
    }

    json clusters = json::array();
    for (const auto& [name, cluster] : dag.clusters) {
        json c{{"name", cluster.name},
               {"service", cluster.service.name.str()},
               {"port", cluster.service.port}};
        if (!cluster.protocol.empty()) {
            c["protocol"] = cluster.protocol;
        }
        if (!cluster.service.external_name.empty()) {
            c["external_name"] = cluster.service.external_name;
        }
        if (!cluster.load_balancer_strategy.empty()) {
            c["load_balancer_strategy"] = cluster.load_balancer_strategy;
        }
        if (cluster.upstream_validation) {
            c["upstream_validation"] =
                json{{"ca_secret", cluster.upstream_validation->ca_secret},
                     {"subject_name", cluster.upstream_validation->subject_name}};
        }
        clusters.push_back(std::move(c));
    }

    json secrets = json::array();
    for (const auto& [key, secret] : dag.secrets) {
        secrets.push_back(json{{"key", key}, {"name", secret.name.str()}, {"usage", secret.usage}});
    }

    json extensions = json::array();
    for (const auto& [name, ext] : dag.extensions) {
        json e{{"name", name},
               {"source", ext.source.str()},
               {"protocol", ext.protocol},
               {"upstreams", clusters_json(ext.upstreams)}};
        if (!ext.load_balancer_strategy.empty()) {
            e["load_balancer_strategy"] = ext.load_balancer_strategy;
        }
        if (ext.response_timeout) {
            e["response_timeout_ms"] = ext.response_timeout->count();
        }
        extensions.push_back(std::move(e));
    }

    json out{{"listeners", std::move(listeners)},
             {"clusters", std::move(clusters)},
             {"secrets", std::move(secrets)},
             {"extensions", std::move(extensions)}};
    if (!dag.global_rate_limit.empty()) {
        out["global_rate_limit"] = dag.global_rate_limit;
    }
    return out;
}

json to_json(const Dag& dag, const std::vector<ObjectStatus>& statuses) {
    json out = json::array();
    for (const auto& status : statuses) {
        out.push_back(to_json(status));
    }
    return json{{"sequence", dag.sequence}, {"snapshot", to_json(dag)}, {"statuses", std::move(out)}};
}

}  // namespace lattice::dag
