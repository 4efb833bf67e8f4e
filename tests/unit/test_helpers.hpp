// Lattice Unit Tests - Shared Helpers
// Runtime-generated key material and small builders for source objects

#pragma once

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/core/tls.hpp"
#include "../../src/dag/builder.hpp"
#include "../../src/source/cache.hpp"
#include "../../src/source/objects.hpp"

namespace lattice::testing {

// ============================
// Key material
// ============================

struct TestKeypair {
    std::string cert_pem;
    std::string key_pem;
    std::string crl_pem;  // Empty CRL signed by the key
};

inline std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(len));
}

/// Self-signed P-256 CA certificate with the given common name
inline TestKeypair make_keypair(std::string_view common_name = "example.com") {
    TestKeypair out;

    EVP_PKEY* raw_key = nullptr;
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!pctx) {
        return out;
    }
    if (EVP_PKEY_keygen_init(pctx) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) <= 0 ||
        EVP_PKEY_keygen(pctx, &raw_key) <= 0) {
        EVP_PKEY_CTX_free(pctx);
        return out;
    }
    EVP_PKEY_CTX_free(pctx);
    core::EvpPkeyPtr key(raw_key);

    core::X509Ptr cert(X509_new());
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * 365);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    std::string cn(common_name);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);
    if (X509_EXTENSION* ext =
            X509V3_EXT_conf_nid(nullptr, &v3, NID_basic_constraints, "critical,CA:TRUE")) {
        X509_add_ext(cert.get(), ext, -1);
        X509_EXTENSION_free(ext);
    }
    X509_sign(cert.get(), key.get(), EVP_sha256());

    core::BioPtr cert_bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509(cert_bio.get(), cert.get());
    out.cert_pem = bio_to_string(cert_bio.get());

    core::BioPtr key_bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    out.key_pem = bio_to_string(key_bio.get());

    core::X509CrlPtr crl(X509_CRL_new());
    X509_CRL_set_version(crl.get(), 1);
    X509_CRL_set_issuer_name(crl.get(), name);
    ASN1_TIME* now = ASN1_TIME_new();
    X509_gmtime_adj(now, 0);
    X509_CRL_set1_lastUpdate(crl.get(), now);
    ASN1_TIME_free(now);
    X509_CRL_sign(crl.get(), key.get(), EVP_sha256());

    core::BioPtr crl_bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509_CRL(crl_bio.get(), crl.get());
    out.crl_pem = bio_to_string(crl_bio.get());
    return out;
}

/// One keypair per test binary; generation is not free
inline const TestKeypair& shared_keypair() {
    static const TestKeypair keypair = make_keypair("example.com");
    return keypair;
}

// ============================
// Object builders
// ============================

inline source::ObjectMeta meta(std::string ns, std::string name, int64_t created = 1000) {
    source::ObjectMeta m;
    m.ns = std::move(ns);
    m.name = std::move(name);
    m.creation_timestamp = created;
    return m;
}

inline source::Service service(std::string ns, std::string name, std::vector<int32_t> ports = {80}) {
    source::Service svc;
    svc.metadata = meta(std::move(ns), std::move(name));
    for (auto port : ports) {
        source::ServicePort p;
        p.name = "port-" + std::to_string(port);
        p.port = port;
        svc.ports.push_back(std::move(p));
    }
    return svc;
}

inline source::Secret tls_secret(std::string ns, std::string name) {
    source::Secret secret;
    secret.metadata = meta(std::move(ns), std::move(name));
    secret.type = std::string(core::kSecretTypeTls);
    const auto& kp = shared_keypair();
    secret.data.emplace(std::string(core::kTlsCertKey), kp.cert_pem);
    secret.data.emplace(std::string(core::kTlsPrivateKeyKey), kp.key_pem);
    return secret;
}

inline source::Secret ca_secret(std::string ns, std::string name) {
    source::Secret secret;
    secret.metadata = meta(std::move(ns), std::move(name));
    secret.data.emplace(std::string(core::kCaCertificateKey), shared_keypair().cert_pem);
    return secret;
}

inline source::Secret broken_secret(std::string ns, std::string name) {
    source::Secret secret;
    secret.metadata = meta(std::move(ns), std::move(name));
    secret.type = std::string(core::kSecretTypeTls);
    secret.data.emplace(std::string(core::kTlsCertKey), "not a certificate");
    secret.data.emplace(std::string(core::kTlsPrivateKeyKey), "not a key");
    return secret;
}

inline source::MatchCondition prefix(std::string value) {
    source::MatchCondition c;
    c.prefix = std::move(value);
    return c;
}

inline source::ProxyService proxy_service(std::string name, int32_t port = 80) {
    source::ProxyService s;
    s.name = std::move(name);
    s.port = port;
    return s;
}

inline source::ProxyRoute proxy_route(std::string path, std::string service_name,
                                      int32_t port = 80) {
    source::ProxyRoute r;
    if (!path.empty()) {
        r.conditions.push_back(prefix(std::move(path)));
    }
    r.services.push_back(proxy_service(std::move(service_name), port));
    return r;
}

inline source::HTTPProxy root_proxy(std::string ns, std::string name, std::string fqdn,
                                    int64_t created = 1000) {
    source::HTTPProxy p;
    p.metadata = meta(std::move(ns), std::move(name), created);
    p.virtualhost.emplace();
    p.virtualhost->fqdn = std::move(fqdn);
    return p;
}

inline source::ExtensionService extension_service(std::string ns, std::string name,
                                                  std::string service_name, int32_t port = 9001) {
    source::ExtensionService e;
    e.metadata = meta(std::move(ns), std::move(name));
    e.services.push_back(proxy_service(std::move(service_name), port));
    return e;
}

inline source::HTTPProxy child_proxy(std::string ns, std::string name, int64_t created = 1000) {
    source::HTTPProxy p;
    p.metadata = meta(std::move(ns), std::move(name), created);
    return p;
}

inline source::Include include(std::string name, std::string prefix_value = "",
                               std::string ns = "") {
    source::Include inc;
    inc.name = std::move(name);
    inc.ns = std::move(ns);
    if (!prefix_value.empty()) {
        inc.conditions.push_back(prefix(std::move(prefix_value)));
    }
    return inc;
}

inline source::IngressPath ingress_path(std::string path, std::string service_name,
                                        int32_t port = 80,
                                        std::string path_type = "ImplementationSpecific") {
    source::IngressPath p;
    p.path = std::move(path);
    p.path_type = std::move(path_type);
    p.backend.service_name = std::move(service_name);
    p.backend.port_number = port;
    return p;
}

inline source::Ingress ingress(std::string ns, std::string name, std::string host,
                               std::vector<source::IngressPath> paths, int64_t created = 1000) {
    source::Ingress ing;
    ing.metadata = meta(std::move(ns), std::move(name), created);
    source::IngressRule rule;
    rule.host = std::move(host);
    rule.paths = std::move(paths);
    ing.rules.push_back(std::move(rule));
    return ing;
}

inline source::GatewayClass gateway_class(std::string name = "lattice") {
    source::GatewayClass gc;
    gc.metadata = meta("", std::move(name));
    gc.controller_name = "projectcontour.io/gateway-controller";
    return gc;
}

inline source::GatewayListener gateway_listener(std::string name, int32_t port,
                                                std::string protocol,
                                                std::string hostname = "") {
    source::GatewayListener l;
    l.name = std::move(name);
    l.port = port;
    l.protocol = std::move(protocol);
    l.hostname = std::move(hostname);
    return l;
}

inline source::Gateway gateway(std::string ns, std::string name,
                               std::vector<source::GatewayListener> listeners,
                               int64_t created = 1000) {
    source::Gateway gw;
    gw.metadata = meta(std::move(ns), std::move(name), created);
    gw.gateway_class_name = "lattice";
    gw.listeners = std::move(listeners);
    return gw;
}

inline source::ParentReference parent_ref(std::string name, std::string section = "") {
    source::ParentReference ref;
    ref.name = std::move(name);
    ref.section_name = std::move(section);
    return ref;
}

inline source::BackendRef backend_ref(std::string name, int32_t port = 80) {
    source::BackendRef ref;
    ref.name = std::move(name);
    ref.port = port;
    return ref;
}

inline source::HTTPRouteMatch path_prefix_match(std::string value) {
    source::HTTPRouteMatch m;
    m.path = source::HTTPPathMatch{"PathPrefix", std::move(value)};
    return m;
}

inline source::HTTPRoute http_route(std::string ns, std::string name, std::string gateway_name,
                                    std::vector<std::string> hostnames, std::string path,
                                    std::string backend, int64_t created = 1000) {
    source::HTTPRoute route;
    route.metadata = meta(std::move(ns), std::move(name), created);
    route.parent_refs.push_back(parent_ref(std::move(gateway_name)));
    route.hostnames = std::move(hostnames);
    source::HTTPRouteRule rule;
    rule.matches.push_back(path_prefix_match(std::move(path)));
    rule.backend_refs.push_back(backend_ref(std::move(backend)));
    route.rules.push_back(std::move(rule));
    return route;
}

// ============================
// Build helpers
// ============================

inline control::Config test_config() {
    control::Config config;
    config.logging.output = "stdout";
    return config;
}

inline dag::BuildResult build(const source::ObjectCache& cache,
                              const control::Config& config = test_config()) {
    dag::Builder builder;
    return builder.build(cache, config, 1);
}

template <typename... Objects>
source::ObjectCache cache_of(Objects&&... objects) {
    source::ObjectCache cache;
    (cache.insert(source::Object(std::forward<Objects>(objects))), ...);
    cache.mark_synced();
    return cache;
}

inline const dag::ObjectStatus* find_status(const dag::BuildResult& result, source::Kind kind,
                                            std::string_view ns, std::string_view name) {
    for (const auto& status : result.statuses) {
        if (status.object.kind == kind && status.object.name.ns == ns &&
            status.object.name.name == name) {
            return &status;
        }
    }
    return nullptr;
}

inline const dag::Condition* find_condition(const std::vector<dag::Condition>& conditions,
                                            std::string_view type) {
    for (const auto& c : conditions) {
        if (c.type == type) {
            return &c;
        }
    }
    return nullptr;
}

inline const dag::VirtualHost* find_vhost(const dag::Dag& dag, std::string_view listener,
                                          std::string_view host) {
    const auto* l = dag.find_listener(listener);
    if (!l) {
        return nullptr;
    }
    auto it = l->virtual_hosts.find(std::string(host));
    return it == l->virtual_hosts.end() ? nullptr : &it->second;
}

/// Route paths of a virtual host in final order
inline std::vector<std::string> route_paths(const dag::VirtualHost& vhost) {
    std::vector<std::string> out;
    for (const auto& r : vhost.routes) {
        out.push_back(r.match.path.str());
    }
    return out;
}

/// First route whose path match renders as path ("prefix:/api")
inline const dag::Route* find_path(const dag::VirtualHost& vhost, std::string_view path) {
    for (const auto& r : vhost.routes) {
        if (r.match.path.str() == path) {
            return &r;
        }
    }
    return nullptr;
}

inline http::Request request(std::string_view authority, std::string_view target,
                             http::Method method = http::Method::GET) {
    return http::Request::from_target(method, authority, target);
}

}  // namespace lattice::testing
