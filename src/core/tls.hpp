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

// Lattice TLS - Header
// Shape validation of TLS key material referenced from routing objects

#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace lattice::core {

/// Reasons a referenced secret cannot be used
enum class SecretError {
    NotFound = 1,
    WrongType,
    MissingCertificate,
    InvalidCertificate,
    NoCommonName,
    MissingPrivateKey,
    InvalidPrivateKey,
    MultiplePrivateKeys,
    MissingCaBundle,
    InvalidCaBundle,
    MissingCrl,
    InvalidCrl,
    DelegationNotPermitted,
};

/// Secret error category for std::error_code
class SecretErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "secret";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get secret error category instance
[[nodiscard]] const SecretErrorCategory& secret_category() noexcept;

[[nodiscard]] std::error_code make_error_code(SecretError e) noexcept;

/// BIO deleter for std::unique_ptr
struct BioDeleter {
    void operator()(BIO* bio) const noexcept {
        if (bio) {
            BIO_free(bio);
        }
    }
};

/// X509 deleter for std::unique_ptr
struct X509Deleter {
    void operator()(X509* cert) const noexcept {
        if (cert) {
            X509_free(cert);
        }
    }
};

/// X509_CRL deleter for std::unique_ptr
struct X509CrlDeleter {
    void operator()(X509_CRL* crl) const noexcept {
        if (crl) {
            X509_CRL_free(crl);
        }
    }
};

/// EVP_PKEY deleter for std::unique_ptr
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509CrlPtr = std::unique_ptr<X509_CRL, X509CrlDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// Well-known secret keys and types
inline constexpr std::string_view kTlsCertKey = "tls.crt";
inline constexpr std::string_view kTlsPrivateKeyKey = "tls.key";
inline constexpr std::string_view kCaCertificateKey = "ca.crt";
inline constexpr std::string_view kCrlKey = "crl.pem";
inline constexpr std::string_view kSecretTypeTls = "kubernetes.io/tls";
inline constexpr std::string_view kSecretTypeOpaque = "Opaque";

using SecretData = std::map<std::string, std::string, std::less<>>;

/// Certificate chain: at least one CERTIFICATE block; the first names a CN or SAN
[[nodiscard]] std::error_code validate_serving_bundle(std::string_view pem);

/// Exactly one PKCS#8, PKCS#1 or SEC1 private key (EC PARAMETERS blocks are ignored)
[[nodiscard]] std::error_code validate_private_key(std::string_view pem);

/// At least one CERTIFICATE block
[[nodiscard]] std::error_code validate_ca_bundle(std::string_view pem);

/// At least one X509 CRL block
[[nodiscard]] std::error_code validate_crl(std::string_view pem);

/// Serving keypair secret (tls.crt + tls.key)
[[nodiscard]] std::error_code validate_tls_secret(std::string_view type, const SecretData& data);

/// CA bundle secret (ca.crt)
[[nodiscard]] std::error_code validate_ca_secret(std::string_view type, const SecretData& data);

/// Certificate revocation list secret (crl.pem)
[[nodiscard]] std::error_code validate_crl_secret(std::string_view type, const SecretData& data);

/// Downstream TLS protocol versions
enum class TlsVersion {
    Unspecified,
    V1_2,
    V1_3,
};

/// Parse "1.2" / "1.3" / "" (Unspecified). Returns nullopt for anything else.
[[nodiscard]] std::optional<TlsVersion> parse_tls_version(std::string_view version) noexcept;

[[nodiscard]] std::string_view to_string(TlsVersion version) noexcept;

/// Initialize OpenSSL library (call once at startup)
void initialize_openssl() noexcept;

/// Cleanup OpenSSL library (call once at shutdown)
void cleanup_openssl() noexcept;

}  // namespace lattice::core

namespace std {
template <>
struct is_error_code_enum<lattice::core::SecretError> : true_type {};
}  // namespace std
