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

// Lattice TLS - Implementation
// Shape validation of TLS key material referenced from routing objects

#include "tls.hpp"

#include <openssl/crypto.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <cctype>
#include <functional>

namespace lattice::core {

// ============================
// Error Handling
// ============================

std::string SecretErrorCategory::message(int ev) const {
    switch (static_cast<SecretError>(ev)) {
        case SecretError::NotFound:
            return "secret not found";
        case SecretError::WrongType:
            return "secret type is not \"kubernetes.io/tls\" or \"Opaque\"";
        case SecretError::MissingCertificate:
            return "missing TLS certificate";
        case SecretError::InvalidCertificate:
            return "invalid TLS certificate";
        case SecretError::NoCommonName:
            return "invalid TLS certificate: certificate has no common name or subject alt name";
        case SecretError::MissingPrivateKey:
            return "missing TLS private key";
        case SecretError::InvalidPrivateKey:
            return "invalid TLS private key";
        case SecretError::MultiplePrivateKeys:
            return "invalid TLS private key: multiple private keys";
        case SecretError::MissingCaBundle:
            return "empty \"ca.crt\" key";
        case SecretError::InvalidCaBundle:
            return "invalid CA certificate bundle";
        case SecretError::MissingCrl:
            return "empty \"crl.pem\" key";
        case SecretError::InvalidCrl:
            return "failed to locate CRL";
        case SecretError::DelegationNotPermitted:
            return "certificate delegation not permitted";
    }
    return "unknown secret error";
}

const SecretErrorCategory& secret_category() noexcept {
    static SecretErrorCategory instance;
    return instance;
}

std::error_code make_error_code(SecretError e) noexcept {
    return std::error_code(static_cast<int>(e), secret_category());
}

// ============================
// PEM Walking
// ============================

namespace {

/// One decoded PEM block. Owns the buffers returned by PEM_read_bio.
struct PemBlock {
    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long length = 0;

    PemBlock() = default;
    PemBlock(const PemBlock&) = delete;
    PemBlock& operator=(const PemBlock&) = delete;

    ~PemBlock() {
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
    }
};

enum class PemWalk { Done, ParseError, Stopped };

/// Visit each PEM block in order. Trailing non-PEM data is accepted, the same
/// way OpenSSL callers that check PEM_R_NO_START_LINE accept it.
/// The visitor returns false to stop early.
PemWalk walk_pem(std::string_view pem, const std::function<bool(const PemBlock&)>& visit) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return PemWalk::ParseError;
    }

    ERR_clear_error();
    while (true) {
        PemBlock block;
        if (PEM_read_bio(bio.get(), &block.name, &block.header, &block.data, &block.length) != 1) {
            unsigned long err = ERR_peek_last_error();
            bool clean_end = ERR_GET_LIB(err) == ERR_LIB_PEM &&
                             ERR_GET_REASON(err) == PEM_R_NO_START_LINE;
            ERR_clear_error();
            return clean_end ? PemWalk::Done : PemWalk::ParseError;
        }
        if (!visit(block)) {
            ERR_clear_error();
            return PemWalk::Stopped;
        }
    }
}

bool has_common_name(X509* cert) {
    X509_NAME* subject = X509_get_subject_name(cert);
    if (!subject) {
        return false;
    }
    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) {
        return false;
    }
    ASN1_STRING* value = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
    if (!value) {
        return false;
    }
    const unsigned char* bytes = ASN1_STRING_get0_data(value);
    for (int i = 0; i < ASN1_STRING_length(value); ++i) {
        if (!std::isspace(bytes[i])) {
            return true;
        }
    }
    return false;
}

bool has_subject_alt_names(X509* cert) {
    auto* names = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!names) {
        return false;
    }
    bool found = false;
    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names, i);
        if (name->type == GEN_DNS || name->type == GEN_IPADD) {
            found = true;
            break;
        }
    }
    GENERAL_NAMES_free(names);
    return found;
}

bool secret_type_allowed(std::string_view type) {
    return type == kSecretTypeTls || type == kSecretTypeOpaque;
}

}  // namespace

// ============================
// Bundle Validation
// ============================

std::error_code validate_serving_bundle(std::string_view pem) {
    size_t count = 0;
    std::error_code ec;

    auto walk = walk_pem(pem, [&](const PemBlock& block) {
        if (std::string_view(block.name) != "CERTIFICATE") {
            ec = SecretError::InvalidCertificate;
            return false;
        }
        const unsigned char* p = block.data;
        X509Ptr cert(d2i_X509(nullptr, &p, block.length));
        if (!cert) {
            ec = SecretError::InvalidCertificate;
            return false;
        }
        // Only the leaf names the served host
        if (count == 0 && !has_common_name(cert.get()) && !has_subject_alt_names(cert.get())) {
            ec = SecretError::NoCommonName;
            return false;
        }
        ++count;
        return true;
    });

    if (ec) {
        return ec;
    }
    if (walk == PemWalk::ParseError || count == 0) {
        return SecretError::InvalidCertificate;
    }
    return {};
}

std::error_code validate_private_key(std::string_view pem) {
    size_t keys = 0;
    std::error_code ec;

    auto walk = walk_pem(pem, [&](const PemBlock& block) {
        std::string_view name(block.name);
        if (name == "EC PARAMETERS") {
            return true;
        }
        if (name != "PRIVATE KEY" && name != "RSA PRIVATE KEY" && name != "EC PRIVATE KEY") {
            ec = SecretError::InvalidPrivateKey;
            return false;
        }
        const unsigned char* p = block.data;
        EvpPkeyPtr key(d2i_AutoPrivateKey(nullptr, &p, block.length));
        if (!key) {
            ec = SecretError::InvalidPrivateKey;
            return false;
        }
        ++keys;
        return true;
    });

    if (ec) {
        return ec;
    }
    if (walk == PemWalk::ParseError) {
        return SecretError::InvalidPrivateKey;
    }
    switch (keys) {
        case 0:
            return SecretError::InvalidPrivateKey;
        case 1:
            return {};
        default:
            return SecretError::MultiplePrivateKeys;
    }
}

std::error_code validate_ca_bundle(std::string_view pem) {
    size_t count = 0;
    std::error_code ec;

    auto walk = walk_pem(pem, [&](const PemBlock& block) {
        if (std::string_view(block.name) != "CERTIFICATE") {
            ec = SecretError::InvalidCaBundle;
            return false;
        }
        ++count;
        return true;
    });

    if (ec) {
        return ec;
    }
    if (walk == PemWalk::ParseError || count == 0) {
        return SecretError::InvalidCaBundle;
    }
    return {};
}

std::error_code validate_crl(std::string_view pem) {
    bool found = false;

    auto walk = walk_pem(pem, [&](const PemBlock& block) {
        if (std::string_view(block.name) != "X509 CRL") {
            return true;
        }
        const unsigned char* p = block.data;
        X509CrlPtr crl(d2i_X509_CRL(nullptr, &p, block.length));
        found = crl != nullptr;
        return false;
    });

    if (walk == PemWalk::ParseError || !found) {
        return SecretError::InvalidCrl;
    }
    return {};
}

// ============================
// Secret Validation
// ============================

std::error_code validate_tls_secret(std::string_view type, const SecretData& data) {
    if (!secret_type_allowed(type)) {
        return SecretError::WrongType;
    }

    auto cert = data.find(kTlsCertKey);
    if (cert == data.end()) {
        return SecretError::MissingCertificate;
    }
    if (auto ec = validate_serving_bundle(cert->second)) {
        return ec;
    }

    auto key = data.find(kTlsPrivateKeyKey);
    if (key == data.end()) {
        return SecretError::MissingPrivateKey;
    }
    return validate_private_key(key->second);
}

std::error_code validate_ca_secret(std::string_view type, const SecretData& data) {
    if (!secret_type_allowed(type)) {
        return SecretError::WrongType;
    }

    auto ca = data.find(kCaCertificateKey);
    if (ca == data.end() || ca->second.empty()) {
        return SecretError::MissingCaBundle;
    }
    return validate_ca_bundle(ca->second);
}

std::error_code validate_crl_secret(std::string_view type, const SecretData& data) {
    if (!secret_type_allowed(type)) {
        return SecretError::WrongType;
    }

    auto crl = data.find(kCrlKey);
    if (crl == data.end() || crl->second.empty()) {
        return SecretError::MissingCrl;
    }
    return validate_crl(crl->second);
}

// ============================
// Protocol Versions
// ============================

std::optional<TlsVersion> parse_tls_version(std::string_view version) noexcept {
    if (version.empty()) {
        return TlsVersion::Unspecified;
    }
    if (version == "1.2") {
        return TlsVersion::V1_2;
    }
    if (version == "1.3") {
        return TlsVersion::V1_3;
    }
    return std::nullopt;
}

std::string_view to_string(TlsVersion version) noexcept {
    switch (version) {
        case TlsVersion::V1_2:
            return "1.2";
        case TlsVersion::V1_3:
            return "1.3";
        case TlsVersion::Unspecified:
            break;
    }
    return "";
}

void initialize_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-initializes, but we call this for compatibility
    OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

void cleanup_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-cleans up, but we call this for completeness
    EVP_cleanup();
}

}  // namespace lattice::core
