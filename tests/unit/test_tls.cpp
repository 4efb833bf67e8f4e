// Lattice TLS Tests
// Shape validation of serving keypairs, CA bundles and revocation lists

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/core/tls.hpp"
#include "test_helpers.hpp"

using namespace lattice::core;
using lattice::testing::shared_keypair;

// ============================
// Serving keypairs
// ============================

TEST_CASE("Serving keypair validation", "[tls][secret]") {
    const auto& kp = shared_keypair();

    SECTION("Generated keypair is valid") {
        REQUIRE_FALSE(validate_serving_bundle(kp.cert_pem));
        REQUIRE_FALSE(validate_private_key(kp.key_pem));

        SecretData data{{"tls.crt", kp.cert_pem}, {"tls.key", kp.key_pem}};
        REQUIRE_FALSE(validate_tls_secret(kSecretTypeTls, data));
        REQUIRE_FALSE(validate_tls_secret(kSecretTypeOpaque, data));
    }

    SECTION("Other secret types are rejected") {
        SecretData data{{"tls.crt", kp.cert_pem}, {"tls.key", kp.key_pem}};
        REQUIRE(validate_tls_secret("kubernetes.io/dockerconfigjson", data) ==
                SecretError::WrongType);
    }

    SECTION("Missing entries") {
        SecretData no_cert{{"tls.key", kp.key_pem}};
        SecretData no_key{{"tls.crt", kp.cert_pem}};
        REQUIRE(validate_tls_secret(kSecretTypeTls, no_cert) == SecretError::MissingCertificate);
        REQUIRE(validate_tls_secret(kSecretTypeTls, no_key) == SecretError::MissingPrivateKey);
    }

    SECTION("Garbage certificate") {
        std::string garbage = "-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n";
        REQUIRE(validate_serving_bundle(garbage) == SecretError::InvalidCertificate);
        REQUIRE(validate_serving_bundle("") == SecretError::InvalidCertificate);
    }

    SECTION("Two private keys are rejected") {
        REQUIRE(validate_private_key(kp.key_pem + kp.key_pem) == SecretError::MultiplePrivateKeys);
    }

    SECTION("A certificate is not a private key") {
        REQUIRE(validate_private_key(kp.cert_pem) == SecretError::InvalidPrivateKey);
    }
}

// ============================
// CA bundles and CRLs
// ============================

TEST_CASE("CA bundle validation", "[tls][secret]") {
    const auto& kp = shared_keypair();

    SecretData data{{"ca.crt", kp.cert_pem}};
    REQUIRE_FALSE(validate_ca_secret(kSecretTypeOpaque, data));

    SecretData empty{{"ca.crt", ""}};
    REQUIRE(validate_ca_secret(kSecretTypeOpaque, empty) == SecretError::MissingCaBundle);

    SecretData with_key{{"ca.crt", kp.cert_pem + kp.key_pem}};
    REQUIRE(validate_ca_secret(kSecretTypeOpaque, with_key) == SecretError::InvalidCaBundle);
}

TEST_CASE("CRL validation", "[tls][secret]") {
    const auto& kp = shared_keypair();

    SecretData data{{"crl.pem", kp.crl_pem}};
    REQUIRE_FALSE(validate_crl_secret(kSecretTypeOpaque, data));

    SecretData missing;
    REQUIRE(validate_crl_secret(kSecretTypeOpaque, missing) == SecretError::MissingCrl);

    SecretData not_a_crl{{"crl.pem", kp.cert_pem}};
    REQUIRE(validate_crl_secret(kSecretTypeOpaque, not_a_crl) == SecretError::InvalidCrl);
}

// ============================
// Error codes and versions
// ============================

TEST_CASE("Secret error codes", "[tls][error]") {
    std::error_code ec = SecretError::NoCommonName;
    REQUIRE(ec.category().name() == std::string("secret"));
    REQUIRE_FALSE(ec.message().empty());
}

TEST_CASE("TLS version parsing", "[tls][version]") {
    REQUIRE(parse_tls_version("") == TlsVersion::Unspecified);
    REQUIRE(parse_tls_version("1.2") == TlsVersion::V1_2);
    REQUIRE(parse_tls_version("1.3") == TlsVersion::V1_3);
    REQUIRE_FALSE(parse_tls_version("1.1").has_value());
    REQUIRE(to_string(TlsVersion::V1_3) == "1.3");
}
