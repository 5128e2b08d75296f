#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <stdexcept>
#include <string>

#include "jwsign/key.hpp"

// Key generation for tests only; the library itself never creates keys.
namespace test_keys {

inline std::string toPem(EVP_PKEY* pkey, bool privateKey) {
    jwsign::BioPtr bio(BIO_new(BIO_s_mem()));
    int ok = privateKey
        ? PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr)
        : PEM_write_bio_PUBKEY(bio.get(), pkey);
    if (ok != 1) {
        throw std::runtime_error("PEM export failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

inline std::string generatePem(const char* type, const char* curve, size_t bits) {
    jwsign::EvpKeyPtr pkey(curve ? EVP_PKEY_Q_keygen(nullptr, nullptr, type, curve)
                                 : EVP_PKEY_Q_keygen(nullptr, nullptr, type, bits));
    if (!pkey) {
        throw std::runtime_error("Key generation failed");
    }
    return toPem(pkey.get(), true);
}

inline const std::string& rsaPem() {
    static const std::string pem = generatePem("RSA", nullptr, 2048);
    return pem;
}

inline const std::string& otherRsaPem() {
    static const std::string pem = generatePem("RSA", nullptr, 2048);
    return pem;
}

inline const std::string& weakRsaPem() {
    static const std::string pem = generatePem("RSA", nullptr, 1024);
    return pem;
}

inline const std::string& ecPem(const char* curve) {
    static const std::string p256 = generatePem("EC", "P-256", 0);
    static const std::string p384 = generatePem("EC", "P-384", 0);
    static const std::string p521 = generatePem("EC", "P-521", 0);
    std::string name(curve);
    if (name == "P-384") return p384;
    if (name == "P-521") return p521;
    return p256;
}

inline jwsign::Key rsa() { return jwsign::Key::fromPem(rsaPem()); }
inline jwsign::Key otherRsa() { return jwsign::Key::fromPem(otherRsaPem()); }
inline jwsign::Key weakRsa() { return jwsign::Key::fromPem(weakRsaPem()); }
inline jwsign::Key ec(const char* curve = "P-256") {
    return jwsign::Key::fromPem(ecPem(curve));
}

inline jwsign::Key otherEc256() {
    static const std::string pem = generatePem("EC", "P-256", 0);
    return jwsign::Key::fromPem(pem);
}

// Private key for signing and the matching public-only key for verifying
struct KeyPair {
    jwsign::Key signing;
    jwsign::Key verifying;
};

inline KeyPair pairFor(const std::string& alg) {
    if (alg.starts_with("HS")) {
        auto secret = jwsign::Key::fromSecret("a-shared-secret-of-reasonable-length");
        return {secret, secret};
    }
    jwsign::Key key = alg.starts_with("RS") ? rsa()
                      : alg == "ES384"      ? ec("P-384")
                      : alg == "ES512"      ? ec("P-521")
                                            : ec("P-256");
    return {key, key.publicKey()};
}

}  // namespace test_keys
