/**
 * @file key.hpp
 * @brief Opaque key handle passed to sign and verify
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations for OpenSSL types
typedef struct evp_pkey_st EVP_PKEY;
typedef struct bio_st BIO;

namespace jwsign {

/**
 * @brief RAII wrapper for OpenSSL EVP_PKEY
 */
struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

/**
 * @brief RAII wrapper for OpenSSL BIO
 */
struct BioDeleter {
  void operator()(BIO* bio) const noexcept;
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

enum class KeyType {
  Secret,  ///< Shared secret bytes (HMAC)
  Rsa,     ///< RSA key pair or public key
  Ec       ///< Elliptic curve key pair or public key
};

/**
 * @brief Key material for one signing or verification call
 *
 * The library never generates, stores or rotates keys. A Key only wraps
 * material the caller already holds. Copies share the same immutable state.
 */
class Key {
 public:
  /**
   * @brief Shared secret from the bytes of a string
   * @throws InvalidKeyError if the secret is empty
   */
  static Key fromSecret(std::string_view secret);

  /**
   * @brief Shared secret from raw bytes
   * @throws InvalidKeyError if the secret is empty
   */
  static Key fromSecret(std::span<const uint8_t> secret);

  /**
   * @brief Load a PEM private key (PKCS#8 or traditional) or a
   * SubjectPublicKeyInfo public key
   * @throws InvalidKeyError if the PEM cannot be parsed or is not RSA or EC
   */
  static Key fromPem(std::string_view pem);

  /**
   * @brief Load a DER private key or SubjectPublicKeyInfo public key
   * @throws InvalidKeyError if the DER cannot be parsed or is not RSA or EC
   */
  static Key fromDer(std::span<const uint8_t> der);

  [[nodiscard]] KeyType type() const noexcept;

  /**
   * @brief True for secrets and for asymmetric keys carrying private
   * material
   */
  [[nodiscard]] bool hasPrivateKey() const noexcept;

  /**
   * @brief Key size in bits (modulus for RSA, group order for EC, secret
   * length for secrets)
   */
  [[nodiscard]] size_t bits() const;

  /**
   * @brief OpenSSL short curve name (e.g. "prime256v1"), empty for non-EC
   */
  [[nodiscard]] std::string curveName() const;

  /**
   * @throws InvalidKeyError if this is not a secret key
   */
  [[nodiscard]] std::span<const uint8_t> secret() const;

  /**
   * @brief Underlying OpenSSL key, owned by this Key
   * @throws InvalidKeyError if this is a secret key
   */
  [[nodiscard]] EVP_PKEY* evpKey() const;

  /**
   * @brief Public-only copy of an asymmetric key
   * @throws InvalidKeyError if this is a secret key
   */
  [[nodiscard]] Key publicKey() const;

  /**
   * @brief DER-encoded SubjectPublicKeyInfo
   * @throws InvalidKeyError if this is a secret key
   */
  [[nodiscard]] std::vector<uint8_t> publicKeyDer() const;

 private:
  struct Impl;
  explicit Key(std::shared_ptr<const Impl> impl);

  static Key fromEvpKey(EvpKeyPtr pkey, bool hasPrivate);

  std::shared_ptr<const Impl> impl_;
};

std::string_view keyTypeName(KeyType type) noexcept;

}  // namespace jwsign
