/**
 * @file algorithms.hpp
 * @brief Signing algorithm implementations (HMAC, RSA, ECDSA)
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "codec.hpp"
#include "key.hpp"

namespace jwsign {

namespace crypto_constants {
constexpr size_t RSA_MIN_KEY_BITS = 2048;  ///< Smallest RSA modulus accepted
constexpr size_t P256_SCALAR_SIZE = 32;    ///< P-256 coordinate size in bytes
constexpr size_t P384_SCALAR_SIZE = 48;    ///< P-384 coordinate size in bytes
constexpr size_t P521_SCALAR_SIZE = 66;    ///< P-521 coordinate size in bytes
}  // namespace crypto_constants

static_assert(crypto_constants::P521_SCALAR_SIZE == (521 + 7) / 8,
              "P-521 scalar size must round 521 bits up to whole bytes");

enum class HashAlgorithm { SHA256, SHA384, SHA512 };

/**
 * @brief NIST curves for ECDSA; each curve fixes its hash
 */
enum class EcdsaCurve { P256, P384, P521 };

/**
 * @brief Digest size in bytes
 */
constexpr size_t hashSize(HashAlgorithm hash) noexcept {
  switch (hash) {
    case HashAlgorithm::SHA256:
      return 32;
    case HashAlgorithm::SHA384:
      return 48;
    case HashAlgorithm::SHA512:
      return 64;
  }
  return 0;
}

/**
 * @brief Hash paired with a curve (P-256/SHA-256, P-384/SHA-384,
 * P-521/SHA-512)
 */
constexpr HashAlgorithm curveHash(EcdsaCurve curve) noexcept {
  switch (curve) {
    case EcdsaCurve::P256:
      return HashAlgorithm::SHA256;
    case EcdsaCurve::P384:
      return HashAlgorithm::SHA384;
    case EcdsaCurve::P521:
      return HashAlgorithm::SHA512;
  }
  return HashAlgorithm::SHA256;
}

constexpr size_t curveScalarSize(EcdsaCurve curve) noexcept {
  switch (curve) {
    case EcdsaCurve::P256:
      return crypto_constants::P256_SCALAR_SIZE;
    case EcdsaCurve::P384:
      return crypto_constants::P384_SCALAR_SIZE;
    case EcdsaCurve::P521:
      return crypto_constants::P521_SCALAR_SIZE;
  }
  return 0;
}

/**
 * @brief Abstract base class for JWS signing algorithms
 *
 * Implementations are stateless beyond their construction parameters and
 * may be reused across calls and threads. Caller-defined algorithms derive
 * from this class and are reachable only through a registered binding.
 */
class SigningAlgorithm {
 public:
  virtual ~SigningAlgorithm() = default;

  /**
   * @brief Sign a message
   * @param message Signing input
   * @param key Key material for this algorithm
   * @return Raw signature bytes
   * @throws InvalidKeyError if the key does not fit the algorithm
   * @throws CryptoError if the underlying primitive fails
   */
  template <ByteData T>
  std::vector<uint8_t> sign(const T& message, const Key& key) const {
    return signImpl({std::data(message), std::size(message)}, key);
  }

  /**
   * @brief Verify a signature; returns only if it is valid
   * @param message Signing input
   * @param signature Signature to check
   * @param key Key material for this algorithm
   * @throws SignatureError on any verification failure
   */
  template <ByteData T1, ByteData T2>
  void verify(const T1& message, const T2& signature, const Key& key) const {
    verifyImpl({std::data(message), std::size(message)},
               {std::data(signature), std::size(signature)}, key);
  }

  /**
   * @brief Algorithm identifier as written in the alg header parameter
   */
  virtual std::string identifier() const = 0;

 protected:
  virtual std::vector<uint8_t> signImpl(std::span<const uint8_t> message,
                                        const Key& key) const = 0;
  virtual void verifyImpl(std::span<const uint8_t> message,
                          std::span<const uint8_t> signature,
                          const Key& key) const = 0;
};

/**
 * @brief HMAC with SHA-2 (HS256, HS384, HS512)
 */
class HmacAlgorithm : public SigningAlgorithm {
 private:
  HashAlgorithm hash_;

 public:
  explicit HmacAlgorithm(HashAlgorithm hash) : hash_(hash) {}

  HashAlgorithm hash() const noexcept { return hash_; }

  std::string identifier() const override;

 protected:
  std::vector<uint8_t> signImpl(std::span<const uint8_t> message,
                                const Key& key) const override;
  void verifyImpl(std::span<const uint8_t> message,
                  std::span<const uint8_t> signature,
                  const Key& key) const override;
};

/**
 * @brief RSASSA-PKCS1-v1_5 with SHA-2 (RS256, RS384, RS512)
 */
class RsaAlgorithm : public SigningAlgorithm {
 private:
  HashAlgorithm hash_;

  // Empty when the key fits, otherwise the reason it does not
  std::string keyMismatch(const Key& key, bool forSigning) const;

 public:
  explicit RsaAlgorithm(HashAlgorithm hash) : hash_(hash) {}

  HashAlgorithm hash() const noexcept { return hash_; }

  std::string identifier() const override;

 protected:
  std::vector<uint8_t> signImpl(std::span<const uint8_t> message,
                                const Key& key) const override;
  void verifyImpl(std::span<const uint8_t> message,
                  std::span<const uint8_t> signature,
                  const Key& key) const override;
};

/**
 * @brief ECDSA over NIST curves (ES256, ES384, ES512)
 *
 * Signatures are the fixed-width R || S concatenation used by JWS, not DER.
 * Nonces are drawn from the OpenSSL random generator, so signing the same
 * input twice yields different signatures.
 */
class EcdsaAlgorithm : public SigningAlgorithm {
 private:
  EcdsaCurve curve_;

  // Empty when the key fits, otherwise the reason it does not
  std::string keyMismatch(const Key& key, bool forSigning) const;

 public:
  explicit EcdsaAlgorithm(EcdsaCurve curve) : curve_(curve) {}

  EcdsaCurve curve() const noexcept { return curve_; }
  HashAlgorithm hash() const noexcept { return curveHash(curve_); }

  std::string identifier() const override;

 protected:
  std::vector<uint8_t> signImpl(std::span<const uint8_t> message,
                                const Key& key) const override;
  void verifyImpl(std::span<const uint8_t> message,
                  std::span<const uint8_t> signature,
                  const Key& key) const override;
};

/**
 * @brief Compute a SHA-2 digest
 */
std::vector<uint8_t> digest(HashAlgorithm hash,
                            std::span<const uint8_t> data);

/**
 * @brief Compute an HMAC with a raw secret
 */
std::vector<uint8_t> hmac(HashAlgorithm hash, std::span<const uint8_t> secret,
                          std::span<const uint8_t> data);

}  // namespace jwsign
