#include "jwsign/algorithms.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/objects.h>
#include <openssl/rsa.h>

#include "jwsign/error.hpp"
#include "jwsign/logging.hpp"
#include "jwsign/secure_vector.hpp"

namespace jwsign {

namespace {

/**
 * @brief RAII wrapper for OpenSSL contexts
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;

  T* get() const noexcept { return ptr_; }

 private:
  T* ptr_;
};

using EvpMdCtxWrapper = OpenSSLWrapper<EVP_MD_CTX, EVP_MD_CTX_free>;
using EcdsaSigWrapper = OpenSSLWrapper<ECDSA_SIG, ECDSA_SIG_free>;

[[noreturn]] void throwOpenSSLError(const std::string& what) {
  unsigned long err = ERR_get_error();
  ERR_clear_error();
  JWSIGN_LOG_ERROR("{} (OpenSSL error {})", what, err);
  if (err == 0) {
    throw CryptoError(what);
  }
  throw CryptoError(what + ": OpenSSL error " + std::to_string(err));
}

const EVP_MD* messageDigest(HashAlgorithm hash) {
  switch (hash) {
    case HashAlgorithm::SHA256:
      return EVP_sha256();
    case HashAlgorithm::SHA384:
      return EVP_sha384();
    case HashAlgorithm::SHA512:
      return EVP_sha512();
  }
  throw CryptoError("Unknown hash algorithm");
}

std::string hashBits(HashAlgorithm hash) {
  return std::to_string(hashSize(hash) * 8);
}

/**
 * @brief Hash-then-sign with an OpenSSL key
 * @param rsaPadding RSA padding mode, or 0 for non-RSA keys
 */
std::vector<uint8_t> digestSign(EVP_PKEY* pkey, HashAlgorithm hash,
                                std::span<const uint8_t> data,
                                int rsaPadding) {
  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) throwOpenSSLError("Failed to create signing context");

  EVP_PKEY_CTX* pctx = nullptr;  // owned by mdctx
  if (EVP_DigestSignInit(mdctx.get(), &pctx, messageDigest(hash), nullptr,
                         pkey) <= 0) {
    throwOpenSSLError("Failed to initialize signing");
  }

  if (rsaPadding != 0 && EVP_PKEY_CTX_set_rsa_padding(pctx, rsaPadding) <= 0) {
    throwOpenSSLError("Failed to set RSA padding");
  }

  if (EVP_DigestSignUpdate(mdctx.get(), data.data(), data.size()) <= 0) {
    throwOpenSSLError("Failed to update signing context");
  }

  size_t sigLen = 0;
  if (EVP_DigestSignFinal(mdctx.get(), nullptr, &sigLen) <= 0) {
    throwOpenSSLError("Failed to determine signature length");
  }

  std::vector<uint8_t> signature(sigLen);
  if (EVP_DigestSignFinal(mdctx.get(), signature.data(), &sigLen) <= 0) {
    throwOpenSSLError("Failed to sign data");
  }

  signature.resize(sigLen);
  return signature;
}

/**
 * @brief Hash-then-verify with an OpenSSL key
 * @return true only for a valid signature; the error queue is left empty
 */
bool digestVerify(EVP_PKEY* pkey, HashAlgorithm hash,
                  std::span<const uint8_t> data,
                  std::span<const uint8_t> signature, int rsaPadding) {
  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) throwOpenSSLError("Failed to create verification context");

  EVP_PKEY_CTX* pctx = nullptr;
  bool valid =
      EVP_DigestVerifyInit(mdctx.get(), &pctx, messageDigest(hash), nullptr,
                           pkey) > 0 &&
      (rsaPadding == 0 || EVP_PKEY_CTX_set_rsa_padding(pctx, rsaPadding) > 0) &&
      EVP_DigestVerifyUpdate(mdctx.get(), data.data(), data.size()) > 0 &&
      EVP_DigestVerifyFinal(mdctx.get(), signature.data(), signature.size()) ==
          1;

  if (!valid) {
    ERR_clear_error();
  }
  return valid;
}

// DER ECDSA-Sig-Value to fixed-width R || S
std::vector<uint8_t> derToRaw(std::span<const uint8_t> der,
                              size_t scalarSize) {
  const unsigned char* p = der.data();
  auto sig = EcdsaSigWrapper(
      d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
  if (!sig.get()) throwOpenSSLError("Failed to parse DER ECDSA signature");

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::vector<uint8_t> raw(2 * scalarSize, 0);
  if (BN_bn2binpad(r, raw.data(), static_cast<int>(scalarSize)) < 0 ||
      BN_bn2binpad(s, raw.data() + scalarSize, static_cast<int>(scalarSize)) <
          0) {
    throwOpenSSLError("Failed to encode ECDSA signature");
  }
  return raw;
}

// Fixed-width R || S to DER ECDSA-Sig-Value
std::vector<uint8_t> rawToDer(std::span<const uint8_t> raw,
                              size_t scalarSize) {
  auto sig = EcdsaSigWrapper(ECDSA_SIG_new());
  if (!sig.get()) throwOpenSSLError("Failed to allocate ECDSA signature");

  BIGNUM* r = BN_bin2bn(raw.data(), static_cast<int>(scalarSize), nullptr);
  BIGNUM* s = BN_bin2bn(raw.data() + scalarSize, static_cast<int>(scalarSize),
                        nullptr);
  // ECDSA_SIG_set0 takes ownership of r and s on success only
  if (!r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    throwOpenSSLError("Failed to build ECDSA signature");
  }

  int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (der_len <= 0) throwOpenSSLError("Failed to encode DER ECDSA signature");

  std::vector<uint8_t> der(static_cast<size_t>(der_len));
  unsigned char* der_ptr = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &der_ptr) != der_len) {
    throwOpenSSLError("Failed to encode DER ECDSA signature");
  }
  return der;
}

int curveNid(EcdsaCurve curve) noexcept {
  switch (curve) {
    case EcdsaCurve::P256:
      return NID_X9_62_prime256v1;
    case EcdsaCurve::P384:
      return NID_secp384r1;
    case EcdsaCurve::P521:
      return NID_secp521r1;
  }
  return NID_undef;
}

std::string_view curveDisplayName(EcdsaCurve curve) noexcept {
  switch (curve) {
    case EcdsaCurve::P256:
      return "P-256";
    case EcdsaCurve::P384:
      return "P-384";
    case EcdsaCurve::P521:
      return "P-521";
  }
  return "unknown";
}

}  // namespace

std::vector<uint8_t> digest(HashAlgorithm hash,
                            std::span<const uint8_t> data) {
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len,
                 messageDigest(hash), nullptr) != 1) {
    throwOpenSSLError("Digest computation failed");
  }
  out.resize(len);
  return out;
}

std::vector<uint8_t> hmac(HashAlgorithm hash, std::span<const uint8_t> secret,
                          std::span<const uint8_t> data) {
  // Intermediate buffer in locked memory
  SecureVector<uint8_t> secure_result(EVP_MAX_MD_SIZE);
  unsigned int len = 0;

  if (!HMAC(messageDigest(hash), secret.data(), static_cast<int>(secret.size()),
            data.data(), data.size(), secure_result.data(), &len)) {
    throwOpenSSLError("HMAC computation failed");
  }

  return std::vector<uint8_t>(secure_result.begin(),
                              secure_result.begin() + len);
}

//
// HmacAlgorithm
//

std::string HmacAlgorithm::identifier() const { return "HS" + hashBits(hash_); }

std::vector<uint8_t> HmacAlgorithm::signImpl(std::span<const uint8_t> message,
                                             const Key& key) const {
  if (key.type() != KeyType::Secret) {
    throw InvalidKeyError(identifier() + " requires a shared secret, got " +
                          std::string(keyTypeName(key.type())) + " key");
  }
  return hmac(hash_, key.secret(), message);
}

void HmacAlgorithm::verifyImpl(std::span<const uint8_t> message,
                               std::span<const uint8_t> signature,
                               const Key& key) const {
  if (key.type() != KeyType::Secret) {
    throw SignatureError(identifier() + " requires a shared secret");
  }

  auto computed = hmac(hash_, key.secret(), message);
  if (!secure_utils::constantTimeEqual(computed, signature)) {
    throw SignatureError("HMAC mismatch");
  }
}

//
// RsaAlgorithm
//

std::string RsaAlgorithm::identifier() const { return "RS" + hashBits(hash_); }

std::string RsaAlgorithm::keyMismatch(const Key& key, bool forSigning) const {
  if (key.type() != KeyType::Rsa) {
    return identifier() + " requires an RSA key, got " +
           std::string(keyTypeName(key.type())) + " key";
  }
  if (forSigning && !key.hasPrivateKey()) {
    return identifier() + " signing requires a private key";
  }
  if (key.bits() < crypto_constants::RSA_MIN_KEY_BITS) {
    return "RSA key of " + std::to_string(key.bits()) +
           " bits is below the minimum of " +
           std::to_string(crypto_constants::RSA_MIN_KEY_BITS);
  }
  return {};
}

std::vector<uint8_t> RsaAlgorithm::signImpl(std::span<const uint8_t> message,
                                            const Key& key) const {
  if (auto reason = keyMismatch(key, true); !reason.empty()) {
    throw InvalidKeyError(reason);
  }
  return digestSign(key.evpKey(), hash_, message, RSA_PKCS1_PADDING);
}

void RsaAlgorithm::verifyImpl(std::span<const uint8_t> message,
                              std::span<const uint8_t> signature,
                              const Key& key) const {
  if (auto reason = keyMismatch(key, false); !reason.empty()) {
    throw SignatureError(reason);
  }
  if (!digestVerify(key.evpKey(), hash_, message, signature,
                    RSA_PKCS1_PADDING)) {
    throw SignatureError("RSA signature does not match");
  }
}

//
// EcdsaAlgorithm
//

std::string EcdsaAlgorithm::identifier() const {
  return "ES" + hashBits(hash());
}

std::string EcdsaAlgorithm::keyMismatch(const Key& key,
                                        bool forSigning) const {
  if (key.type() != KeyType::Ec) {
    return identifier() + " requires an EC key, got " +
           std::string(keyTypeName(key.type())) + " key";
  }
  if (forSigning && !key.hasPrivateKey()) {
    return identifier() + " signing requires a private key";
  }

  auto name = key.curveName();
  int nid = OBJ_txt2nid(name.c_str());
  if (nid == NID_undef) {
    nid = EC_curve_nist2nid(name.c_str());
  }
  if (nid != curveNid(curve_)) {
    return identifier() + " requires a " +
           std::string(curveDisplayName(curve_)) + " key, got curve '" + name +
           "'";
  }
  return {};
}

std::vector<uint8_t> EcdsaAlgorithm::signImpl(std::span<const uint8_t> message,
                                              const Key& key) const {
  if (auto reason = keyMismatch(key, true); !reason.empty()) {
    throw InvalidKeyError(reason);
  }
  auto der = digestSign(key.evpKey(), hash(), message, 0);
  return derToRaw(der, curveScalarSize(curve_));
}

void EcdsaAlgorithm::verifyImpl(std::span<const uint8_t> message,
                                std::span<const uint8_t> signature,
                                const Key& key) const {
  if (auto reason = keyMismatch(key, false); !reason.empty()) {
    throw SignatureError(reason);
  }

  size_t scalarSize = curveScalarSize(curve_);
  if (signature.size() != 2 * scalarSize) {
    throw SignatureError(identifier() + " signature must be " +
                         std::to_string(2 * scalarSize) + " bytes, got " +
                         std::to_string(signature.size()));
  }

  auto der = rawToDer(signature, scalarSize);
  if (!digestVerify(key.evpKey(), hash(), message, der, 0)) {
    throw SignatureError("ECDSA signature does not match");
  }
}

}  // namespace jwsign
