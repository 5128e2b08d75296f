#include "jwsign/key.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "jwsign/error.hpp"
#include "jwsign/logging.hpp"
#include "jwsign/secure_vector.hpp"

namespace jwsign {

void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

void BioDeleter::operator()(BIO* bio) const noexcept {
  if (bio) BIO_free(bio);
}

struct Key::Impl {
  KeyType type = KeyType::Secret;
  SecureVector<uint8_t> secret;
  EvpKeyPtr pkey;
  bool hasPrivate = false;
};

namespace {

// Encrypted PEM is refused instead of prompting on the terminal
int refusePassphrase(char*, int, int, void*) { return 0; }

BioPtr memoryBio(const void* data, size_t size) {
  auto bio = BioPtr(BIO_new_mem_buf(data, static_cast<int>(size)));
  if (!bio) {
    throw CryptoError("Failed to create BIO for key data");
  }
  return bio;
}

}  // namespace

Key::Key(std::shared_ptr<const Impl> impl) : impl_(std::move(impl)) {}

Key Key::fromSecret(std::string_view secret) {
  return fromSecret(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(secret.data()), secret.size()));
}

Key Key::fromSecret(std::span<const uint8_t> secret) {
  if (secret.empty()) {
    throw InvalidKeyError("Shared secret must not be empty");
  }
  auto impl = std::make_shared<Impl>();
  impl->type = KeyType::Secret;
  impl->secret = secure_utils::to_secure_vector(secret);
  impl->hasPrivate = true;
  return Key(std::move(impl));
}

Key Key::fromEvpKey(EvpKeyPtr pkey, bool hasPrivate) {
  auto impl = std::make_shared<Impl>();
  switch (EVP_PKEY_get_base_id(pkey.get())) {
    case EVP_PKEY_RSA:
      impl->type = KeyType::Rsa;
      break;
    case EVP_PKEY_EC:
      impl->type = KeyType::Ec;
      break;
    default:
      throw InvalidKeyError("Only RSA and EC keys are supported");
  }
  impl->pkey = std::move(pkey);
  impl->hasPrivate = hasPrivate;
  return Key(std::move(impl));
}

Key Key::fromPem(std::string_view pem) {
  if (pem.empty()) {
    throw InvalidKeyError("Empty PEM input");
  }

  auto priv_bio = memoryBio(pem.data(), pem.size());
  EvpKeyPtr pkey(PEM_read_bio_PrivateKey(priv_bio.get(), nullptr,
                                         refusePassphrase, nullptr));
  if (pkey) {
    return fromEvpKey(std::move(pkey), true);
  }
  ERR_clear_error();

  auto pub_bio = memoryBio(pem.data(), pem.size());
  pkey.reset(
      PEM_read_bio_PUBKEY(pub_bio.get(), nullptr, refusePassphrase, nullptr));
  if (pkey) {
    return fromEvpKey(std::move(pkey), false);
  }
  ERR_clear_error();

  JWSIGN_LOG_DEBUG("PEM input is neither a private nor a public key");
  throw InvalidKeyError("Unable to parse PEM key");
}

Key Key::fromDer(std::span<const uint8_t> der) {
  if (der.empty()) {
    throw InvalidKeyError("Empty DER input");
  }

  auto priv_bio = memoryBio(der.data(), der.size());
  EvpKeyPtr pkey(d2i_PrivateKey_bio(priv_bio.get(), nullptr));
  if (pkey) {
    return fromEvpKey(std::move(pkey), true);
  }
  ERR_clear_error();

  auto pub_bio = memoryBio(der.data(), der.size());
  pkey.reset(d2i_PUBKEY_bio(pub_bio.get(), nullptr));
  if (pkey) {
    return fromEvpKey(std::move(pkey), false);
  }
  ERR_clear_error();

  throw InvalidKeyError("Unable to parse DER key");
}

KeyType Key::type() const noexcept { return impl_->type; }

bool Key::hasPrivateKey() const noexcept { return impl_->hasPrivate; }

size_t Key::bits() const {
  if (impl_->type == KeyType::Secret) {
    return impl_->secret.size() * 8;
  }
  return static_cast<size_t>(EVP_PKEY_get_bits(impl_->pkey.get()));
}

std::string Key::curveName() const {
  if (impl_->type != KeyType::Ec) {
    return {};
  }
  char name[80];
  size_t len = 0;
  if (EVP_PKEY_get_group_name(impl_->pkey.get(), name, sizeof(name), &len) !=
      1) {
    ERR_clear_error();
    return {};
  }
  return std::string(name, len);
}

std::span<const uint8_t> Key::secret() const {
  if (impl_->type != KeyType::Secret) {
    throw InvalidKeyError(std::string("Expected a shared secret, got ") +
                          std::string(keyTypeName(impl_->type)) + " key");
  }
  return {impl_->secret.data(), impl_->secret.size()};
}

EVP_PKEY* Key::evpKey() const {
  if (impl_->type == KeyType::Secret) {
    throw InvalidKeyError("Expected an asymmetric key, got a shared secret");
  }
  return impl_->pkey.get();
}

std::vector<uint8_t> Key::publicKeyDer() const {
  EVP_PKEY* pkey = evpKey();

  int der_len = i2d_PUBKEY(pkey, nullptr);
  if (der_len <= 0) {
    throw CryptoError("Failed to get DER length for public key");
  }

  std::vector<uint8_t> der(static_cast<size_t>(der_len));
  uint8_t* der_ptr = der.data();
  if (i2d_PUBKEY(pkey, &der_ptr) != der_len) {
    throw CryptoError("Failed to encode public key to DER");
  }
  return der;
}

Key Key::publicKey() const {
  auto der = publicKeyDer();
  const uint8_t* data = der.data();
  EvpKeyPtr pkey(d2i_PUBKEY(nullptr, &data, static_cast<long>(der.size())));
  if (!pkey) {
    throw CryptoError("Failed to parse public key DER");
  }
  return fromEvpKey(std::move(pkey), false);
}

std::string_view keyTypeName(KeyType type) noexcept {
  switch (type) {
    case KeyType::Secret:
      return "secret";
    case KeyType::Rsa:
      return "RSA";
    case KeyType::Ec:
      return "EC";
  }
  return "unknown";
}

}  // namespace jwsign
