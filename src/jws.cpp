#include "jwsign/jws.hpp"

#include <exception>

#include "jwsign/codec.hpp"
#include "jwsign/logging.hpp"

namespace jwsign {

std::string algorithmOf(const Header& header) {
  if (!header.is_object()) {
    throw InvalidHeaderError("header must be a JSON object");
  }
  auto it = header.find(std::string(header_params::ALG));
  if (it == header.end()) {
    throw InvalidHeaderError("missing 'alg' parameter");
  }
  if (!it->is_string()) {
    throw InvalidHeaderError("'alg' must be a string");
  }
  return it->get<std::string>();
}

std::vector<uint8_t> createSigningInput(const Header& header,
                                        const Payload& payload) {
  std::string input = codec::encodeSegment(header);
  input += '.';
  input += codec::encodeSegment(payload);
  return std::vector<uint8_t>(input.begin(), input.end());
}

JwsEngine::JwsEngine() : registry_(&AlgorithmRegistry::global()) {}

JwsEngine::JwsEngine(const AlgorithmRegistry& registry)
    : registry_(&registry) {}

JwsEngine& JwsEngine::withAllowedAlgorithms(
    const std::vector<std::string>& algorithms) {
  allowed_ = std::unordered_set<std::string>(algorithms.begin(),
                                             algorithms.end());
  return *this;
}

JwsEngine& JwsEngine::withMinimumSecretLength(size_t bytes) {
  min_secret_length_ = bytes;
  return *this;
}

std::unique_ptr<SigningAlgorithm> JwsEngine::resolve(
    std::string_view algorithm) const {
  if (!allowed_.empty() && !allowed_.contains(std::string(algorithm))) {
    JWSIGN_LOG_WARN("Rejected algorithm '{}' outside the allowlist",
                    algorithm);
    throw AlgorithmNotAllowedError(algorithm);
  }
  return registry_->resolve(algorithm);
}

std::vector<uint8_t> JwsEngine::sign(const Header& header,
                                     const Payload& payload,
                                     const Key& key) const {
  auto impl = resolve(algorithmOf(header));
  auto input = createSigningInput(header, payload);
  return signWith(*impl, input, key);
}

void JwsEngine::verify(const Header& header, const Payload& payload,
                       std::span<const uint8_t> signature,
                       const Key& key) const {
  auto algorithm = algorithmOf(header);
  auto impl = resolve(algorithm);
  auto input = createSigningInput(header, payload);
  verifyWith(*impl, algorithm, input, signature, key);
}

VoidResult JwsEngine::tryVerify(const Header& header, const Payload& payload,
                                std::span<const uint8_t> signature,
                                const Key& key) const {
  try {
    verify(header, payload, signature, key);
  } catch (const JwsError& e) {
    return VoidResult::error(e, std::current_exception());
  }
  return success();
}

std::vector<uint8_t> JwsEngine::signInput(std::string_view algorithm,
                                          std::span<const uint8_t> input,
                                          const Key& key) const {
  auto impl = resolve(algorithm);
  return signWith(*impl, input, key);
}

void JwsEngine::verifyInput(std::string_view algorithm,
                            std::span<const uint8_t> input,
                            std::span<const uint8_t> signature,
                            const Key& key) const {
  auto impl = resolve(algorithm);
  verifyWith(*impl, algorithm, input, signature, key);
}

std::vector<uint8_t> JwsEngine::signWith(const SigningAlgorithm& impl,
                                         std::span<const uint8_t> input,
                                         const Key& key) const {
  if (key.type() == KeyType::Secret &&
      key.secret().size() < min_secret_length_) {
    throw InvalidKeyError("Shared secret shorter than " +
                          std::to_string(min_secret_length_) + " bytes");
  }
  return impl.sign(input, key);
}

void JwsEngine::verifyWith(const SigningAlgorithm& impl,
                           std::string_view algorithm,
                           std::span<const uint8_t> input,
                           std::span<const uint8_t> signature,
                           const Key& key) const {
  if (key.type() == KeyType::Secret &&
      key.secret().size() < min_secret_length_) {
    JWSIGN_LOG_WARN("Verification with '{}' rejected a short secret",
                    algorithm);
    throw SignatureError("shared secret below minimum length");
  }

  try {
    impl.verify(input, signature, key);
  } catch (const SignatureError& e) {
    JWSIGN_LOG_WARN("Verification with '{}' failed: {}", algorithm,
                    e.reason());
    throw;
  } catch (const InvalidKeyError& e) {
    JWSIGN_LOG_WARN("Verification with '{}' failed: {}", algorithm, e.what());
    throw SignatureError(e.what());
  } catch (const CryptoError& e) {
    JWSIGN_LOG_WARN("Verification with '{}' failed: {}", algorithm, e.what());
    throw SignatureError(e.what());
  }
}

std::vector<uint8_t> sign(const Header& header, const Payload& payload,
                          const Key& key) {
  return JwsEngine().sign(header, payload, key);
}

void verify(const Header& header, const Payload& payload,
            std::span<const uint8_t> signature, const Key& key) {
  JwsEngine().verify(header, payload, signature, key);
}

void registerAlgorithm(AlgorithmPattern pattern, AlgorithmFactory factory) {
  AlgorithmRegistry::global().registerAlgorithm(std::move(pattern),
                                                std::move(factory));
}

}  // namespace jwsign
