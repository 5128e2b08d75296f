/**
 * @file jws.hpp
 * @brief JWS signing and verification entry points
 *
 * The engine reads the algorithm identifier from the header, resolves it
 * through an AlgorithmRegistry, builds the canonical signing input and
 * dispatches to the resolved implementation:
 * @code
 *   jwsign::Header header = {{"alg", "HS256"}};
 *   jwsign::Payload payload = {{"claim", "x"}};
 *   auto key = jwsign::Key::fromSecret("secret");
 *   auto signature = jwsign::sign(header, payload, key);
 *   jwsign::verify(header, payload, signature, key);  // throws on failure
 * @endcode
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "algorithms.hpp"
#include "error.hpp"
#include "key.hpp"
#include "registry.hpp"

namespace jwsign {

using Header = nlohmann::json;
using Payload = nlohmann::json;

/**
 * @brief Registered JOSE header parameter names
 */
namespace header_params {
constexpr std::string_view ALG = "alg";  ///< Algorithm identifier (required)
constexpr std::string_view TYP = "typ";  ///< Media type
constexpr std::string_view JKU = "jku";  ///< JWK set URL
constexpr std::string_view KID = "kid";  ///< Key ID
constexpr std::string_view X5U = "x5u";  ///< X.509 URL
constexpr std::string_view X5T = "x5t";  ///< X.509 certificate thumbprint
}  // namespace header_params

/**
 * @brief Read the alg parameter
 * @throws InvalidHeaderError if the header is not an object or alg is
 * missing or not a string
 */
std::string algorithmOf(const Header& header);

/**
 * @brief base64url(canonical(header)) "." base64url(canonical(payload))
 *
 * Codec exceptions propagate unchanged.
 */
std::vector<uint8_t> createSigningInput(const Header& header,
                                        const Payload& payload);

/**
 * @brief Resolves, builds and dispatches sign/verify calls
 *
 * The engine does not own its registry; the registry must outlive it.
 * Engines are cheap to construct and safe to share once configured.
 */
class JwsEngine {
 public:
  /**
   * @brief Engine over the process-wide registry
   */
  JwsEngine();
  explicit JwsEngine(const AlgorithmRegistry& registry);

  /**
   * @brief Only accept the listed alg values; an empty list accepts any
   */
  JwsEngine& withAllowedAlgorithms(const std::vector<std::string>& algorithms);

  /**
   * @brief Reject shared secrets shorter than the given number of bytes
   */
  JwsEngine& withMinimumSecretLength(size_t bytes);

  /**
   * @brief Sign a header and payload
   * @return Raw signature bytes
   * @throws InvalidHeaderError, AlgorithmNotAllowedError,
   * AlgorithmNotImplementedError, InvalidKeyError, CryptoError
   */
  std::vector<uint8_t> sign(const Header& header, const Payload& payload,
                            const Key& key) const;

  /**
   * @brief Verify a signature; returns only if it is valid
   * @throws SignatureError on verification failure
   * @throws InvalidHeaderError, AlgorithmNotAllowedError,
   * AlgorithmNotImplementedError before any verification is attempted
   */
  void verify(const Header& header, const Payload& payload,
              std::span<const uint8_t> signature, const Key& key) const;

  /**
   * @brief verify() reporting JwsError failures as a value
   *
   * The held error keeps its code and message; codec exceptions still
   * propagate.
   */
  [[nodiscard]] VoidResult tryVerify(const Header& header,
                                     const Payload& payload,
                                     std::span<const uint8_t> signature,
                                     const Key& key) const;

  /**
   * @brief Sign an already-built signing input
   */
  std::vector<uint8_t> signInput(std::string_view algorithm,
                                 std::span<const uint8_t> input,
                                 const Key& key) const;

  /**
   * @brief Verify an already-built signing input
   */
  void verifyInput(std::string_view algorithm, std::span<const uint8_t> input,
                   std::span<const uint8_t> signature, const Key& key) const;

 private:
  std::unique_ptr<SigningAlgorithm> resolve(std::string_view algorithm) const;
  std::vector<uint8_t> signWith(const SigningAlgorithm& impl,
                                std::span<const uint8_t> input,
                                const Key& key) const;
  void verifyWith(const SigningAlgorithm& impl, std::string_view algorithm,
                  std::span<const uint8_t> input,
                  std::span<const uint8_t> signature, const Key& key) const;

  const AlgorithmRegistry* registry_;
  std::unordered_set<std::string> allowed_;
  size_t min_secret_length_ = 0;
};

/**
 * @brief Sign with the global registry
 */
std::vector<uint8_t> sign(const Header& header, const Payload& payload,
                          const Key& key);

/**
 * @brief Verify with the global registry
 * @throws SignatureError on verification failure
 */
void verify(const Header& header, const Payload& payload,
            std::span<const uint8_t> signature, const Key& key);

/**
 * @brief Add a custom binding to the global registry
 */
void registerAlgorithm(AlgorithmPattern pattern, AlgorithmFactory factory);

}  // namespace jwsign
