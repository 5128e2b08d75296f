/**
 * @file compact.hpp
 * @brief JWS compact serialization (header.payload.signature)
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "jws.hpp"

namespace jwsign {

/**
 * @brief Decoded parts of a compact token
 */
struct CompactJws {
  Header header;
  Payload payload;
  std::vector<uint8_t> signature;
  std::string signingInput;  ///< First two segments as transmitted
};

namespace compact {

/**
 * @brief Sign and produce base64url(header).base64url(payload).base64url(sig)
 */
std::string serialize(const Header& header, const Payload& payload,
                      const Key& key, const JwsEngine& engine = JwsEngine());

/**
 * @brief Split and decode a compact token without verifying it
 * @throws DecodeError if the token is not three non-empty segments or a
 * segment is not JSON
 * @throws InvalidBase64Error if a segment is not base64url
 */
CompactJws parse(std::string_view token);

/**
 * @brief Parse, then verify the transmitted signing input
 * @return The decoded token, only if the signature is valid
 * @throws SignatureError on verification failure
 */
CompactJws verify(std::string_view token, const Key& key,
                  const JwsEngine& engine = JwsEngine());

}  // namespace compact

}  // namespace jwsign
