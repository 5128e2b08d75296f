#include "jwsign/compact.hpp"

#include <array>

#include "jwsign/codec.hpp"
#include "jwsign/logging.hpp"

namespace jwsign {
namespace compact {

namespace {

std::array<std::string_view, 3> splitSegments(std::string_view token) {
  std::array<std::string_view, 3> segments;
  size_t start = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    size_t dot = token.find('.', start);
    bool last = i + 1 == segments.size();
    if (last != (dot == std::string_view::npos)) {
      throw DecodeError("Compact JWS must have exactly three segments");
    }
    size_t end = last ? token.size() : dot;
    segments[i] = token.substr(start, end - start);
    if (segments[i].empty()) {
      throw DecodeError("Compact JWS segment " + std::to_string(i) +
                        " is empty");
    }
    start = end + 1;
  }
  return segments;
}

}  // namespace

std::string serialize(const Header& header, const Payload& payload,
                      const Key& key, const JwsEngine& engine) {
  auto signature = engine.sign(header, payload, key);
  auto input = createSigningInput(header, payload);

  std::string token(input.begin(), input.end());
  token += '.';
  token += base64UrlEncode(signature);
  return token;
}

CompactJws parse(std::string_view token) {
  auto segments = splitSegments(token);

  CompactJws jws;
  jws.header = codec::decodeSegment(segments[0]);
  jws.payload = codec::decodeSegment(segments[1]);
  jws.signature = base64UrlDecode(segments[2]);
  jws.signingInput =
      std::string(token.substr(0, segments[0].size() + 1 + segments[1].size()));
  return jws;
}

CompactJws verify(std::string_view token, const Key& key,
                  const JwsEngine& engine) {
  auto jws = parse(token);
  auto algorithm = algorithmOf(jws.header);
  JWSIGN_LOG_DEBUG("Verifying compact JWS with '{}'", algorithm);

  std::span<const uint8_t> input(
      reinterpret_cast<const uint8_t*>(jws.signingInput.data()),
      jws.signingInput.size());
  engine.verifyInput(algorithm, input, jws.signature, key);
  return jws;
}

}  // namespace compact
}  // namespace jwsign
