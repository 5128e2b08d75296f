#include "jwsign/codec.hpp"

#include <array>

namespace jwsign {

static constexpr std::string_view base64_chars_url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  std::string result;
  result.reserve((data.size() * 4 + 2) / 3);

  int val = 0, valb = -6;
  for (uint8_t c : data) {
    val = ((val << 8) + c) & 0xFFFF;
    valb += 8;
    while (valb >= 0) {
      result.push_back(base64_chars_url[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(base64_chars_url[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  return result;
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  static const std::array<int8_t, 256> decode_table = []() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < base64_chars_url.size(); ++i) {
      table[static_cast<unsigned char>(base64_chars_url[i])] =
          static_cast<int8_t>(i);
    }
    return table;
  }();

  // Compact segments are unpadded and canonical
  if (encoded.find('=') != std::string_view::npos) {
    throw InvalidBase64Error("Padding is not allowed in base64url segments");
  }
  if (encoded.size() % 4 == 1) {
    throw InvalidBase64Error("Truncated base64 string");
  }

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  int val = 0, valb = -8;
  for (char c : encoded) {
    int8_t decoded = decode_table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }

    val = ((val << 6) + decoded) & 0xFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }

  // Bits left over from the last character must be zero
  int leftover = valb + 8;
  if (leftover > 0 && (val & ((1 << leftover) - 1)) != 0) {
    throw InvalidBase64Error("Non-zero trailing bits in base64 string");
  }
  return result;
}

namespace codec {

std::string canonicalize(const nlohmann::json& value) {
  // nlohmann::json objects are std::map backed, so keys come out sorted
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

std::string encodeSegment(const nlohmann::json& value) {
  return base64UrlEncode(canonicalize(value));
}

nlohmann::json decodeSegment(std::string_view segment) {
  auto bytes = base64UrlDecode(segment);
  auto parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr,
                                      /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    throw DecodeError("Segment is not valid JSON");
  }
  return parsed;
}

}  // namespace codec

}  // namespace jwsign
