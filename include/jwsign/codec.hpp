/**
 * @file codec.hpp
 * @brief Base64url transport encoding and canonical JSON serialization
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace jwsign {

/**
 * @brief Concept for contiguous byte containers
 */
template <typename T>
concept ByteData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<std::remove_cv_t<typename T::value_type>, uint8_t>;
};

/**
 * @brief Implementation for base64url encoding from span
 * @param data Input byte span
 * @return Unpadded base64url string
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Encode data as unpadded base64url
 */
template <ByteData T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Encode the bytes of a string as unpadded base64url
 */
inline std::string base64UrlEncode(std::string_view text) {
  return base64UrlEncodeImpl(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

/**
 * @brief Decode base64url string
 * @param data Unpadded base64url string
 * @return Decoded bytes
 * @throws InvalidBase64Error on invalid characters, '=' padding, a dangling
 * sextet, or non-zero trailing bits
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

namespace codec {

/**
 * @brief Deterministic JSON serialization
 *
 * Compact separators, object keys in lexicographic order, UTF-8 output.
 * Identical values always produce identical bytes.
 * @throws nlohmann::json::type_error for strings that are not valid UTF-8
 */
std::string canonicalize(const nlohmann::json& value);

/**
 * @brief base64url(canonicalize(value))
 */
std::string encodeSegment(const nlohmann::json& value);

/**
 * @brief Inverse of encodeSegment
 * @throws InvalidBase64Error for bad base64url
 * @throws DecodeError if the decoded bytes are not JSON
 */
nlohmann::json decodeSegment(std::string_view segment);

}  // namespace codec

}  // namespace jwsign
