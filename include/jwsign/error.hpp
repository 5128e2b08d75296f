/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for JWS signing
 */

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jwsign {

/**
 * @brief Error codes for programmatic error handling
 */
enum class JwsErrorCode : uint32_t {
  SUCCESS = 0,
  INVALID_HEADER = 1000,
  INVALID_BASE64 = 1001,
  DECODE_FAILED = 1002,
  SIGNATURE_VERIFICATION_FAILED = 2000,
  ALGORITHM_NOT_IMPLEMENTED = 3000,
  ALGORITHM_NOT_ALLOWED = 3001,
  INVALID_ALGORITHM_PATTERN = 3002,
  CRYPTO_OPERATION_FAILED = 3003,
  INVALID_KEY = 3004
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(JwsErrorCode code) noexcept {
  switch (code) {
    case JwsErrorCode::SUCCESS:
      return "Success";
    case JwsErrorCode::INVALID_HEADER:
      return "Invalid JWS header";
    case JwsErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case JwsErrorCode::DECODE_FAILED:
      return "Failed to decode JWS";
    case JwsErrorCode::SIGNATURE_VERIFICATION_FAILED:
      return "Signature verification failed";
    case JwsErrorCode::ALGORITHM_NOT_IMPLEMENTED:
      return "Algorithm not implemented";
    case JwsErrorCode::ALGORITHM_NOT_ALLOWED:
      return "Algorithm not allowed";
    case JwsErrorCode::INVALID_ALGORITHM_PATTERN:
      return "Invalid algorithm pattern";
    case JwsErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case JwsErrorCode::INVALID_KEY:
      return "Invalid key";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all JWS errors
 */
class JwsError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit JwsError(JwsErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] JwsErrorCode errorCode() const noexcept { return error_code_; }

 private:
  JwsErrorCode error_code_;
};

/**
 * @brief Header is not an object, or its alg parameter is missing or not a
 * string
 */
class InvalidHeaderError : public JwsError {
 public:
  explicit InvalidHeaderError(std::string_view details)
      : JwsError(JwsErrorCode::INVALID_HEADER,
                 std::string("Invalid JWS header: ") + std::string(details)) {}
};

class InvalidBase64Error : public JwsError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : JwsError(
            JwsErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

class DecodeError : public JwsError {
 public:
  explicit DecodeError(std::string_view details)
      : JwsError(JwsErrorCode::DECODE_FAILED,
                 std::string("Failed to decode JWS: ") + std::string(details)) {}
};

/**
 * @brief Signature verification failed for any reason
 *
 * Wrong key, tampered message, malformed signature bytes or a failure
 * declared by a custom algorithm. Callers must treat the message as
 * untrusted.
 */
class SignatureError : public JwsError {
 public:
  explicit SignatureError(std::string_view reason)
      : JwsError(JwsErrorCode::SIGNATURE_VERIFICATION_FAILED,
                 std::string("Signature verification failed: ") +
                     std::string(reason)),
        reason_(reason) {}

  [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

 private:
  std::string reason_;
};

/**
 * @brief No registry binding matches the algorithm identifier
 */
class AlgorithmNotImplementedError : public JwsError {
 public:
  explicit AlgorithmNotImplementedError(std::string_view identifier)
      : JwsError(JwsErrorCode::ALGORITHM_NOT_IMPLEMENTED,
                 std::string("Algorithm not implemented: ") +
                     std::string(identifier)),
        identifier_(identifier) {}

  /**
   * @brief The exact identifier that failed to resolve
   */
  [[nodiscard]] const std::string& identifier() const noexcept {
    return identifier_;
  }

 private:
  std::string identifier_;
};

class AlgorithmNotAllowedError : public JwsError {
 public:
  explicit AlgorithmNotAllowedError(std::string_view identifier)
      : JwsError(JwsErrorCode::ALGORITHM_NOT_ALLOWED,
                 std::string("Algorithm not allowed: ") +
                     std::string(identifier)) {}
};

class InvalidAlgorithmPatternError : public JwsError {
 public:
  explicit InvalidAlgorithmPatternError(std::string_view details)
      : JwsError(JwsErrorCode::INVALID_ALGORITHM_PATTERN,
                 std::string("Invalid algorithm pattern: ") +
                     std::string(details)) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public JwsError {
 public:
  explicit CryptoError(std::string_view details)
      : JwsError(JwsErrorCode::CRYPTO_OPERATION_FAILED,
                 std::string("Cryptographic operation failed: ") +
                     std::string(details)) {}
};

/**
 * @brief Key cannot be parsed or does not fit the requested algorithm
 */
class InvalidKeyError : public JwsError {
 public:
  explicit InvalidKeyError(std::string_view details)
      : JwsError(JwsErrorCode::INVALID_KEY,
                 std::string("Invalid key: ") + std::string(details)) {}
};

/**
 * @brief Outcome of an operation that reports failure as a value
 *
 * Keeps the thrown exception so value() rethrows it with its original type,
 * e.g. SignatureError rather than the JwsError base.
 */
class VoidResult {
 public:
  static VoidResult success() { return VoidResult(); }

  /**
   * @param error The caught error
   * @param thrown The in-flight exception, from std::current_exception()
   */
  static VoidResult error(const JwsError& error, std::exception_ptr thrown) {
    VoidResult result;
    result.error_.emplace(error);
    result.thrown_ = std::move(thrown);
    return result;
  }

  bool isSuccess() const noexcept { return !error_.has_value(); }
  bool isError() const noexcept { return error_.has_value(); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Rethrows the held error
  void value() const {
    if (thrown_) {
      std::rethrow_exception(thrown_);
    }
    if (error_) {
      throw *error_;
    }
  }

  const JwsError& error() const {
    if (!error_) {
      throw std::logic_error("Accessing error on successful result");
    }
    return *error_;
  }

 private:
  VoidResult() = default;

  std::optional<JwsError> error_;
  std::exception_ptr thrown_;
};

inline VoidResult success() { return VoidResult::success(); }

}  // namespace jwsign
