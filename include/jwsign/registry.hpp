/**
 * @file registry.hpp
 * @brief Algorithm identifier resolution: built-in table plus caller
 * registered bindings
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "algorithms.hpp"

namespace jwsign {

/**
 * @brief Named capture groups extracted from an algorithm identifier
 */
using AlgorithmParams = std::map<std::string, std::string>;

/**
 * @brief Builds an algorithm instance from the matched identifier's groups
 */
using AlgorithmFactory =
    std::function<std::unique_ptr<SigningAlgorithm>(const AlgorithmParams&)>;

enum class AlgorithmPatternType {
  Exact,  ///< Exact identifier match
  Regex   ///< Whole-identifier regular expression with named groups
};

/**
 * @brief Matcher over algorithm identifier strings
 *
 * Regex patterns use ECMAScript syntax extended with named groups, written
 * either `(?P<name>...)` or `(?<name>...)`. The expression must match the
 * whole identifier, so `HS256` never matches `HS2560`.
 */
class AlgorithmPattern {
 public:
  static AlgorithmPattern exact(std::string identifier);

  /**
   * @throws InvalidAlgorithmPatternError for malformed expressions or
   * group names
   */
  static AlgorithmPattern regex(std::string_view pattern);

  /**
   * @brief Match an identifier
   * @return Named groups on match (empty map for exact patterns), nullopt
   * otherwise
   */
  [[nodiscard]] std::optional<AlgorithmParams> match(
      std::string_view identifier) const;

  AlgorithmPatternType type() const noexcept { return type_; }
  const std::string& source() const noexcept { return source_; }

 private:
  AlgorithmPattern(AlgorithmPatternType type, std::string source)
      : type_(type), source_(std::move(source)) {}

  AlgorithmPatternType type_;
  std::string source_;
  std::regex regex_;
  std::vector<std::string> groupNames_;  ///< Index i names capture group i+1
};

/**
 * @brief Immutable association of a pattern and a factory
 */
struct AlgorithmBinding {
  AlgorithmPattern pattern;
  AlgorithmFactory factory;
};

/**
 * @brief Maps algorithm identifiers to implementations
 *
 * Built-in identifiers (HS256/384/512, RS256/384/512, ES256/384/512) are a
 * fixed table and always take precedence. Custom bindings are searched
 * afterwards in registration order; the first match wins.
 *
 * Registration is expected to finish before concurrent signing starts, but
 * the binding list is guarded by a reader-writer lock so late registration
 * is still safe.
 */
class AlgorithmRegistry {
 public:
  AlgorithmRegistry() = default;

  AlgorithmRegistry(const AlgorithmRegistry&) = delete;
  AlgorithmRegistry& operator=(const AlgorithmRegistry&) = delete;

  /**
   * @brief Process-wide registry used by the free sign/verify functions
   */
  static AlgorithmRegistry& global();

  /**
   * @brief Append a custom binding after all existing ones
   * @throws std::invalid_argument if the factory is empty
   */
  void registerAlgorithm(AlgorithmPattern pattern, AlgorithmFactory factory);

  /**
   * @brief Resolve an identifier to a fresh algorithm instance
   * @throws AlgorithmNotImplementedError if no binding matches
   */
  [[nodiscard]] std::unique_ptr<SigningAlgorithm> resolve(
      std::string_view identifier) const;

  /**
   * @brief Whether an identifier is served by the built-in table
   */
  static bool isBuiltin(std::string_view identifier) noexcept;

  static std::vector<std::string> builtinIdentifiers();

  size_t customBindingCount() const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<AlgorithmBinding> custom_;
};

}  // namespace jwsign
