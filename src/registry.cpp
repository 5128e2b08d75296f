#include "jwsign/registry.hpp"

#include <array>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <variant>

#include "jwsign/error.hpp"
#include "jwsign/logging.hpp"

namespace jwsign {

namespace {

struct HmacSpec {
  HashAlgorithm hash;
};
struct RsaSpec {
  HashAlgorithm hash;
};
struct EcdsaSpec {
  EcdsaCurve curve;
};

using BuiltinSpec = std::variant<HmacSpec, RsaSpec, EcdsaSpec>;

struct BuiltinBinding {
  std::string_view identifier;
  BuiltinSpec spec;
};

constexpr std::array<BuiltinBinding, 9> BUILTIN_ALGORITHMS = {{
    {"HS256", HmacSpec{HashAlgorithm::SHA256}},
    {"HS384", HmacSpec{HashAlgorithm::SHA384}},
    {"HS512", HmacSpec{HashAlgorithm::SHA512}},
    {"RS256", RsaSpec{HashAlgorithm::SHA256}},
    {"RS384", RsaSpec{HashAlgorithm::SHA384}},
    {"RS512", RsaSpec{HashAlgorithm::SHA512}},
    {"ES256", EcdsaSpec{EcdsaCurve::P256}},
    {"ES384", EcdsaSpec{EcdsaCurve::P384}},
    {"ES512", EcdsaSpec{EcdsaCurve::P521}},
}};

const BuiltinBinding* findBuiltin(std::string_view identifier) noexcept {
  for (const auto& binding : BUILTIN_ALGORITHMS) {
    if (binding.identifier == identifier) {
      return &binding;
    }
  }
  return nullptr;
}

struct BuiltinFactory {
  std::unique_ptr<SigningAlgorithm> operator()(const HmacSpec& s) const {
    return std::make_unique<HmacAlgorithm>(s.hash);
  }
  std::unique_ptr<SigningAlgorithm> operator()(const RsaSpec& s) const {
    return std::make_unique<RsaAlgorithm>(s.hash);
  }
  std::unique_ptr<SigningAlgorithm> operator()(const EcdsaSpec& s) const {
    return std::make_unique<EcdsaAlgorithm>(s.curve);
  }
};

bool isNameStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Rewrites (?P<name>...) and (?<name>...) into plain capture groups for
// std::regex. names[i] receives the name of capture group i+1, or an empty
// string for unnamed groups.
std::string translateNamedGroups(std::string_view pattern,
                                 std::vector<std::string>& names) {
  std::string out;
  out.reserve(pattern.size());

  size_t i = 0;
  while (i < pattern.size()) {
    char c = pattern[i];

    if (c == '\\') {
      out += c;
      if (i + 1 < pattern.size()) {
        out += pattern[i + 1];
      }
      i += 2;
      continue;
    }

    if (c == '[') {
      // Copy the bracket expression verbatim; parentheses inside are literal
      size_t j = i + 1;
      if (j < pattern.size() && pattern[j] == '^') ++j;
      if (j < pattern.size() && pattern[j] == ']') ++j;
      while (j < pattern.size() && pattern[j] != ']') {
        if (pattern[j] == '\\') ++j;
        ++j;
      }
      if (j >= pattern.size()) {
        throw InvalidAlgorithmPatternError("Unterminated character class in '" +
                                           std::string(pattern) + "'");
      }
      out.append(pattern.substr(i, j - i + 1));
      i = j + 1;
      continue;
    }

    if (c == '(' && i + 1 < pattern.size() && pattern[i + 1] == '?') {
      size_t name_start = 0;
      if (pattern.substr(i, 4) == "(?P<") {
        name_start = i + 4;
      } else if (pattern.substr(i, 3) == "(?<" && i + 3 < pattern.size() &&
                 isNameStart(pattern[i + 3])) {
        name_start = i + 3;
      }

      if (name_start == 0) {
        // Non-capturing group or lookahead
        out += c;
        ++i;
        continue;
      }

      size_t name_end = pattern.find('>', name_start);
      if (name_end == std::string_view::npos) {
        throw InvalidAlgorithmPatternError("Unterminated group name in '" +
                                           std::string(pattern) + "'");
      }
      std::string name(pattern.substr(name_start, name_end - name_start));
      if (name.empty() || !isNameStart(name.front())) {
        throw InvalidAlgorithmPatternError("Invalid group name '" + name + "'");
      }
      for (char ch : name) {
        if (!isNameChar(ch)) {
          throw InvalidAlgorithmPatternError("Invalid group name '" + name +
                                             "'");
        }
      }
      for (const auto& existing : names) {
        if (existing == name) {
          throw InvalidAlgorithmPatternError("Duplicate group name '" + name +
                                             "'");
        }
      }

      names.push_back(std::move(name));
      out += '(';
      i = name_end + 1;
      continue;
    }

    if (c == '(') {
      names.emplace_back();
    }
    out += c;
    ++i;
  }

  return out;
}

}  // namespace

AlgorithmPattern AlgorithmPattern::exact(std::string identifier) {
  return AlgorithmPattern(AlgorithmPatternType::Exact, std::move(identifier));
}

AlgorithmPattern AlgorithmPattern::regex(std::string_view pattern) {
  AlgorithmPattern result(AlgorithmPatternType::Regex, std::string(pattern));

  std::string translated = translateNamedGroups(pattern, result.groupNames_);
  try {
    result.regex_ = std::regex(translated, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw InvalidAlgorithmPatternError("'" + std::string(pattern) +
                                       "': " + e.what());
  }

  if (result.regex_.mark_count() != result.groupNames_.size()) {
    throw InvalidAlgorithmPatternError("Unsupported group syntax in '" +
                                       std::string(pattern) + "'");
  }
  return result;
}

std::optional<AlgorithmParams> AlgorithmPattern::match(
    std::string_view identifier) const {
  if (type_ == AlgorithmPatternType::Exact) {
    if (identifier == source_) {
      return AlgorithmParams{};
    }
    return std::nullopt;
  }

  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_match(identifier.begin(), identifier.end(), m, regex_)) {
    return std::nullopt;
  }

  AlgorithmParams params;
  for (size_t i = 0; i < groupNames_.size(); ++i) {
    if (groupNames_[i].empty()) continue;
    // Groups that did not participate in the match bind to an empty string
    params[groupNames_[i]] = m[i + 1].matched ? m[i + 1].str() : std::string();
  }
  return params;
}

AlgorithmRegistry& AlgorithmRegistry::global() {
  static AlgorithmRegistry instance;
  return instance;
}

void AlgorithmRegistry::registerAlgorithm(AlgorithmPattern pattern,
                                          AlgorithmFactory factory) {
  if (!factory) {
    throw std::invalid_argument("Algorithm factory must not be empty");
  }
  for (const auto& builtin : BUILTIN_ALGORITHMS) {
    if (pattern.match(builtin.identifier)) {
      JWSIGN_LOG_WARN("Pattern '{}' is shadowed by built-in algorithm '{}'",
                      pattern.source(), builtin.identifier);
    }
  }

  std::unique_lock lock(mutex_);
  custom_.push_back({std::move(pattern), std::move(factory)});
  JWSIGN_LOG_DEBUG("Registered algorithm pattern '{}' ({} custom bindings)",
                   custom_.back().pattern.source(), custom_.size());
}

std::unique_ptr<SigningAlgorithm> AlgorithmRegistry::resolve(
    std::string_view identifier) const {
  if (const auto* builtin = findBuiltin(identifier)) {
    return std::visit(BuiltinFactory{}, builtin->spec);
  }

  // Factories run outside the lock so they may register or resolve
  AlgorithmFactory factory;
  AlgorithmParams params;
  std::string source;
  {
    std::shared_lock lock(mutex_);
    for (const auto& binding : custom_) {
      auto matched = binding.pattern.match(identifier);
      if (!matched) continue;
      factory = binding.factory;
      params = std::move(*matched);
      source = binding.pattern.source();
      break;
    }
  }

  if (factory) {
    JWSIGN_LOG_DEBUG("Algorithm '{}' resolved by pattern '{}'", identifier,
                     source);
    auto algorithm = factory(params);
    if (!algorithm) {
      JWSIGN_LOG_WARN("Factory for pattern '{}' returned no algorithm",
                      source);
      throw AlgorithmNotImplementedError(identifier);
    }
    return algorithm;
  }

  JWSIGN_LOG_WARN("No algorithm registered for '{}'", identifier);
  throw AlgorithmNotImplementedError(identifier);
}

bool AlgorithmRegistry::isBuiltin(std::string_view identifier) noexcept {
  return findBuiltin(identifier) != nullptr;
}

std::vector<std::string> AlgorithmRegistry::builtinIdentifiers() {
  std::vector<std::string> identifiers;
  identifiers.reserve(BUILTIN_ALGORITHMS.size());
  for (const auto& binding : BUILTIN_ALGORITHMS) {
    identifiers.emplace_back(binding.identifier);
  }
  return identifiers;
}

size_t AlgorithmRegistry::customBindingCount() const {
  std::shared_lock lock(mutex_);
  return custom_.size();
}

}  // namespace jwsign
