// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/validation/algorithm_policy.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

#include "agentcard/validation/error_codes.h"
#include "agentcard/validation/jws_algorithm.h"

namespace agentcard::validation {

namespace {

ValidationFailure Fail(std::string message,
                       std::string_view error_code,
                       std::string property,
                       std::optional<std::string> attempted_value = std::nullopt) {
  ValidationFailure f;
  f.message = std::move(message);
  f.error_code = std::string(error_code);
  f.property_name = std::move(property);
  f.attempted_value = std::move(attempted_value);
  return f;
}

bool IsSchemeChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

} // namespace

std::optional<KeyUri> ParseKeyUri(std::string_view uri) {
  for (char c : uri) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc <= 0x20 || uc == 0x7F) {
      return std::nullopt;
    }
  }

  const auto colon = uri.find(':');
  if (colon == std::string_view::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(uri[0]))) {
    return std::nullopt;
  }

  KeyUri out;
  for (std::size_t i = 0; i < colon; ++i) {
    if (!IsSchemeChar(uri[i])) {
      return std::nullopt;
    }
    out.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(uri[i]))));
  }

  std::string_view rest = uri.substr(colon + 1);
  if (rest.substr(0, 2) != "//") {
    // Non-hierarchical URI (e.g. "urn:..."): well formed, but has no host.
    return out;
  }
  rest.remove_prefix(2);

  std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    out.host = std::string(authority.substr(0, close + 1));
  } else {
    out.host = std::string(authority.substr(0, authority.find(':')));
  }

  return out;
}

std::optional<ValidationFailure> ValidateCriticalHeader(const agentcard::common::JwsHeader& header) {
  if (!header.crit) {
    return std::nullopt;
  }

  const auto& crit = *header.crit;
  bool well_formed = crit.is_array() && !crit.empty();
  for (std::size_t i = 0; well_formed && i < crit.size(); ++i) {
    well_formed = crit[i].is_string();
  }
  if (!well_formed) {
    return Fail("Invalid protected header format: 'crit' must be a non-empty array of strings",
                error_codes::kMalformedHeader, "crit", crit.dump());
  }

  const auto name = crit.front().get<std::string>();
  return Fail("Unsupported critical header parameter: " + name, error_codes::kUnsupportedCriticalHeader, "crit", name);
}

std::optional<ValidationFailure> ValidateAlgorithmPolicy(const agentcard::common::JwsHeader& header, bool allow_insecure) {
  if (header.alg.empty()) {
    return Fail("Missing algorithm (alg) in signature header", error_codes::kMissingAlgorithm, "alg");
  }

  if (header.alg == "none") {
    return Fail("Algorithm \"none\" is not allowed for security reasons", error_codes::kDisallowedAlgorithm, "alg", header.alg);
  }

  if (!ParseJwsAlgorithm(header.alg)) {
    return Fail("Unsupported algorithm: " + header.alg, error_codes::kUnsupportedAlgorithm, "alg", header.alg);
  }

  if (auto crit = ValidateCriticalHeader(header)) {
    return crit;
  }

  const auto key_uri = header.KeyUri();
  if (!key_uri || allow_insecure) {
    return std::nullopt;
  }

  const char* property = (header.jku && !header.jku->empty()) ? "jku" : "jwks_uri";
  const auto parsed = ParseKeyUri(*key_uri);
  if (!parsed) {
    return Fail("Invalid JWKS URI format", error_codes::kInvalidKeyUri, property, *key_uri);
  }

  if (parsed->scheme != "https") {
    return Fail("JWKS URI must use HTTPS for security", error_codes::kInsecureKeyUri, property, *key_uri);
  }

  if (parsed->host.empty()) {
    return Fail("Invalid JWKS URI format", error_codes::kInvalidKeyUri, property, *key_uri);
  }

  return std::nullopt;
}

} // namespace agentcard::validation
