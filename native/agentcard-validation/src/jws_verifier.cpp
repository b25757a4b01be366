// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/validation/jws_verifier.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/openssl_utils.h"

#include <agentcard/common/base64url.h>
#include <agentcard/common/detached_jws.h>
#include <agentcard/common/jws_header.h>

#include "agentcard/validation/algorithm_policy.h"
#include "agentcard/validation/error_codes.h"

namespace agentcard::validation {

namespace {

ValidationResult Fail(std::string_view validator_name,
                      std::string message,
                      std::string_view error_code,
                      std::optional<std::string> property = std::nullopt) {
  ValidationFailure f;
  f.message = std::move(message);
  f.error_code = std::string(error_code);
  f.property_name = std::move(property);
  std::vector<ValidationFailure> failures;
  failures.push_back(std::move(f));
  return ValidationResult::Failure(std::string(validator_name), std::move(failures));
}

std::span<const std::uint8_t> AsBytes(std::string_view s) {
  return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace

ValidationResult VerifyCompactJws(std::string_view validator_name,
                                  std::string_view compact_jws,
                                  const JwsVerifyOptions& options) {
  const auto parts = agentcard::common::SplitCompactJws(compact_jws);
  if (!parts) {
    return Fail(validator_name, "Invalid JWS compact serialization (expected three segments)", error_codes::kMalformedSignature);
  }

  std::string header_error;
  const auto header = agentcard::common::DecodeProtectedHeader(parts->protected_header, &header_error);
  if (!header) {
    return Fail(validator_name, header_error, error_codes::kMalformedHeader, "protected");
  }

  if (auto crit = ValidateCriticalHeader(*header)) {
    std::vector<ValidationFailure> failures;
    failures.push_back(std::move(*crit));
    return ValidationResult::Failure(std::string(validator_name), std::move(failures));
  }

  if (header->alg.empty()) {
    return Fail(validator_name, "Missing JWS 'alg' header", error_codes::kMissingAlgorithm, "alg");
  }

  const auto alg = ParseJwsAlgorithm(header->alg);
  if (!alg) {
    return Fail(validator_name, "Unsupported algorithm: " + header->alg, error_codes::kUnsupportedAlgorithm, "alg");
  }

  if (options.expected_alg && *options.expected_alg != *alg) {
    return Fail(validator_name, "JWS 'alg' did not match expected value", error_codes::kAlgorithmMismatch, "alg");
  }

  const auto signature = agentcard::common::Base64UrlDecode(parts->signature);
  if (!signature || signature->empty()) {
    return Fail(validator_name, "Signature value is not valid base64url", error_codes::kMalformedSignature, "signature");
  }

  if (!options.public_key_bytes) {
    return Fail(validator_name, "No verification key provided (JwsVerifyOptions.public_key_bytes is required)", error_codes::kInvalidPublicKey);
  }

  auto key = internal::LoadPublicKeyFromDer(*options.public_key_bytes);
  if (!key) {
    return Fail(validator_name, "Failed to parse public key bytes", error_codes::kInvalidPublicKey);
  }

  if (const auto mismatch = internal::CheckKeyFitsAlgorithm(key.get(), *alg); !mismatch.empty()) {
    return Fail(validator_name, "Key cannot be used with " + header->alg + ": " + mismatch, error_codes::kInvalidPublicKey);
  }

  const std::string signing_input = parts->SigningInput();
  const auto input = AsBytes(signing_input);
  const EVP_MD* md = internal::DigestForAlgorithm(*alg);

  bool ok = false;
  switch (*alg) {
    case JwsAlgorithm::RS256:
    case JwsAlgorithm::RS384:
    case JwsAlgorithm::RS512:
      ok = internal::VerifyPkcs1(key.get(), md, input, *signature);
      break;
    case JwsAlgorithm::PS256:
    case JwsAlgorithm::PS384:
    case JwsAlgorithm::PS512:
      ok = internal::VerifyPss(key.get(), md, input, *signature);
      break;
    case JwsAlgorithm::ES256:
    case JwsAlgorithm::ES384:
    case JwsAlgorithm::ES512:
      if (signature->size() != 2 * internal::EcdsaComponentSize(*alg)) {
        return Fail(validator_name, "ECDSA signature has the wrong length for " + header->alg, error_codes::kSignatureInvalid, "signature");
      }
      ok = internal::VerifyEcdsa(key.get(), md, input, *signature);
      break;
    case JwsAlgorithm::EdDSA:
      ok = internal::VerifyEdDsa(key.get(), input, *signature);
      break;
  }

  if (!ok) {
    return Fail(validator_name, "Signature verification failed", error_codes::kSignatureInvalid);
  }

  std::unordered_map<std::string, std::string> metadata;
  metadata.emplace("alg", header->alg);
  return ValidationResult::Success(std::string(validator_name), std::move(metadata));
}

} // namespace agentcard::validation
