#include "agentcard/signatures/signature_verifier.h"

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <agentcard/common/detached_jws.h>
#include <agentcard/common/jws_header.h>
#include <agentcard/common/logging.h>
#include <agentcard/validation/algorithm_policy.h>
#include <agentcard/validation/error_codes.h>
#include <agentcard/validation/jws_verifier.h>

#include "agentcard/signatures/jwks.h"

namespace agentcard::signatures {

namespace {

namespace error_codes = agentcard::validation::error_codes;

constexpr std::string_view kValidatorName = "AgentCardSignature";

SignatureResult& Fail(SignatureResult& r, std::string message, std::string_view error_code) {
  r.valid = false;
  r.error = std::move(message);
  r.error_code = std::string(error_code);
  return r;
}

std::string DescribeMissingKey(const agentcard::common::JwsHeader& header) {
  std::string msg = "No key in the key set matches algorithm " + header.alg;
  if (header.kid) {
    msg += " and kid \"" + *header.kid + "\"";
  }
  return msg;
}

} // namespace

SignatureVerifier::SignatureVerifier(KeySetResolver& resolver)
    : resolver_(resolver), logger_(agentcard::common::Logging::Create("agentcard:signatures")) {}

SignatureResult SignatureVerifier::Verify(const agentcard::common::AgentCard& card,
                                          const agentcard::common::AgentCardSignature& signature,
                                          std::size_t index,
                                          const VerificationOptions& options) const {
  std::string payload;
  try {
    payload = card.CanonicalPayload();
  } catch (const std::exception& ex) {
    SignatureResult r;
    r.index = index;
    logger_->error("Failed to canonicalize Agent Card: {}", ex.what());
    return Fail(r, std::string("Internal error during signature verification: ") + ex.what(), error_codes::kInternalError);
  }
  return VerifyDetached(payload, signature, index, options);
}

SignatureResult SignatureVerifier::VerifyDetached(std::string_view canonical_payload,
                                                  const agentcard::common::AgentCardSignature& signature,
                                                  std::size_t index,
                                                  const VerificationOptions& options) const {
  SignatureResult r;
  try {
    r = RunStages(canonical_payload, signature, index, options);
  } catch (const std::exception& ex) {
    r = SignatureResult{};
    r.index = index;
    logger_->error("Signature {}: unexpected fault: {}", index + 1, ex.what());
    Fail(r, std::string("Internal error during signature verification: ") + ex.what(), error_codes::kInternalError);
  } catch (...) {
    r = SignatureResult{};
    r.index = index;
    logger_->error("Signature {}: unexpected non-standard fault", index + 1);
    Fail(r, "Unknown verification error", error_codes::kInternalError);
  }

  if (!r.valid) {
    logger_->warn("Signature {} failed verification: {}", index + 1, r.error.value_or("unknown"));
  }
  return r;
}

SignatureResult SignatureVerifier::RunStages(std::string_view canonical_payload,
                                             const agentcard::common::AgentCardSignature& signature,
                                             std::size_t index,
                                             const VerificationOptions& options) const {
  SignatureResult r;
  r.index = index;

  // Decoding.
  std::string header_error;
  const auto header = agentcard::common::DecodeProtectedHeader(signature.protected_header, &header_error);
  if (!header) {
    return Fail(r, header_error, error_codes::kMalformedHeader);
  }
  if (!header->alg.empty()) {
    r.algorithm = header->alg;
  }
  r.key_id = header->kid;

  // PolicyCheck.
  if (const auto violation = agentcard::validation::ValidateAlgorithmPolicy(*header, options.allow_insecure)) {
    return Fail(r, violation->message, violation->error_code.value_or(std::string(error_codes::kInternalError)));
  }

  // ResolvingKey.
  const auto key_uri = header->KeyUri();
  if (!key_uri) {
    return Fail(r, "No JWKS URI found in signature header (jku or jwks_uri required)", error_codes::kMissingKeyUri);
  }
  r.jwks_uri = key_uri;

  const auto resolution = resolver_.Resolve(*key_uri, options.timeout_ms);
  if (resolution.failure) {
    return Fail(r, resolution.failure->message, resolution.failure->error_code.value_or(std::string(error_codes::kKeyFetchError)));
  }

  // Verifying.
  const auto alg = agentcard::validation::ParseJwsAlgorithm(header->alg);
  if (!alg) {
    return Fail(r, "Unsupported algorithm: " + header->alg, error_codes::kUnsupportedAlgorithm);
  }

  const auto candidates = SelectCandidateKeys(*resolution.key_set, *alg, header->kid);
  if (candidates.empty()) {
    return Fail(r, DescribeMissingKey(*header), error_codes::kKeyNotFound);
  }

  const std::string compact =
      agentcard::common::AssembleDetachedJws(signature.protected_header, canonical_payload, signature.signature);

  std::optional<agentcard::validation::ValidationFailure> last_failure;
  for (const Jwk* key : candidates) {
    auto der = JwkToPublicKeyDer(*key);
    if (!der) {
      logger_->debug("Skipping unusable {} key {} from {}", key->kty, key->kid.value_or("(no kid)"), *key_uri);
      continue;
    }

    agentcard::validation::JwsVerifyOptions verify_options;
    verify_options.public_key_bytes = std::move(*der);
    verify_options.expected_alg = *alg;

    const auto result = agentcard::validation::VerifyCompactJws(kValidatorName, compact, verify_options);
    if (result.is_valid) {
      r.valid = true;
      r.details = "Signature verified successfully";
      return r;
    }

    if (const auto* f = result.FirstFailure()) {
      last_failure = *f;
    }
  }

  if (!last_failure) {
    return Fail(r, DescribeMissingKey(*header) + " with usable key material", error_codes::kKeyNotFound);
  }

  return Fail(r,
              "Signature verification failed: " + last_failure->message,
              last_failure->error_code.value_or(std::string(error_codes::kSignatureInvalid)));
}

} // namespace agentcard::signatures
