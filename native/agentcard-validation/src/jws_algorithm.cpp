// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/validation/jws_algorithm.h"

namespace agentcard::validation {

std::optional<JwsAlgorithm> ParseJwsAlgorithm(std::string_view alg) {
  if (alg == "RS256") return JwsAlgorithm::RS256;
  if (alg == "RS384") return JwsAlgorithm::RS384;
  if (alg == "RS512") return JwsAlgorithm::RS512;
  if (alg == "PS256") return JwsAlgorithm::PS256;
  if (alg == "PS384") return JwsAlgorithm::PS384;
  if (alg == "PS512") return JwsAlgorithm::PS512;
  if (alg == "ES256") return JwsAlgorithm::ES256;
  if (alg == "ES384") return JwsAlgorithm::ES384;
  if (alg == "ES512") return JwsAlgorithm::ES512;
  if (alg == "EdDSA") return JwsAlgorithm::EdDSA;
  return std::nullopt;
}

std::string_view ToString(JwsAlgorithm alg) {
  switch (alg) {
    case JwsAlgorithm::RS256: return "RS256";
    case JwsAlgorithm::RS384: return "RS384";
    case JwsAlgorithm::RS512: return "RS512";
    case JwsAlgorithm::PS256: return "PS256";
    case JwsAlgorithm::PS384: return "PS384";
    case JwsAlgorithm::PS512: return "PS512";
    case JwsAlgorithm::ES256: return "ES256";
    case JwsAlgorithm::ES384: return "ES384";
    case JwsAlgorithm::ES512: return "ES512";
    case JwsAlgorithm::EdDSA: return "EdDSA";
  }
  return "unknown";
}

} // namespace agentcard::validation
