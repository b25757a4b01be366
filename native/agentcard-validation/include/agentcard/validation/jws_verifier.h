// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file jws_verifier.h
 * @brief Signature verification of a JWS in compact serialization against one public key.
 */

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "agentcard/validation/jws_algorithm.h"
#include "agentcard/validation/validation_result.h"

namespace agentcard::validation {

struct JwsVerifyOptions {
  // DER-encoded SubjectPublicKeyInfo of the verification key.
  std::optional<std::vector<std::uint8_t>> public_key_bytes;

  // If provided, require the header 'alg' to match.
  std::optional<JwsAlgorithm> expected_alg;
};

/**
 * @brief Verifies `header.payload.signature`.
 *
 * The key type must fit the algorithm: RSA (at least 2048 bits) for RS* and PS*,
 * an EC key on the algorithm's curve for ES*, Ed25519 or Ed448 for EdDSA.
 * ECDSA signatures use the JOSE raw `r||s` encoding.
 *
 * On success the result metadata carries only `alg`.
 */
ValidationResult VerifyCompactJws(std::string_view validator_name,
                                  std::string_view compact_jws,
                                  const JwsVerifyOptions& options);

} // namespace agentcard::validation
