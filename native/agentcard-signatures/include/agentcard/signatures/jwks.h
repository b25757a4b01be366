// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <agentcard/validation/jws_algorithm.h>

#include "agentcard/signatures/jwk.h"
#include "agentcard/signatures/jwks_document.h"

namespace agentcard::signatures {

/**
 * @file jwks.h
 * @brief JWKS parsing, JWK key conversion and key selection.
 */

/**
 * @brief Parses a JWKS JSON document (RFC 7517 section 5).
 *
 * Elements of `keys` that are not objects or have no string `kty` are skipped.
 *
 * @return std::nullopt when the text is not a JSON object with a `keys` array,
 * or when no usable key remains.
 */
std::optional<JwksDocument> ParseJwks(std::string_view jwks_json);

/**
 * @brief Converts a JWK public key into a DER-encoded SubjectPublicKeyInfo.
 *
 * Supported key forms:
 * - RSA (n, e);
 * - EC on P-256, P-384 or P-521 (crv, x, y);
 * - OKP on Ed25519 or Ed448 (crv, x).
 */
std::optional<std::vector<std::uint8_t>> JwkToPublicKeyDer(const Jwk& jwk);

/**
 * @brief True when the key type and curve of @p jwk can produce @p alg signatures.
 */
bool JwkFitsAlgorithm(const Jwk& jwk, agentcard::validation::JwsAlgorithm alg);

/**
 * @brief Selects the keys of @p jwks that may verify a signature.
 *
 * A key qualifies when:
 * - its `kid` equals @p kid (only checked when @p kid is set);
 * - its `alg`, if present, equals @p alg;
 * - its `use`, if present, is "sig";
 * - its type and curve fit @p alg.
 *
 * Returned pointers refer into @p jwks and keep the key-set order.
 */
std::vector<const Jwk*> SelectCandidateKeys(const JwksDocument& jwks,
                                            agentcard::validation::JwsAlgorithm alg,
                                            const std::optional<std::string>& kid);

} // namespace agentcard::signatures
