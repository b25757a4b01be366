// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file jws_algorithm.h
 * @brief The asymmetric JWS algorithms (RFC 7518, RFC 8037) accepted for Agent Card signatures.
 *
 * HMAC algorithms are deliberately absent: a verifier must never treat a
 * published public key as a shared secret.
 */

#include <optional>
#include <string_view>

namespace agentcard::validation {

enum class JwsAlgorithm {
  RS256,
  RS384,
  RS512,
  PS256,
  PS384,
  PS512,
  ES256,
  ES384,
  ES512,
  EdDSA,
};

/**
 * @brief Maps a JWS `alg` value to the enum. Matching is case-sensitive.
 *
 * @return std::nullopt for anything outside the allow-list, including "none" and HS*.
 */
std::optional<JwsAlgorithm> ParseJwsAlgorithm(std::string_view alg);

/**
 * @brief The registered JWS name of @p alg.
 */
std::string_view ToString(JwsAlgorithm alg);

} // namespace agentcard::validation
