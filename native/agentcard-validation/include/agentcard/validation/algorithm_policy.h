// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file algorithm_policy.h
 * @brief Security policy applied to a decoded protected header before any key is fetched.
 */

#include <optional>
#include <string>
#include <string_view>

#include <agentcard/common/jws_header.h>

#include "agentcard/validation/validation_failure.h"

namespace agentcard::validation {

/**
 * @brief The pieces of a key-set URI the policy needs.
 */
struct KeyUri {
  std::string scheme;  // lower-cased
  std::string host;
};

/**
 * @brief Parses an absolute URI far enough to read its scheme and host.
 *
 * Non-hierarchical URIs (no `//` authority) parse with an empty host.
 *
 * @return std::nullopt when the text has no RFC 3986 scheme or contains whitespace or controls.
 */
std::optional<KeyUri> ParseKeyUri(std::string_view uri);

/**
 * @brief Checks the `crit` header parameter (RFC 7515 section 4.1.11).
 *
 * No JWS extensions are implemented. A `crit` that is not a non-empty array of
 * strings is MALFORMED_HEADER; a well-formed one names an extension this library
 * does not understand and is UNSUPPORTED_CRIT.
 *
 * @return std::nullopt when the header has no `crit` member.
 */
std::optional<ValidationFailure> ValidateCriticalHeader(const agentcard::common::JwsHeader& header);

/**
 * @brief Validates the header against the algorithm and transport policy.
 *
 * Checks, in order:
 * - `alg` is present and non-empty (MISSING_ALG);
 * - `alg` is not "none", regardless of @p allow_insecure (DISALLOWED_ALG);
 * - `alg` is in the asymmetric allow-list (UNSUPPORTED_ALG);
 * - ValidateCriticalHeader passes;
 * - unless @p allow_insecure, the key-set URI (if any) is well formed (INVALID_KEY_URI)
 *   and uses https (INSECURE_KEY_URI).
 *
 * A header without any key-set URI passes; the verifier reports MISSING_KEY_URI later.
 *
 * @return std::nullopt when the header is acceptable; otherwise the first violation.
 */
std::optional<ValidationFailure> ValidateAlgorithmPolicy(const agentcard::common::JwsHeader& header, bool allow_insecure);

} // namespace agentcard::validation
