// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file detached_jws.h
 * @brief Reassembly of a detached JWS (RFC 7515 appendix F) into compact serialization.
 *
 * Agent Card signatures carry the protected header and the signature value but not
 * the payload. The payload is rebuilt from the current card content and inserted
 * between the two to obtain `header.payload.signature`.
 */

#include <optional>
#include <string>
#include <string_view>

namespace agentcard::common {

/**
 * @brief The three segments of a JWS compact serialization, still base64url encoded.
 */
struct CompactJwsParts {
  std::string_view protected_header;
  std::string_view payload;
  std::string_view signature;

  /** @brief The JWS signing input: ASCII(protected "." payload). */
  std::string SigningInput() const;
};

/**
 * @brief Builds `protected_header "." base64url(payload) "." signature`.
 *
 * @param protected_header The base64url protected header exactly as stored in the card.
 * @param canonical_payload Raw payload bytes; they are base64url encoded here.
 * @param signature The base64url signature value exactly as stored in the card.
 */
std::string AssembleDetachedJws(std::string_view protected_header,
                                std::string_view canonical_payload,
                                std::string_view signature);

/**
 * @brief Splits a compact JWS into its three segments.
 *
 * The returned views point into @p compact. Fails unless there are exactly two '.' separators.
 */
std::optional<CompactJwsParts> SplitCompactJws(std::string_view compact);

} // namespace agentcard::common
