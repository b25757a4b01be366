// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file jws_header.h
 * @brief Decoding of the JWS protected header carried by an Agent Card signature.
 */

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "agentcard/common/agent_card.h"

namespace agentcard::common {

/**
 * @brief The recognized members of a JWS protected header (RFC 7515 section 4.1).
 *
 * Members outside this set are ignored when decoding.
 */
struct JwsHeader {
  std::string alg;
  std::optional<std::string> typ;
  std::optional<std::string> kid;
  std::optional<std::string> jku;
  std::optional<std::string> jwks_uri;

  /**
   * @brief The `crit` member exactly as it appeared (RFC 7515 section 4.1.11).
   *
   * Kept undecoded; the verifier decides whether the listed extensions are understood.
   */
  std::optional<nlohmann::json> crit;

  /**
   * @brief The key-set URI to consult: `jku` when non-empty, otherwise `jwks_uri`.
   *
   * An empty string counts as absent.
   */
  std::optional<std::string> KeyUri() const {
    if (jku && !jku->empty()) {
      return jku;
    }
    if (jwks_uri && !jwks_uri->empty()) {
      return jwks_uri;
    }
    return std::nullopt;
  }
};

/**
 * @brief Decodes a base64url protected header into a JwsHeader.
 *
 * Fails when the text is not base64url, the decoded bytes are not a UTF-8 JSON
 * object, or a recognized member is present with a non-string value.
 *
 * @param encoded The `protected` member of a signature entry.
 * @param out_error Optional human-readable reason on failure.
 */
std::optional<JwsHeader> DecodeProtectedHeader(std::string_view encoded, std::string* out_error = nullptr);

/**
 * @brief Decodes the protected header of a signature for display, without verifying anything.
 */
std::optional<JwsHeader> InspectSignatureHeader(const AgentCardSignature& signature);

} // namespace agentcard::common
