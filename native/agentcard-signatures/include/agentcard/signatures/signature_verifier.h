// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file signature_verifier.h
 * @brief Verification pipeline for a single Agent Card signature entry.
 */

#include <cstddef>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include <agentcard/common/agent_card.h>

#include "agentcard/signatures/key_set_resolver.h"
#include "agentcard/signatures/signature_result.h"
#include "agentcard/signatures/verification_options.h"

namespace agentcard::signatures {

/**
 * @brief Verifies one signature entry.
 *
 * Stages, each of which ends the pipeline with an invalid result on failure:
 * 1. decode the protected header (MALFORMED_HEADER);
 * 2. apply the algorithm and transport policy;
 * 3. select the key-set URI (`jku`, else `jwks_uri`; MISSING_KEY_URI when neither is present);
 * 4. resolve the key set (KEY_FETCH_TIMEOUT, KEY_FETCH_ERROR);
 * 5. rebuild the compact JWS over the canonical card payload and verify it against
 *    every key matching the header `alg` and `kid` (KEY_NOT_FOUND, SIGNATURE_INVALID).
 *
 * Never throws: unexpected faults become INTERNAL_ERROR results.
 */
class SignatureVerifier {
 public:
  /**
   * @param resolver Shared key-set cache; must outlive the verifier.
   */
  explicit SignatureVerifier(KeySetResolver& resolver);

  /**
   * @brief Verifies @p signature against the current content of @p card.
   */
  SignatureResult Verify(const agentcard::common::AgentCard& card,
                         const agentcard::common::AgentCardSignature& signature,
                         std::size_t index,
                         const VerificationOptions& options) const;

  /**
   * @brief Same as Verify, with the canonical card payload computed by the caller.
   */
  SignatureResult VerifyDetached(std::string_view canonical_payload,
                                 const agentcard::common::AgentCardSignature& signature,
                                 std::size_t index,
                                 const VerificationOptions& options) const;

 private:
  SignatureResult RunStages(std::string_view canonical_payload,
                            const agentcard::common::AgentCardSignature& signature,
                            std::size_t index,
                            const VerificationOptions& options) const;

  KeySetResolver& resolver_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace agentcard::signatures
