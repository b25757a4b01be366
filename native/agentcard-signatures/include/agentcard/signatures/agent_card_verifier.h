// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file agent_card_verifier.h
 * @brief Verification of every signature carried by an Agent Card.
 */

#include <agentcard/common/agent_card.h>

#include "agentcard/signatures/jwks_fetcher.h"
#include "agentcard/signatures/key_set_resolver.h"
#include "agentcard/signatures/signature_verifier.h"
#include "agentcard/signatures/verification_options.h"
#include "agentcard/signatures/verification_result.h"

namespace agentcard::signatures {

/**
 * @brief Verifies Agent Cards against remotely published key sets.
 *
 * Owns the key-set cache, so one instance should be reused across cards.
 */
class AgentCardVerifier {
 public:
  /**
   * @param fetcher Network fetch implementation; must outlive the verifier.
   * @param cache_options Key-set cache lifetimes.
   * @param clock Time source for the cache; nullptr selects the steady clock.
   */
  explicit AgentCardVerifier(const IJwksFetcher& fetcher = GetDefaultJwksFetcher(),
                             KeySetCacheOptions cache_options = {},
                             const IClock* clock = nullptr);

  AgentCardVerifier(const AgentCardVerifier&) = delete;
  AgentCardVerifier& operator=(const AgentCardVerifier&) = delete;

  /**
   * @brief Verifies every entry of the card's `signatures` array.
   *
   * Entries are independent: a failing entry never stops the others. Results keep
   * the order of the array whether or not @ref VerificationOptions::parallel is set.
   */
  VerificationResult Verify(const agentcard::common::AgentCard& card, const VerificationOptions& options = {});

  KeySetResolver& Resolver() { return resolver_; }

 private:
  KeySetResolver resolver_;
  SignatureVerifier verifier_;
};

/**
 * @brief Verifies @p card with a process-wide verifier that uses the default fetcher.
 */
VerificationResult VerifyAgentCardSignatures(const agentcard::common::AgentCard& card,
                                             const VerificationOptions& options = {});

} // namespace agentcard::signatures
