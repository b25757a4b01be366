// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file result_aggregator.h
 * @brief Combines per-signature outcomes into the card-level verdict.
 */

#include <vector>

#include "agentcard/signatures/signature_result.h"
#include "agentcard/signatures/verification_result.h"

namespace agentcard::signatures {

/**
 * @brief Builds the VerificationResult for @p results, which must be in index order.
 *
 * The card is valid only when there is at least one signature and every signature is valid.
 * An empty input yields the single error "No signatures present in Agent Card".
 */
VerificationResult AggregateResults(std::vector<SignatureResult> results);

} // namespace agentcard::signatures
