// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "agentcard/signatures/signature_result.h"

namespace agentcard::signatures {

/**
 * @file verification_result.h
 * @brief Card-level verdict over every signature entry.
 */

struct VerificationSummary {
  std::size_t total = 0;
  std::size_t valid = 0;
  std::size_t failed = 0;
  std::vector<std::string> errors;
};

/**
 * @brief Aggregated result.
 *
 * Invariants: `summary.total == signatures.size()`, `summary.valid + summary.failed == summary.total`,
 * and `valid == (summary.total > 0 && summary.valid == summary.total)`.
 */
struct VerificationResult {
  bool valid = false;
  std::vector<SignatureResult> signatures;
  VerificationSummary summary;
};

} // namespace agentcard::signatures
