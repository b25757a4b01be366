// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file verification_options.h
 * @brief Options controlling Agent Card signature verification.
 */

#include <cstdint>

namespace agentcard::signatures {

struct VerificationOptions {
  // Network timeout for each key-set retrieval.
  std::uint32_t timeout_ms = 10000;

  // Permits key-set URIs that are not https. Never permits alg "none".
  bool allow_insecure = false;

  // Verify signature entries concurrently. Results are identical to sequential verification.
  bool parallel = true;
};

} // namespace agentcard::signatures
