// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace agentcard::signatures {

/**
 * @file signature_result.h
 * @brief Outcome of verifying one signature entry.
 */

struct SignatureResult {
  /** @brief Position of the entry in the card's `signatures` array. */
  std::size_t index = 0;

  bool valid = false;

  /** @brief Header `alg`, once the header decoded. */
  std::optional<std::string> algorithm;

  /** @brief Header `kid`, if any. */
  std::optional<std::string> key_id;

  /** @brief The key-set URI that was consulted. */
  std::optional<std::string> jwks_uri;

  /** @brief Why the entry is invalid. */
  std::optional<std::string> error;

  /** @brief Set on success. */
  std::optional<std::string> details;

  /** @brief Stable code for @ref error; not part of the JSON rendering. */
  std::optional<std::string> error_code;
};

} // namespace agentcard::signatures
