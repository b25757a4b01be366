// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file jwks_fetcher.h
 * @brief Abstractions for retrieving JWKS documents over the network.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace agentcard::signatures {

enum class JwksFetchStatus {
  kOk,
  kTimeout,
  kError,
};

struct JwksFetchResponse {
  JwksFetchStatus status = JwksFetchStatus::kError;

  // Response body when status is kOk.
  std::string body;

  // Human-readable reason when status is not kOk.
  std::string error;
};

/**
 * @brief Fetches a JWKS JSON document.
 *
 * Abstracted so the verifier can run without a specific HTTP stack, and so tests
 * can serve key sets from memory.
 */
class IJwksFetcher {
 public:
  virtual ~IJwksFetcher() = default;

  /**
   * @brief Performs a single GET of @p uri.
   *
   * @param uri Absolute key-set URI, already checked by the transport policy.
   * @param timeout_ms Upper bound for the whole request.
   * @param max_response_bytes Larger bodies fail with kError.
   */
  virtual JwksFetchResponse FetchJwksJson(std::string_view uri,
                                          std::uint32_t timeout_ms,
                                          std::size_t max_response_bytes) const = 0;
};

/**
 * @brief Returns the library's default JWKS fetcher implementation (libcurl-based).
 *
 * Only `https` URIs are fetched, plus `http` when the starting URI is `http`; every
 * other scheme fails with kError before any I/O. Redirects obey the same rule.
 * A zero timeout is raised to 1 ms.
 */
const IJwksFetcher& GetDefaultJwksFetcher();

} // namespace agentcard::signatures
