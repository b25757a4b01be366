// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file key_set_resolver.h
 * @brief Remote key-set resolution with a per-URI cache, failure cooldown and fetch coalescing.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include <agentcard/validation/validation_failure.h>

#include "agentcard/signatures/jwks_document.h"
#include "agentcard/signatures/jwks_fetcher.h"

namespace agentcard::signatures {

/**
 * @brief Source of monotonic time for cache expiry.
 */
class IClock {
 public:
  virtual ~IClock() = default;
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};

/**
 * @brief The process steady clock.
 */
const IClock& GetSteadyClock();

struct KeySetCacheOptions {
  // How long a successfully fetched key set is served from the cache.
  std::chrono::milliseconds max_age{std::chrono::minutes(5)};

  // How long a failed fetch is reported again without contacting the endpoint.
  std::chrono::milliseconds failure_cooldown{std::chrono::seconds(30)};

  // Key-set documents larger than this are rejected.
  std::size_t max_response_bytes = 1024 * 1024;
};

/**
 * @brief Outcome of KeySetResolver::Resolve. Exactly one of key_set and failure is set.
 */
struct KeySetResolution {
  std::shared_ptr<const JwksDocument> key_set;
  std::optional<agentcard::validation::ValidationFailure> failure;

  // True when no fetch was issued on behalf of this call.
  bool from_cache = false;
};

/**
 * @brief Fetches and caches key sets by URI.
 *
 * - A successful fetch is served from the cache for KeySetCacheOptions::max_age.
 * - A failed fetch (transport error, timeout, or a body that is not a key set) is
 *   returned from the cache for KeySetCacheOptions::failure_cooldown.
 * - Concurrent callers asking for the same URI share one in-flight fetch. Each
 *   caller waits at most its own timeout; one that gives up gets KEY_FETCH_TIMEOUT,
 *   which is not cached, while the fetch runs on for the others.
 *
 * Thread-safe. No lock is held while a fetch is in progress.
 */
class KeySetResolver {
 public:
  /**
   * @param fetcher Network fetch implementation; must outlive the resolver.
   * @param options Cache lifetimes and response limits.
   * @param clock Time source; nullptr selects the steady clock. Must outlive the resolver.
   */
  explicit KeySetResolver(const IJwksFetcher& fetcher,
                          KeySetCacheOptions options = {},
                          const IClock* clock = nullptr);

  KeySetResolver(const KeySetResolver&) = delete;
  KeySetResolver& operator=(const KeySetResolver&) = delete;

  /**
   * @brief Returns the key set published at @p uri.
   *
   * Failures carry KEY_FETCH_TIMEOUT or KEY_FETCH_ERROR. A @p timeout_ms of 0 is
   * treated as 1 ms.
   */
  KeySetResolution Resolve(std::string_view uri, std::uint32_t timeout_ms);

  /** @brief Number of fetches issued so far. */
  std::size_t FetchCount() const { return fetch_count_.load(); }

  /** @brief Drops every cached entry. In-flight fetches complete but are not cached. */
  void Clear();

 private:
  struct Outcome {
    std::shared_ptr<const JwksDocument> key_set;
    std::optional<agentcard::validation::ValidationFailure> failure;
    std::chrono::steady_clock::time_point completed_at;
  };

  struct Entry {
    std::optional<Outcome> last;
    std::optional<std::shared_future<Outcome>> in_flight;
    std::uint64_t fetch_id = 0;
  };

  Outcome Fetch(const std::string& uri, std::uint32_t timeout_ms);
  void Complete(const std::string& uri, std::uint64_t fetch_id, const Outcome& outcome);

  const IJwksFetcher& fetcher_;
  KeySetCacheOptions options_;
  const IClock& clock_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t next_fetch_id_ = 0;
  std::atomic<std::size_t> fetch_count_{0};
};

} // namespace agentcard::signatures
