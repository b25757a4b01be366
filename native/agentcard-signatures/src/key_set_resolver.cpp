#include "agentcard/signatures/key_set_resolver.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include <agentcard/common/logging.h>
#include <agentcard/validation/error_codes.h>

#include "agentcard/signatures/jwks.h"

namespace agentcard::signatures {

namespace {

namespace error_codes = agentcard::validation::error_codes;
using agentcard::validation::ValidationFailure;

class SteadyClock final : public IClock {
 public:
  std::chrono::steady_clock::time_point Now() const override { return std::chrono::steady_clock::now(); }
};

ValidationFailure FetchFailure(std::string message, std::string_view error_code, const std::string& uri) {
  ValidationFailure f;
  f.message = std::move(message);
  f.error_code = std::string(error_code);
  f.attempted_value = uri;
  return f;
}

} // namespace

const IClock& GetSteadyClock() {
  static SteadyClock c;
  return c;
}

KeySetResolver::KeySetResolver(const IJwksFetcher& fetcher, KeySetCacheOptions options, const IClock* clock)
    : fetcher_(fetcher),
      options_(options),
      clock_(clock ? *clock : GetSteadyClock()),
      logger_(agentcard::common::Logging::Create("agentcard:keyset")) {}

KeySetResolution KeySetResolver::Resolve(std::string_view uri, std::uint32_t timeout_ms) {
  const std::string key(uri);
  timeout_ms = std::max<std::uint32_t>(timeout_ms, 1);

  std::promise<Outcome> promise;
  std::uint64_t fetch_id = 0;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    Entry& entry = entries_[key];

    if (entry.last) {
      const auto age = clock_.Now() - entry.last->completed_at;
      if (entry.last->key_set && age < options_.max_age) {
        logger_->debug("Key set cache hit for {}", key);
        return KeySetResolution{entry.last->key_set, std::nullopt, true};
      }
      if (entry.last->failure && age < options_.failure_cooldown) {
        logger_->debug("Key set fetch for {} is cooling down after a failure", key);
        return KeySetResolution{nullptr, entry.last->failure, true};
      }
    }

    if (entry.in_flight) {
      auto pending = *entry.in_flight;
      lock.unlock();

      logger_->debug("Waiting for in-flight key set fetch of {}", key);
      if (pending.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        logger_->info("Gave up waiting for key set fetch of {} after {} ms", key, timeout_ms);
        return KeySetResolution{nullptr,
                                FetchFailure("Key set fetch timed out: " + key, error_codes::kKeyFetchTimeout, key),
                                true};
      }
      const Outcome& shared = pending.get();
      return KeySetResolution{shared.key_set, shared.failure, true};
    }

    fetch_id = ++next_fetch_id_;
    entry.fetch_id = fetch_id;
    entry.in_flight = promise.get_future().share();
  }

  logger_->debug("Key set cache miss for {}; fetching", key);

  Outcome outcome;
  try {
    outcome = Fetch(key, timeout_ms);
  } catch (...) {
    // Waiters see the same fault; nothing is cached.
    promise.set_exception(std::current_exception());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto it = entries_.find(key);
      if (it != entries_.end() && it->second.fetch_id == fetch_id) {
        it->second.in_flight.reset();
      }
    }
    throw;
  }

  Complete(key, fetch_id, outcome);
  promise.set_value(outcome);
  return KeySetResolution{outcome.key_set, outcome.failure, false};
}

void KeySetResolver::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

KeySetResolver::Outcome KeySetResolver::Fetch(const std::string& uri, std::uint32_t timeout_ms) {
  fetch_count_.fetch_add(1);

  Outcome out;
  JwksFetchResponse response;
  try {
    response = fetcher_.FetchJwksJson(uri, timeout_ms, options_.max_response_bytes);
  } catch (const std::exception& ex) {
    response.status = JwksFetchStatus::kError;
    response.error = ex.what();
  }
  out.completed_at = clock_.Now();

  switch (response.status) {
    case JwksFetchStatus::kTimeout:
      logger_->info("Key set fetch from {} timed out: {}", uri, response.error);
      out.failure = FetchFailure("Key set fetch timed out: " + uri, error_codes::kKeyFetchTimeout, uri);
      out.failure->exception_message = response.error;
      return out;
    case JwksFetchStatus::kError:
      logger_->info("Key set fetch from {} failed: {}", uri, response.error);
      out.failure = FetchFailure("Failed to fetch key set from " + uri + ": " + response.error, error_codes::kKeyFetchError, uri);
      out.failure->exception_message = response.error;
      return out;
    case JwksFetchStatus::kOk:
      break;
  }

  auto jwks = ParseJwks(response.body);
  if (!jwks) {
    logger_->info("Key set at {} is not a usable JWKS document", uri);
    out.failure = FetchFailure("Key set at " + uri + " is not a valid JWKS document", error_codes::kKeyFetchError, uri);
    return out;
  }

  logger_->info("Fetched {} key(s) from {}", jwks->keys.size(), uri);
  out.key_set = std::make_shared<const JwksDocument>(std::move(*jwks));
  return out;
}

void KeySetResolver::Complete(const std::string& uri, std::uint64_t fetch_id, const Outcome& outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(uri);
  if (it == entries_.end() || it->second.fetch_id != fetch_id) {
    // Cleared while the fetch was running.
    return;
  }
  it->second.last = outcome;
  it->second.in_flight.reset();
}

} // namespace agentcard::signatures
