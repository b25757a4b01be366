// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_key_set_resolver.cpp
 * @brief Tests for key-set caching, failure cooldown and fetch coalescing.
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <agentcard/validation/error_codes.h>

#include "agentcard/signatures/key_set_resolver.h"
#include "test_fakes.h"
#include "test_utils.h"

using agentcard::signatures::JwksFetchStatus;
using agentcard::signatures::KeySetCacheOptions;
using agentcard::signatures::KeySetResolution;
using agentcard::signatures::KeySetResolver;
using agentcard::tests::FakeClock;
using agentcard::tests::FakeJwksFetcher;

namespace error_codes = agentcard::validation::error_codes;

namespace {

const std::string kUri = "https://issuer.example/.well-known/jwks.json";

KeySetCacheOptions TestOptions() {
  KeySetCacheOptions o;
  o.max_age = std::chrono::minutes(5);
  o.failure_cooldown = std::chrono::seconds(30);
  return o;
}

void ServeOneKey(FakeJwksFetcher& fetcher, const std::string& uri, const std::string& kid) {
  auto key = agentcard::tests::GenerateEcP256Key();
  fetcher.Serve(uri, agentcard::tests::MakeJwks({agentcard::tests::PublicJwkFromKey(key.get(), kid)}));
}

} // namespace

TEST_CASE("Resolve caches a fetched key set until it expires") {
  FakeJwksFetcher fetcher;
  FakeClock clock;
  ServeOneKey(fetcher, kUri, "k1");
  KeySetResolver resolver(fetcher, TestOptions(), &clock);

  const auto first = resolver.Resolve(kUri, 1000);
  REQUIRE_FALSE(first.failure.has_value());
  REQUIRE(first.key_set);
  REQUIRE(first.key_set->keys.size() == 1);
  REQUIRE_FALSE(first.from_cache);

  clock.Advance(std::chrono::minutes(4));
  const auto second = resolver.Resolve(kUri, 1000);
  REQUIRE(second.from_cache);
  REQUIRE(second.key_set == first.key_set);
  REQUIRE(fetcher.Calls() == 1);

  clock.Advance(std::chrono::minutes(2));
  const auto third = resolver.Resolve(kUri, 1000);
  REQUIRE_FALSE(third.from_cache);
  REQUIRE(third.key_set);
  REQUIRE(fetcher.Calls() == 2);
  REQUIRE(resolver.FetchCount() == 2);
}

TEST_CASE("Resolve keeps one cache entry per URI") {
  FakeJwksFetcher fetcher;
  FakeClock clock;
  const std::string other = "https://other.example/keys";
  ServeOneKey(fetcher, kUri, "k1");
  ServeOneKey(fetcher, other, "k2");
  KeySetResolver resolver(fetcher, TestOptions(), &clock);

  REQUIRE(resolver.Resolve(kUri, 1000).key_set->keys[0].kid == "k1");
  REQUIRE(resolver.Resolve(other, 1000).key_set->keys[0].kid == "k2");
  REQUIRE(resolver.Resolve(kUri, 1000).from_cache);
  REQUIRE(fetcher.CallsFor(kUri) == 1);
  REQUIRE(fetcher.CallsFor(other) == 1);
}

TEST_CASE("Resolve reports transport failures with stable codes") {
  FakeJwksFetcher fetcher;
  FakeClock clock;
  KeySetResolver resolver(fetcher, TestOptions(), &clock);

  SECTION("timeout") {
    fetcher.Fail(kUri, JwksFetchStatus::kTimeout, "Timed out after 50 ms");
    const auto r = resolver.Resolve(kUri, 50);
    REQUIRE_FALSE(r.key_set);
    REQUIRE(r.failure.has_value());
    REQUIRE(r.failure->error_code == std::string(error_codes::kKeyFetchTimeout));
    REQUIRE(r.failure->message == "Key set fetch timed out: " + kUri);
  }
  SECTION("transport error") {
    fetcher.Fail(kUri, JwksFetchStatus::kError, "HTTP 500");
    const auto r = resolver.Resolve(kUri, 1000);
    REQUIRE(r.failure.has_value());
    REQUIRE(r.failure->error_code == std::string(error_codes::kKeyFetchError));
    REQUIRE(r.failure->message == "Failed to fetch key set from " + kUri + ": HTTP 500");
  }
  SECTION("body is not a key set") {
    fetcher.ServeBody(kUri, "<html>not found</html>");
    const auto r = resolver.Resolve(kUri, 1000);
    REQUIRE(r.failure.has_value());
    REQUIRE(r.failure->error_code == std::string(error_codes::kKeyFetchError));
    REQUIRE(r.failure->message == "Key set at " + kUri + " is not a valid JWKS document");
  }
  SECTION("body over the size limit") {
    KeySetCacheOptions small = TestOptions();
    small.max_response_bytes = 16;
    KeySetResolver limited(fetcher, small, &clock);
    ServeOneKey(fetcher, kUri, "k1");
    const auto r = limited.Resolve(kUri, 1000);
    REQUIRE(r.failure.has_value());
    REQUIRE(r.failure->error_code == std::string(error_codes::kKeyFetchError));
  }
}

TEST_CASE("Resolve does not refetch a failed key set during the cooldown") {
  FakeJwksFetcher fetcher;
  FakeClock clock;
  KeySetResolver resolver(fetcher, TestOptions(), &clock);
  fetcher.Fail(kUri, JwksFetchStatus::kError, "connection refused");

  const auto first = resolver.Resolve(kUri, 1000);
  REQUIRE(first.failure.has_value());
  REQUIRE(fetcher.Calls() == 1);

  // The endpoint recovers, but the failure is still cooling down.
  ServeOneKey(fetcher, kUri, "k1");
  clock.Advance(std::chrono::seconds(10));
  const auto second = resolver.Resolve(kUri, 1000);
  REQUIRE(second.failure.has_value());
  REQUIRE(second.from_cache);
  REQUIRE(second.failure->message == first.failure->message);
  REQUIRE(fetcher.Calls() == 1);

  clock.Advance(std::chrono::seconds(25));
  const auto third = resolver.Resolve(kUri, 1000);
  REQUIRE_FALSE(third.failure.has_value());
  REQUIRE(third.key_set);
  REQUIRE(fetcher.Calls() == 2);
}

TEST_CASE("Clear drops cached key sets") {
  FakeJwksFetcher fetcher;
  FakeClock clock;
  ServeOneKey(fetcher, kUri, "k1");
  KeySetResolver resolver(fetcher, TestOptions(), &clock);

  REQUIRE(resolver.Resolve(kUri, 1000).key_set);
  resolver.Clear();
  REQUIRE_FALSE(resolver.Resolve(kUri, 1000).from_cache);
  REQUIRE(fetcher.Calls() == 2);
}

TEST_CASE("Concurrent callers share a single in-flight fetch") {
  FakeJwksFetcher fetcher;
  ServeOneKey(fetcher, kUri, "k1");
  fetcher.SetDelay(std::chrono::milliseconds(200));
  KeySetResolver resolver(fetcher, TestOptions());

  constexpr int kThreads = 8;
  std::vector<KeySetResolution> results(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&resolver, &results, i] { results[i] = resolver.Resolve(kUri, 5000); });
  }
  for (auto& t : threads) {
    t.join();
  }

  REQUIRE(fetcher.Calls() == 1);
  REQUIRE(resolver.FetchCount() == 1);

  int fetched = 0;
  for (const auto& r : results) {
    REQUIRE_FALSE(r.failure.has_value());
    REQUIRE(r.key_set == results[0].key_set);
    if (!r.from_cache) {
      ++fetched;
    }
  }
  REQUIRE(fetched == 1);
}

TEST_CASE("Resolve raises a zero timeout to 1 ms") {
  FakeJwksFetcher fetcher;
  ServeOneKey(fetcher, kUri, "k1");
  KeySetResolver resolver(fetcher, TestOptions());

  const auto r = resolver.Resolve(kUri, 0);
  REQUIRE(r.key_set);
  REQUIRE(fetcher.LastTimeoutMs() == 1);
}

TEST_CASE("A caller waiting on an in-flight fetch gives up after its own timeout") {
  FakeJwksFetcher fetcher;
  ServeOneKey(fetcher, kUri, "k1");
  fetcher.SetDelay(std::chrono::milliseconds(1000));
  KeySetResolver resolver(fetcher, TestOptions());

  KeySetResolution slow;
  std::thread fetching([&resolver, &slow] { slow = resolver.Resolve(kUri, 5000); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const auto start = std::chrono::steady_clock::now();
  const auto impatient = resolver.Resolve(kUri, 50);
  const auto waited = std::chrono::steady_clock::now() - start;
  fetching.join();

  REQUIRE_FALSE(impatient.key_set);
  REQUIRE(impatient.failure.has_value());
  REQUIRE(impatient.failure->error_code == std::string(error_codes::kKeyFetchTimeout));
  REQUIRE(impatient.failure->message == "Key set fetch timed out: " + kUri);
  REQUIRE(impatient.from_cache);
  REQUIRE(waited < std::chrono::milliseconds(700));

  REQUIRE(slow.key_set);
  REQUIRE_FALSE(slow.failure.has_value());
  REQUIRE(fetcher.Calls() == 1);

  // The abandoned wait left no failure behind.
  const auto later = resolver.Resolve(kUri, 1000);
  REQUIRE(later.key_set == slow.key_set);
  REQUIRE(later.from_cache);
}
