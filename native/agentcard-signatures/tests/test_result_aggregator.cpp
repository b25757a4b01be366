// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_result_aggregator.cpp
 * @brief Tests for the card-level verdict.
 */

#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

#include "agentcard/signatures/result_aggregator.h"

using agentcard::signatures::AggregateResults;
using agentcard::signatures::SignatureResult;

namespace {

SignatureResult Valid(std::size_t index) {
  SignatureResult r;
  r.index = index;
  r.valid = true;
  r.details = "Signature verified successfully";
  return r;
}

SignatureResult Invalid(std::size_t index, std::string error) {
  SignatureResult r;
  r.index = index;
  r.error = std::move(error);
  return r;
}

} // namespace

TEST_CASE("A card without signatures is not valid") {
  const auto r = AggregateResults({});
  REQUIRE_FALSE(r.valid);
  REQUIRE(r.signatures.empty());
  REQUIRE(r.summary.total == 0);
  REQUIRE(r.summary.valid == 0);
  REQUIRE(r.summary.failed == 0);
  REQUIRE(r.summary.errors == std::vector<std::string>{"No signatures present in Agent Card"});
}

TEST_CASE("Every signature must be valid") {
  const auto all = AggregateResults({Valid(0), Valid(1)});
  REQUIRE(all.valid);
  REQUIRE(all.summary.total == 2);
  REQUIRE(all.summary.valid == 2);
  REQUIRE(all.summary.failed == 0);
  REQUIRE(all.summary.errors.empty());

  const auto mixed = AggregateResults({Valid(0), Invalid(1, "Signature verification failed")});
  REQUIRE_FALSE(mixed.valid);
  REQUIRE(mixed.summary.total == 2);
  REQUIRE(mixed.summary.valid == 1);
  REQUIRE(mixed.summary.failed == 1);
  REQUIRE(mixed.summary.errors == std::vector<std::string>{"Signature 2: Signature verification failed"});
}

TEST_CASE("Errors are numbered from one and keep signature order") {
  const auto r = AggregateResults({Invalid(0, "first"), Valid(1), Invalid(2, "third")});
  REQUIRE(r.signatures.size() == 3);
  REQUIRE(r.signatures[1].valid);
  REQUIRE(r.summary.errors == std::vector<std::string>{"Signature 1: first", "Signature 3: third"});
  REQUIRE(r.summary.valid + r.summary.failed == r.summary.total);
}
