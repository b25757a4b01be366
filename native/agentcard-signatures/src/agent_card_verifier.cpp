#include "agentcard/signatures/agent_card_verifier.h"

#include <cstddef>
#include <exception>
#include <future>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <agentcard/validation/error_codes.h>

#include "agentcard/signatures/result_aggregator.h"

namespace agentcard::signatures {

namespace {

SignatureResult MalformedEntry(std::size_t index, const std::string& problem) {
  SignatureResult r;
  r.index = index;
  r.valid = false;
  r.error = problem;
  r.error_code = std::string(agentcard::validation::error_codes::kMalformedSignature);
  return r;
}

} // namespace

AgentCardVerifier::AgentCardVerifier(const IJwksFetcher& fetcher, KeySetCacheOptions cache_options, const IClock* clock)
    : resolver_(fetcher, cache_options, clock), verifier_(resolver_) {}

VerificationResult AgentCardVerifier::Verify(const agentcard::common::AgentCard& card, const VerificationOptions& options) {
  const auto entries = card.SignatureEntries();
  if (entries.empty()) {
    return AggregateResults({});
  }

  // One canonical payload serves every entry.
  std::string payload;
  try {
    payload = card.CanonicalPayload();
  } catch (const std::exception& ex) {
    std::vector<SignatureResult> failed;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      SignatureResult r;
      r.index = i;
      r.error = std::string("Internal error during signature verification: ") + ex.what();
      r.error_code = std::string(agentcard::validation::error_codes::kInternalError);
      failed.push_back(std::move(r));
    }
    return AggregateResults(std::move(failed));
  }

  auto verify_one = [&](std::size_t i) {
    const auto& entry = entries[i];
    if (!entry.signature) {
      return MalformedEntry(i, entry.problem);
    }
    return verifier_.VerifyDetached(payload, *entry.signature, i, options);
  };

  std::vector<SignatureResult> results;
  results.reserve(entries.size());

  if (!options.parallel || entries.size() == 1) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
      results.push_back(verify_one(i));
    }
    return AggregateResults(std::move(results));
  }

  std::vector<std::future<SignatureResult>> tasks;
  tasks.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    try {
      tasks.push_back(std::async(std::launch::async, verify_one, i));
    } catch (const std::system_error&) {
      // No thread available: verify this entry on the calling thread.
      std::promise<SignatureResult> inline_result;
      inline_result.set_value(verify_one(i));
      tasks.push_back(inline_result.get_future());
    }
  }

  for (auto& task : tasks) {
    results.push_back(task.get());
  }
  return AggregateResults(std::move(results));
}

VerificationResult VerifyAgentCardSignatures(const agentcard::common::AgentCard& card, const VerificationOptions& options) {
  static AgentCardVerifier verifier;
  return verifier.Verify(card, options);
}

} // namespace agentcard::signatures
