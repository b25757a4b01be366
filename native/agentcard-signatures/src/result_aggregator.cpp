#include "agentcard/signatures/result_aggregator.h"

#include <string>
#include <utility>

namespace agentcard::signatures {

VerificationResult AggregateResults(std::vector<SignatureResult> results) {
  VerificationResult out;

  if (results.empty()) {
    out.summary.errors.push_back("No signatures present in Agent Card");
    return out;
  }

  for (const auto& r : results) {
    if (r.valid) {
      ++out.summary.valid;
    } else if (r.error) {
      out.summary.errors.push_back("Signature " + std::to_string(r.index + 1) + ": " + *r.error);
    }
  }

  out.summary.total = results.size();
  out.summary.failed = out.summary.total - out.summary.valid;
  out.valid = out.summary.valid == out.summary.total;
  out.signatures = std::move(results);
  return out;
}

} // namespace agentcard::signatures
