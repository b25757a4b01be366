#include "agentcard/signatures/result_format.h"

#include <string>

#include <agentcard/validation/algorithm_policy.h>

namespace agentcard::signatures {

nlohmann::json ToJson(const VerificationResult& result) {
  nlohmann::json signatures = nlohmann::json::array();
  for (const auto& sig : result.signatures) {
    nlohmann::json s = nlohmann::json::object();
    s["index"] = sig.index;
    s["valid"] = sig.valid;
    if (sig.algorithm) s["algorithm"] = *sig.algorithm;
    if (sig.key_id) s["keyId"] = *sig.key_id;
    if (sig.jwks_uri) s["jwksUri"] = *sig.jwks_uri;
    if (sig.error) s["error"] = *sig.error;
    if (sig.details) s["details"] = *sig.details;
    signatures.push_back(std::move(s));
  }

  nlohmann::json out = nlohmann::json::object();
  out["valid"] = result.valid;
  out["signatures"] = std::move(signatures);
  out["summary"] = {
      {"total", result.summary.total},
      {"valid", result.summary.valid},
      {"failed", result.summary.failed},
      {"errors", result.summary.errors},
  };
  return out;
}

std::vector<std::string> FormatVerificationResults(const VerificationResult& result) {
  std::vector<std::string> out;

  if (result.summary.total == 0) {
    out.push_back("[!] No signatures present in Agent Card");
    return out;
  }

  const std::string total = std::to_string(result.summary.total);
  out.push_back(std::string(result.valid ? "[OK]" : "[FAIL]") + " Signature verification: " +
                std::to_string(result.summary.valid) + "/" + total + " signatures valid");

  for (std::size_t i = 0; i < result.signatures.size(); ++i) {
    const auto& sig = result.signatures[i];

    std::string line = std::string(sig.valid ? "[OK]" : "[FAIL]") + " Signature " + std::to_string(i + 1) + "/" + total;
    if (sig.algorithm) line += ": " + *sig.algorithm;
    if (sig.key_id) line += " (key: " + *sig.key_id + ")";
    if (sig.jwks_uri) {
      // Unparseable URIs are simply not shown.
      if (const auto uri = agentcard::validation::ParseKeyUri(*sig.jwks_uri); uri && !uri->host.empty()) {
        line += " from " + uri->host;
      }
    }
    out.push_back(std::move(line));

    if (sig.error) {
      out.push_back("   Error: " + *sig.error);
    }
    if (sig.details && sig.valid) {
      out.push_back("   " + *sig.details);
    }
  }

  return out;
}

} // namespace agentcard::signatures
