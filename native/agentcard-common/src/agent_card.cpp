// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/agent_card.h"

#include <utility>

#include "agentcard/common/canonical_json.h"

namespace agentcard::common {

namespace {

constexpr const char* kSignaturesMember = "signatures";

const nlohmann::json* FindSignatures(const nlohmann::json& document) {
  const auto it = document.find(kSignaturesMember);
  if (it == document.end() || !it->is_array()) {
    return nullptr;
  }
  return &*it;
}

SignatureEntry ReadEntry(const nlohmann::json& element) {
  SignatureEntry entry;
  if (!element.is_object()) {
    entry.problem = "Signature entry is not a JSON object";
    return entry;
  }

  const auto prot = element.find("protected");
  if (prot == element.end() || !prot->is_string()) {
    entry.problem = "Signature entry is missing the 'protected' header string";
    return entry;
  }

  const auto sig = element.find("signature");
  if (sig == element.end() || !sig->is_string()) {
    entry.problem = "Signature entry is missing the 'signature' value string";
    return entry;
  }

  AgentCardSignature s;
  s.protected_header = prot->get<std::string>();
  s.signature = sig->get<std::string>();
  if (const auto hdr = element.find("header"); hdr != element.end() && hdr->is_object()) {
    s.header = *hdr;
  }
  entry.signature = std::move(s);
  return entry;
}

} // namespace

std::optional<AgentCard> AgentCard::FromJson(nlohmann::json document, std::string* out_error) {
  if (!document.is_object()) {
    if (out_error) {
      *out_error = "Agent Card must be a JSON object";
    }
    return std::nullopt;
  }
  return AgentCard(std::move(document));
}

std::optional<AgentCard> AgentCard::FromString(std::string_view json_text, std::string* out_error) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(json_text.begin(), json_text.end());
  } catch (const nlohmann::json::exception& ex) {
    if (out_error) {
      *out_error = std::string("Agent Card is not valid JSON: ") + ex.what();
    }
    return std::nullopt;
  }
  return FromJson(std::move(document), out_error);
}

bool AgentCard::HasSignatures() const {
  const auto* sigs = FindSignatures(document_);
  return sigs && !sigs->empty();
}

std::vector<SignatureEntry> AgentCard::SignatureEntries() const {
  std::vector<SignatureEntry> out;
  const auto* sigs = FindSignatures(document_);
  if (!sigs) {
    return out;
  }

  out.reserve(sigs->size());
  for (const auto& element : *sigs) {
    out.push_back(ReadEntry(element));
  }
  return out;
}

std::string AgentCard::CanonicalPayload() const {
  return CanonicalizeAgentCard(document_);
}

} // namespace agentcard::common
