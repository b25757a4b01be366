// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/jws_header.h"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "agentcard/common/base64url.h"

namespace agentcard::common {

namespace {

void SetError(std::string* out_error, std::string message) {
  if (out_error) {
    *out_error = std::move(message);
  }
}

// Reads an optional string member; a present member of another type is an error.
bool ReadOptionalString(const nlohmann::json& obj,
                        const char* name,
                        std::optional<std::string>& out,
                        std::string* out_error) {
  const auto it = obj.find(name);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    SetError(out_error, std::string("Invalid protected header format: '") + name + "' must be a string");
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

std::optional<JwsHeader> DecodeProtectedHeader(std::string_view encoded, std::string* out_error) {
  const auto bytes = Base64UrlDecode(encoded);
  if (!bytes) {
    SetError(out_error, "Invalid protected header format: not valid base64url");
    return std::nullopt;
  }

  nlohmann::json j;
  try {
    // The parser rejects ill-formed UTF-8 inside strings.
    j = nlohmann::json::parse(bytes->begin(), bytes->end());
  } catch (const nlohmann::json::exception& ex) {
    SetError(out_error, std::string("Invalid protected header format: ") + ex.what());
    return std::nullopt;
  }

  if (!j.is_object()) {
    SetError(out_error, "Invalid protected header format: header is not a JSON object");
    return std::nullopt;
  }

  JwsHeader header;
  std::optional<std::string> alg;
  if (!ReadOptionalString(j, "alg", alg, out_error) || !ReadOptionalString(j, "typ", header.typ, out_error) ||
      !ReadOptionalString(j, "kid", header.kid, out_error) || !ReadOptionalString(j, "jku", header.jku, out_error) ||
      !ReadOptionalString(j, "jwks_uri", header.jwks_uri, out_error)) {
    return std::nullopt;
  }

  if (const auto crit = j.find("crit"); crit != j.end() && !crit->is_null()) {
    header.crit = *crit;
  }

  // A missing alg is a policy failure, not a decoding failure.
  header.alg = alg.value_or(std::string());
  return header;
}

std::optional<JwsHeader> InspectSignatureHeader(const AgentCardSignature& signature) {
  return DecodeProtectedHeader(signature.protected_header);
}

} // namespace agentcard::common
