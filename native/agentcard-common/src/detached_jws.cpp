// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/detached_jws.h"

#include "agentcard/common/base64url.h"

namespace agentcard::common {

std::string CompactJwsParts::SigningInput() const {
  std::string out;
  out.reserve(protected_header.size() + 1 + payload.size());
  out.append(protected_header);
  out.push_back('.');
  out.append(payload);
  return out;
}

std::string AssembleDetachedJws(std::string_view protected_header,
                                std::string_view canonical_payload,
                                std::string_view signature) {
  const std::string payload_b64 = Base64UrlEncode(canonical_payload);

  std::string out;
  out.reserve(protected_header.size() + payload_b64.size() + signature.size() + 2);
  out.append(protected_header);
  out.push_back('.');
  out.append(payload_b64);
  out.push_back('.');
  out.append(signature);
  return out;
}

std::optional<CompactJwsParts> SplitCompactJws(std::string_view compact) {
  const auto first = compact.find('.');
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  const auto second = compact.find('.', first + 1);
  if (second == std::string_view::npos || compact.find('.', second + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  CompactJwsParts parts;
  parts.protected_header = compact.substr(0, first);
  parts.payload = compact.substr(first + 1, second - first - 1);
  parts.signature = compact.substr(second + 1);
  return parts;
}

} // namespace agentcard::common
