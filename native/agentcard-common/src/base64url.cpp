// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/base64url.h"

#include <string>

#include <openssl/evp.h>

namespace agentcard::common {

namespace {

bool IsBase64UrlChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

std::string Base64UrlEncode(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string b64(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(b64.data()), bytes.data(), static_cast<int>(bytes.size()));
  b64.resize(len > 0 ? static_cast<std::size_t>(len) : 0);

  std::string out;
  out.reserve(b64.size());
  for (char c : b64) {
    if (c == '+') {
      out.push_back('-');
    } else if (c == '/') {
      out.push_back('_');
    } else if (c == '=') {
      break;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string Base64UrlEncode(std::string_view text) {
  return Base64UrlEncode(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::optional<std::vector<std::uint8_t>> Base64UrlDecode(std::string_view in) {
  // Strip padding, but only as much as a final quantum can carry.
  std::size_t padding = 0;
  while (!in.empty() && in.back() == '=') {
    in.remove_suffix(1);
    ++padding;
  }
  if (padding > 2 || (padding > 0 && (in.size() + padding) % 4 != 0)) {
    return std::nullopt;
  }

  if (in.size() % 4 == 1) {
    return std::nullopt;
  }

  std::string b64;
  b64.reserve(in.size() + 4);
  for (char c : in) {
    if (!IsBase64UrlChar(c)) {
      return std::nullopt;
    }
    if (c == '-') {
      b64.push_back('+');
    } else if (c == '_') {
      b64.push_back('/');
    } else {
      b64.push_back(c);
    }
  }

  std::size_t pad = 0;
  while (b64.size() % 4 != 0) {
    b64.push_back('=');
    ++pad;
  }

  if (b64.empty()) {
    return std::vector<std::uint8_t>{};
  }

  std::vector<std::uint8_t> out((b64.size() / 4) * 3);
  const int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
  if (len < 0 || static_cast<std::size_t>(len) < pad) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts the bytes implied by '=' padding.
  out.resize(static_cast<std::size_t>(len) - pad);
  return out;
}

} // namespace agentcard::common
