// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file base64url.h
 * @brief Base64url (RFC 4648 section 5) encoding used by JWS compact serialization.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentcard::common {

/**
 * @brief Encodes bytes as unpadded base64url.
 */
std::string Base64UrlEncode(std::span<const std::uint8_t> bytes);

/**
 * @brief Encodes the bytes of a string as unpadded base64url.
 */
std::string Base64UrlEncode(std::string_view text);

/**
 * @brief Decodes base64url text.
 *
 * Rejects characters outside the URL-safe alphabet and lengths that cannot
 * describe whole bytes. Trailing '=' padding is accepted only when it completes
 * the final quantum.
 *
 * @return Decoded bytes; std::nullopt on malformed input.
 */
std::optional<std::vector<std::uint8_t>> Base64UrlDecode(std::string_view in);

} // namespace agentcard::common
