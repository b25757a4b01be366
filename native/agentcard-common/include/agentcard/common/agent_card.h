// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file agent_card.h
 * @brief In-memory model of an Agent Card and its detached JWS signatures.
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace agentcard::common {

/**
 * @brief One entry of the card's `signatures` array.
 */
struct AgentCardSignature {
  /** @brief base64url(JSON protected header). */
  std::string protected_header;

  /** @brief base64url(raw signature bytes). */
  std::string signature;

  /** @brief Optional unprotected header. Carried for display; never used for verification. */
  std::optional<nlohmann::json> header;
};

/**
 * @brief A position in the `signatures` array.
 *
 * Entries that are not well-formed keep their position so that result indices
 * line up with the card; @ref problem explains why @ref signature is empty.
 */
struct SignatureEntry {
  std::optional<AgentCardSignature> signature;
  std::string problem;
};

/**
 * @brief An Agent Card document.
 *
 * Every member other than `signatures` is opaque here and only participates in
 * the canonical payload.
 */
class AgentCard {
 public:
  /**
   * @brief Wraps a parsed card. The document must be a JSON object.
   */
  static std::optional<AgentCard> FromJson(nlohmann::json document, std::string* out_error = nullptr);

  /**
   * @brief Parses card JSON text.
   */
  static std::optional<AgentCard> FromString(std::string_view json_text, std::string* out_error = nullptr);

  const nlohmann::json& Document() const { return document_; }

  /** @brief True when the card carries at least one signature entry. */
  bool HasSignatures() const;

  /**
   * @brief The `signatures` array, one element per entry.
   *
   * An absent, null or non-array `signatures` member yields no entries.
   */
  std::vector<SignatureEntry> SignatureEntries() const;

  /**
   * @brief The signing payload: the card without `signatures`, in canonical form.
   */
  std::string CanonicalPayload() const;

 private:
  explicit AgentCard(nlohmann::json document) : document_(std::move(document)) {}

  nlohmann::json document_;
};

} // namespace agentcard::common
