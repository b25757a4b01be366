// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file canonical_json.h
 * @brief Deterministic JSON serialization used to rebuild the signed Agent Card payload.
 *
 * The output matches `JSON.stringify` applied to a recursively key-sorted copy of
 * the document, so that signers written against the ECMAScript JSON model and
 * this verifier agree on the exact bytes:
 * - object keys are ordered by UTF-16 code units at every nesting level;
 * - array elements keep their order;
 * - no insignificant whitespace;
 * - numbers use the ECMAScript Number::toString rendering.
 */

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace agentcard::common {

/**
 * @brief Returns a copy of @p object without the top-level member @p name.
 *
 * Non-object values are returned unchanged. Nested members with the same name are kept.
 */
nlohmann::json CloneWithoutMember(const nlohmann::json& object, std::string_view name);

/**
 * @brief Serializes a JSON value in canonical form.
 */
std::string CanonicalizeJson(const nlohmann::json& value);

/**
 * @brief Produces the signing payload of an Agent Card: the card without its
 * top-level `signatures` member, in canonical form.
 */
std::string CanonicalizeAgentCard(const nlohmann::json& card);

/**
 * @brief Renders a double the way ECMAScript Number::toString does.
 *
 * Non-finite values render as `null`, matching JSON.stringify.
 */
std::string FormatEcmaScriptNumber(double value);

} // namespace agentcard::common
