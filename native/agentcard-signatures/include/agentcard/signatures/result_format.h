// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file result_format.h
 * @brief JSON and text renderings of a VerificationResult.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentcard/signatures/verification_result.h"

namespace agentcard::signatures {

/**
 * @brief Renders @p result as
 * `{"valid", "signatures": [{"index", "valid", "algorithm"?, "keyId"?, "jwksUri"?, "error"?, "details"?}],
 *   "summary": {"total", "valid", "failed", "errors"}}`.
 *
 * Optional members are omitted when unset. Error codes are not rendered.
 */
nlohmann::json ToJson(const VerificationResult& result);

/**
 * @brief Human-readable lines: a summary line, then one line per signature followed by
 * its error or details.
 */
std::vector<std::string> FormatVerificationResults(const VerificationResult& result);

} // namespace agentcard::signatures
