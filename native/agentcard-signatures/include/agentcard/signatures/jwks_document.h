// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <vector>

#include "agentcard/signatures/jwk.h"

namespace agentcard::signatures {

/**
 * @file jwks_document.h
 * @brief Data model for a JWKS (JSON Web Key Set) document.
 */

/**
 * @brief Represents a JWKS document containing one or more keys.
 */
struct JwksDocument {
  std::vector<Jwk> keys;
};

} // namespace agentcard::signatures
