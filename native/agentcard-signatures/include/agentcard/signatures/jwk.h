// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <optional>
#include <string>

namespace agentcard::signatures {

/**
 * @file jwk.h
 * @brief Data model for a public JWK (RFC 7517 / RFC 7518 / RFC 8037).
 */

/**
 * @brief A public key in JWK form.
 *
 * Key material is stored as the base64url strings that appear in the key set.
 */
struct Jwk {
  /** @brief Key type: "RSA", "EC" or "OKP". */
  std::string kty;

  /** @brief Key identifier used to select the key. */
  std::optional<std::string> kid;

  /** @brief Algorithm the key is intended for, if restricted. */
  std::optional<std::string> alg;

  /** @brief Public key use ("sig" or "enc"). */
  std::optional<std::string> use;

  /** @brief Curve name for EC ("P-256", ...) and OKP ("Ed25519", "Ed448") keys. */
  std::optional<std::string> crv;

  /** @brief RSA modulus and exponent, base64url encoded. */
  std::optional<std::string> n;
  std::optional<std::string> e;

  /** @brief EC coordinates, or the OKP public key in x, base64url encoded. */
  std::optional<std::string> x;
  std::optional<std::string> y;
};

} // namespace agentcard::signatures
