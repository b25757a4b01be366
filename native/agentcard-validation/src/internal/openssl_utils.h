#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "agentcard/validation/jws_algorithm.h"

namespace agentcard::internal {

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

// Loads a public key from DER-encoded SubjectPublicKeyInfo.
EvpPkeyPtr LoadPublicKeyFromDer(std::span<const std::uint8_t> der);

// JOSE encodes ECDSA signatures as raw r||s; OpenSSL verifies the DER form.
std::optional<std::vector<std::uint8_t>> JoseEcdsaRawToDer(std::span<const std::uint8_t> jose_raw_sig);

// Size in bytes of r (and of s) for the ES* algorithms; 0 for anything else.
std::size_t EcdsaComponentSize(validation::JwsAlgorithm alg);

// Digest used by RS*/PS*/ES*; nullptr for EdDSA.
const EVP_MD* DigestForAlgorithm(validation::JwsAlgorithm alg);

// Returns an empty string when the key may be used with alg, otherwise the reason it may not.
std::string CheckKeyFitsAlgorithm(EVP_PKEY* key, validation::JwsAlgorithm alg);

bool VerifyPkcs1(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature);
bool VerifyPss(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature);
bool VerifyEcdsa(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> jose_raw_sig);
bool VerifyEdDsa(EVP_PKEY* key, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature);

} // namespace agentcard::internal
