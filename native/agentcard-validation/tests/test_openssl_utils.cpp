// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_openssl_utils.cpp
 * @brief Unit tests for internal OpenSSL helpers.
 */

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include "../src/internal/openssl_utils.h"

#include "test_utils.h"

namespace {

using agentcard::validation::JwsAlgorithm;

std::vector<std::uint8_t> MakeDerEcdsaSigP256(EVP_PKEY* key) {
  const std::uint8_t msg[] = {1, 2, 3, 4, 5};
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  REQUIRE(ctx != nullptr);
  REQUIRE(EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key) == 1);
  REQUIRE(EVP_DigestSignUpdate(ctx, msg, sizeof(msg)) == 1);

  size_t sig_len = 0;
  REQUIRE(EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1);
  std::vector<std::uint8_t> sig(sig_len);
  REQUIRE(EVP_DigestSignFinal(ctx, sig.data(), &sig_len) == 1);
  sig.resize(sig_len);

  EVP_MD_CTX_free(ctx);
  return sig;
}

} // namespace

TEST_CASE("JoseEcdsaRawToDer rejects empty and odd-length signatures") {
  REQUIRE_FALSE(agentcard::internal::JoseEcdsaRawToDer({}).has_value());

  const std::uint8_t odd[] = {0x01, 0x02, 0x03};
  REQUIRE_FALSE(agentcard::internal::JoseEcdsaRawToDer(odd).has_value());
}

TEST_CASE("JoseEcdsaRawToDer encodes zero-padded components as minimal DER integers") {
  std::vector<std::uint8_t> raw(64, 0x00);
  raw[31] = 0x01;
  raw[63] = 0x02;

  const auto der = agentcard::internal::JoseEcdsaRawToDer(raw);
  REQUIRE(der.has_value());
  const std::vector<std::uint8_t> expected = {0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02};
  REQUIRE(*der == expected);
}

TEST_CASE("JoseEcdsaRawToDer adds a sign byte to components with the high bit set") {
  std::vector<std::uint8_t> raw(64, 0x00);
  raw[0] = 0x80;
  raw[63] = 0x01;

  const auto der = agentcard::internal::JoseEcdsaRawToDer(raw);
  REQUIRE(der.has_value());
  // SEQUENCE { INTEGER 0x00 0x80 <31 zero bytes>, INTEGER 0x01 }
  REQUIRE(der->size() == 2 + 35 + 3);
  REQUIRE((*der)[2] == 0x02);
  REQUIRE((*der)[3] == 0x21);
  REQUIRE((*der)[4] == 0x00);
  REQUIRE((*der)[5] == 0x80);
}

TEST_CASE("ECDSA DER and JOSE raw encodings convert both ways") {
  auto key = agentcard::tests::GenerateEcP256Key();
  const auto der = MakeDerEcdsaSigP256(key.get());

  const auto raw = agentcard::tests::EcdsaDerToJoseRaw(der, 32);
  REQUIRE(raw.has_value());
  REQUIRE(raw->size() == 64);

  const auto back = agentcard::internal::JoseEcdsaRawToDer(*raw);
  REQUIRE(back.has_value());
  REQUIRE(*back == der);
}

TEST_CASE("LoadPublicKeyFromDer rejects empty") {
  const std::vector<std::uint8_t> empty;
  const auto key = agentcard::internal::LoadPublicKeyFromDer(empty);
  REQUIRE_FALSE(static_cast<bool>(key));
}

TEST_CASE("LoadPublicKeyFromDer loads SPKI public key DER") {
  auto key = agentcard::tests::GenerateEcP256Key();
  const auto der = agentcard::tests::PublicKeyDerFromKey(key.get());
  const auto loaded = agentcard::internal::LoadPublicKeyFromDer(der);
  REQUIRE(static_cast<bool>(loaded));
}

TEST_CASE("LoadPublicKeyFromDer rejects SPKI DER with trailing bytes") {
  auto key = agentcard::tests::GenerateEcP256Key();
  auto der = agentcard::tests::PublicKeyDerFromKey(key.get());
  der.push_back(0x00);
  const auto loaded = agentcard::internal::LoadPublicKeyFromDer(der);
  REQUIRE_FALSE(static_cast<bool>(loaded));
}

TEST_CASE("EcdsaComponentSize follows the curve of each ES algorithm") {
  REQUIRE(agentcard::internal::EcdsaComponentSize(JwsAlgorithm::ES256) == 32);
  REQUIRE(agentcard::internal::EcdsaComponentSize(JwsAlgorithm::ES384) == 48);
  REQUIRE(agentcard::internal::EcdsaComponentSize(JwsAlgorithm::ES512) == 66);
  REQUIRE(agentcard::internal::EcdsaComponentSize(JwsAlgorithm::RS256) == 0);
}

TEST_CASE("DigestForAlgorithm maps hash sizes and has none for EdDSA") {
  REQUIRE(agentcard::internal::DigestForAlgorithm(JwsAlgorithm::RS256) == EVP_sha256());
  REQUIRE(agentcard::internal::DigestForAlgorithm(JwsAlgorithm::PS384) == EVP_sha384());
  REQUIRE(agentcard::internal::DigestForAlgorithm(JwsAlgorithm::ES512) == EVP_sha512());
  REQUIRE(agentcard::internal::DigestForAlgorithm(JwsAlgorithm::EdDSA) == nullptr);
}

TEST_CASE("CheckKeyFitsAlgorithm accepts matching key types") {
  auto rsa = agentcard::tests::GenerateRsaKey(2048);
  auto p256 = agentcard::tests::GenerateEcP256Key();
  auto p384 = agentcard::tests::GenerateEcKey(NID_secp384r1);
  auto ed = agentcard::tests::GenerateEd25519Key();

  REQUIRE(agentcard::internal::CheckKeyFitsAlgorithm(rsa.get(), JwsAlgorithm::RS256).empty());
  REQUIRE(agentcard::internal::CheckKeyFitsAlgorithm(rsa.get(), JwsAlgorithm::PS512).empty());
  REQUIRE(agentcard::internal::CheckKeyFitsAlgorithm(p256.get(), JwsAlgorithm::ES256).empty());
  REQUIRE(agentcard::internal::CheckKeyFitsAlgorithm(p384.get(), JwsAlgorithm::ES384).empty());
  REQUIRE(agentcard::internal::CheckKeyFitsAlgorithm(ed.get(), JwsAlgorithm::EdDSA).empty());
}

TEST_CASE("CheckKeyFitsAlgorithm rejects mismatched keys") {
  auto rsa = agentcard::tests::GenerateRsaKey(2048);
  auto p256 = agentcard::tests::GenerateEcP256Key();
  auto ed = agentcard::tests::GenerateEd25519Key();

  REQUIRE_FALSE(agentcard::internal::CheckKeyFitsAlgorithm(rsa.get(), JwsAlgorithm::ES256).empty());
  REQUIRE_FALSE(agentcard::internal::CheckKeyFitsAlgorithm(p256.get(), JwsAlgorithm::ES384).empty());
  REQUIRE_FALSE(agentcard::internal::CheckKeyFitsAlgorithm(p256.get(), JwsAlgorithm::RS256).empty());
  REQUIRE_FALSE(agentcard::internal::CheckKeyFitsAlgorithm(ed.get(), JwsAlgorithm::PS256).empty());
}

TEST_CASE("CheckKeyFitsAlgorithm rejects RSA keys below 2048 bits") {
  auto small = agentcard::tests::GenerateRsaKey(1024);
  const auto reason = agentcard::internal::CheckKeyFitsAlgorithm(small.get(), JwsAlgorithm::RS256);
  REQUIRE(reason.find("2048") != std::string::npos);
}
