#include "agentcard/signatures/jwks.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <agentcard/common/base64url.h>

namespace agentcard::signatures {

namespace {
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using RsaPtr = std::unique_ptr<RSA, decltype(&RSA_free)>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

using agentcard::validation::JwsAlgorithm;

std::optional<std::string> ReadString(const nlohmann::json& obj, const char* name) {
  const auto it = obj.find(name);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<int> NidFromCrv(std::string_view crv) {
  if (crv == "P-256") return NID_X9_62_prime256v1;
  if (crv == "P-384") return NID_secp384r1;
  if (crv == "P-521") return NID_secp521r1;
  return std::nullopt;
}

std::optional<std::vector<std::uint8_t>> DecodeMember(const std::optional<std::string>& member) {
  if (!member || member->empty()) {
    return std::nullopt;
  }
  return agentcard::common::Base64UrlDecode(*member);
}

BnPtr ToBignum(const std::vector<std::uint8_t>& bytes) {
  return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), &BN_free);
}

EvpPkeyPtr RsaJwkToEvpPkey(const Jwk& jwk) {
  EvpPkeyPtr none(nullptr, &EVP_PKEY_free);

  const auto n = DecodeMember(jwk.n);
  const auto e = DecodeMember(jwk.e);
  if (!n || !e) {
    return none;
  }

  BnPtr bn_n = ToBignum(*n);
  BnPtr bn_e = ToBignum(*e);
  if (!bn_n || !bn_e) {
    return none;
  }

  RsaPtr rsa(RSA_new(), &RSA_free);
  if (!rsa) {
    return none;
  }

  // RSA_set0_key takes ownership of both numbers on success.
  if (RSA_set0_key(rsa.get(), bn_n.get(), bn_e.get(), nullptr) != 1) {
    return none;
  }
  bn_n.release();
  bn_e.release();

  EvpPkeyPtr pkey(EVP_PKEY_new(), &EVP_PKEY_free);
  if (!pkey || EVP_PKEY_set1_RSA(pkey.get(), rsa.get()) != 1) {
    return none;
  }
  return pkey;
}

EvpPkeyPtr EcJwkToEvpPkey(const Jwk& jwk) {
  EvpPkeyPtr none(nullptr, &EVP_PKEY_free);

  const auto nid = jwk.crv ? NidFromCrv(*jwk.crv) : std::nullopt;
  if (!nid) {
    return none;
  }

  const auto x = DecodeMember(jwk.x);
  const auto y = DecodeMember(jwk.y);
  if (!x || !y) {
    return none;
  }

  EcKeyPtr ec(EC_KEY_new_by_curve_name(*nid), &EC_KEY_free);
  if (!ec) {
    return none;
  }

  const EC_GROUP* group = EC_KEY_get0_group(ec.get());
  if (!group) {
    return none;
  }

  BnPtr bn_x = ToBignum(*x);
  BnPtr bn_y = ToBignum(*y);
  if (!bn_x || !bn_y) {
    return none;
  }

  EcPointPtr point(EC_POINT_new(group), &EC_POINT_free);
  if (!point) {
    return none;
  }

  // Also rejects points that are not on the curve.
  if (EC_POINT_set_affine_coordinates(group, point.get(), bn_x.get(), bn_y.get(), nullptr) != 1) {
    return none;
  }

  if (EC_KEY_set_public_key(ec.get(), point.get()) != 1) {
    return none;
  }

  EvpPkeyPtr pkey(EVP_PKEY_new(), &EVP_PKEY_free);
  if (!pkey || EVP_PKEY_set1_EC_KEY(pkey.get(), ec.get()) != 1) {
    return none;
  }
  return pkey;
}

EvpPkeyPtr OkpJwkToEvpPkey(const Jwk& jwk) {
  EvpPkeyPtr none(nullptr, &EVP_PKEY_free);
  if (!jwk.crv) {
    return none;
  }

  int type = 0;
  if (*jwk.crv == "Ed25519") {
    type = EVP_PKEY_ED25519;
  } else if (*jwk.crv == "Ed448") {
    type = EVP_PKEY_ED448;
  } else {
    return none;
  }

  const auto x = DecodeMember(jwk.x);
  if (!x) {
    return none;
  }

  return EvpPkeyPtr(EVP_PKEY_new_raw_public_key(type, nullptr, x->data(), x->size()), &EVP_PKEY_free);
}

} // namespace

std::optional<JwksDocument> ParseJwks(std::string_view jwks_json) {
  JwksDocument out;

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(jwks_json.begin(), jwks_json.end());
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }

  if (!j.is_object() || !j.contains("keys") || !j["keys"].is_array()) {
    return std::nullopt;
  }

  for (const auto& k : j["keys"]) {
    if (!k.is_object()) continue;

    auto kty = ReadString(k, "kty");
    if (!kty || kty->empty()) {
      continue;
    }

    Jwk key;
    key.kty = std::move(*kty);
    key.kid = ReadString(k, "kid");
    key.alg = ReadString(k, "alg");
    key.use = ReadString(k, "use");
    key.crv = ReadString(k, "crv");
    key.n = ReadString(k, "n");
    key.e = ReadString(k, "e");
    key.x = ReadString(k, "x");
    key.y = ReadString(k, "y");
    out.keys.push_back(std::move(key));
  }

  if (out.keys.empty()) {
    return std::nullopt;
  }

  return out;
}

std::optional<std::vector<std::uint8_t>> JwkToPublicKeyDer(const Jwk& jwk) {
  EvpPkeyPtr pkey(nullptr, &EVP_PKEY_free);
  if (jwk.kty == "RSA") {
    pkey = RsaJwkToEvpPkey(jwk);
  } else if (jwk.kty == "EC") {
    pkey = EcJwkToEvpPkey(jwk);
  } else if (jwk.kty == "OKP") {
    pkey = OkpJwkToEvpPkey(jwk);
  }
  if (!pkey) {
    return std::nullopt;
  }

  const int len = i2d_PUBKEY(pkey.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(static_cast<std::size_t>(len));
  unsigned char* p = out.data();
  if (i2d_PUBKEY(pkey.get(), &p) != len) {
    return std::nullopt;
  }
  return out;
}

bool JwkFitsAlgorithm(const Jwk& jwk, JwsAlgorithm alg) {
  switch (alg) {
    case JwsAlgorithm::RS256:
    case JwsAlgorithm::RS384:
    case JwsAlgorithm::RS512:
    case JwsAlgorithm::PS256:
    case JwsAlgorithm::PS384:
    case JwsAlgorithm::PS512:
      return jwk.kty == "RSA";
    case JwsAlgorithm::ES256:
      return jwk.kty == "EC" && jwk.crv == "P-256";
    case JwsAlgorithm::ES384:
      return jwk.kty == "EC" && jwk.crv == "P-384";
    case JwsAlgorithm::ES512:
      return jwk.kty == "EC" && jwk.crv == "P-521";
    case JwsAlgorithm::EdDSA:
      return jwk.kty == "OKP" && (jwk.crv == "Ed25519" || jwk.crv == "Ed448");
  }
  return false;
}

std::vector<const Jwk*> SelectCandidateKeys(const JwksDocument& jwks,
                                            JwsAlgorithm alg,
                                            const std::optional<std::string>& kid) {
  const std::string_view alg_name = agentcard::validation::ToString(alg);

  std::vector<const Jwk*> out;
  for (const auto& key : jwks.keys) {
    if (kid && key.kid != kid) continue;
    if (key.alg && *key.alg != alg_name) continue;
    if (key.use && *key.use != "sig") continue;
    if (!JwkFitsAlgorithm(key, alg)) continue;
    out.push_back(&key);
  }
  return out;
}

} // namespace agentcard::signatures
