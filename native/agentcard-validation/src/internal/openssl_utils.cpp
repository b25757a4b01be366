#include "openssl_utils.h"

#include <string>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace agentcard::internal {

namespace {
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

constexpr int kMinRsaModulusBits = 2048;

int ExpectedCurveNid(validation::JwsAlgorithm alg) {
  switch (alg) {
    case validation::JwsAlgorithm::ES256: return NID_X9_62_prime256v1;
    case validation::JwsAlgorithm::ES384: return NID_secp384r1;
    case validation::JwsAlgorithm::ES512: return NID_secp521r1;
    default: return NID_undef;
  }
}

bool DigestVerify(EVP_PKEY* key,
                  const EVP_MD* md,
                  std::span<const std::uint8_t> signing_input,
                  std::span<const std::uint8_t> signature,
                  int padding) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, md, nullptr, key) != 1) return false;
  if (padding == RSA_PKCS1_PSS_PADDING) {
    // RFC 7518 section 3.5: MGF1 with the same hash, salt as long as the hash.
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1) return false;
    if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, md) != 1) return false;
    if (EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1) return false;
  } else if (padding == RSA_PKCS1_PADDING) {
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1) return false;
  }

  if (EVP_DigestVerifyUpdate(ctx.get(), signing_input.data(), signing_input.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;
}

} // namespace

EvpPkeyPtr LoadPublicKeyFromDer(std::span<const std::uint8_t> der) {
  if (der.empty()) {
    return EvpPkeyPtr(nullptr, &EVP_PKEY_free);
  }

  const unsigned char* p = der.data();
  EvpPkeyPtr key(d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size())), &EVP_PKEY_free);
  // Trailing bytes after the SubjectPublicKeyInfo are rejected.
  if (key && p != der.data() + der.size()) {
    key.reset();
  }
  return key;
}

std::optional<std::vector<std::uint8_t>> JoseEcdsaRawToDer(std::span<const std::uint8_t> jose_raw_sig) {
  if (jose_raw_sig.empty() || jose_raw_sig.size() % 2 != 0) {
    return std::nullopt;
  }

  const int half = static_cast<int>(jose_raw_sig.size() / 2);
  BnPtr r(BN_bin2bn(jose_raw_sig.data(), half, nullptr), &BN_free);
  BnPtr s(BN_bin2bn(jose_raw_sig.data() + half, half, nullptr), &BN_free);
  EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
  if (!r || !s || !sig) {
    return std::nullopt;
  }

  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // The signature object owns r and s from here on.
  r.release();
  s.release();

  const int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != len) {
    return std::nullopt;
  }
  return der;
}

std::size_t EcdsaComponentSize(validation::JwsAlgorithm alg) {
  switch (alg) {
    case validation::JwsAlgorithm::ES256: return 32;
    case validation::JwsAlgorithm::ES384: return 48;
    case validation::JwsAlgorithm::ES512: return 66;
    default: return 0;
  }
}

const EVP_MD* DigestForAlgorithm(validation::JwsAlgorithm alg) {
  switch (alg) {
    case validation::JwsAlgorithm::RS256:
    case validation::JwsAlgorithm::PS256:
    case validation::JwsAlgorithm::ES256:
      return EVP_sha256();
    case validation::JwsAlgorithm::RS384:
    case validation::JwsAlgorithm::PS384:
    case validation::JwsAlgorithm::ES384:
      return EVP_sha384();
    case validation::JwsAlgorithm::RS512:
    case validation::JwsAlgorithm::PS512:
    case validation::JwsAlgorithm::ES512:
      return EVP_sha512();
    case validation::JwsAlgorithm::EdDSA:
      return nullptr;
  }
  return nullptr;
}

std::string CheckKeyFitsAlgorithm(EVP_PKEY* key, validation::JwsAlgorithm alg) {
  const int type = EVP_PKEY_base_id(key);

  switch (alg) {
    case validation::JwsAlgorithm::RS256:
    case validation::JwsAlgorithm::RS384:
    case validation::JwsAlgorithm::RS512:
    case validation::JwsAlgorithm::PS256:
    case validation::JwsAlgorithm::PS384:
    case validation::JwsAlgorithm::PS512: {
      if (type != EVP_PKEY_RSA) {
        return "key is not an RSA key";
      }
      const int bits = EVP_PKEY_bits(key);
      if (bits < kMinRsaModulusBits) {
        return std::string(validation::ToString(alg)) + " requires key modulusLength to be " +
               std::to_string(kMinRsaModulusBits) + " bits or larger (got " + std::to_string(bits) + ")";
      }
      return {};
    }
    case validation::JwsAlgorithm::ES256:
    case validation::JwsAlgorithm::ES384:
    case validation::JwsAlgorithm::ES512: {
      if (type != EVP_PKEY_EC) {
        return "key is not an EC key";
      }
      const EC_KEY* ec = EVP_PKEY_get0_EC_KEY(key);
      const EC_GROUP* group = ec ? EC_KEY_get0_group(ec) : nullptr;
      if (!group || EC_GROUP_get_curve_name(group) != ExpectedCurveNid(alg)) {
        return std::string("EC key curve does not match ") + std::string(validation::ToString(alg));
      }
      return {};
    }
    case validation::JwsAlgorithm::EdDSA:
      if (type != EVP_PKEY_ED25519 && type != EVP_PKEY_ED448) {
        return "key is not an Ed25519 or Ed448 key";
      }
      return {};
  }
  return "unsupported algorithm";
}

bool VerifyPkcs1(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature) {
  return DigestVerify(key, md, signing_input, signature, RSA_PKCS1_PADDING);
}

bool VerifyPss(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature) {
  return DigestVerify(key, md, signing_input, signature, RSA_PKCS1_PSS_PADDING);
}

bool VerifyEcdsa(EVP_PKEY* key, const EVP_MD* md, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> jose_raw_sig) {
  auto der = JoseEcdsaRawToDer(jose_raw_sig);
  if (!der) {
    return false;
  }
  return DigestVerify(key, md, signing_input, *der, 0);
}

bool VerifyEdDsa(EVP_PKEY* key, std::span<const std::uint8_t> signing_input, std::span<const std::uint8_t> signature) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  // EdDSA is a one-shot scheme: no digest, no update/final split.
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1) return false;
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), signing_input.data(), signing_input.size()) == 1;
}

} // namespace agentcard::internal
