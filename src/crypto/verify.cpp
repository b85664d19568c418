#include <tessera/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace tessera::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const tessera::schema::bytes_view_t& signature,
                   const tessera::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

evp_pkey_ptr make_ed25519_key(
    const tessera::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(
    const tessera::schema::secp256k1_signer_id& signer) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_key, EVP_PKEY_free};
}

// Signatures are [r || s || v]; v is a recovery id (0..3, or 27..30 in the
// legacy offset form) and is not needed for verification against a known key.
std::optional<std::vector<uint8_t>> secp256k1_der_signature(
    const tessera::schema::secp256k1_signature_t& signature) {
  auto recovery = signature[64];
  if (!(recovery <= 3 || (recovery >= 27 && recovery <= 30))) {
    return std::nullopt;
  }

  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!sig || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // Ownership moved into sig.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto length = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (length <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(length));
  auto* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != length) {
    return std::nullopt;
  }
  return der;
}

bool verify_ed25519(const tessera::schema::bytes_view_t& message,
                    const tessera::schema::ed25519_signer_id& signer,
                    const tessera::schema::ed25519_signature_t& signature) {
  auto key = make_ed25519_key(signer);
  if (!key) {
    return false;
  }
  return digest_verify(key.get(), nullptr,
                       tessera::schema::bytes_view_t{signature}, message);
}

bool verify_secp256k1(const tessera::schema::bytes_view_t& message,
                      const tessera::schema::secp256k1_signer_id& signer,
                      const tessera::schema::secp256k1_signature_t& signature) {
  auto der = secp256k1_der_signature(signature);
  if (!der.has_value()) {
    return false;
  }
  auto key = make_secp256k1_key(signer);
  if (!key) {
    return false;
  }
  return digest_verify(key.get(), EVP_sha256(),
                       tessera::schema::bytes_view_t{der.value()}, message);
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const tessera::schema::bytes_view_t& message,
                      const tessera::schema::signer_id_t& signer,
                      const tessera::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const tessera::schema::ed25519_signer_id& value) {
            const auto* sig =
                std::get_if<tessera::schema::ed25519_signature_t>(&signature);
            return sig != nullptr && verify_ed25519(message, value, *sig);
          },
          [&](const tessera::schema::secp256k1_signer_id& value) {
            const auto* sig =
                std::get_if<tessera::schema::secp256k1_signature_t>(
                    &signature);
            return sig != nullptr && verify_secp256k1(message, value, *sig);
          },
          [](const tessera::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace tessera::crypto
