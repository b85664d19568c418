#include <tessera/blake3/hash.hpp>
#include <tessera/crypto/identity.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace tessera::crypto {

tessera::schema::account_id_t account_of(
    const tessera::schema::signer_id_t& signer) {
  return std::visit(
      overloaded{[](const tessera::schema::ed25519_signer_id& value) {
                   return tessera::blake3::hash(
                       tessera::schema::bytes_view_t{value.public_key});
                 },
                 [](const tessera::schema::secp256k1_signer_id& value) {
                   return tessera::blake3::hash(
                       tessera::schema::bytes_view_t{value.public_key});
                 },
                 [](const tessera::schema::named_signer_t& value) {
                   return tessera::schema::account_id_t{value};
                 }},
      signer);
}

tessera::schema::bytes_t signing_bytes(
    const tessera::schema::transaction_t& transaction) {
  auto encoder = tessera::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{transaction.version, transaction.chain_id,
                                   transaction.nonce, transaction.signer,
                                   transaction.payload});
}

}  // namespace tessera::crypto
