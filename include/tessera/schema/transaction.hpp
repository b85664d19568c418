#pragma once
#include <tessera/schema/approve.hpp>
#include <tessera/schema/burn.hpp>
#include <tessera/schema/mint.hpp>
#include <tessera/schema/pause.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/renounce_ownership.hpp>
#include <tessera/schema/set_asset_info.hpp>
#include <tessera/schema/transfer.hpp>
#include <tessera/schema/transfer_from.hpp>
#include <tessera/schema/transfer_ownership.hpp>
#include <tessera/schema/unpause.hpp>
#include <variant>

namespace tessera::schema {

using transaction_payload_t = std::variant<transfer_t,
                                           approve_t,
                                           transfer_from_t,
                                           mint_t,
                                           burn_t,
                                           pause_t,
                                           unpause_t,
                                           set_asset_info_t,
                                           transfer_ownership_t,
                                           renounce_ownership_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace tessera::schema
