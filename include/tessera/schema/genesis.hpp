#pragma once

#include <tessera/schema/primitives.hpp>

#include <string>

// Schema type: genesis.
// Token workflow: construction parameters; the whole initial supply is
// credited to the creator, who also becomes the owner.
namespace tessera::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  amount_t initial_supply{0};
  amount_t max_supply{0};
  account_id_t creator{};
};

using genesis_t = genesis<1>;

}  // namespace tessera::schema
