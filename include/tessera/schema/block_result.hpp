#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

namespace tessera::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  int64_t height{};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

}  // namespace tessera::schema
