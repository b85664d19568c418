#pragma once

#include <tessera/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Ordered record of every finalized transaction: raw bytes plus the result
// code it produced.
namespace tessera::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t height{};
  uint32_t index{};
  uint32_t code{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace tessera::schema
