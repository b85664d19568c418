#pragma once
#include <blake3.h>
#include <tessera/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tessera::blake3 {

tessera::schema::hash32_t hash(const std::string_view& str);
tessera::schema::hash32_t hash(const tessera::schema::bytes_view_t& bytes);

/// Incremental BLAKE3 over a sequence of byte ranges.
class hasher final {
 public:
  hasher();

  hasher& update(const tessera::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  tessera::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace tessera::blake3
