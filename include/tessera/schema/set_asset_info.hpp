#pragma once
#include <tessera/schema/primitives.hpp>
#include <string>

// Schema type: set asset info.
// Token workflow: replaces the opaque asset metadata pointer. Not blocked by
// the emergency stop.
namespace tessera::schema {

template <uint16_t Version>
struct set_asset_info;

template <>
struct set_asset_info<1> final {
  uint16_t version{1};
  std::string uri;
};

using set_asset_info_t = set_asset_info<1>;

}  // namespace tessera::schema
