#pragma once

#include <tessera/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tessera::testing {

inline tessera::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tessera::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Account id with only the first byte set; seed 0 is the null account.
inline tessera::schema::account_id_t make_account(const uint8_t seed) {
  auto account = tessera::schema::account_id_t{};
  account[0] = seed;
  return account;
}

inline tessera::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return tessera::schema::signer_id_t{make_account(seed)};
}

inline tessera::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = tessera::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline tessera::schema::amount_t amount(const uint64_t value) {
  return tessera::schema::amount_t{value};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tessera::testing
