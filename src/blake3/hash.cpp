#include <tessera/blake3/hash.hpp>

namespace tessera::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const tessera::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

tessera::schema::hash32_t hasher::finalize() const {
  auto output = tessera::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

tessera::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

tessera::schema::hash32_t hash(const tessera::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace tessera::blake3
