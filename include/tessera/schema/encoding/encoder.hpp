#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tessera::schema::encoding {

/// Byte codec selected at build time by tag. Every persisted row, query
/// value, query key and transaction goes through one of these.
///
/// encode/decode treat failure as unrecoverable (the node only decodes bytes
/// it wrote itself); try_decode is for bytes that arrive from clients.
template <typename Library>
struct encoder {
  template <typename T>
  tessera::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tessera::schema::bytes_t& out);

  template <typename T>
  T decode(const tessera::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tessera::schema::bytes_view_t& bytes);
};

}  // namespace tessera::schema::encoding
