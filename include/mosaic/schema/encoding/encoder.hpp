#pragma once
#include <mosaic/schema/primitives.hpp>
#include <optional>
#include <span>

namespace mosaic::schema::encoding {

// Codec facade selected at build time by tag. Everything that is hashed,
// persisted or sent over the wire goes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  mosaic::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, mosaic::schema::bytes_t& out);

  template <typename T>
  T decode(const mosaic::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const mosaic::schema::bytes_view_t& bytes);
};

}  // namespace mosaic::schema::encoding
