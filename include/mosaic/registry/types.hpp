#pragma once

#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/registry_error_code.hpp>
#include <mosaic/schema/registry_event.hpp>
#include <vector>

namespace mosaic::registry {

using event_buffer_t = std::vector<mosaic::schema::registry_event_t>;

/// Who is calling, what they attached, and when.
struct call_context final {
  mosaic::schema::address_t caller{};
  mosaic::schema::amount_t value{};
  mosaic::schema::block_height_t now{};
};

/// Value of a registry call plus the error code that replaces it on failure.
template <typename T>
struct outcome final {
  mosaic::schema::registry_error_code code{
      mosaic::schema::registry_error_code::ok};
  T value{};

  bool ok() const { return code == mosaic::schema::registry_error_code::ok; }
};

template <typename T>
outcome<T> fail(const mosaic::schema::registry_error_code code) {
  return outcome<T>{.code = code, .value = T{}};
}

template <typename T>
outcome<T> succeed(T value) {
  return outcome<T>{.code = mosaic::schema::registry_error_code::ok,
                    .value = std::move(value)};
}

}  // namespace mosaic::registry
