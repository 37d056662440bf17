#pragma once

#include <mosaic/registry/constants.hpp>
#include <mosaic/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace mosaic::testing {

inline mosaic::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = mosaic::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Distinct non-zero address per seed.
inline mosaic::schema::address_t make_address(const uint8_t seed) {
  auto out = mosaic::schema::address_t{};
  out[0] = 0xA0;
  out[31] = seed;
  return out;
}

inline mosaic::schema::amount_t mint_price() {
  return mosaic::registry::mint_price();
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

}  // namespace mosaic::testing
