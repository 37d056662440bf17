#pragma once
#include <mosaic/schema/primitives.hpp>
#include <string_view>

namespace mosaic::blake3 {

mosaic::schema::hash32_t hash(const std::string_view& str);
mosaic::schema::hash32_t hash(const mosaic::schema::bytes_view_t& bytes);

}  // namespace mosaic::blake3
