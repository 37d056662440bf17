#pragma once

#include <mosaic/schema/primitives.hpp>
#include <string>

// Schema type: update base uri. Controller only.
namespace mosaic::schema {

template <uint16_t Version>
struct update_base_uri;

template <>
struct update_base_uri<1> final {
  uint16_t version{1};
  std::string base_uri;
};

using update_base_uri_t = update_base_uri<1>;

}  // namespace mosaic::schema
