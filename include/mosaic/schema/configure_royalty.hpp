#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: configure royalty. Controller only.
namespace mosaic::schema {

template <uint16_t Version>
struct configure_royalty;

template <>
struct configure_royalty<1> final {
  uint16_t version{1};
  address_t payee{};
  uint16_t basis_points{};
};

using configure_royalty_t = configure_royalty<1>;

}  // namespace mosaic::schema
