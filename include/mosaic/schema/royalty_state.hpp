#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: royalty state.
// Single payee and basis-point rate consulted by marketplaces.
namespace mosaic::schema {

template <uint16_t Version>
struct royalty_state;

template <>
struct royalty_state<1> final {
  uint16_t version{1};
  address_t payee{};
  uint16_t basis_points{};
};

using royalty_state_t = royalty_state<1>;

}  // namespace mosaic::schema
