#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: approve spender.
// A zero spender clears the single-spender delegation.
namespace mosaic::schema {

template <uint16_t Version>
struct approve_spender;

template <>
struct approve_spender<1> final {
  uint16_t version{1};
  address_t spender{};
  token_id_t token_id{};
};

using approve_spender_t = approve_spender<1>;

}  // namespace mosaic::schema
