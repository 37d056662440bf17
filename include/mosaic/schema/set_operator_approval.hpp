#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: set operator approval.
namespace mosaic::schema {

template <uint16_t Version>
struct set_operator_approval;

template <>
struct set_operator_approval<1> final {
  uint16_t version{1};
  address_t operator_id{};
  bool approved{};
};

using set_operator_approval_t = set_operator_approval<1>;

}  // namespace mosaic::schema
