#pragma once

#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/royalty_state.hpp>
#include <string>

// Schema type: registry meta.
// Singleton row holding the registry's scalar state: controller, base URI,
// counters, retained payments and royalty policy.
namespace mosaic::schema {

template <uint16_t Version>
struct registry_meta;

template <>
struct registry_meta<1> final {
  uint16_t version{1};
  address_t controller{};
  std::string base_uri;
  token_id_t next_token_id{};
  uint64_t total_minted{};
  amount_t collected{};
  royalty_state_t royalty{};
};

using registry_meta_t = registry_meta<1>;

}  // namespace mosaic::schema
