#pragma once

#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/royalty_state.hpp>
#include <string>

// Schema type: registry info.
// Scalar read surface of the registry returned by /registry/info.
namespace mosaic::schema {

template <uint16_t Version>
struct registry_info;

template <>
struct registry_info<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  std::string base_uri;
  address_t controller{};
  uint64_t total_minted{};
  uint64_t remaining_supply{};
  token_id_t next_token_id{};
  amount_t collected{};
  royalty_state_t royalty{};
};

using registry_info_t = registry_info<1>;

}  // namespace mosaic::schema
