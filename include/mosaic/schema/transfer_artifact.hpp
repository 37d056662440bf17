#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: transfer artifact.
// `safe` asks the registry to consult the recipient's receiver hook.
namespace mosaic::schema {

template <uint16_t Version>
struct transfer_artifact;

template <>
struct transfer_artifact<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  token_id_t token_id{};
  bool safe{};
};

using transfer_artifact_t = transfer_artifact<1>;

}  // namespace mosaic::schema
