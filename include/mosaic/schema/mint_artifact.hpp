#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: mint artifact.
// Payable: the payment travels in transaction_t::value.
namespace mosaic::schema {

template <uint16_t Version>
struct mint_artifact;

template <>
struct mint_artifact<1> final {
  uint16_t version{1};
  address_t recipient{};
  hash32_t trait_commitment{};
  uint32_t layer_count{};
};

using mint_artifact_t = mint_artifact<1>;

}  // namespace mosaic::schema
