#pragma once

#include <mosaic/schema/primitives.hpp>

// Schema type: artifact record.
// Immutable trait data bound to an artifact at issuance. Written exactly once.
namespace mosaic::schema {

template <uint16_t Version>
struct artifact_record;

template <>
struct artifact_record<1> final {
  uint16_t version{1};
  hash32_t trait_commitment{};
  uint32_t layer_count{};
  block_height_t issued_at{};
};

using artifact_record_t = artifact_record<1>;

}  // namespace mosaic::schema
