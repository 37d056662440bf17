#pragma once

#include <mosaic/schema/primitives.hpp>
#include <optional>

namespace mosaic::registry {

/// Recipient-side hook consulted after a safe transfer or an issuance lands on
/// an account that registered one. Returning false rejects the artifact and
/// rolls the whole call back. Implementations may call back into the registry;
/// any mutating call made from here fails with reentrancy.
class artifact_receiver {
 public:
  virtual ~artifact_receiver() = default;

  virtual bool on_artifact_received(
      const mosaic::schema::address_t& operator_id,
      const std::optional<mosaic::schema::address_t>& from,
      mosaic::schema::token_id_t token_id) = 0;
};

}  // namespace mosaic::registry
