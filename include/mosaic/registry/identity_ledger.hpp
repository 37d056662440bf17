#pragma once

#include <mosaic/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <optional>

namespace mosaic::registry {

/// Artifact id -> holder, and holder -> number of artifacts held.
class identity_ledger final {
 public:
  identity_ledger() = default;
  /// Rebuild from persisted owners; counts are derived.
  explicit identity_ledger(
      const std::map<mosaic::schema::token_id_t, mosaic::schema::address_t>&
          owners);

  /// nullopt when the id was never minted.
  std::optional<mosaic::schema::address_t> owner_of(
      mosaic::schema::token_id_t token_id) const;

  /// nullopt for the null identity.
  std::optional<uint64_t> balance_of(
      const mosaic::schema::address_t& holder) const;

  bool exists(mosaic::schema::token_id_t token_id) const;

  /// Unchecked. Callers validate eligibility first.
  void set_owner(mosaic::schema::token_id_t token_id,
                 const mosaic::schema::address_t& new_owner);

  const std::map<mosaic::schema::token_id_t, mosaic::schema::address_t>&
  owners() const;

 private:
  std::map<mosaic::schema::token_id_t, mosaic::schema::address_t> owners_;
  std::map<mosaic::schema::address_t, uint64_t> balances_;
};

}  // namespace mosaic::registry
