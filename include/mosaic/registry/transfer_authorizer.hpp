#pragma once

#include <mosaic/registry/delegation_table.hpp>
#include <mosaic/registry/identity_ledger.hpp>
#include <mosaic/registry/types.hpp>

namespace mosaic::registry {

/// Moves artifacts between holders. Owns no state; bound per call to the
/// ledger, the delegation table and the call's event buffer.
class transfer_authorizer final {
 public:
  transfer_authorizer(identity_ledger& ledger,
                      delegation_table& delegations,
                      event_buffer_t& events);

  /// Holder, single-spender or operator of the holder.
  bool is_authorized(const mosaic::schema::address_t& caller,
                     const mosaic::schema::address_t& holder,
                     mosaic::schema::token_id_t token_id) const;

  mosaic::schema::registry_error_code transfer(
      const mosaic::schema::address_t& caller,
      const mosaic::schema::address_t& from,
      const mosaic::schema::address_t& to,
      mosaic::schema::token_id_t token_id);

  /// Issuance path: assigns an unowned id to its first holder.
  mosaic::schema::registry_error_code issue(
      const mosaic::schema::address_t& to,
      mosaic::schema::token_id_t token_id);

 private:
  identity_ledger& ledger_;
  delegation_table& delegations_;
  event_buffer_t& events_;
};

}  // namespace mosaic::registry
