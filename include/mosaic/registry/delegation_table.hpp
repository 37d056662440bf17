#pragma once

#include <mosaic/registry/identity_ledger.hpp>
#include <mosaic/registry/types.hpp>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace mosaic::registry {

using operator_grant_t =
    std::pair<mosaic::schema::address_t, mosaic::schema::address_t>;

/// Single-spender approvals per artifact and blanket operator approvals per
/// holder. Only granted operators are stored.
class delegation_table final {
 public:
  delegation_table() = default;
  delegation_table(
      std::map<mosaic::schema::token_id_t, mosaic::schema::address_t> approvals,
      std::set<operator_grant_t> operators);

  mosaic::schema::registry_error_code approve(
      const mosaic::schema::address_t& caller,
      mosaic::schema::token_id_t token_id,
      const mosaic::schema::address_t& spender,
      const identity_ledger& ledger,
      event_buffer_t& events);

  mosaic::schema::registry_error_code set_approval_for_all(
      const mosaic::schema::address_t& caller,
      const mosaic::schema::address_t& operator_id,
      bool approved,
      event_buffer_t& events);

  /// nullopt when the id was never minted; the zero address when nobody is
  /// approved.
  std::optional<mosaic::schema::address_t> get_approved(
      mosaic::schema::token_id_t token_id,
      const identity_ledger& ledger) const;

  bool is_approved_for_all(const mosaic::schema::address_t& holder,
                           const mosaic::schema::address_t& operator_id) const;

  void clear_approval(mosaic::schema::token_id_t token_id);

  const std::map<mosaic::schema::token_id_t, mosaic::schema::address_t>&
  approvals() const;
  const std::set<operator_grant_t>& operators() const;

 private:
  std::map<mosaic::schema::token_id_t, mosaic::schema::address_t> approvals_;
  std::set<operator_grant_t> operators_;
};

}  // namespace mosaic::registry
