#pragma once

#include <mosaic/registry/artifact_store.hpp>
#include <mosaic/registry/transfer_authorizer.hpp>
#include <mosaic/registry/types.hpp>
#include <map>

namespace mosaic::registry {

struct mint_request final {
  mosaic::schema::address_t to{};
  mosaic::schema::hash32_t trait_commitment{};
  uint32_t layer_count{};
};

/// Admission control for issuance: supply cap, price, layer bound and the
/// per-caller cooldown. Payments are retained in full, overpayment included.
class mint_gate final {
 public:
  mint_gate() = default;
  mint_gate(mosaic::schema::token_id_t next_token_id,
            uint64_t total_minted,
            mosaic::schema::amount_t collected,
            std::map<mosaic::schema::address_t, mosaic::schema::block_height_t>
                last_mint);

  /// Checks run in order: zero recipient, supply, payment, layers, cooldown.
  /// Nothing is mutated unless every check passes.
  outcome<mosaic::schema::token_id_t> mint(const call_context& context,
                                           const mint_request& request,
                                           artifact_store& artifacts,
                                           transfer_authorizer& authorizer,
                                           event_buffer_t& events);

  /// Blocks left before the caller may mint again; 0 when never minted.
  /// Time starts at 1: a recorded last mint of 0 means never.
  mosaic::schema::block_height_t cooldown_remaining(
      const mosaic::schema::address_t& caller,
      mosaic::schema::block_height_t now) const;

  mosaic::schema::token_id_t next_token_id() const;
  uint64_t total_minted() const;
  uint64_t remaining_supply() const;
  const mosaic::schema::amount_t& collected() const;
  const std::map<mosaic::schema::address_t, mosaic::schema::block_height_t>&
  last_mint() const;

 private:
  mosaic::schema::token_id_t next_token_id_{1};
  uint64_t total_minted_{};
  mosaic::schema::amount_t collected_{};
  std::map<mosaic::schema::address_t, mosaic::schema::block_height_t>
      last_mint_;
};

}  // namespace mosaic::registry
