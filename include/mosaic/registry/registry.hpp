#pragma once

#include <mosaic/registry/artifact_store.hpp>
#include <mosaic/registry/delegation_table.hpp>
#include <mosaic/registry/identity_ledger.hpp>
#include <mosaic/registry/mint_gate.hpp>
#include <mosaic/registry/receiver.hpp>
#include <mosaic/registry/royalty_policy.hpp>
#include <mosaic/registry/single_flight.hpp>
#include <mosaic/registry/types.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace mosaic::registry {

struct registry_config final {
  mosaic::schema::address_t controller{};
  std::string base_uri;
  // Zero means "pay the controller".
  mosaic::schema::address_t royalty_payee{};
  uint16_t royalty_basis_points{500};
};

/// Everything a registry persists. Copyable so a call can checkpoint it.
struct registry_state final {
  mosaic::schema::address_t controller{};
  std::string base_uri;
  identity_ledger ledger;
  delegation_table delegations;
  artifact_store artifacts;
  mint_gate minting;
  royalty_policy royalty;
};

registry_state make_registry_state(const registry_config& config);

/// Layered-artifact registry.
///
/// Every mutating entry point is serialized through a single-flight guard and
/// is atomic: on failure no state changes and no events are published. On
/// success the call's events are appended to the pending buffer, drained with
/// take_events().
class registry final {
 public:
  explicit registry(const registry_config& config);
  explicit registry(registry_state state);

  /// Issue the next id to `to`. `context.value` is the payment.
  outcome<mosaic::schema::token_id_t> mint(
      const call_context& context,
      const mosaic::schema::address_t& to,
      const mosaic::schema::hash32_t& trait_commitment,
      uint32_t layer_count);

  /// Grant or revoke (zero spender) the single-spender approval of an id.
  mosaic::schema::registry_error_code approve(
      const call_context& context,
      const mosaic::schema::address_t& spender,
      mosaic::schema::token_id_t token_id);

  mosaic::schema::registry_error_code set_approval_for_all(
      const call_context& context,
      const mosaic::schema::address_t& operator_id,
      bool approved);

  mosaic::schema::registry_error_code transfer(
      const call_context& context,
      const mosaic::schema::address_t& from,
      const mosaic::schema::address_t& to,
      mosaic::schema::token_id_t token_id);

  /// Transfer, then ask the recipient's receiver hook (if any) to accept.
  mosaic::schema::registry_error_code safe_transfer(
      const call_context& context,
      const mosaic::schema::address_t& from,
      const mosaic::schema::address_t& to,
      mosaic::schema::token_id_t token_id);

  mosaic::schema::registry_error_code configure_royalty(
      const call_context& context,
      const mosaic::schema::address_t& payee,
      uint16_t basis_points);

  mosaic::schema::registry_error_code update_base_uri(
      const call_context& context,
      const std::string& base_uri);

  std::string_view name() const;
  std::string_view symbol() const;
  const std::string& base_uri() const;
  const mosaic::schema::address_t& controller() const;
  uint64_t total_minted() const;
  uint64_t remaining_supply() const;
  mosaic::schema::token_id_t next_token_id() const;
  const mosaic::schema::amount_t& collected() const;
  const mosaic::schema::royalty_state_t& royalty() const;
  std::pair<mosaic::schema::address_t, mosaic::schema::amount_t> royalty_info(
      const mosaic::schema::amount_t& sale_price) const;
  outcome<mosaic::schema::artifact_record_t> artifact(
      mosaic::schema::token_id_t token_id) const;
  mosaic::schema::block_height_t cooldown_remaining(
      const mosaic::schema::address_t& caller,
      mosaic::schema::block_height_t now) const;
  outcome<uint64_t> balance_of(const mosaic::schema::address_t& holder) const;
  outcome<mosaic::schema::address_t> owner_of(
      mosaic::schema::token_id_t token_id) const;
  outcome<mosaic::schema::address_t> get_approved(
      mosaic::schema::token_id_t token_id) const;
  bool is_approved_for_all(const mosaic::schema::address_t& holder,
                           const mosaic::schema::address_t& operator_id) const;
  bool supports_interface(uint32_t interface_id) const;

  /// Hooks are not part of the persisted state.
  void register_receiver(const mosaic::schema::address_t& account,
                         std::shared_ptr<artifact_receiver> receiver);
  void unregister_receiver(const mosaic::schema::address_t& account);

  std::vector<mosaic::schema::registry_event_t> take_events();
  const registry_state& state() const;

 private:
  std::shared_ptr<artifact_receiver> find_receiver(
      const mosaic::schema::address_t& account) const;
  mosaic::schema::registry_error_code notify_receiver(
      const std::shared_ptr<artifact_receiver>& receiver,
      registry_state& checkpoint,
      const mosaic::schema::address_t& operator_id,
      const std::optional<mosaic::schema::address_t>& from,
      mosaic::schema::token_id_t token_id);
  void publish(event_buffer_t& events);

  registry_state state_;
  single_flight in_flight_;
  event_buffer_t pending_events_;
  std::map<mosaic::schema::address_t, std::shared_ptr<artifact_receiver>>
      receivers_;
};

}  // namespace mosaic::registry
