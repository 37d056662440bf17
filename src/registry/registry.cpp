#include <mosaic/registry/constants.hpp>
#include <mosaic/registry/registry.hpp>
#include <mosaic/registry/transfer_authorizer.hpp>
#include <iterator>
#include <utility>

using namespace mosaic::schema;

namespace mosaic::registry {

registry_state make_registry_state(const registry_config& config) {
  auto payee = is_zero_address(config.royalty_payee) ? config.controller
                                                     : config.royalty_payee;
  return registry_state{
      .controller = config.controller,
      .base_uri = config.base_uri,
      .ledger = identity_ledger{},
      .delegations = delegation_table{},
      .artifacts = artifact_store{},
      .minting = mint_gate{},
      .royalty = royalty_policy{royalty_state_t{
          .payee = payee, .basis_points = config.royalty_basis_points}}};
}

registry::registry(const registry_config& config)
    : state_{make_registry_state(config)} {}

registry::registry(registry_state state) : state_{std::move(state)} {}

outcome<token_id_t> registry::mint(const call_context& context,
                                   const address_t& to,
                                   const hash32_t& trait_commitment,
                                   const uint32_t layer_count) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return fail<token_id_t>(registry_error_code::reentrancy);
  }

  auto receiver = find_receiver(to);
  auto checkpoint = receiver ? std::optional<registry_state>{state_}
                             : std::optional<registry_state>{};
  auto events = event_buffer_t{};
  auto authorizer =
      transfer_authorizer{state_.ledger, state_.delegations, events};
  auto minted = state_.minting.mint(
      context,
      mint_request{.to = to,
                   .trait_commitment = trait_commitment,
                   .layer_count = layer_count},
      state_.artifacts, authorizer, events);
  if (!minted.ok()) {
    return minted;
  }

  if (receiver) {
    auto accepted = notify_receiver(receiver, *checkpoint, context.caller,
                                    std::nullopt, minted.value);
    if (accepted != registry_error_code::ok) {
      return fail<token_id_t>(accepted);
    }
  }
  publish(events);
  return minted;
}

registry_error_code registry::approve(const call_context& context,
                                      const address_t& spender,
                                      const token_id_t token_id) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }
  auto events = event_buffer_t{};
  auto result = state_.delegations.approve(context.caller, token_id, spender,
                                           state_.ledger, events);
  if (result == registry_error_code::ok) {
    publish(events);
  }
  return result;
}

registry_error_code registry::set_approval_for_all(const call_context& context,
                                                   const address_t& operator_id,
                                                   const bool approved) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }
  auto events = event_buffer_t{};
  auto result = state_.delegations.set_approval_for_all(
      context.caller, operator_id, approved, events);
  if (result == registry_error_code::ok) {
    publish(events);
  }
  return result;
}

registry_error_code registry::transfer(const call_context& context,
                                       const address_t& from,
                                       const address_t& to,
                                       const token_id_t token_id) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }
  auto events = event_buffer_t{};
  auto result =
      transfer_authorizer{state_.ledger, state_.delegations, events}.transfer(
          context.caller, from, to, token_id);
  if (result == registry_error_code::ok) {
    publish(events);
  }
  return result;
}

registry_error_code registry::safe_transfer(const call_context& context,
                                            const address_t& from,
                                            const address_t& to,
                                            const token_id_t token_id) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }

  auto receiver = find_receiver(to);
  auto checkpoint = receiver ? std::optional<registry_state>{state_}
                             : std::optional<registry_state>{};
  auto events = event_buffer_t{};
  auto result =
      transfer_authorizer{state_.ledger, state_.delegations, events}.transfer(
          context.caller, from, to, token_id);
  if (result != registry_error_code::ok) {
    return result;
  }

  if (receiver) {
    result = notify_receiver(receiver, *checkpoint, context.caller, from,
                             token_id);
    if (result != registry_error_code::ok) {
      return result;
    }
  }
  publish(events);
  return registry_error_code::ok;
}

registry_error_code registry::configure_royalty(const call_context& context,
                                                const address_t& payee,
                                                const uint16_t basis_points) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }
  auto events = event_buffer_t{};
  auto result = state_.royalty.configure(context.caller, state_.controller,
                                         payee, basis_points, events);
  if (result == registry_error_code::ok) {
    publish(events);
  }
  return result;
}

registry_error_code registry::update_base_uri(const call_context& context,
                                              const std::string& base_uri) {
  auto guard = in_flight_.try_enter();
  if (!guard) {
    return registry_error_code::reentrancy;
  }
  if (context.caller != state_.controller) {
    return registry_error_code::not_controller;
  }
  auto previous = std::exchange(state_.base_uri, base_uri);
  auto events = event_buffer_t{};
  events.emplace_back(base_uri_changed_event{.previous = std::move(previous),
                                             .current = base_uri});
  publish(events);
  return registry_error_code::ok;
}

std::string_view registry::name() const {
  return kName;
}

std::string_view registry::symbol() const {
  return kSymbol;
}

const std::string& registry::base_uri() const {
  return state_.base_uri;
}

const address_t& registry::controller() const {
  return state_.controller;
}

uint64_t registry::total_minted() const {
  return state_.minting.total_minted();
}

uint64_t registry::remaining_supply() const {
  return state_.minting.remaining_supply();
}

token_id_t registry::next_token_id() const {
  return state_.minting.next_token_id();
}

const amount_t& registry::collected() const {
  return state_.minting.collected();
}

const royalty_state_t& registry::royalty() const {
  return state_.royalty.state();
}

std::pair<address_t, amount_t> registry::royalty_info(
    const amount_t& sale_price) const {
  return state_.royalty.royalty_info(sale_price);
}

outcome<artifact_record_t> registry::artifact(const token_id_t token_id) const {
  auto record = state_.artifacts.find(token_id);
  if (!record) {
    return fail<artifact_record_t>(registry_error_code::invalid_token);
  }
  return succeed(*record);
}

block_height_t registry::cooldown_remaining(const address_t& caller,
                                            const block_height_t now) const {
  return state_.minting.cooldown_remaining(caller, now);
}

outcome<uint64_t> registry::balance_of(const address_t& holder) const {
  auto balance = state_.ledger.balance_of(holder);
  if (!balance) {
    return fail<uint64_t>(registry_error_code::zero_address);
  }
  return succeed(*balance);
}

outcome<address_t> registry::owner_of(const token_id_t token_id) const {
  auto owner = state_.ledger.owner_of(token_id);
  if (!owner) {
    return fail<address_t>(registry_error_code::invalid_token);
  }
  return succeed(*owner);
}

outcome<address_t> registry::get_approved(const token_id_t token_id) const {
  auto approved = state_.delegations.get_approved(token_id, state_.ledger);
  if (!approved) {
    return fail<address_t>(registry_error_code::invalid_token);
  }
  return succeed(*approved);
}

bool registry::is_approved_for_all(const address_t& holder,
                                   const address_t& operator_id) const {
  return state_.delegations.is_approved_for_all(holder, operator_id);
}

bool registry::supports_interface(const uint32_t interface_id) const {
  switch (interface_id) {
    case kInterfaceDiscoveryId:
    case kNonFungibleRegistryId:
    case kRegistryMetadataId:
    case kRoyaltyInfoId:
      return true;
    default:
      return false;
  }
}

void registry::register_receiver(const address_t& account,
                                 std::shared_ptr<artifact_receiver> receiver) {
  receivers_[account] = std::move(receiver);
}

void registry::unregister_receiver(const address_t& account) {
  receivers_.erase(account);
}

std::vector<registry_event_t> registry::take_events() {
  return std::exchange(pending_events_, event_buffer_t{});
}

const registry_state& registry::state() const {
  return state_;
}

std::shared_ptr<artifact_receiver> registry::find_receiver(
    const address_t& account) const {
  auto it = receivers_.find(account);
  if (it == std::end(receivers_)) {
    return nullptr;
  }
  return it->second;
}

registry_error_code registry::notify_receiver(
    const std::shared_ptr<artifact_receiver>& receiver,
    registry_state& checkpoint,
    const address_t& operator_id,
    const std::optional<address_t>& from,
    const token_id_t token_id) {
  auto accepted = false;
  try {
    accepted = receiver->on_artifact_received(operator_id, from, token_id);
  } catch (...) {
    state_ = std::move(checkpoint);
    throw;
  }
  if (!accepted) {
    state_ = std::move(checkpoint);
    return registry_error_code::unsafe_recipient;
  }
  return registry_error_code::ok;
}

void registry::publish(event_buffer_t& events) {
  pending_events_.insert(std::end(pending_events_),
                         std::make_move_iterator(std::begin(events)),
                         std::make_move_iterator(std::end(events)));
}

}  // namespace mosaic::registry
