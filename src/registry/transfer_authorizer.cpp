#include <mosaic/registry/transfer_authorizer.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

transfer_authorizer::transfer_authorizer(identity_ledger& ledger,
                                         delegation_table& delegations,
                                         event_buffer_t& events)
    : ledger_{ledger}, delegations_{delegations}, events_{events} {}

bool transfer_authorizer::is_authorized(const address_t& caller,
                                        const address_t& holder,
                                        const token_id_t token_id) const {
  if (caller == holder) {
    return true;
  }
  auto approved = delegations_.get_approved(token_id, ledger_);
  if (approved && !is_zero_address(*approved) && *approved == caller) {
    return true;
  }
  return delegations_.is_approved_for_all(holder, caller);
}

registry_error_code transfer_authorizer::transfer(const address_t& caller,
                                                  const address_t& from,
                                                  const address_t& to,
                                                  const token_id_t token_id) {
  auto owner = ledger_.owner_of(token_id);
  if (!owner) {
    return registry_error_code::invalid_token;
  }
  if (*owner != from) {
    return registry_error_code::transfer_from_wrong_owner;
  }
  if (is_zero_address(to)) {
    return registry_error_code::transfer_to_zero;
  }
  if (!is_authorized(caller, from, token_id)) {
    return registry_error_code::caller_not_owner_nor_approved;
  }

  delegations_.clear_approval(token_id);
  ledger_.set_owner(token_id, to);
  events_.emplace_back(
      transfer_event{.from = from, .to = to, .token_id = token_id});
  return registry_error_code::ok;
}

registry_error_code transfer_authorizer::issue(const address_t& to,
                                               const token_id_t token_id) {
  if (is_zero_address(to)) {
    return registry_error_code::mint_to_zero;
  }
  ledger_.set_owner(token_id, to);
  events_.emplace_back(
      transfer_event{.from = std::nullopt, .to = to, .token_id = token_id});
  return registry_error_code::ok;
}

}  // namespace mosaic::registry
