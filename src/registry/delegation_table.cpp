#include <mosaic/registry/delegation_table.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

delegation_table::delegation_table(std::map<token_id_t, address_t> approvals,
                                   std::set<operator_grant_t> operators)
    : approvals_{std::move(approvals)}, operators_{std::move(operators)} {}

registry_error_code delegation_table::approve(const address_t& caller,
                                              const token_id_t token_id,
                                              const address_t& spender,
                                              const identity_ledger& ledger,
                                              event_buffer_t& events) {
  auto holder = ledger.owner_of(token_id);
  if (!holder) {
    return registry_error_code::invalid_token;
  }
  if (caller != *holder && !is_approved_for_all(*holder, caller)) {
    return registry_error_code::caller_not_owner_nor_approved;
  }
  if (is_zero_address(spender)) {
    approvals_.erase(token_id);
  } else {
    approvals_[token_id] = spender;
  }
  events.emplace_back(approval_event{
      .holder = *holder, .spender = spender, .token_id = token_id});
  return registry_error_code::ok;
}

registry_error_code delegation_table::set_approval_for_all(
    const address_t& caller,
    const address_t& operator_id,
    const bool approved,
    event_buffer_t& events) {
  if (operator_id == caller) {
    return registry_error_code::approve_to_caller;
  }
  if (approved) {
    operators_.insert({caller, operator_id});
  } else {
    operators_.erase({caller, operator_id});
  }
  events.emplace_back(approval_for_all_event{
      .holder = caller, .operator_id = operator_id, .approved = approved});
  return registry_error_code::ok;
}

std::optional<address_t> delegation_table::get_approved(
    const token_id_t token_id,
    const identity_ledger& ledger) const {
  if (!ledger.exists(token_id)) {
    return std::nullopt;
  }
  auto it = approvals_.find(token_id);
  if (it == std::end(approvals_)) {
    return make_zero_address();
  }
  return it->second;
}

bool delegation_table::is_approved_for_all(const address_t& holder,
                                           const address_t& operator_id) const {
  return operators_.contains({holder, operator_id});
}

void delegation_table::clear_approval(const token_id_t token_id) {
  approvals_.erase(token_id);
}

const std::map<token_id_t, address_t>& delegation_table::approvals() const {
  return approvals_;
}

const std::set<operator_grant_t>& delegation_table::operators() const {
  return operators_;
}

}  // namespace mosaic::registry
