#include <mosaic/registry/identity_ledger.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

identity_ledger::identity_ledger(
    const std::map<token_id_t, address_t>& owners) {
  for (const auto& [token_id, owner] : owners) {
    set_owner(token_id, owner);
  }
}

std::optional<address_t> identity_ledger::owner_of(
    const token_id_t token_id) const {
  auto it = owners_.find(token_id);
  if (it == std::end(owners_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<uint64_t> identity_ledger::balance_of(
    const address_t& holder) const {
  if (is_zero_address(holder)) {
    return std::nullopt;
  }
  auto it = balances_.find(holder);
  if (it == std::end(balances_)) {
    return uint64_t{0};
  }
  return it->second;
}

bool identity_ledger::exists(const token_id_t token_id) const {
  return owners_.contains(token_id);
}

void identity_ledger::set_owner(const token_id_t token_id,
                                const address_t& new_owner) {
  auto it = owners_.find(token_id);
  if (it != std::end(owners_)) {
    auto balance = balances_.find(it->second);
    if (balance != std::end(balances_)) {
      if (--balance->second == 0) {
        balances_.erase(balance);
      }
    }
    it->second = new_owner;
  } else {
    owners_.emplace(token_id, new_owner);
  }
  ++balances_[new_owner];
}

const std::map<token_id_t, address_t>& identity_ledger::owners() const {
  return owners_;
}

}  // namespace mosaic::registry
