#include <mosaic/registry/constants.hpp>
#include <mosaic/registry/royalty_policy.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

royalty_policy::royalty_policy(const royalty_state_t& state) : state_{state} {}

registry_error_code royalty_policy::configure(const address_t& caller,
                                              const address_t& controller,
                                              const address_t& payee,
                                              const uint16_t basis_points,
                                              event_buffer_t& events) {
  if (caller != controller) {
    return registry_error_code::not_controller;
  }
  if (basis_points > kMaxRoyaltyBasisPoints) {
    return registry_error_code::royalty_bps_too_high;
  }
  state_.payee = payee;
  state_.basis_points = basis_points;
  events.emplace_back(
      royalty_configured_event{.payee = payee, .basis_points = basis_points});
  return registry_error_code::ok;
}

std::pair<address_t, amount_t> royalty_policy::royalty_info(
    const amount_t& sale_price) const {
  // uint256 division truncates, which is the floor for unsigned values.
  auto amount = (sale_price * amount_t{state_.basis_points}) /
                amount_t{kBasisPointsDenominator};
  return {state_.payee, amount};
}

const royalty_state_t& royalty_policy::state() const {
  return state_;
}

}  // namespace mosaic::registry
