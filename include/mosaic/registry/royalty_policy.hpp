#pragma once

#include <mosaic/registry/types.hpp>
#include <mosaic/schema/royalty_state.hpp>
#include <utility>

namespace mosaic::registry {

class royalty_policy final {
 public:
  royalty_policy() = default;
  explicit royalty_policy(const mosaic::schema::royalty_state_t& state);

  mosaic::schema::registry_error_code configure(
      const mosaic::schema::address_t& caller,
      const mosaic::schema::address_t& controller,
      const mosaic::schema::address_t& payee,
      uint16_t basis_points,
      event_buffer_t& events);

  /// (payee, floor(sale_price * basis_points / 10000)).
  std::pair<mosaic::schema::address_t, mosaic::schema::amount_t> royalty_info(
      const mosaic::schema::amount_t& sale_price) const;

  const mosaic::schema::royalty_state_t& state() const;

 private:
  mosaic::schema::royalty_state_t state_{};
};

}  // namespace mosaic::registry
