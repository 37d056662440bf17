#pragma once

#include <array>
#include <cstdint>
#include <mosaic/schema/enum_string.hpp>
#include <string_view>
#include <utility>

// Schema type: registry error code.
// Stable numeric codes for registry failures, grouped by taxonomy:
// 10x access control, 11x admission control, 12x input validation,
// 13x ownership consistency, 14x concurrency.
namespace mosaic::schema {

enum class registry_error_code : uint32_t {
  ok = 0,
  not_controller = 100,
  caller_not_owner_nor_approved = 101,
  supply_cap_exceeded = 110,
  payment_too_low = 111,
  cooldown_active = 112,
  mint_to_zero = 120,
  transfer_to_zero = 121,
  approve_to_caller = 122,
  invalid_token = 123,
  layer_index_out_of_range = 124,
  royalty_bps_too_high = 125,
  zero_address = 126,
  unsafe_recipient = 127,
  transfer_from_wrong_owner = 130,
  reentrancy = 140,
};

inline constexpr auto kRegistryErrorCodeNames =
    std::array<std::pair<std::string_view, registry_error_code>, 16>{{
        {"ok", registry_error_code::ok},
        {"not_controller", registry_error_code::not_controller},
        {"caller_not_owner_nor_approved",
         registry_error_code::caller_not_owner_nor_approved},
        {"supply_cap_exceeded", registry_error_code::supply_cap_exceeded},
        {"payment_too_low", registry_error_code::payment_too_low},
        {"cooldown_active", registry_error_code::cooldown_active},
        {"mint_to_zero", registry_error_code::mint_to_zero},
        {"transfer_to_zero", registry_error_code::transfer_to_zero},
        {"approve_to_caller", registry_error_code::approve_to_caller},
        {"invalid_token", registry_error_code::invalid_token},
        {"layer_index_out_of_range",
         registry_error_code::layer_index_out_of_range},
        {"royalty_bps_too_high", registry_error_code::royalty_bps_too_high},
        {"zero_address", registry_error_code::zero_address},
        {"unsafe_recipient", registry_error_code::unsafe_recipient},
        {"transfer_from_wrong_owner",
         registry_error_code::transfer_from_wrong_owner},
        {"reentrancy", registry_error_code::reentrancy},
    }};

constexpr std::string_view name_of(const registry_error_code code) {
  return to_string(code, kRegistryErrorCodeNames).value_or("unknown");
}

}  // namespace mosaic::schema
