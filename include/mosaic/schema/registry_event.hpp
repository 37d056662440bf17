#pragma once

#include <mosaic/schema/primitives.hpp>
#include <optional>
#include <string>
#include <variant>

// Schema type: registry event.
// One fact per successful state transition. Indexers rebuild ownership and
// approvals from this stream alone.
namespace mosaic::schema {

struct transfer_event final {
  std::optional<address_t> from;  // nullopt on issuance
  address_t to{};
  token_id_t token_id{};
};

struct approval_event final {
  address_t holder{};
  address_t spender{};
  token_id_t token_id{};
};

struct approval_for_all_event final {
  address_t holder{};
  address_t operator_id{};
  bool approved{};
};

struct artifact_issued_event final {
  address_t recipient{};
  token_id_t token_id{};
  hash32_t trait_commitment{};
  uint32_t layer_count{};
  amount_t payment{};
};

struct royalty_configured_event final {
  address_t payee{};
  uint16_t basis_points{};
};

struct base_uri_changed_event final {
  std::string previous;
  std::string current;
};

using registry_event_t = std::variant<transfer_event,
                                      approval_event,
                                      approval_for_all_event,
                                      artifact_issued_event,
                                      royalty_configured_event,
                                      base_uri_changed_event>;

}  // namespace mosaic::schema
