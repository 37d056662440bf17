#pragma once
#include <mosaic/schema/approve_spender.hpp>
#include <mosaic/schema/configure_royalty.hpp>
#include <mosaic/schema/mint_artifact.hpp>
#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/set_operator_approval.hpp>
#include <mosaic/schema/transfer_artifact.hpp>
#include <mosaic/schema/update_base_uri.hpp>
#include <variant>

namespace mosaic::schema {

using transaction_payload_t = std::variant<mint_artifact_t,
                                           approve_spender_t,
                                           set_operator_approval_t,
                                           transfer_artifact_t,
                                           configure_royalty_t,
                                           update_base_uri_t>;

template <uint16_t Version>
struct transaction;

// The signed message is the SCALE encoding of the transaction with an
// all-zero signature.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  ed25519_public_key_t signer{};
  amount_t value{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace mosaic::schema
