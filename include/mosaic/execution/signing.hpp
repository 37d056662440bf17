#pragma once

#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/transaction.hpp>

namespace mosaic::execution {

/// Bytes covered by a transaction signature: the transaction encoded with an
/// all-zero signature.
template <typename Encoder>
mosaic::schema::bytes_t make_signing_payload(
    Encoder& encoder,
    mosaic::schema::transaction_t tx) {
  tx.signature = mosaic::schema::ed25519_signature_t{};
  return encoder.encode(tx);
}

}  // namespace mosaic::execution
