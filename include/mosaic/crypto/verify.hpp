#pragma once

#include <mosaic/schema/primitives.hpp>
#include <array>
#include <optional>

namespace mosaic::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

bool available();

bool verify_signature(const mosaic::schema::bytes_view_t& message,
                      const mosaic::schema::ed25519_public_key_t& signer,
                      const mosaic::schema::ed25519_signature_t& signature);

/// Registry identity of a signer: blake3 of its public key.
mosaic::schema::address_t derive_address(
    const mosaic::schema::ed25519_public_key_t& signer);

std::optional<mosaic::schema::ed25519_public_key_t> derive_public_key(
    const ed25519_seed_t& seed);

std::optional<mosaic::schema::ed25519_signature_t> sign(
    const mosaic::schema::bytes_view_t& message,
    const ed25519_seed_t& seed);

}  // namespace mosaic::crypto
