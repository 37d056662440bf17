#pragma once

#include <mosaic/schema/primitives.hpp>
#include <functional>

namespace mosaic::execution {

using signature_verifier_t =
    std::function<bool(const mosaic::schema::bytes_view_t& message,
                       const mosaic::schema::ed25519_public_key_t& signer,
                       const mosaic::schema::ed25519_signature_t& signature)>;

}  // namespace mosaic::execution
