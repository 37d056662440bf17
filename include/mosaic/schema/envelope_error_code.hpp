#pragma once

#include <cstdint>

// Schema type: envelope error code.
// Failures detected before a transaction reaches the registry.
namespace mosaic::schema {

enum class envelope_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signer = 5,
  signature_verification_failed = 6,
  invalid_block_height = 7,
};

}  // namespace mosaic::schema
