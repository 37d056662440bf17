#pragma once

#include <cstdint>

// Schema type: query error code.
// Read-path failures that are not registry errors.
namespace mosaic::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace mosaic::schema
