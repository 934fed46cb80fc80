#pragma once

#include <cstdint>

// Schema type: query error code.
// Registry workflow: read-path failure taxonomy; stable numeric codes for
// clients.
namespace reliquary::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace reliquary::schema
