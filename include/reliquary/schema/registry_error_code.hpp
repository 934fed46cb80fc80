#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

// Schema type: registry error code.
// Registry workflow: failure taxonomy shared by the vault, the access matrix
// and the command handlers.
namespace reliquary::schema {

enum class registry_error_code : uint32_t {
  not_found = 1,
  duplicate = 2,
  format_invalid = 3,
  range_invalid = 4,
  insufficient_privileges = 5,
};

const std::error_category& registry_category() noexcept;

std::error_code make_error_code(registry_error_code code) noexcept;

}  // namespace reliquary::schema

template <>
struct std::is_error_code_enum<reliquary::schema::registry_error_code>
    : std::true_type {};
