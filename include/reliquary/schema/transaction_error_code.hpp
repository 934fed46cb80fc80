#pragma once

#include <reliquary/schema/registry_error_code.hpp>

#include <cstdint>

namespace reliquary::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  artifact_missing = 10,
  artifact_exists = 11,
  format_invalid = 12,
  range_invalid = 13,
  insufficient_privileges = 14,
};

/// Map a registry failure onto the transaction result code space.
constexpr transaction_error_code to_transaction_error(
    const registry_error_code code) {
  switch (code) {
    case registry_error_code::not_found:
      return transaction_error_code::artifact_missing;
    case registry_error_code::duplicate:
      return transaction_error_code::artifact_exists;
    case registry_error_code::format_invalid:
      return transaction_error_code::format_invalid;
    case registry_error_code::range_invalid:
      return transaction_error_code::range_invalid;
    case registry_error_code::insufficient_privileges:
      return transaction_error_code::insufficient_privileges;
  }
  return transaction_error_code::invalid_transaction;
}

}  // namespace reliquary::schema
