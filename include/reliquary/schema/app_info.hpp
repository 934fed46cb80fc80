#pragma once

#include <reliquary/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace reliquary::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"reliquary-registry"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  int64_t last_block_height{};
  hash32_t last_block_state_root;
};

using app_info_t = app_info<1>;

}  // namespace reliquary::schema
