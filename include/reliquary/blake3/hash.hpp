#pragma once
#include <reliquary/schema/primitives.hpp>
#include <string_view>

namespace reliquary::blake3 {

reliquary::schema::hash32_t hash(const std::string_view& str);
reliquary::schema::hash32_t hash(const reliquary::schema::bytes_view_t& bytes);

}  // namespace reliquary::blake3
