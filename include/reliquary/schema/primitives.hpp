#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace reliquary::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Opaque caller identity, authenticated by the host before it reaches us.
using principal_t = hash32_t;
using artifact_id_t = uint64_t;
using block_height_t = uint64_t;
using power_rating_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string& bytes);

/// Exactly 32 bytes, or 64 hex characters with an optional `0x` prefix.
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace reliquary::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
