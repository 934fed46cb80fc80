#include <blake3.h>
#include <reliquary/blake3/hash.hpp>

namespace reliquary::blake3 {

reliquary::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = reliquary::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

reliquary::schema::hash32_t hash(const reliquary::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = reliquary::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace reliquary::blake3
