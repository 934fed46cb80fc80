#pragma once

#include <reliquary/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace reliquary::testing {

inline reliquary::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = reliquary::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline reliquary::schema::principal_t make_principal(const uint8_t seed) {
  auto principal = reliquary::schema::principal_t{};
  principal[0] = seed;
  return principal;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace reliquary::testing
