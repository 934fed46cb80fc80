#pragma once

#include <reliquary/schema/primitives.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Pure property checks run before any registry mutation. Lengths are byte
// lengths of the stored text.
namespace reliquary::registry {

inline constexpr std::size_t kMinNameLength = 1;
inline constexpr std::size_t kMaxNameLength = 64;
inline constexpr std::size_t kMinLoreLength = 1;
inline constexpr std::size_t kMaxLoreLength = 128;
inline constexpr std::size_t kMinTagLength = 1;
inline constexpr std::size_t kMaxTagLength = 32;
inline constexpr std::size_t kMinTagCount = 1;
inline constexpr std::size_t kMaxTagCount = 10;
inline constexpr reliquary::schema::power_rating_t kMinPowerRating = 1;
/// Exclusive upper bound.
inline constexpr reliquary::schema::power_rating_t kPowerRatingCeiling =
    1'000'000'000;

bool validate_text_bounds(std::string_view text,
                          std::size_t min_length,
                          std::size_t max_length);

bool validate_tag(std::string_view tag);

bool validate_tag_collection(const std::vector<std::string>& tags);

bool validate_power_rating(reliquary::schema::power_rating_t rating);

/// Run every property check in order and report the first failure.
///
/// Returns an empty error code when all properties are within bounds.
std::error_code validate_artifact_properties(
    std::string_view name,
    reliquary::schema::power_rating_t power_rating,
    std::string_view lore,
    const std::vector<std::string>& tags);

}  // namespace reliquary::registry
