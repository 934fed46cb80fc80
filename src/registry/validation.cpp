#include <reliquary/registry/validation.hpp>
#include <reliquary/schema/registry_error_code.hpp>

#include <algorithm>

namespace reliquary::registry {

bool validate_text_bounds(const std::string_view text,
                          const std::size_t min_length,
                          const std::size_t max_length) {
  return text.size() >= min_length && text.size() <= max_length;
}

bool validate_tag(const std::string_view tag) {
  return validate_text_bounds(tag, kMinTagLength, kMaxTagLength);
}

bool validate_tag_collection(const std::vector<std::string>& tags) {
  if (tags.size() < kMinTagCount || tags.size() > kMaxTagCount) {
    return false;
  }
  return std::ranges::all_of(
      tags, [](const std::string& tag) { return validate_tag(tag); });
}

bool validate_power_rating(const reliquary::schema::power_rating_t rating) {
  return rating >= kMinPowerRating && rating < kPowerRatingCeiling;
}

std::error_code validate_artifact_properties(
    const std::string_view name,
    const reliquary::schema::power_rating_t power_rating,
    const std::string_view lore,
    const std::vector<std::string>& tags) {
  using reliquary::schema::registry_error_code;
  if (!validate_text_bounds(name, kMinNameLength, kMaxNameLength)) {
    return make_error_code(registry_error_code::format_invalid);
  }
  if (!validate_power_rating(power_rating)) {
    return make_error_code(registry_error_code::range_invalid);
  }
  if (!validate_text_bounds(lore, kMinLoreLength, kMaxLoreLength)) {
    return make_error_code(registry_error_code::format_invalid);
  }
  if (!validate_tag_collection(tags)) {
    return make_error_code(registry_error_code::format_invalid);
  }
  return {};
}

}  // namespace reliquary::registry
