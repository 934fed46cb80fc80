#pragma once
#include <reliquary/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: artifact record.
// Registry workflow: canonical vault row; one per artifact id, owned by a
// single guardian.
namespace reliquary::schema {

template <uint16_t Version>
struct artifact_record;

template <>
struct artifact_record<1> final {
  uint16_t version{1};
  artifact_id_t id{};
  std::string name;
  principal_t guardian{};
  power_rating_t power_rating{};
  block_height_t created_at{};
  std::string lore;
  std::vector<std::string> tags;

  bool operator==(const artifact_record&) const = default;
};

using artifact_record_t = artifact_record<1>;

}  // namespace reliquary::schema
