#pragma once
#include <reliquary/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: modify artifact.
// Registry workflow: full property overwrite by the current guardian.
namespace reliquary::schema {

template <uint16_t Version>
struct modify_artifact;

template <>
struct modify_artifact<1> final {
  uint16_t version{1};
  artifact_id_t artifact_id{};
  std::string name;
  power_rating_t power_rating{};
  std::string lore;
  std::vector<std::string> tags;
};

using modify_artifact_t = modify_artifact<1>;

}  // namespace reliquary::schema
