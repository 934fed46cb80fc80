#pragma once
#include <reliquary/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: forge artifact.
// Registry workflow: creation payload; the signer becomes guardian.
namespace reliquary::schema {

template <uint16_t Version>
struct forge_artifact;

template <>
struct forge_artifact<1> final {
  uint16_t version{1};
  std::string name;
  power_rating_t power_rating{};
  std::string lore;
  std::vector<std::string> tags;
};

using forge_artifact_t = forge_artifact<1>;

}  // namespace reliquary::schema
