#pragma once
#include <reliquary/schema/primitives.hpp>

namespace reliquary::schema {

template <uint16_t Version>
struct destroy_artifact;

template <>
struct destroy_artifact<1> final {
  uint16_t version{1};
  artifact_id_t artifact_id{};
};

using destroy_artifact_t = destroy_artifact<1>;

}  // namespace reliquary::schema
