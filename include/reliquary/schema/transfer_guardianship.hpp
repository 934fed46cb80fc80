#pragma once
#include <reliquary/schema/primitives.hpp>

// Schema type: transfer guardianship.
// Registry workflow: hands an artifact to a new guardian.
namespace reliquary::schema {

template <uint16_t Version>
struct transfer_guardianship;

template <>
struct transfer_guardianship<1> final {
  uint16_t version{1};
  artifact_id_t artifact_id{};
  principal_t new_guardian{};
};

using transfer_guardianship_t = transfer_guardianship<1>;

}  // namespace reliquary::schema
