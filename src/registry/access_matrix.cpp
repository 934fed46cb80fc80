#include <reliquary/registry/access_matrix.hpp>
#include <reliquary/schema/key/registry_keys.hpp>

namespace reliquary::registry {

access_matrix::access_matrix(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void access_matrix::grant(const reliquary::schema::artifact_id_t artifact_id,
                          const reliquary::schema::principal_t& principal,
                          reliquary::storage::write_set& writes) const {
  auto key =
      reliquary::schema::key::make_access_key(encoder_, artifact_id, principal);
  writes.put(encoder_, reliquary::schema::bytes_view_t{key.data(), key.size()},
             true);
}

bool access_matrix::is_authorized(
    const reliquary::schema::artifact_id_t artifact_id,
    const reliquary::schema::principal_t& principal) const {
  auto key =
      reliquary::schema::key::make_access_key(encoder_, artifact_id, principal);
  auto granted = storage_.get<bool>(
      encoder_, reliquary::schema::bytes_view_t{key.data(), key.size()});
  return granted.value_or(false);
}

}  // namespace reliquary::registry
