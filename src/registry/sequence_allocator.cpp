#include <reliquary/common/critical.hpp>
#include <reliquary/registry/sequence_allocator.hpp>
#include <reliquary/schema/key/registry_keys.hpp>

namespace reliquary::registry {

sequence_allocator::sequence_allocator(encoder_t& encoder,
                                       const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

reliquary::schema::artifact_id_t sequence_allocator::current() const {
  auto key = reliquary::schema::key::make_sequence_key(encoder_);
  auto value = storage_.get<reliquary::schema::artifact_id_t>(
      encoder_, reliquary::schema::bytes_view_t{key.data(), key.size()});
  return value.value_or(0);
}

reliquary::schema::artifact_id_t sequence_allocator::next_id() const {
  return current() + 1;
}

void sequence_allocator::advance(const reliquary::schema::artifact_id_t id,
                                 reliquary::storage::write_set& writes) const {
  const auto last = current();
  if (id <= last) {
    reliquary::common::critical(
        "sequence counter must strictly increase: {} <= {}", id, last);
  }
  auto key = reliquary::schema::key::make_sequence_key(encoder_);
  writes.put(encoder_, reliquary::schema::bytes_view_t{key.data(), key.size()},
             id);
}

}  // namespace reliquary::registry
