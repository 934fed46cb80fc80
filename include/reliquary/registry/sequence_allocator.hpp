#pragma once

#include <reliquary/registry/result.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/storage/storage.hpp>

namespace reliquary::registry {

/// Process-wide artifact id counter persisted under the sequence key.
///
/// The counter only moves as part of a successful forge commit, so rejected
/// attempts never consume an id.
class sequence_allocator final {
 public:
  sequence_allocator(encoder_t& encoder, const storage_t& storage);

  /// Id of the most recently forged artifact; 0 before the first forge.
  reliquary::schema::artifact_id_t current() const;

  /// Candidate id for the next forge (current + 1).
  reliquary::schema::artifact_id_t next_id() const;

  /// Stage the counter update to `id` into the forge's write set.
  void advance(reliquary::schema::artifact_id_t id,
               reliquary::storage::write_set& writes) const;

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
};

}  // namespace reliquary::registry
