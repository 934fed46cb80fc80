#pragma once

#include <reliquary/registry/result.hpp>
#include <reliquary/schema/artifact_record.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/storage/storage.hpp>

namespace reliquary::registry {

/// Artifact id -> artifact record table.
///
/// Enforces key presence only; business rules belong to the validation layer
/// and the command handlers. Mutations are staged into a write set so a
/// handler commits them together with its other effects.
class artifact_vault final {
 public:
  artifact_vault(encoder_t& encoder, const storage_t& storage);

  /// Stage a new record. Fails with `duplicate` if the id is taken.
  result_t<void> insert(reliquary::schema::artifact_id_t id,
                        const reliquary::schema::artifact_record_t& record,
                        reliquary::storage::write_set& writes) const;

  /// Load a record. Fails with `not_found` if the id is absent.
  result_t<reliquary::schema::artifact_record_t> get(
      reliquary::schema::artifact_id_t id) const;

  /// Stage an overwrite of an existing record.
  result_t<void> set(reliquary::schema::artifact_id_t id,
                     const reliquary::schema::artifact_record_t& record,
                     reliquary::storage::write_set& writes) const;

  /// Stage removal of an existing record.
  result_t<void> erase(reliquary::schema::artifact_id_t id,
                       reliquary::storage::write_set& writes) const;

  bool exists(reliquary::schema::artifact_id_t id) const;

 private:
  reliquary::schema::bytes_t key_for(reliquary::schema::artifact_id_t id) const;

  encoder_t& encoder_;
  const storage_t& storage_;
};

}  // namespace reliquary::registry
