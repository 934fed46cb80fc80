#pragma once

#include <reliquary/registry/access_matrix.hpp>
#include <reliquary/registry/artifact_vault.hpp>
#include <reliquary/registry/result.hpp>
#include <reliquary/registry/sequence_allocator.hpp>
#include <reliquary/schema/artifact_record.hpp>
#include <reliquary/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace reliquary::registry {

/// Artifact registry command handlers.
///
/// Holds the vault, the access matrix and the sequence allocator over one
/// storage handle. Every handler validates and authorizes first, then commits
/// its effects as a single write batch; a failed call leaves storage
/// untouched. The caller principal is always an explicit argument.
///
/// Not internally synchronized; the execution engine serializes calls.
class registry final {
 public:
  registry(encoder_t& encoder, const storage_t& storage);

  /// Create an artifact guarded by `caller` and grant `caller` read access.
  ///
  /// Returns the new artifact id, which is also the sequence counter after
  /// the call.
  result_t<reliquary::schema::artifact_id_t> forge_new_artifact(
      const reliquary::schema::principal_t& caller,
      reliquary::schema::block_height_t height,
      const std::string& name,
      reliquary::schema::power_rating_t power_rating,
      const std::string& lore,
      const std::vector<std::string>& tags);

  result_t<std::string> retrieve_artifact_lore(
      reliquary::schema::artifact_id_t artifact_id) const;

  /// Answer purely from the access matrix; a missing artifact is simply
  /// "not authorized".
  bool check_entity_access(
      reliquary::schema::artifact_id_t artifact_id,
      const reliquary::schema::principal_t& principal) const;

  result_t<uint64_t> count_artifact_tags(
      reliquary::schema::artifact_id_t artifact_id) const;

  /// True when `name` would be accepted as an artifact name.
  bool verify_identifier_structure(std::string_view name) const;

  result_t<bool> transfer_guardianship(
      const reliquary::schema::principal_t& caller,
      reliquary::schema::artifact_id_t artifact_id,
      const reliquary::schema::principal_t& new_guardian);

  /// Overwrite name, rating, lore and tags. Id, guardian and creation height
  /// are preserved.
  result_t<bool> modify_artifact_properties(
      const reliquary::schema::principal_t& caller,
      reliquary::schema::artifact_id_t artifact_id,
      const std::string& name,
      reliquary::schema::power_rating_t power_rating,
      const std::string& lore,
      const std::vector<std::string>& tags);

  result_t<bool> destroy_artifact(const reliquary::schema::principal_t& caller,
                                  reliquary::schema::artifact_id_t artifact_id);

  result_t<reliquary::schema::artifact_record_t> get_artifact(
      reliquary::schema::artifact_id_t artifact_id) const;

  reliquary::schema::artifact_id_t last_artifact_id() const;

 private:
  /// Load the record and require `caller` to be its guardian.
  result_t<reliquary::schema::artifact_record_t> load_guarded(
      const reliquary::schema::principal_t& caller,
      reliquary::schema::artifact_id_t artifact_id) const;

  const storage_t& storage_;
  sequence_allocator sequence_;
  artifact_vault vault_;
  access_matrix access_;
};

}  // namespace reliquary::registry
