#include <reliquary/registry/registry.hpp>
#include <reliquary/registry/validation.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using reliquary::schema::artifact_id_t;
using reliquary::schema::artifact_record_t;
using reliquary::schema::principal_t;
using reliquary::schema::registry_error_code;

namespace reliquary::registry {

registry::registry(encoder_t& encoder, const storage_t& storage)
    : storage_{storage},
      sequence_{encoder, storage},
      vault_{encoder, storage},
      access_{encoder, storage} {}

result_t<artifact_id_t> registry::forge_new_artifact(
    const principal_t& caller,
    const reliquary::schema::block_height_t height,
    const std::string& name,
    const reliquary::schema::power_rating_t power_rating,
    const std::string& lore,
    const std::vector<std::string>& tags) {
  if (auto invalid =
          validate_artifact_properties(name, power_rating, lore, tags)) {
    spdlog::debug("Rejected forge of '{}': {}", name, invalid.message());
    return boost::outcome_v2::failure(invalid);
  }

  auto id = sequence_.next_id();
  auto record = artifact_record_t{.id = id,
                                  .name = name,
                                  .guardian = caller,
                                  .power_rating = power_rating,
                                  .created_at = height,
                                  .lore = lore,
                                  .tags = tags};

  auto writes = reliquary::storage::write_set{};
  auto inserted = vault_.insert(id, record, writes);
  if (!inserted) {
    spdlog::error("Artifact id {} already present in vault", id);
    return boost::outcome_v2::failure(inserted.error());
  }
  access_.grant(id, caller, writes);
  sequence_.advance(id, writes);
  storage_.apply(writes);

  spdlog::debug("Forged artifact {} '{}' at height {}", id, name, height);
  return id;
}

result_t<std::string> registry::retrieve_artifact_lore(
    const artifact_id_t artifact_id) const {
  auto record = vault_.get(artifact_id);
  if (!record) {
    return boost::outcome_v2::failure(record.error());
  }
  return std::move(record.value().lore);
}

bool registry::check_entity_access(const artifact_id_t artifact_id,
                                   const principal_t& principal) const {
  return access_.is_authorized(artifact_id, principal);
}

result_t<uint64_t> registry::count_artifact_tags(
    const artifact_id_t artifact_id) const {
  auto record = vault_.get(artifact_id);
  if (!record) {
    return boost::outcome_v2::failure(record.error());
  }
  return static_cast<uint64_t>(record.value().tags.size());
}

bool registry::verify_identifier_structure(const std::string_view name) const {
  return validate_text_bounds(name, kMinNameLength, kMaxNameLength);
}

result_t<bool> registry::transfer_guardianship(
    const principal_t& caller,
    const artifact_id_t artifact_id,
    const principal_t& new_guardian) {
  auto record = load_guarded(caller, artifact_id);
  if (!record) {
    return boost::outcome_v2::failure(record.error());
  }

  auto updated = std::move(record).value();
  updated.guardian = new_guardian;

  auto writes = reliquary::storage::write_set{};
  auto stored = vault_.set(artifact_id, updated, writes);
  if (!stored) {
    return boost::outcome_v2::failure(stored.error());
  }
  storage_.apply(writes);
  spdlog::debug("Transferred guardianship of artifact {}", artifact_id);
  return true;
}

result_t<bool> registry::modify_artifact_properties(
    const principal_t& caller,
    const artifact_id_t artifact_id,
    const std::string& name,
    const reliquary::schema::power_rating_t power_rating,
    const std::string& lore,
    const std::vector<std::string>& tags) {
  auto record = load_guarded(caller, artifact_id);
  if (!record) {
    return boost::outcome_v2::failure(record.error());
  }
  if (auto invalid =
          validate_artifact_properties(name, power_rating, lore, tags)) {
    spdlog::debug("Rejected modify of artifact {}: {}", artifact_id,
                  invalid.message());
    return boost::outcome_v2::failure(invalid);
  }

  auto updated = std::move(record).value();
  updated.name = name;
  updated.power_rating = power_rating;
  updated.lore = lore;
  updated.tags = tags;

  auto writes = reliquary::storage::write_set{};
  auto stored = vault_.set(artifact_id, updated, writes);
  if (!stored) {
    return boost::outcome_v2::failure(stored.error());
  }
  storage_.apply(writes);
  spdlog::debug("Modified artifact {}", artifact_id);
  return true;
}

result_t<bool> registry::destroy_artifact(const principal_t& caller,
                                          const artifact_id_t artifact_id) {
  auto record = load_guarded(caller, artifact_id);
  if (!record) {
    return boost::outcome_v2::failure(record.error());
  }

  // Access grants for the id are left in place.
  auto writes = reliquary::storage::write_set{};
  auto erased = vault_.erase(artifact_id, writes);
  if (!erased) {
    return boost::outcome_v2::failure(erased.error());
  }
  storage_.apply(writes);
  spdlog::debug("Destroyed artifact {}", artifact_id);
  return true;
}

result_t<artifact_record_t> registry::get_artifact(
    const artifact_id_t artifact_id) const {
  return vault_.get(artifact_id);
}

artifact_id_t registry::last_artifact_id() const {
  return sequence_.current();
}

result_t<artifact_record_t> registry::load_guarded(
    const principal_t& caller,
    const artifact_id_t artifact_id) const {
  auto record = vault_.get(artifact_id);
  if (!record) {
    return record;
  }
  if (record.value().guardian != caller) {
    spdlog::debug("Caller is not guardian of artifact {}", artifact_id);
    return fail(registry_error_code::insufficient_privileges);
  }
  return record;
}

}  // namespace reliquary::registry
