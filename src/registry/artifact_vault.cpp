#include <reliquary/registry/artifact_vault.hpp>
#include <reliquary/schema/key/registry_keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using reliquary::schema::artifact_id_t;
using reliquary::schema::artifact_record_t;
using reliquary::schema::bytes_view_t;
using reliquary::schema::registry_error_code;

namespace reliquary::registry {

artifact_vault::artifact_vault(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

result_t<void> artifact_vault::insert(
    const artifact_id_t id,
    const artifact_record_t& record,
    reliquary::storage::write_set& writes) const {
  auto key = key_for(id);
  if (storage_.contains(bytes_view_t{key.data(), key.size()})) {
    return fail(registry_error_code::duplicate);
  }
  writes.put(encoder_, bytes_view_t{key.data(), key.size()}, record);
  return boost::outcome_v2::success();
}

result_t<artifact_record_t> artifact_vault::get(const artifact_id_t id) const {
  auto key = key_for(id);
  auto record = storage_.get<artifact_record_t>(
      encoder_, bytes_view_t{key.data(), key.size()});
  if (!record) {
    return fail(registry_error_code::not_found);
  }
  return std::move(*record);
}

result_t<void> artifact_vault::set(
    const artifact_id_t id,
    const artifact_record_t& record,
    reliquary::storage::write_set& writes) const {
  auto key = key_for(id);
  if (!storage_.contains(bytes_view_t{key.data(), key.size()})) {
    spdlog::warn("Overwrite of missing artifact {}", id);
    return fail(registry_error_code::not_found);
  }
  writes.put(encoder_, bytes_view_t{key.data(), key.size()}, record);
  return boost::outcome_v2::success();
}

result_t<void> artifact_vault::erase(
    const artifact_id_t id,
    reliquary::storage::write_set& writes) const {
  auto key = key_for(id);
  if (!storage_.contains(bytes_view_t{key.data(), key.size()})) {
    spdlog::warn("Erase of missing artifact {}", id);
    return fail(registry_error_code::not_found);
  }
  writes.erase(bytes_view_t{key.data(), key.size()});
  return boost::outcome_v2::success();
}

bool artifact_vault::exists(const artifact_id_t id) const {
  auto key = key_for(id);
  return storage_.contains(bytes_view_t{key.data(), key.size()});
}

reliquary::schema::bytes_t artifact_vault::key_for(
    const artifact_id_t id) const {
  return reliquary::schema::key::make_artifact_key(encoder_, id);
}

}  // namespace reliquary::registry
