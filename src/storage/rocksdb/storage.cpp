#include <spdlog/spdlog.h>
#include <reliquary/common/critical.hpp>
#include <reliquary/storage/rocksdb/storage.hpp>

#include <string>

namespace reliquary::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    reliquary::common::critical("Registry store path must not be empty");
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* raw_database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw_database);
  if (!status.ok()) {
    reliquary::common::critical("Failed to open registry store at {}: {}",
                                path, status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw_database);
  spdlog::info("Opened registry store at {} (checkpoint {})", path,
               store.load_committed_state() ? "present" : "absent");
  return store;
}

}  // namespace reliquary::storage
