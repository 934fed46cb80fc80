#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <reliquary/common/critical.hpp>
#include <reliquary/schema/encoding/scale/encoder.hpp>
#include <reliquary/schema/key/registry_keys.hpp>
#include <reliquary/storage/storage.hpp>
#include <memory>
#include <string_view>
#include <tuple>

namespace reliquary::storage {

namespace detail {

using encoder_t = reliquary::schema::encoding::encoder<
    reliquary::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const reliquary::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const reliquary::schema::bytes_view_t& key) const;

  bool contains(const reliquary::schema::bytes_view_t& key) const;
  void apply(const write_set& writes) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const reliquary::schema::bytes_view_t& key) const {
  if (!database) {
    reliquary::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      reliquary::common::critical("Failed to get value from RocksDB: {}",
                                  status.ToString());
    }
  }
  auto decoded = encoder.template try_decode<T>(reliquary::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    reliquary::common::critical("Failed to decode value stored in RocksDB");
  }
  return decoded;
}

inline bool storage<rocksdb_storage_tag>::contains(
    const reliquary::schema::bytes_view_t& key) const {
  if (!database) {
    reliquary::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    reliquary::common::critical("Failed to probe key in RocksDB: {}",
                                status.ToString());
  }
  return true;
}

inline void storage<rocksdb_storage_tag>::apply(const write_set& writes) const {
  if (!database) {
    reliquary::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes.entries) {
    auto key_slice =
        detail::to_slice(reliquary::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? batch.Put(key_slice,
                        detail::to_slice(reliquary::schema::bytes_view_t{
                            value->data(), value->size()}))
            : batch.Delete(key_slice);
    if (!status.ok()) {
      reliquary::common::critical("failed staging key in write batch: {}",
                                  status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    reliquary::common::critical("failed to commit write batch of {} entries: {}",
                                writes.size(), write_status.ToString());
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    reliquary::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{reliquary::schema::key::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    reliquary::common::critical("failed to load committed state: {}",
                                committed_status.ToString());
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, reliquary::schema::hash32_t>>(
          reliquary::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    reliquary::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    reliquary::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{reliquary::schema::key::kCommittedHeightKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    reliquary::common::critical("failed to persist committed height {}: {}",
                                state.height, state_status.ToString());
  }
}

}  // namespace reliquary::storage
