#pragma once
#include <reliquary/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace reliquary::storage {

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  reliquary::schema::hash32_t state_root;
};

/// Ordered puts and erases committed together by `storage::apply`.
///
/// An entry without a value is an erase.
struct write_set final {
  std::vector<std::pair<reliquary::schema::bytes_t,
                        std::optional<reliquary::schema::bytes_t>>>
      entries;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const reliquary::schema::bytes_view_t& key,
           const T& value) {
    entries.emplace_back(reliquary::schema::make_bytes(key),
                         encoder.encode(value));
  }

  void erase(const reliquary::schema::bytes_view_t& key) {
    entries.emplace_back(reliquary::schema::make_bytes(key), std::nullopt);
  }

  bool empty() const { return entries.empty(); }
  std::size_t size() const { return entries.size(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const reliquary::schema::bytes_view_t& key) const;

  /// True when a value is stored at key.
  bool contains(const reliquary::schema::bytes_view_t& key) const;

  /// Atomically commit every entry of the write set, or none of them.
  void apply(const write_set& writes) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace reliquary::storage
