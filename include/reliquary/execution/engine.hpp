#pragma once

#include <reliquary/registry/registry.hpp>
#include <reliquary/schema/app_info.hpp>
#include <reliquary/schema/block_result.hpp>
#include <reliquary/schema/commit_result.hpp>
#include <reliquary/schema/encoding/encoder.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/schema/query_result.hpp>
#include <reliquary/schema/transaction.hpp>
#include <reliquary/schema/transaction_result.hpp>
#include <reliquary/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reliquary::execution {

/// Deterministic artifact registry state machine.
///
/// The engine decodes transactions, runs them through the registry command
/// handlers one at a time, folds successful transactions into a state root,
/// and exposes the read-path query routes.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends and reload the last
  /// committed checkpoint.
  explicit engine(
      reliquary::schema::encoding::encoder<
          reliquary::schema::encoding::scale_encoder_tag>& encoder,
      reliquary::storage::storage<reliquary::storage::rocksdb_storage_tag>&
          storage);

  /// Admit a transaction for inclusion (CheckTx semantics).
  ///
  /// Performs decode + stateless validation only; does not mutate state.
  /// Forge payloads are bounds-checked here. Modify payloads are not, so that
  /// a missing artifact or a non-guardian caller is reported before any
  /// property failure.
  reliquary::schema::transaction_result_t check_transaction(
      const reliquary::schema::bytes_view_t& raw_tx);

  /// Execute a block of transactions in order at `height`.
  ///
  /// Per-tx results are returned even on failures. Successful transactions
  /// are applied to storage immediately and folded into the state root.
  reliquary::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<reliquary::schema::bytes_t>& txs);

  /// Persist the latest finalized height and state root.
  reliquary::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  reliquary::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  ///
  /// Routes: `/engine/info`, `/sequence/last`, `/artifact`, `/artifact/lore`,
  /// `/artifact/tags/count`, `/artifact/access`, `/identifier/verify`.
  reliquary::schema::query_result_t query(
      std::string_view path,
      const reliquary::schema::bytes_view_t& data);

 private:
  /// Dispatch a decoded transaction to the matching registry handler.
  reliquary::schema::transaction_result_t execute_operation(
      const reliquary::schema::transaction_t& tx,
      uint64_t height);

  /// Version check plus stateless payload validation.
  reliquary::schema::transaction_result_t validate_transaction(
      const reliquary::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  reliquary::schema::encoding::encoder<
      reliquary::schema::encoding::scale_encoder_tag>& encoder_;
  reliquary::storage::storage<reliquary::storage::rocksdb_storage_tag>&
      storage_;
  reliquary::registry::registry registry_;
  int64_t last_committed_height_{};
  reliquary::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  reliquary::schema::hash32_t pending_state_root_{};
};

}  // namespace reliquary::execution
