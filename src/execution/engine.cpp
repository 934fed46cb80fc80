#include <spdlog/spdlog.h>
#include <reliquary/blake3/hash.hpp>
#include <reliquary/execution/engine.hpp>
#include <reliquary/registry/validation.hpp>
#include <reliquary/schema/encoding/scale/encoder.hpp>
#include <reliquary/schema/query_error_code.hpp>
#include <reliquary/schema/transaction_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace reliquary::schema;

namespace {

using encoder_t = reliquary::schema::encoding::encoder<
    reliquary::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckCodespace = std::string_view{"reliquary.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"reliquary.finalize"};
constexpr auto kQueryCodespace = std::string_view{"reliquary.query"};

reliquary::schema::hash32_t fold_state_root(
    const reliquary::schema::hash32_t& seed,
    const reliquary::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = reliquary::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return reliquary::blake3::hash(
      reliquary::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<reliquary::schema::transaction_t> decode_transaction(
    const reliquary::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<reliquary::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_registry_error_result(
    const std::error_code& error,
    const std::string_view codespace) {
  auto code = transaction_error_code::invalid_transaction;
  if (error.category() == registry_category()) {
    code = to_transaction_error(static_cast<registry_error_code>(error.value()));
  }
  return make_error_result(code, error.message(), std::string{}, codespace);
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace reliquary::execution {

engine::engine(
    reliquary::schema::encoding::encoder<
        reliquary::schema::encoding::scale_encoder_tag>& encoder,
    reliquary::storage::storage<reliquary::storage::rocksdb_storage_tag>&
        storage)
    : encoder_{encoder}, storage_{storage}, registry_{encoder, storage} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine");
  load_persisted_state();
  if (last_committed_height_ == 0) {
    last_committed_state_root_ = make_zero_hash();
    pending_state_root_ = last_committed_state_root_;
    storage_.save_committed_state(reliquary::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  }
  spdlog::info("Execution engine ready at height {} with {} artifact(s) forged",
               last_committed_height_, registry_.last_artifact_id());
}

transaction_result_t engine::check_transaction(
    const reliquary::schema::bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckCodespace);
  }
  return validate_transaction(*maybe_tx, kCheckCodespace);
}

transaction_result_t engine::validate_transaction(
    const reliquary::schema::transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }

  auto invalid = std::visit(
      overloaded{[](const forge_artifact_t& op) {
                   return reliquary::registry::validate_artifact_properties(
                       op.name, op.power_rating, op.lore, op.tags);
                 },
                 // Modify bounds are checked by the handler, after existence
                 // and guardianship.
                 [](const modify_artifact_t&) { return std::error_code{}; },
                 [](const transfer_guardianship_t&) { return std::error_code{}; },
                 [](const destroy_artifact_t&) { return std::error_code{}; }},
      tx.payload);
  if (invalid) {
    return make_registry_error_result(invalid, codespace);
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const reliquary::schema::transaction_t& tx,
    const uint64_t height) {
  auto result = transaction_result_t{};
  auto failure = std::error_code{};
  std::visit(
      overloaded{
          [&](const forge_artifact_t& op) {
            auto forged = registry_.forge_new_artifact(
                tx.signer, height, op.name, op.power_rating, op.lore, op.tags);
            if (!forged) {
              failure = forged.error();
              return;
            }
            result.data = encoder_.encode(forged.value());
            result.info = "forge_artifact accepted";
          },
          [&](const modify_artifact_t& op) {
            auto modified = registry_.modify_artifact_properties(
                tx.signer, op.artifact_id, op.name, op.power_rating, op.lore,
                op.tags);
            if (!modified) {
              failure = modified.error();
              return;
            }
            result.info = "modify_artifact accepted";
          },
          [&](const transfer_guardianship_t& op) {
            auto transferred = registry_.transfer_guardianship(
                tx.signer, op.artifact_id, op.new_guardian);
            if (!transferred) {
              failure = transferred.error();
              return;
            }
            result.info = "transfer_guardianship accepted";
          },
          [&](const destroy_artifact_t& op) {
            auto destroyed =
                registry_.destroy_artifact(tx.signer, op.artifact_id);
            if (!destroyed) {
              failure = destroyed.error();
              return;
            }
            result.info = "destroy_artifact accepted";
          }},
      tx.payload);

  if (failure) {
    return make_registry_error_result(failure, kFinalizeCodespace);
  }
  return result;
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const std::vector<reliquary::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        reliquary::schema::bytes_view_t{txs[i].data(), txs[i].size()},
        decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, "invalid transaction",
          decode_error, kFinalizeCodespace));
      continue;
    }

    auto validation = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (validation.code != 0) {
      spdlog::debug("Rejected tx {} at height {}: {}", i, height,
                    validation.log);
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    auto tx_result = execute_operation(*maybe_tx, height);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      spdlog::debug("Tx {} at height {} failed: {}", i, height, tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  spdlog::debug("Finalized height {} with {} tx(s), state root {}", height,
                txs.size(), to_hex(rolling_root));
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  storage_.save_committed_state(reliquary::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} state root {}", last_committed_height_,
               to_hex(last_committed_state_root_));

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const reliquary::schema::bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto from_registry = [&](const std::error_code& error) {
    auto code = query_error_code::invalid_key;
    if (error == registry_error_code::not_found) {
      code = query_error_code::not_found;
    }
    return make_query_error(code, error.message(), last_committed_height_);
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_});
    return result;
  }

  if (path == "/sequence/last") {
    result.value = encoder_.encode(registry_.last_artifact_id());
    return result;
  }

  if (path == "/identifier/verify") {
    auto name = encoder_.try_decode<std::string>(data);
    if (!name) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE string", last_committed_height_);
    }
    result.value = encoder_.encode(registry_.verify_identifier_structure(*name));
    return result;
  }

  if (path == "/artifact/access") {
    auto key = encoder_.try_decode<std::tuple<artifact_id_t, principal_t>>(data);
    if (!key) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (artifact_id, principal)",
                              last_committed_height_);
    }
    result.value = encoder_.encode(registry_.check_entity_access(
        std::get<0>(*key), std::get<1>(*key)));
    return result;
  }

  if (path != "/artifact" && path != "/artifact/lore" &&
      path != "/artifact/tags/count") {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported query path", last_committed_height_);
  }

  auto artifact_id = encoder_.try_decode<artifact_id_t>(data);
  if (!artifact_id) {
    return make_query_error(query_error_code::invalid_key,
                            "expected SCALE artifact id",
                            last_committed_height_);
  }

  if (path == "/artifact") {
    auto record = registry_.get_artifact(*artifact_id);
    if (!record) {
      return from_registry(record.error());
    }
    result.value = encoder_.encode(record.value());
  } else if (path == "/artifact/lore") {
    auto lore = registry_.retrieve_artifact_lore(*artifact_id);
    if (!lore) {
      return from_registry(lore.error());
    }
    result.value = encoder_.encode(lore.value());
  } else {
    auto count = registry_.count_artifact_tags(*artifact_id);
    if (!count) {
      return from_registry(count.error());
    }
    result.value = encoder_.encode(count.value());
  }
  return result;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }
}

}  // namespace reliquary::execution
