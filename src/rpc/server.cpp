#include <spdlog/spdlog.h>
#include <reliquary/rpc/server.hpp>
#include <reliquary/schema/encoding/scale/encoder.hpp>
#include <reliquary/schema/query_error_code.hpp>
#include <reliquary/schema/transaction_error_code.hpp>

#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace reliquary::rpc;
using namespace reliquary::schema;

namespace {

using encoder_t = reliquary::schema::encoding::encoder<
    reliquary::schema::encoding::scale_encoder_tag>;

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_unauthenticated(
    grpc::CallbackServerContext* context) {
  return finish(context,
                grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                             "missing or malformed x-reliquary-principal"});
}

std::optional<principal_t> principal_from_bytes(const std::string& raw) {
  return try_make_hash32(make_bytes_view(raw));
}

std::vector<std::string> copy_tags(
    const google::protobuf::RepeatedPtrField<std::string>& tags) {
  return std::vector<std::string>{std::begin(tags), std::end(tags)};
}

}  // namespace

namespace reliquary::rpc {

std::optional<principal_t> principal_from_metadata(
    const std::multimap<grpc::string_ref, grpc::string_ref>& metadata) {
  auto entry = metadata.find(grpc::string_ref{kPrincipalMetadataKey.data(),
                                              kPrincipalMetadataKey.size()});
  if (entry == std::end(metadata)) {
    return std::nullopt;
  }
  return try_make_hash32(
      std::string_view{entry->second.data(), entry->second.size()});
}

grpc::Status to_status(const transaction_result_t& result) {
  if (result.code == 0) {
    return grpc::Status::OK;
  }
  switch (static_cast<transaction_error_code>(result.code)) {
    case transaction_error_code::artifact_missing:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, result.log};
    case transaction_error_code::artifact_exists:
      return grpc::Status{grpc::StatusCode::ALREADY_EXISTS, result.log};
    case transaction_error_code::format_invalid:
    case transaction_error_code::range_invalid:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, result.log};
    case transaction_error_code::insufficient_privileges:
      return grpc::Status{grpc::StatusCode::PERMISSION_DENIED, result.log};
    case transaction_error_code::invalid_transaction:
    case transaction_error_code::unsupported_transaction_version:
      break;
  }
  return grpc::Status{grpc::StatusCode::INTERNAL, result.log};
}

grpc::Status to_status(const query_result_t& result) {
  if (result.code == 0) {
    return grpc::Status::OK;
  }
  switch (static_cast<query_error_code>(result.code)) {
    case query_error_code::not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, result.log};
    case query_error_code::invalid_key:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, result.log};
    case query_error_code::unsupported_path:
      break;
  }
  return grpc::Status{grpc::StatusCode::UNIMPLEMENTED, result.log};
}

listener::listener(reliquary::execution::engine& engine)
    : execution_engine_{engine} {}

transaction_result_t listener::submit(const principal_t& signer,
                                      transaction_payload_t payload,
                                      int64_t& committed_height) {
  auto lock = std::scoped_lock{submit_mutex_};
  auto tx = transaction_t{.version = 1,
                          .signer = signer,
                          .payload = std::move(payload)};
  auto encoder = encoder_t{};
  auto raw = encoder.encode(tx);

  auto check = execution_engine_.check_transaction(
      bytes_view_t{raw.data(), raw.size()});
  if (check.code != 0) {
    committed_height = execution_engine_.info().last_block_height;
    return check;
  }

  auto height =
      static_cast<uint64_t>(execution_engine_.info().last_block_height + 1);
  auto block = execution_engine_.finalize_block(height, {raw});
  auto commit = execution_engine_.commit();
  committed_height = commit.committed_height;
  if (block.tx_results.size() != 1) {
    spdlog::error("Expected one tx result at height {}, got {}", height,
                  block.tx_results.size());
    auto result = transaction_result_t{};
    result.code =
        static_cast<uint32_t>(transaction_error_code::invalid_transaction);
    result.log = "block produced no result";
    return result;
  }
  return block.tx_results.front();
}

query_result_t listener::query(const std::string_view path,
                               const bytes_t& data) {
  return execution_engine_.query(path, bytes_view_t{data.data(), data.size()});
}

grpc::ServerUnaryReactor* listener::ForgeArtifact(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::ForgeArtifactRequest* request,
    reliquary::registry::v1::ForgeArtifactResponse* response) {
  auto caller = principal_from_metadata(context->client_metadata());
  if (!caller) {
    return finish_unauthenticated(context);
  }

  auto height = int64_t{};
  auto result = submit(*caller,
                       forge_artifact_t{.name = request->name(),
                                        .power_rating = request->power_rating(),
                                        .lore = request->lore(),
                                        .tags = copy_tags(request->tags())},
                       height);
  if (result.code != 0) {
    return finish(context, to_status(result));
  }

  auto encoder = encoder_t{};
  auto artifact_id = encoder.try_decode<artifact_id_t>(
      bytes_view_t{result.data.data(), result.data.size()});
  if (!artifact_id) {
    return finish(context, grpc::Status{grpc::StatusCode::INTERNAL,
                                        "malformed forge result"});
  }
  response->set_artifact_id(*artifact_id);
  response->set_height(height);
  spdlog::info("Forged artifact {} at height {}", *artifact_id, height);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RetrieveArtifactLore(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::ArtifactRef* request,
    reliquary::registry::v1::RetrieveArtifactLoreResponse* response) {
  auto encoder = encoder_t{};
  auto result = query("/artifact/lore", encoder.encode(request->artifact_id()));
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  auto lore = encoder.try_decode<std::string>(
      bytes_view_t{result.value.data(), result.value.size()});
  if (!lore) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::INTERNAL, "malformed lore"});
  }
  response->set_lore(*lore);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckEntityAccess(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::CheckEntityAccessRequest* request,
    reliquary::registry::v1::CheckEntityAccessResponse* response) {
  auto principal = principal_from_bytes(request->principal());
  if (!principal) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "principal must be 32 bytes"});
  }
  auto encoder = encoder_t{};
  auto result = query("/artifact/access",
                      encoder.encode(std::tuple{request->artifact_id(),
                                                *principal}));
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  auto authorized = encoder.try_decode<bool>(
      bytes_view_t{result.value.data(), result.value.size()});
  response->set_authorized(authorized.value_or(false));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CountArtifactTags(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::ArtifactRef* request,
    reliquary::registry::v1::CountArtifactTagsResponse* response) {
  auto encoder = encoder_t{};
  auto result =
      query("/artifact/tags/count", encoder.encode(request->artifact_id()));
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  auto count = encoder.try_decode<uint64_t>(
      bytes_view_t{result.value.data(), result.value.size()});
  if (!count) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::INTERNAL, "malformed count"});
  }
  response->set_count(*count);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyIdentifierStructure(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::VerifyIdentifierStructureRequest* request,
    reliquary::registry::v1::VerifyIdentifierStructureResponse* response) {
  auto encoder = encoder_t{};
  auto result = query("/identifier/verify", encoder.encode(request->name()));
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  auto valid = encoder.try_decode<bool>(
      bytes_view_t{result.value.data(), result.value.size()});
  response->set_valid(valid.value_or(false));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::TransferGuardianship(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::TransferGuardianshipRequest* request,
    reliquary::registry::v1::MutationResponse* response) {
  auto caller = principal_from_metadata(context->client_metadata());
  if (!caller) {
    return finish_unauthenticated(context);
  }
  auto new_guardian = principal_from_bytes(request->new_guardian());
  if (!new_guardian) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "new_guardian must be 32 bytes"});
  }

  auto height = int64_t{};
  auto result = submit(
      *caller,
      transfer_guardianship_t{.artifact_id = request->artifact_id(),
                              .new_guardian = *new_guardian},
      height);
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  response->set_success(true);
  response->set_height(height);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ModifyArtifactProperties(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::ModifyArtifactPropertiesRequest* request,
    reliquary::registry::v1::MutationResponse* response) {
  auto caller = principal_from_metadata(context->client_metadata());
  if (!caller) {
    return finish_unauthenticated(context);
  }

  auto height = int64_t{};
  auto result =
      submit(*caller,
             modify_artifact_t{.artifact_id = request->artifact_id(),
                               .name = request->name(),
                               .power_rating = request->power_rating(),
                               .lore = request->lore(),
                               .tags = copy_tags(request->tags())},
             height);
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  response->set_success(true);
  response->set_height(height);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DestroyArtifact(
    grpc::CallbackServerContext* context,
    const reliquary::registry::v1::ArtifactRef* request,
    reliquary::registry::v1::MutationResponse* response) {
  auto caller = principal_from_metadata(context->client_metadata());
  if (!caller) {
    return finish_unauthenticated(context);
  }

  auto height = int64_t{};
  auto result = submit(
      *caller, destroy_artifact_t{.artifact_id = request->artifact_id()},
      height);
  if (result.code != 0) {
    return finish(context, to_status(result));
  }
  response->set_success(true);
  response->set_height(height);
  return finish_ok(context);
}

}  // namespace reliquary::rpc
