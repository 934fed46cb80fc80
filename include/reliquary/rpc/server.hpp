#pragma once

#include <grpcpp/grpcpp.h>
#include <reliquary/execution/engine.hpp>
#include <reliquary/registry/v1/registry.grpc.pb.h>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/schema/query_result.hpp>
#include <reliquary/schema/transaction.hpp>
#include <reliquary/schema/transaction_result.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string_view>

namespace reliquary::rpc {

/// Metadata header carrying the host-authenticated caller principal as 64 hex
/// characters. Principals inside request bodies are 32 raw bytes instead.
inline constexpr std::string_view kPrincipalMetadataKey{"x-reliquary-principal"};

/// Parse the caller principal (64 hex characters) from request metadata.
std::optional<reliquary::schema::principal_t> principal_from_metadata(
    const std::multimap<grpc::string_ref, grpc::string_ref>& metadata);

/// Map a finalized transaction result onto a gRPC status.
grpc::Status to_status(const reliquary::schema::transaction_result_t& result);

/// Map a query result onto a gRPC status.
grpc::Status to_status(const reliquary::schema::query_result_t& result);

/// gRPC front end for the artifact registry.
///
/// Each mutating call is executed as its own block through the engine and
/// committed before the response is sent. Reads go through engine queries
/// against committed state.
struct listener final
    : public reliquary::registry::v1::ArtifactRegistry::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(reliquary::execution::engine& engine);

  grpc::ServerUnaryReactor* ForgeArtifact(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::ForgeArtifactRequest* request,
      reliquary::registry::v1::ForgeArtifactResponse* response) override final;

  grpc::ServerUnaryReactor* RetrieveArtifactLore(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::ArtifactRef* request,
      reliquary::registry::v1::RetrieveArtifactLoreResponse* response)
      override final;

  /// Never fails for a well-formed principal; unknown artifacts report
  /// `authorized = false`.
  grpc::ServerUnaryReactor* CheckEntityAccess(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::CheckEntityAccessRequest* request,
      reliquary::registry::v1::CheckEntityAccessResponse* response)
      override final;

  grpc::ServerUnaryReactor* CountArtifactTags(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::ArtifactRef* request,
      reliquary::registry::v1::CountArtifactTagsResponse* response)
      override final;

  grpc::ServerUnaryReactor* VerifyIdentifierStructure(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::VerifyIdentifierStructureRequest* request,
      reliquary::registry::v1::VerifyIdentifierStructureResponse* response)
      override final;

  grpc::ServerUnaryReactor* TransferGuardianship(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::TransferGuardianshipRequest* request,
      reliquary::registry::v1::MutationResponse* response) override final;

  grpc::ServerUnaryReactor* ModifyArtifactProperties(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::ModifyArtifactPropertiesRequest* request,
      reliquary::registry::v1::MutationResponse* response) override final;

  grpc::ServerUnaryReactor* DestroyArtifact(
      grpc::CallbackServerContext* context,
      const reliquary::registry::v1::ArtifactRef* request,
      reliquary::registry::v1::MutationResponse* response) override final;

 private:
  /// Execute one transaction as a single-tx block and commit it.
  reliquary::schema::transaction_result_t submit(
      const reliquary::schema::principal_t& signer,
      reliquary::schema::transaction_payload_t payload,
      int64_t& committed_height);

  reliquary::schema::query_result_t query(
      std::string_view path,
      const reliquary::schema::bytes_t& data);

  /// Serializes block production across concurrent callbacks.
  std::mutex submit_mutex_;
  reliquary::execution::engine& execution_engine_;
};

}  // namespace reliquary::rpc
