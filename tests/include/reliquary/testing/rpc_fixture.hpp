#pragma once

#include <grpcpp/grpcpp.h>
#include <reliquary/registry/v1/registry.grpc.pb.h>
#include <reliquary/rpc/server.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/testing/execution_fixture.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace reliquary::testing {

/// Registry listener served on an ephemeral loopback port, with a stub bound
/// to it.
class rpc_fixture final {
 public:
  explicit rpc_fixture(const std::string_view db_prefix)
      : execution_{db_prefix}, listener_{execution_.engine()} {
    auto port = 0;
    auto builder = grpc::ServerBuilder{};
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    stub_ = reliquary::registry::v1::ArtifactRegistry::NewStub(
        grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                            grpc::InsecureChannelCredentials()));
  }

  rpc_fixture(const rpc_fixture&) = delete;
  rpc_fixture& operator=(const rpc_fixture&) = delete;
  rpc_fixture(rpc_fixture&&) = delete;
  rpc_fixture& operator=(rpc_fixture&&) = delete;

  ~rpc_fixture() {
    if (server_) {
      server_->Shutdown();
    }
  }

  bool serving() const { return server_ != nullptr; }
  reliquary::registry::v1::ArtifactRegistry::Stub& stub() { return *stub_; }
  reliquary::execution::engine& engine() { return execution_.engine(); }

 private:
  execution_fixture execution_;
  reliquary::rpc::listener listener_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<reliquary::registry::v1::ArtifactRegistry::Stub> stub_;
};

/// Attach `caller` as the hex principal header.
inline void set_caller(grpc::ClientContext& context,
                       const reliquary::schema::principal_t& caller) {
  context.AddMetadata(std::string{reliquary::rpc::kPrincipalMetadataKey},
                      reliquary::schema::to_hex(caller));
}

/// 32 raw bytes, as carried in request bodies.
inline std::string raw_principal(const reliquary::schema::principal_t& p) {
  return std::string{reinterpret_cast<const char*>(p.data()), p.size()};
}

}  // namespace reliquary::testing
