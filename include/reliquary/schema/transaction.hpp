#pragma once
#include <reliquary/schema/destroy_artifact.hpp>
#include <reliquary/schema/forge_artifact.hpp>
#include <reliquary/schema/modify_artifact.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/schema/transfer_guardianship.hpp>
#include <variant>

namespace reliquary::schema {

using transaction_payload_t = std::variant<forge_artifact_t,
                                           modify_artifact_t,
                                           transfer_guardianship_t,
                                           destroy_artifact_t>;

template <uint16_t Version>
struct transaction;

/// Envelope executed by the engine. `signer` is the caller principal as
/// authenticated by the host.
template <>
struct transaction<1> final {
  uint16_t version{1};
  principal_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace reliquary::schema
