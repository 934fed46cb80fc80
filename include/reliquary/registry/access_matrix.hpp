#pragma once

#include <reliquary/registry/result.hpp>
#include <reliquary/schema/primitives.hpp>
#include <reliquary/storage/storage.hpp>

namespace reliquary::registry {

/// (artifact id, principal) -> explicit read grant.
///
/// Only `true` is ever written. A missing row means "not authorized". Rows
/// are independent of the vault: they are neither checked against nor swept
/// with artifact records.
class access_matrix final {
 public:
  access_matrix(encoder_t& encoder, const storage_t& storage);

  /// Stage a grant; granting twice leaves a single `true` row.
  void grant(reliquary::schema::artifact_id_t artifact_id,
             const reliquary::schema::principal_t& principal,
             reliquary::storage::write_set& writes) const;

  bool is_authorized(reliquary::schema::artifact_id_t artifact_id,
                     const reliquary::schema::principal_t& principal) const;

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
};

}  // namespace reliquary::registry
