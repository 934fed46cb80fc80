#pragma once

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <reliquary/schema/encoding/scale/encoder.hpp>
#include <reliquary/schema/registry_error_code.hpp>
#include <reliquary/storage/rocksdb/storage.hpp>

namespace reliquary::registry {

using encoder_t = reliquary::schema::encoding::encoder<
    reliquary::schema::encoding::scale_encoder_tag>;
using storage_t =
    reliquary::storage::storage<reliquary::storage::rocksdb_storage_tag>;

/// Value or `registry_error_code` carried as a std::error_code.
template <typename T>
using result_t = boost::outcome_v2::std_result<T>;

inline auto fail(const reliquary::schema::registry_error_code code) {
  return boost::outcome_v2::failure(make_error_code(code));
}

}  // namespace reliquary::registry
