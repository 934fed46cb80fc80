#pragma once

#include <reliquary/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: registry keys.
// Registry workflow: canonical key prefixes and key codecs for the artifact
// vault, the access matrix and the sequence counter.
namespace reliquary::schema::key {

inline constexpr std::string_view kArtifactKeyPrefix{"SYS|STATE|ARTIFACT|"};
inline constexpr std::string_view kAccessKeyPrefix{"SYS|STATE|ACCESS|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQUENCE|"};
inline constexpr std::string_view kCommittedHeightKey{
    "SYS|APP|COMMITTED_HEIGHT"};

template <typename Encoder, typename T>
reliquary::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
reliquary::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
reliquary::schema::bytes_t make_artifact_key(
    Encoder& encoder,
    const reliquary::schema::artifact_id_t artifact_id) {
  return make_prefixed_key(encoder, kArtifactKeyPrefix, artifact_id);
}

template <typename Encoder>
reliquary::schema::bytes_t make_access_key(
    Encoder& encoder,
    const reliquary::schema::artifact_id_t artifact_id,
    const reliquary::schema::principal_t& principal) {
  return make_prefixed_key(encoder, kAccessKeyPrefix,
                           std::tuple{artifact_id, principal});
}

template <typename Encoder>
reliquary::schema::bytes_t make_sequence_key(Encoder& encoder) {
  return make_prefix_key(encoder, kSequenceKeyPrefix);
}

}  // namespace reliquary::schema::key
