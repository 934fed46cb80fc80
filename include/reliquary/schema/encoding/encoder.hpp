#pragma once
#include <reliquary/schema/primitives.hpp>
#include <optional>
#include <span>

namespace reliquary::schema::encoding {

/// Build-time selected wire codec. Specialized per library tag.
template <typename Library>
struct encoder {
  template <typename T>
  reliquary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, reliquary::schema::bytes_t& out);

  template <typename T>
  T decode(const reliquary::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const reliquary::schema::bytes_view_t& bytes);
};

}  // namespace reliquary::schema::encoding
