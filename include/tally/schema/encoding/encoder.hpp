#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

// Records are encoded through a build-time selected library, named by a tag
// type. The persisted format is JSON; the tag keeps the call sites
// independent of the JSON library in use.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
