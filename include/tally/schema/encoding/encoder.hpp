#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

// The codec is a build time choice: callers name the library through a tag
// (`encoder<scale_encoder_tag>`) and never see the library's own types.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tally::schema::bytes_t& out);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
