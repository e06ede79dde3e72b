#pragma once
#include <tally/common/errors.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/discussion_record.hpp>
#include <tally/schema/encoding/scale/grant_record.hpp>
#include <tally/schema/encoding/scale/grant_vote_record.hpp>
#include <tally/schema/encoding/scale/proposal_record.hpp>
#include <tally/schema/encoding/scale/proposal_vote_record.hpp>
#include <tally/schema/encoding/scale/validator_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace tally::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tally::schema::bytes_t& out);

  /// Throws storage_error on malformed input; stored values are only ever
  /// written by this encoder, so a failure means the database is damaged.
  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);
};

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    throw tally::common::storage_error{"failed to encode SCALE object"};
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tally::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    throw tally::common::storage_error{"failed to decode SCALE bytes"};
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace tally::schema::encoding
