#pragma once
#include <tally/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tally::schema::key {

/// Appends key parts. Integers are written big-endian so that RocksDB's
/// bytewise ordering matches numeric ordering; variable length strings are
/// length-prefixed so one value can never be a prefix of another.
struct builder final {
  tally::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write_sized(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }

  tally::schema::bytes_t build() const { return data; }
};

/// Reads back a big-endian integer written by `builder::write`.
template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
T read_big_endian(const std::span<const uint8_t>& bytes) {
  auto value = T{};
  for (size_t i = 0; i < sizeof(T) && i < bytes.size(); ++i) {
    value = static_cast<T>((value << 8u) | bytes[i]);
  }
  return value;
}

}  // namespace tally::schema::key
