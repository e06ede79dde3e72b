#include <tally/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace tally::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_sized(const std::string_view& str) {
  write(static_cast<uint32_t>(str.size()));
  return write(str);
}
