#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/record_keys.hpp>

namespace tally::schema::key {

bytes_t make_prefix(const std::string_view prefix) {
  return tally::schema::make_bytes(prefix);
}

bytes_t make_row_key(const std::string_view prefix, const uint64_t id) {
  auto key = builder{};
  key.write(prefix).write(id);
  return key.build();
}

bytes_t make_owner_prefix(const std::string_view prefix, const uint64_t owner) {
  auto key = builder{};
  key.write(prefix).write(owner);
  return key.build();
}

bytes_t make_owner_key(const std::string_view prefix,
                       const uint64_t owner,
                       const uint64_t id) {
  auto key = builder{};
  key.write(prefix).write(owner).write(id);
  return key.build();
}

bytes_t make_address_prefix(const std::string_view prefix,
                            const std::string_view address) {
  auto key = builder{};
  key.write(prefix).write_sized(address);
  return key.build();
}

bytes_t make_address_key(const std::string_view prefix,
                         const std::string_view address,
                         const uint64_t id) {
  auto key = builder{};
  key.write(prefix).write_sized(address).write(id);
  return key.build();
}

bytes_t make_sequence_key(const std::string_view sequence) {
  auto key = builder{};
  key.write(kSequencePrefix).write(sequence);
  return key.build();
}

bytes_t make_discussion_origin_key(const uint64_t height,
                                   const uint32_t ordinal) {
  auto key = builder{};
  key.write(kDiscussionByOriginPrefix).write(height).write(ordinal);
  return key.build();
}

uint64_t trailing_id(const bytes_view_t& key) {
  if (key.size() < sizeof(uint64_t)) {
    return 0;
  }
  return read_big_endian<uint64_t>(key.subspan(key.size() - sizeof(uint64_t)));
}

}  // namespace tally::schema::key
