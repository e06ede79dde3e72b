#pragma once

#include <cstdint>
#include <vector>

namespace tally::schema {

/// Zero-based page index and page size.
struct page_request final {
  uint32_t page{};
  uint32_t page_size{20};
};

/// One page of rows, newest id first, with the size of the whole result set.
template <typename T>
struct page_result final {
  std::vector<T> items;
  uint64_t total{};
};

}  // namespace tally::schema
