#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using match_span = std::pair<std::size_t, std::size_t>;

/// A line that matched, with every match in it
struct search_result {
  std::size_t line_number{0};
  std::string line{};
  // Half-open byte ranges into `line`, non-overlapping, left to right
  std::vector<match_span> matches{};

  std::vector<std::string_view> match_texts() const;
};
