#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

/// Returns the offset of the first byte that is not part of a well formed
/// UTF-8 sequence, or nothing if the whole buffer is valid UTF-8
std::optional<std::size_t> find_invalid_utf8(std::string_view buffer);

inline bool is_valid_utf8(std::string_view buffer) {
  return !find_invalid_utf8(buffer).has_value();
}
