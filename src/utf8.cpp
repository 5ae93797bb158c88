#include <linegrep/utf8.hpp>

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::optional<std::size_t> find_invalid_utf8(std::string_view buffer) {
  const auto *bytes = reinterpret_cast<const unsigned char *>(buffer.data());
  const auto size = buffer.size();

  std::size_t i{0};
  while (i < size) {
    const unsigned char c = bytes[i];
    if (c < 0x80) {
      i += 1;
      continue;
    }

    // Sequence length and the allowed range of the second byte, which
    // rules out overlong forms, surrogates and code points past U+10FFFF
    std::size_t length{0};
    unsigned char lower{0x80}, upper{0xBF};
    if (c >= 0xC2 && c <= 0xDF) {
      length = 2;
    } else if (c == 0xE0) {
      length = 3;
      lower = 0xA0;
    } else if (c == 0xED) {
      length = 3;
      upper = 0x9F;
    } else if (c >= 0xE1 && c <= 0xEF) {
      length = 3;
    } else if (c == 0xF0) {
      length = 4;
      lower = 0x90;
    } else if (c == 0xF4) {
      length = 4;
      upper = 0x8F;
    } else if (c >= 0xF1 && c <= 0xF3) {
      length = 4;
    } else {
      return i;
    }

    if (i + length > size) {
      return i;
    }
    if (bytes[i + 1] < lower || bytes[i + 1] > upper) {
      return i;
    }
    for (std::size_t j = 2; j < length; ++j) {
      if (!is_continuation(bytes[i + j])) {
        return i;
      }
    }
    i += length;
  }

  return std::nullopt;
}
