#include <fmt/format.h>
#include <linegrep/line_source.hpp>
#include <linegrep/trim_line.hpp>
#include <linegrep/utf8.hpp>

istream_line_source::istream_line_source(std::istream &stream)
    : stream(stream) {}

read_status istream_line_source::read_line(std::string &line) {
  if (!std::getline(stream, line)) {
    if (stream.bad()) {
      error = "I/O error while reading input";
      return read_status::failed;
    }
    return read_status::end_of_input;
  }

  rtrim_line_terminators_in_place(line);

  if (const auto offset = find_invalid_utf8(line)) {
    error = fmt::format(
        "stream did not contain valid UTF-8 (invalid byte at offset {})",
        *offset);
    return read_status::failed;
  }

  return read_status::ok;
}
