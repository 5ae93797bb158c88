#include <fmt/format.h>
#include <linegrep/errors.hpp>

line_read_failure::line_read_failure(std::size_t line_number,
                                     const std::string &message)
    : search_error(
          fmt::format("Failed to read line {}: {}", line_number, message)),
      failed_line_number(line_number) {}
