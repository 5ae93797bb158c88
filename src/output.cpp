#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <linegrep/errors.hpp>
#include <linegrep/match_handler.hpp>
#include <linegrep/output.hpp>
#include <system_error>

void write_line(std::FILE *out, std::string_view line) {
  try {
    fmt::print(out, "{}\n", line);
  } catch (const std::system_error &e) {
    throw write_failure(e.what());
  }
}

static void flush(std::FILE *out) {
  if (std::fflush(out) != 0 || std::ferror(out)) {
    throw write_failure(std::strerror(errno));
  }
}

std::size_t print_results(line_scan &scan, output_mode mode, bool colored,
                          std::FILE *out) {
  for (auto &result : scan) {
    for (const auto &line : format_result(result, mode, colored)) {
      write_line(out, line);
    }
  }

  if (mode == output_mode::count_only) {
    write_line(out, fmt::format("{}", scan.matched_lines()));
  }

  flush(out);
  return scan.matched_lines();
}
