#include <linegrep/trim_line.hpp>

std::string_view rtrim_line_terminators(const std::string_view &s) {
  const auto end = s.find_last_not_of(LINE_TERMINATORS);
  return (end == std::string_view::npos) ? "" : s.substr(0, end + 1);
}

void rtrim_line_terminators_in_place(std::string &s) {
  s.resize(rtrim_line_terminators(s).size());
}
