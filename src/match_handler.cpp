#include <algorithm>
#include <fmt/color.h>
#include <fmt/format.h>
#include <linegrep/match_handler.hpp>
#include <string_view>

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx) {
  line_context *lctx = (line_context *)(ctx);
  lctx->matches.push_back(std::make_pair(from, to));
  return 0;
}

std::optional<std::size_t> resolve_matches(
    std::vector<std::pair<unsigned long long, unsigned long long>> &matches,
    std::vector<match_span> &spans) {
  // Hyperscan reports matches in order of their end offset, and every
  // end offset of a repeat is its own match. Order by start, and for the
  // same start put the longest match first.
  std::sort(matches.begin(), matches.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.first != rhs.first) {
                return lhs.first < rhs.first;
              }
              return lhs.second > rhs.second;
            });

  for (const auto &[from, to] : matches) {
    if (!spans.empty()) {
      const auto previous_end = spans.back().second;

      // Case 1: Overlaps (or is contained in) the previous match.
      // Only the leftmost start is reported for an end offset, so a match
      // running past the previous one may hide another that starts at or
      // after previous_end. Everything from there on has to be rescanned.
      if (from < previous_end) {
        if (to > previous_end) {
          return previous_end;
        }
        continue;
      }

      // Case 2: An empty match right where the previous match ended
      if (from == to && from == previous_end) {
        continue;
      }
    }
    spans.emplace_back(from, to);
  }
  return std::nullopt;
}

static std::string highlight_matches(const search_result &result) {
  const std::string_view line(result.line);
  std::string highlighted;
  std::size_t index{0};
  for (const auto &[from, to] : result.matches) {
    highlighted += line.substr(index, from - index);
    highlighted +=
        fmt::format(fg(fmt::color::red), "{}", line.substr(from, to - from));
    index = to;
  }
  highlighted += line.substr(index);
  return highlighted;
}

std::vector<std::string> format_result(const search_result &result,
                                       output_mode mode, bool colored) {
  std::vector<std::string> lines;

  switch (mode) {
  case output_mode::count_only:
    break;
  case output_mode::match_only:
    lines.reserve(result.matches.size());
    for (const auto &text : result.match_texts()) {
      if (colored) {
        lines.push_back(fmt::format(fg(fmt::color::red), "{}", text));
      } else {
        lines.emplace_back(text);
      }
    }
    break;
  case output_mode::line_numbered:
    if (colored) {
      lines.push_back(
          fmt::format(fg(fmt::color::green), "{}:", result.line_number) +
          " " + highlight_matches(result));
    } else {
      lines.push_back(fmt::format("{}: {}", result.line_number, result.line));
    }
    break;
  case output_mode::full_line:
    lines.push_back(colored ? highlight_matches(result) : result.line);
    break;
  }

  return lines;
}
