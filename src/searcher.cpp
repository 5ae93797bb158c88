#include <fmt/format.h>
#include <linegrep/compiler.hpp>
#include <linegrep/constants.hpp>
#include <linegrep/errors.hpp>
#include <linegrep/match_handler.hpp>
#include <linegrep/searcher.hpp>
#include <vector>

searcher::searcher(const std::string &pattern, const search_options &options)
    : options(options), format(resolve_output_mode(options)) {
  compile_hs_database(&database, &scratch, this->options, pattern);
}

searcher::~searcher() {
  if (scratch) {
    hs_free_scratch(scratch);
  }
  if (database) {
    hs_free_database(database);
  }
}

line_scan searcher::search(line_source &source) {
  return line_scan{*this, source};
}

std::optional<search_result> searcher::search_line(std::size_t line_number,
                                                   std::string &&line) {
  if (line.size() > MAX_LINE_LENGTH) {
    throw search_error(
        fmt::format("Line {} is too long to be searched", line_number));
  }

  std::vector<match_span> spans{};
  std::vector<std::pair<unsigned long long, unsigned long long>> matches{};
  std::size_t offset{0};

  while (true) {
    matches.clear();
    line_context ctx{matches};

    if (hs_scan(database, line.data() + offset,
                static_cast<unsigned int>(line.size() - offset), 0, scratch,
                on_match, (void *)(&ctx)) != HS_SUCCESS) {
      throw search_error(fmt::format("Error scanning line {}", line_number));
    }

    for (auto &[from, to] : matches) {
      from += offset;
      to += offset;
    }

    // Resume right after the last accepted match
    const auto resume_offset = resolve_matches(matches, spans);
    if (!resume_offset.has_value() || resume_offset.value() <= offset) {
      break;
    }
    offset = resume_offset.value();
  }

  if (spans.empty()) {
    return std::nullopt;
  }

  return search_result{line_number, std::move(line), std::move(spans)};
}

line_scan::line_scan(searcher &engine, line_source &source)
    : engine(engine), source(source) {}

std::optional<search_result> line_scan::next() {
  while (!done) {
    std::string line;
    const auto status = source.read_line(line);
    if (status == read_status::end_of_input) {
      done = true;
      break;
    }

    current_line_number += 1;

    if (status == read_status::failed) {
      // Line numbers past a read fault cannot be trusted, stop here
      done = true;
      throw line_read_failure(current_line_number, source.last_error());
    }

    auto result = engine.search_line(current_line_number, std::move(line));
    if (result) {
      num_matching_lines += 1;
      return result;
    }
  }

  return std::nullopt;
}

void line_scan::iterator::advance() {
  current = scan->next();
  if (!current) {
    scan = nullptr;
  }
}
