#pragma once
#include <cstddef>
#include <hs/hs.h>
#include <iterator>
#include <linegrep/line_source.hpp>
#include <linegrep/search_options.hpp>
#include <linegrep/search_result.hpp>
#include <optional>
#include <string>

class line_scan;

/// Owns a compiled pattern and the options it was compiled with.
///
/// The pattern is compiled once, in the constructor, which throws
/// invalid_pattern when Hyperscan rejects it. Each call to search() starts
/// an independent scan over a fresh line source.
class searcher {
public:
  searcher(const std::string &pattern, const search_options &options);
  ~searcher();

  searcher(const searcher &) = delete;
  searcher &operator=(const searcher &) = delete;

  line_scan search(line_source &source);

  /// Scans a single line. Returns nothing if the pattern does not occur
  /// in it, otherwise the line together with all of its matches.
  std::optional<search_result> search_line(std::size_t line_number,
                                           std::string &&line);

  output_mode mode() const { return format; }

private:
  hs_database_t *database = NULL;
  hs_scratch_t *scratch = NULL;
  search_options options;
  output_mode format;
};

/// A single pass over a line source, producing matching lines on demand.
///
/// Only the line being scanned is held in memory. A read fault is thrown
/// from next() as line_read_failure and halts the scan; once halted or
/// exhausted, next() keeps returning nothing. Line numbers start at 1 and
/// advance for every line read, matching or not.
class line_scan {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = search_result;
    using difference_type = std::ptrdiff_t;
    using pointer = search_result *;
    using reference = search_result &;

    iterator() = default;
    explicit iterator(line_scan *scan) : scan(scan) { advance(); }

    reference operator*() { return *current; }
    pointer operator->() { return &*current; }

    iterator &operator++() {
      advance();
      return *this;
    }

    bool operator==(const iterator &other) const {
      return scan == other.scan;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    void advance();

    line_scan *scan{nullptr};
    std::optional<search_result> current{};
  };

  line_scan(searcher &engine, line_source &source);

  std::optional<search_result> next();

  iterator begin() { return iterator{this}; }
  iterator end() { return iterator{}; }

  /// Number of matching lines produced so far
  std::size_t matched_lines() const { return num_matching_lines; }

  /// Number of lines read from the source so far
  std::size_t lines_read() const { return current_line_number; }

  bool finished() const { return done; }

private:
  searcher &engine;
  line_source &source;
  std::size_t current_line_number{0};
  std::size_t num_matching_lines{0};
  bool done{false};
};
