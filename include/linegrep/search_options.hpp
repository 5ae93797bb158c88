#pragma once
#include <argparse/argparse.hpp>
#include <string>

struct search_options {
  bool show_line_numbers{false};
  bool count_matching_lines{false};
  bool ignore_case{false};
  bool print_only_matching_parts{false};
  bool word_regexp{false};
  bool compile_pattern_as_literal{false};
  bool use_ucp{false};
  bool is_stdout{false};
};

enum class output_mode { count_only, match_only, line_numbered, full_line };

/// Picks the output mode for a set of options.
///
/// Several flags may be set at once; the first of count, only-matching
/// and line-number that is set wins, otherwise full lines are printed.
output_mode resolve_output_mode(const search_options &options);

/// Registers the search flags (-n, -c, -i, -o, -w, -F, --ucp, --color)
void add_search_arguments(argparse::ArgumentParser &program);

/// Fills `options` from the parsed command line and returns the pattern
/// rewritten for the requested flags (-w, -F)
std::string initialize_search(const std::string &pattern,
                              argparse::ArgumentParser &program,
                              search_options &options);

/// Escapes every regex meta character in `literal`
std::string escape_literal(const std::string &literal);
