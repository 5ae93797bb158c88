#include <linegrep/search_options.hpp>
#include <string_view>
#include <unistd.h>

output_mode resolve_output_mode(const search_options &options) {
  if (options.count_matching_lines) {
    return output_mode::count_only;
  } else if (options.print_only_matching_parts) {
    return output_mode::match_only;
  } else if (options.show_line_numbers) {
    return output_mode::line_numbered;
  } else {
    return output_mode::full_line;
  }
}

std::string escape_literal(const std::string &literal) {
  static constexpr std::string_view meta_characters = "\\^$.|?*+()[]{}";

  std::string result;
  result.reserve(literal.size() * 2);
  for (const auto c : literal) {
    if (meta_characters.find(c) != std::string_view::npos) {
      result += '\\';
    }
    result += c;
  }
  return result;
}

void add_search_arguments(argparse::ArgumentParser &program) {
  program.add_argument("-c", "--count")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("--color").default_value(std::string{"auto"});

  program.add_argument("-F", "--fixed-strings")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-i", "--ignore-case")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-n", "--line-number")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-o", "--only-matching")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("--ucp").default_value(false).implicit_value(true);

  program.add_argument("-w", "--word-regexp")
      .default_value(false)
      .implicit_value(true);
}

std::string initialize_search(const std::string &pattern,
                              argparse::ArgumentParser &program,
                              search_options &options) {
  options.show_line_numbers = program.get<bool>("-n");
  options.count_matching_lines = program.get<bool>("-c");
  options.ignore_case = program.get<bool>("-i");
  options.print_only_matching_parts = program.get<bool>("-o");
  options.compile_pattern_as_literal = program.get<bool>("-F");
  options.word_regexp = program.get<bool>("-w");
  options.use_ucp = program.get<bool>("--ucp");

  const auto color = program.get<std::string>("--color");
  if (color == "always") {
    options.is_stdout = true;
  } else if (color == "never") {
    options.is_stdout = false;
  } else if (color == "auto") {
    options.is_stdout = isatty(STDOUT_FILENO) == 1;
  } else {
    throw std::runtime_error("Invalid value for --color: " + color +
                             " (expected auto, always or never)");
  }

  // Check if word boundary is requested
  if (options.word_regexp) {
    // This cannot work as a literal anymore
    const auto body = options.compile_pattern_as_literal
                          ? escape_literal(pattern)
                          : "(?:" + pattern + ")";
    options.compile_pattern_as_literal = false;
    return "\\b" + body + "\\b";
  }

  return pattern;
}
