#include <fmt/color.h>
#include <fmt/format.h>
#include <linegrep/constants.hpp>
#include <linegrep/print_help.hpp>
#include <unistd.h>

static void print_heading(bool is_stdout, std::string_view name) {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "{}\n", name);
  } else {
    fmt::print("{}\n", name);
  }
}

static void print_option_name(bool is_stdout, std::string_view name,
                              std::string_view arg_placeholder = "") {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", name);
  } else {
    fmt::print("    {}", name);
  }
  if (arg_placeholder.empty()) {
    fmt::print("\n");
  } else {
    fmt::print(" {}\n", arg_placeholder);
  }
}

static void print_description_line(std::string_view line) {
  fmt::print("        {}\n", line);
}

static void print_synopsis(bool is_stdout, std::string_view arguments) {
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", NAME);
  } else {
    fmt::print("    {}", NAME);
  }
  fmt::print(" [OPTIONS] ");
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "{}", arguments);
  } else {
    fmt::print("{}", arguments);
  }
  fmt::print("\n");
}

void print_help() {
  const auto is_stdout = isatty(STDOUT_FILENO) == 1;

  // Name and Brief Description
  print_heading(is_stdout, "NAME");
  if (is_stdout) {
    fmt::print(fmt::emphasis::bold, "    {}", NAME);
  } else {
    fmt::print("    {}", NAME);
  }
  fmt::print(" - {}\n\n", DESCRIPTION);

  // Synopsis
  print_heading(is_stdout, "SYNOPSIS");
  print_synopsis(is_stdout, "PATTERN [PATH]");
  print_synopsis(is_stdout, "--help");
  print_synopsis(is_stdout, "--version");
  fmt::print("\n");

  print_heading(is_stdout, "PATTERN");
  print_description_line(
      "A regular expression in the Hyperscan (PCRE subset) dialect.\n");

  print_heading(is_stdout, "PATH");
  print_description_line(
      "A file to search line by line. Standard input is read if no path");
  print_description_line(
      "is given. The total number of matching lines is reported on");
  print_description_line("standard error once the input is exhausted.\n");

  print_heading(is_stdout, "OPTIONS");

  // Count
  print_option_name(is_stdout, "-c, --count");
  print_description_line(
      "Suppress normal output and print the number of matching lines.");
  print_description_line("Takes precedence over -o and -n.\n");

  // Color
  print_option_name(is_stdout, "--color", "<WHEN>");
  print_description_line(
      "When to highlight matches: auto (default, only on a terminal),");
  print_description_line("always or never.\n");

  // Fixed Strings
  print_option_name(is_stdout, "-F, --fixed-strings");
  print_description_line(
      "Treat the pattern as a literal string instead of a regex.\n");

  // Help
  print_option_name(is_stdout, "-h, --help");
  print_description_line("Display this help message.\n");

  // Ignore case
  print_option_name(is_stdout, "-i, --ignore-case");
  print_description_line(
      "Search the whole pattern case insensitively. The pattern may still");
  print_description_line("use (?i) and (?-i) to toggle it locally.\n");

  // Line Number
  print_option_name(is_stdout, "-n, --line-number");
  print_description_line(
      "Prefix each matching line with its line number (1-based).\n");

  // Only matching parts
  print_option_name(is_stdout, "-o, --only-matching");
  print_description_line(
      "Print only matched parts of a matching line, with each such part on a");
  print_description_line("separate output line. Takes precedence over -n.\n");

  // UCP
  print_option_name(is_stdout, "--ucp");
  print_description_line(
      "Use unicode properties, rather than the default ASCII interpretations,");
  print_description_line(
      "for character mnemonics like \\w and \\s as well as the POSIX");
  print_description_line("character classes.\n");

  // Version
  print_option_name(is_stdout, "-v, --version");
  print_description_line("Display the version information.\n");

  // Word
  print_option_name(is_stdout, "-w, --word-regexp");
  print_description_line(
      "Only show matches surrounded by word boundaries. This is equivalent to");
  print_description_line(
      "putting \\b before and after the search pattern.\n");
}
