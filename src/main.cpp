#include <argparse/argparse.hpp>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <linegrep/constants.hpp>
#include <linegrep/errors.hpp>
#include <linegrep/line_source.hpp>
#include <linegrep/output.hpp>
#include <linegrep/print_help.hpp>
#include <linegrep/search_options.hpp>
#include <linegrep/searcher.hpp>
#include <optional>

std::size_t perform_search(const std::string &pattern,
                           const std::optional<std::string> &path,
                           argparse::ArgumentParser &program) {
  search_options options;
  const auto effective_pattern = initialize_search(pattern, program, options);

  // Compile before touching the input
  searcher s(effective_pattern, options);

  std::ifstream file;
  if (path.has_value()) {
    file.open(path.value(), std::ios::binary);
    if (!file.is_open()) {
      throw search_error(
          fmt::format("{}: {} (os error {})", path.value(),
                      std::strerror(errno), errno));
    }
  }

  istream_line_source source(path.has_value() ? static_cast<std::istream &>(file)
                                              : std::cin);
  auto scan = s.search(source);
  return print_results(scan, s.mode(), options.is_stdout, stdout);
}

int main(int argc, char **argv) {
  std::ios::sync_with_stdio(false);

  argparse::ArgumentParser program(NAME.data(), VERSION.data(),
                                   argparse::default_arguments::none);

  program.add_argument("-h", "--help")
      .default_value(false)
      .implicit_value(true);

  program.add_argument("-v", "--version")
      .default_value(false)
      .implicit_value(true);

  add_search_arguments(program);

  program.add_argument("pattern_and_path")
      .default_value(std::vector<std::string>{})
      .remaining();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error &err) {
    std::cerr << err.what() << std::endl;
    std::cerr << "\nFor more information try --help\n";
    return 1;
  }

  if (program.is_used("-h")) {
    print_help();
    return 0;
  } else if (program.is_used("-v")) {
    fmt::print("{}\n", VERSION);
    return 0;
  }

  auto pattern_and_path =
      program.get<std::vector<std::string>>("pattern_and_path");
  const auto size = pattern_and_path.size();

  if (size == 0) {
    std::cerr << "1 argument(s) expected for <PATTERN>. 0 provided."
              << std::endl;
    std::cerr << "\nFor more information try --help\n";
    return 1;
  } else if (size > 2) {
    std::cerr << "At most one <PATH> may be searched. " << size - 1
              << " provided." << std::endl;
    std::cerr << "\nFor more information try --help\n";
    return 1;
  }

  std::optional<std::string> path{};
  if (size == 2) {
    path = pattern_and_path[1];
  }

  try {
    const auto count = perform_search(pattern_and_path[0], path, program);
    fmt::print(stderr, "Total matched lines: {}\n", count);
  } catch (const std::runtime_error &err) {
    std::fflush(stdout);
    fmt::print(stderr, "{}: {}\n", NAME, err.what());
    return 1;
  }

  return 0;
}
