#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/// Base class for every error raised while searching
class search_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The pattern could not be compiled into a database
class invalid_pattern : public search_error {
public:
  explicit invalid_pattern(const std::string &message)
      : search_error("Error compiling pattern: " + message) {}
};

/// The line source failed while reading a line
class line_read_failure : public search_error {
public:
  line_read_failure(std::size_t line_number, const std::string &message);

  std::size_t line_number() const { return failed_line_number; }

private:
  std::size_t failed_line_number;
};

/// Writing formatted output to the sink failed
class write_failure : public search_error {
public:
  explicit write_failure(const std::string &message)
      : search_error("Failed to write output: " + message) {}
};
