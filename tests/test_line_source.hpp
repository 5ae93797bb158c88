#pragma once
#include <cstddef>
#include <linegrep/line_source.hpp>
#include <optional>
#include <string>
#include <vector>

// Serves lines from memory. A read of line `fail_at` (0-based) fails.
class vector_line_source : public line_source {
public:
  explicit vector_line_source(std::vector<std::string> lines,
                              std::optional<std::size_t> fail_at = {})
      : lines(std::move(lines)), fail_at(fail_at) {}

  read_status read_line(std::string &line) override {
    reads += 1;
    if (fail_at.has_value() && index == fail_at.value()) {
      index += 1;
      return read_status::failed;
    }
    if (index >= lines.size()) {
      return read_status::end_of_input;
    }
    line = lines[index++];
    return read_status::ok;
  }

  const std::string &last_error() const override { return error; }

  std::size_t reads{0};

private:
  std::vector<std::string> lines;
  std::optional<std::size_t> fail_at;
  std::size_t index{0};
  std::string error{"simulated I/O fault"};
};
