#pragma once
#include <istream>
#include <string>

enum class read_status { ok, end_of_input, failed };

/// A read-once producer of text lines. The caller owns whatever it reads
/// from (a file, standard input) and keeps it open while lines are read.
class line_source {
public:
  virtual ~line_source() = default;

  /// Reads the next line into `line` without its terminator. When this
  /// returns `failed`, last_error() describes the fault.
  virtual read_status read_line(std::string &line) = 0;

  virtual const std::string &last_error() const = 0;
};

/// Reads lines with std::getline, strips trailing "\r" and "\n" and
/// rejects lines that are not valid UTF-8
class istream_line_source : public line_source {
public:
  explicit istream_line_source(std::istream &stream);

  read_status read_line(std::string &line) override;
  const std::string &last_error() const override { return error; }

private:
  std::istream &stream;
  std::string error{};
};
