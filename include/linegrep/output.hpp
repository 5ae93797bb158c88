#pragma once
#include <cstddef>
#include <cstdio>
#include <linegrep/search_options.hpp>
#include <linegrep/searcher.hpp>
#include <string_view>

/// Writes one line followed by a newline. Throws write_failure.
void write_line(std::FILE *out, std::string_view line);

/// Drives `scan` to completion, writing every formatted result to `out`.
/// In count mode only the number of matching lines is written, once the
/// scan is exhausted. Returns the number of matching lines.
///
/// line_read_failure from the scan and write_failure from `out` propagate
/// to the caller; lines written before the failure stay written.
std::size_t print_results(line_scan &scan, output_mode mode, bool colored,
                          std::FILE *out);
