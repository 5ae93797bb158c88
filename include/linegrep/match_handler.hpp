#pragma once
#include <hs/hs.h>
#include <linegrep/search_options.hpp>
#include <linegrep/search_result.hpp>
#include <optional>
#include <string>
#include <vector>

struct line_context {
  std::vector<std::pair<unsigned long long, unsigned long long>> &matches;
};

int on_match(unsigned int id, unsigned long long from, unsigned long long to,
             unsigned int flags, void *ctx);

/// Appends the raw matches reported for one line to `spans` as
/// non-overlapping spans, leftmost-longest, in left to right order.
///
/// Returns the offset the line must be scanned again from when a dropped
/// match ran past the last accepted span; spans past that offset have not
/// been appended.
std::optional<std::size_t> resolve_matches(
    std::vector<std::pair<unsigned long long, unsigned long long>> &matches,
    std::vector<match_span> &spans);

/// Renders one result as zero or more output lines (without newlines).
/// With `colored`, matches are highlighted and line numbers are green.
std::vector<std::string> format_result(const search_result &result,
                                       output_mode mode, bool colored = false);
