#include "test_line_source.hpp"
#include <gtest/gtest.h>
#include <linegrep/errors.hpp>
#include <linegrep/searcher.hpp>

static std::vector<search_result> collect(line_scan &scan) {
  std::vector<search_result> results;
  while (auto result = scan.next()) {
    results.push_back(std::move(*result));
  }
  return results;
}

TEST(searcher, NumbersLinesIncludingNonMatchingOnes) {
  searcher s("x", search_options{});
  vector_line_source source({"a", "xb", "c", "xd"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].line_number, 2u);
  EXPECT_EQ(results[0].line, "xb");
  EXPECT_EQ(results[1].line_number, 4u);
  EXPECT_EQ(results[1].line, "xd");
  EXPECT_EQ(scan.matched_lines(), 2u);
  EXPECT_EQ(scan.lines_read(), 4u);
}

TEST(searcher, RepeatIsReportedAsOneLongestSpan) {
  searcher s("a+", search_options{});
  vector_line_source source({"baaab"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{1, 4}};
  EXPECT_EQ(results[0].matches, expected);
  const std::vector<std::string_view> texts{"aaa"};
  EXPECT_EQ(results[0].match_texts(), texts);
}

TEST(searcher, MatchesDoNotOverlap) {
  searcher s("aa", search_options{});
  vector_line_source source({"aaaa"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{0, 2}, {2, 4}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, ResumesAfterPreviousMatchEnd) {
  // b.*c claims end offset 3 with start 1, hiding c at (2,3)
  searcher s("ab|b.*c|c", search_options{});
  vector_line_source source({"abc"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{0, 2}, {2, 3}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, ZeroLengthMatchesAdvance) {
  searcher s("a*", search_options{});
  vector_line_source source({"baaab"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{0, 0}, {1, 4}, {5, 5}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, ZeroLengthMatchOnEmptyLine) {
  searcher s("a*", search_options{});
  vector_line_source source({""});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].line_number, 1u);
  EXPECT_EQ(results[0].line, "");
  const std::vector<match_span> expected{{0, 0}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, EmptyFixedStringMatchesEveryLine) {
  search_options options;
  options.compile_pattern_as_literal = true;
  searcher s("", options);
  vector_line_source source({"abc", "x"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 2u);
  const std::vector<match_span> expected{{0, 0}, {1, 1}};
  EXPECT_EQ(results[1].matches, expected);
}

TEST(searcher, FindsEveryOccurrenceLeftToRight) {
  searcher s("x[0-9]", search_options{});
  vector_line_source source({"x1 y x2 x3"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{0, 2}, {5, 7}, {8, 10}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, IgnoreCaseAppliesToWholePattern) {
  search_options options;
  options.ignore_case = true;
  searcher s("ABC", options);
  vector_line_source source({"xx abc yy", "nothing here"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].line_number, 1u);
  const std::vector<match_span> expected{{3, 6}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, CaseSensitiveByDefault) {
  searcher s("ABC", search_options{});
  vector_line_source source({"xx abc yy"});
  auto scan = s.search(source);
  EXPECT_FALSE(scan.next().has_value());
}

TEST(searcher, InvalidPatternFailsConstruction) {
  EXPECT_THROW(searcher("(abc", search_options{}), invalid_pattern);

  try {
    searcher s("a(b", search_options{});
    FAIL() << "expected invalid_pattern";
  } catch (const invalid_pattern &e) {
    EXPECT_NE(std::string{e.what()}.find("Error compiling pattern"),
              std::string::npos);
  }
}

TEST(searcher, InvalidPatternIsASearchError) {
  EXPECT_THROW(searcher("*abc", search_options{}), search_error);
}

TEST(searcher, ReadFailureHaltsTheScan) {
  searcher s("x", search_options{});
  vector_line_source source({"x1", "x2", "x3", "x4"}, 2);
  auto scan = s.search(source);

  auto first = scan.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->line_number, 1u);
  auto second = scan.next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->line_number, 2u);

  try {
    scan.next();
    FAIL() << "expected line_read_failure";
  } catch (const line_read_failure &e) {
    EXPECT_EQ(e.line_number(), 3u);
    EXPECT_NE(std::string{e.what()}.find("simulated I/O fault"),
              std::string::npos);
  }

  // Nothing past the fault is produced, and the source is not read again
  const auto reads = source.reads;
  EXPECT_FALSE(scan.next().has_value());
  EXPECT_TRUE(scan.finished());
  EXPECT_EQ(source.reads, reads);
  EXPECT_EQ(scan.matched_lines(), 2u);
}

TEST(searcher, ScanIsLazy) {
  searcher s("x", search_options{});
  vector_line_source source({"a", "xb", "c", "xd"});
  auto scan = s.search(source);

  EXPECT_EQ(source.reads, 0u);
  auto result = scan.next();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->line_number, 2u);
  EXPECT_EQ(source.reads, 2u);
}

TEST(searcher, ScanIsNotRestartable) {
  searcher s("x", search_options{});
  vector_line_source source({"x", "y", "x"});
  auto scan = s.search(source);

  std::size_t count{0};
  for (auto &result : scan) {
    EXPECT_EQ(result.line, "x");
    count += 1;
  }
  EXPECT_EQ(count, 2u);
  EXPECT_TRUE(scan.finished());
  EXPECT_TRUE(scan.begin() == scan.end());
  EXPECT_FALSE(scan.next().has_value());
}

TEST(searcher, EngineCanScanSeveralSources) {
  searcher s("needle", search_options{});

  vector_line_source first({"hay", "needle"});
  auto first_scan = s.search(first);
  EXPECT_EQ(collect(first_scan).size(), 1u);

  vector_line_source second({"needle", "needle", "hay"});
  auto second_scan = s.search(second);
  const auto results = collect(second_scan);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].line_number, 1u);
  EXPECT_EQ(results[1].line_number, 2u);
}

TEST(searcher, NonMatchingLinesAreNeverYielded) {
  searcher s("o", search_options{});
  vector_line_source source({"one", "two", "three", "four", "five"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].line_number, 1u);
  EXPECT_EQ(results[1].line_number, 2u);
  EXPECT_EQ(results[2].line_number, 4u);
}

TEST(searcher, FixedStringIsMatchedLiterally) {
  search_options options;
  options.compile_pattern_as_literal = true;
  searcher s("a.b", options);
  vector_line_source source({"axb", "a.b"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].line_number, 2u);
}

TEST(searcher, SpansAreByteOffsets) {
  searcher s("b", search_options{});
  vector_line_source source({"\xC3\xA9" "b"});
  auto scan = s.search(source);
  const auto results = collect(scan);

  ASSERT_EQ(results.size(), 1u);
  const std::vector<match_span> expected{{2, 3}};
  EXPECT_EQ(results[0].matches, expected);
}

TEST(searcher, ResolvesOutputModeOnce) {
  search_options options;
  options.count_matching_lines = true;
  options.print_only_matching_parts = true;
  searcher s("x", options);
  EXPECT_EQ(s.mode(), output_mode::count_only);
}
