#include "minitest.hpp"
#include "core/Expecter.hpp"
#include "io/MemoryStream.hpp"
#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using tether::core::Expecter;
using tether::core::ExpectError;
using tether::io::BufferStream;

static Expecter expecter_from_string(const std::string& s) {
  auto b = std::make_shared<BufferStream>(s);
  return Expecter(b, b);
}

static std::string trim_space(const std::string& s) {
  size_t a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos) return {};
  size_t b = s.find_last_not_of(" \t\r\n");
  return s.substr(a, b - a + 1);
}

// ============================================================================
// BOOLEAN MATCH
// ============================================================================

struct MatchCase { const char* re; const char* good; const char* bad; };

TEST(regex_match_table) {
  const MatchCase cases[] = {
    {"a", "a", "b"},
    {".b", "ab", "ac"},
    {"a+hello", "aaaahello", "bhello"},
    {"(hello|world)", "hello", "unknown"},
    {"(hello|world)", "world", "unknown"},
    {"©", "©", "unknown"},  // two-byte copyright sign
  };
  for (const auto& c : cases) {
    auto good = expecter_from_string(c.good).expect_regex(c.re);
    ASSERT_TRUE(good.matched);
    ASSERT_TRUE(good.status.ok());

    auto bad = expecter_from_string(c.bad).expect_regex(c.re);
    ASSERT_TRUE(!bad.matched);
    ASSERT_TRUE(bad.status == ExpectError::EndOfStream);
  }
}

TEST(regex_compile_error_is_immediate) {
  auto b = std::make_shared<BufferStream>("abc");
  Expecter exp(b, b);
  auto hit = exp.expect_regex("(unclosed");
  ASSERT_TRUE(!hit.matched);
  ASSERT_TRUE(hit.status == ExpectError::PatternCompile);
  ASSERT_TRUE(!hit.status.detail.empty());
  ASSERT_EQ(b->size(), 3u);  // no I/O happened
}

TEST(regex_unknown_inline_flag) {
  auto exp = expecter_from_string("abc");
  auto res = exp.expect_regex_find("(?x)abc");
  ASSERT_TRUE(res.status == ExpectError::PatternCompile);
}

TEST(regex_empty_matches_are_skipped) {
  auto exp = expecter_from_string("bbbaa");
  auto res = exp.expect_regex_find("a*");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "aa");
}

// ============================================================================
// CAPTURE GROUPS
// ============================================================================

struct FindCase { const char* re; const char* input; std::vector<std::string> groups; };

TEST(regex_find_groups) {
  const FindCase cases[] = {
    {"he(l)lo wo(r)ld", "hello world", {"hello world", "l", "r"}},
    {"(a)", "a", {"a", "a"}},
    {"so.. (hello|world)", "so.. hello", {"so.. hello", "hello"}},
    {"(a+)hello", "aaaahello", {"aaaahello", "aaaa"}},
    {"\\d+ (\\d+) (\\d+)", "123 456 789", {"123 456 789", "456", "789"}},
    {"\\d+ (\\d+) (\\d+)", "© 123 456 789 ©", {"123 456 789", "456", "789"}},
    {"(日本)(語)", "テスト日本語", {"日本語", "日本", "語"}},
  };
  for (const auto& c : cases) {
    auto res = expecter_from_string(c.input).expect_regex_find(c.re);
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.groups.size(), c.groups.size());
    for (size_t i = 0; i < c.groups.size(); ++i) {
      ASSERT_TRUE(res.groups[i].has_value());
      ASSERT_STREQ(*res.groups[i], c.groups[i]);
    }
  }
}

TEST(regex_nested_group_order) {
  auto res = expecter_from_string("key=va©lue!").expect_regex_find("((\\w+)=(va©(\\w+)))!");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups.size(), 5u);
  ASSERT_EQ(res.groups[0], "key=va©lue!");
  ASSERT_EQ(res.groups[1], "key=va©lue");
  ASSERT_EQ(res.groups[2], "key");
  ASSERT_EQ(res.groups[3], "va©lue");
  ASSERT_EQ(res.groups[4], "lue");
}

TEST(regex_unset_group_is_absent) {
  auto res = expecter_from_string("yes").expect_regex_find("(no)|(yes)");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups.size(), 3u);
  ASSERT_TRUE(!res.groups[1].has_value());
  ASSERT_EQ(res.groups[2], "yes");
}

// A trailing greedy quantifier takes the whole token. The code point that
// ended it is left for the next call.
TEST(regex_trailing_quantifier_is_greedy) {
  auto exp = expecter_from_string("123 456 789\nnext");
  auto res = exp.expect_regex_find_with_output("\\d+ (\\d+) (\\d+)");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "123 456 789");
  ASSERT_EQ(res.groups[2], "789");
  ASSERT_EQ(res.output, std::string("123 456 789"));
  auto rest = exp.expect_regex_find_with_output("next");
  ASSERT_TRUE(rest.ok());
  ASSERT_EQ(rest.output, std::string("\nnext"));
}

TEST(regex_lazy_quantifier_stops_early) {
  auto exp = expecter_from_string("<a><b>");
  auto res = exp.expect_regex_find_with_output("<(.+?)>");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[1], "a");
  auto rest = exp.expect_regex_find_with_output("<(.+?)>");
  ASSERT_TRUE(rest.ok());
  ASSERT_EQ(rest.output, std::string("<b>"));
}

// A match waiting on what follows it is still reported at end of stream,
// and the end of stream is reported by the next call.
TEST(regex_pending_match_settles_at_end_of_stream) {
  auto exp = expecter_from_string("value 42");
  auto res = exp.expect_regex_find("value (\\d+)");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[1], "42");
  auto after = exp.expect_regex_find("x");
  ASSERT_TRUE(after.status == ExpectError::EndOfStream);
}

TEST(regex_lookahead_code_point_survives_end_of_stream) {
  auto exp = expecter_from_string("ab");
  auto res = exp.expect_regex_find("abc|a");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "a");
  auto rest = exp.expect_regex_find_with_output("b");
  ASSERT_TRUE(rest.ok());
  ASSERT_EQ(rest.output, std::string("b"));
  auto after = exp.expect_regex_find("b");
  ASSERT_TRUE(after.status == ExpectError::EndOfStream);
}

TEST(regex_end_anchors_wait_for_next_code_point) {
  auto exp = expecter_from_string("foo bar\nbaz");
  auto res = exp.expect_regex_find("(?m)bar$");
  ASSERT_TRUE(res.ok());
  auto word = exp.expect_regex_find_with_output("\\bbaz\\b");
  ASSERT_TRUE(word.ok());
  ASSERT_EQ(word.output, std::string("\nbaz"));
}

TEST(regex_case_insensitive_flag) {
  auto res = expecter_from_string("PASSWORD: ").expect_regex_find("(?i)password:\\s");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "PASSWORD: ");
}

TEST(regex_non_capturing_group_is_not_a_flag) {
  auto res = expecter_from_string("xabab").expect_regex_find("(?:ab)+");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups.size(), 1u);
  ASSERT_EQ(res.groups[0], "abab");
}

// ============================================================================
// OUTPUT / TRANSCRIPT
// ============================================================================

TEST(regex_with_output_failure_returns_everything_read) {
  std::string s = "You will not find me";
  auto exp = expecter_from_string(s);
  auto res = exp.expect_regex_find_with_output("I should not find you");
  ASSERT_TRUE(!res.ok());
  ASSERT_TRUE(res.groups.empty());
  ASSERT_EQ(res.output, s);
}

TEST(regex_with_output_group) {
  auto exp = expecter_from_string("You will find me\r\n");
  auto res = exp.expect_regex_find_with_output(".*(You will).*");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[1], "You will");
}

TEST(regex_with_output_includes_prefix) {
  auto exp = expecter_from_string("line one\nline two\n© three\nprompt> ");
  auto res = exp.expect_regex_find_with_output("prompt> ");
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "prompt> ");
  ASSERT_EQ(res.output, std::string("line one\nline two\n© three\nprompt> "));
}

struct ExcessCase {
  const char* desc;
  const char* loop_body;      // printf format with one %d
  const char* pattern;
  const char* expect_full;    // printf format with one %d
  const char* unmatched;      // left behind by each match for the next call
};

TEST(regex_find_no_excess_bytes) {
  const int repeats = 50;
  const ExcessCase cases[] = {
    // "$" does not consume the newline, so it starts the next call's output
    {"line by line with $", "prefix: %d line\n",
     "(?m)^prefix:\\s+(\\d+) line\\s??$", "prefix: %d line", "\n"},
    {"line by line with \\n", "prefix: %d line\r\n",
     "(?m)^prefix:\\s+(\\d+) line\\s??\\n", "prefix: %d line", ""},
    {"chunks in a single line", "a %d b",
     "a\\s+(\\d+)\\s+b", "a %d b", ""},
  };

  for (const auto& c : cases) {
    std::string input;
    char buf[128];
    for (int i = 1; i <= repeats; ++i) {
      std::snprintf(buf, sizeof(buf), c.loop_body, i);
      input += buf;
    }
    auto exp = expecter_from_string(input);

    for (int i = 1; i <= repeats; ++i) {
      auto res = exp.expect_regex_find_with_output(c.pattern);
      ASSERT_TRUE(res.ok());
      ASSERT_EQ(res.groups.size(), 2u);

      std::snprintf(buf, sizeof(buf), c.expect_full, i);
      ASSERT_STREQ(trim_space(*res.groups[0]), std::string(buf));
      ASSERT_STREQ(*res.groups[1], std::to_string(i));

      std::string expected_output = *res.groups[0];
      if (i > 1) expected_output = std::string(c.unmatched) + expected_output;
      ASSERT_STREQ(res.output, expected_output);
    }
  }
}

// ============================================================================
// LARGE INPUT
// ============================================================================

TEST(regex_long_prefix_stays_linear) {
  std::string input(64 * 1024, 'x');
  input += "prompt> ";
  for (const char* re : {"prompt> ", ".*prompt> ", "(x+x+)+prompt> "}) {
    auto t0 = std::chrono::steady_clock::now();
    auto exp = expecter_from_string(input);
    auto res = exp.expect_regex_find_with_output(re);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.output.size(), input.size());
    ASSERT_TRUE(elapsed < std::chrono::seconds(2));
  }
}

// Nested quantifiers that backtracking engines choke on simply fail to
// match once the stream ends.
TEST(regex_pathological_pattern_reports_end_of_stream) {
  std::string input(20000, 'a');
  auto exp = expecter_from_string(input);
  auto t0 = std::chrono::steady_clock::now();
  auto res = exp.expect_regex_find_with_output("(a*)*b");
  auto elapsed = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(res.status == ExpectError::EndOfStream);
  ASSERT_EQ(res.output.size(), input.size());
  ASSERT_TRUE(elapsed < std::chrono::seconds(2));
}
