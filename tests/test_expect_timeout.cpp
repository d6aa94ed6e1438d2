#include "minitest.hpp"
#include "core/Expecter.hpp"
#include "io/MemoryStream.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using tether::core::Expecter;
using tether::core::ExpectError;
using tether::io::Pipe;

using namespace std::chrono_literals;

// Writes `text` to the pipe after `delay`; joined when the test returns.
static std::jthread delayed_write(std::shared_ptr<Pipe> p, std::chrono::milliseconds delay, std::string text) {
  return std::jthread([p, delay, text]{
    std::this_thread::sleep_for(delay);
    (void)p->write(std::string_view(text));
  });
}

TEST(timeout_expires_before_data) {
  auto p = std::make_shared<Pipe>();
  Expecter exp(p, nullptr);
  auto writer = delayed_write(p, 400ms, "You find me\n");
  auto t0 = std::chrono::steady_clock::now();
  auto res = exp.expect_timeout_regex_find_with_output("find me", 100ms);
  auto waited = std::chrono::steady_clock::now() - t0;
  ASSERT_TRUE(res.status == ExpectError::Timeout);
  ASSERT_TRUE(res.groups.empty());
  ASSERT_TRUE(waited < 400ms);
}

TEST(timeout_longer_than_data_delay_succeeds) {
  auto p = std::make_shared<Pipe>();
  Expecter exp(p, nullptr);
  auto writer = delayed_write(p, 100ms, "You find me\n");
  auto res = exp.expect_timeout_regex_find_with_output("find me", 2000ms);
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.groups[0], "find me");
  ASSERT_EQ(res.output, std::string("You find me"));
}

TEST(timeout_reports_terminal_condition_before_expiry) {
  auto p = std::make_shared<Pipe>();
  Expecter exp(p, nullptr);
  (void)p->write(std::string_view("nothing here"));
  p->close_write();
  auto res = exp.expect_timeout_regex_find_with_output("find me", 2000ms);
  ASSERT_TRUE(res.status == ExpectError::EndOfStream);
  ASSERT_EQ(res.output, std::string("nothing here"));
}

TEST(timeout_compile_error_is_not_raced) {
  auto p = std::make_shared<Pipe>();
  Expecter exp(p, nullptr);
  auto res = exp.expect_timeout_regex_find_with_output("[unclosed", 10ms);
  ASSERT_TRUE(res.status == ExpectError::PatternCompile);
}

// The abandoned worker keeps reading and consumes its own match; the next
// call waits for it and then continues after that match.
TEST(timeout_abandoned_worker_consumes_its_match) {
  auto p = std::make_shared<Pipe>();
  Expecter exp(p, nullptr);
  auto res = exp.expect_timeout_regex_find_with_output("find me", 50ms);
  ASSERT_TRUE(res.status == ExpectError::Timeout);

  (void)p->write(std::string_view("You find me\nnext prompt> "));
  auto next = exp.expect_regex_find_with_output("prompt> ");
  ASSERT_TRUE(next.ok());
  ASSERT_EQ(next.output, std::string("\nnext prompt> "));
}
