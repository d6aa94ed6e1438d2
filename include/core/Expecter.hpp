#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "core/RuneReader.hpp"
#include "core/Status.hpp"
#include "io/ByteStream.hpp"
#include "util/Channel.hpp"

namespace tether::core {

// Capture groups: [0] is the whole match, unset sub-groups are nullopt.
using Groups = std::vector<std::optional<std::string>>;

struct RegexHit {
  bool matched{false};
  Status status;
};

struct MatchResult {
  Status status;
  Groups groups;
  // Everything read during the call: unmatched prefix followed by the match.
  // On failure, everything read before the terminal condition.
  std::string output;

  [[nodiscard]] bool ok() const { return status.ok(); }
};

struct InteractChannels {
  std::shared_ptr<util::Channel<std::string>> send;     // caller -> sink
  std::shared_ptr<util::Channel<std::string>> receive;  // source lines -> caller
};

// Streaming match engine over a source/sink pair.
//
// Every matching call reads one code point at a time and re-evaluates its
// pattern after each one, so consumption stops exactly at the end of the
// match. Text read before the match is consumed for good; the next call
// starts at the byte after the match.
//
// Once the source reports end of stream or an I/O error, that condition is
// remembered and every later read-side call fails with it.
class Expecter {
public:
  explicit Expecter(std::shared_ptr<io::IByteSource> source,
                    std::shared_ptr<io::IByteSink> sink = nullptr);

  // Literal containment. EmptyPattern for "".
  [[nodiscard]] Status expect(std::string_view literal);
  [[nodiscard]] Status expect_timeout(std::string_view literal, std::chrono::milliseconds timeout);

  [[nodiscard]] RegexHit expect_regex(std::string_view pattern);
  [[nodiscard]] MatchResult expect_regex_find(std::string_view pattern);
  [[nodiscard]] MatchResult expect_regex_find_with_output(std::string_view pattern);

  // Runs the accumulation loop on a detached worker and waits at most
  // `timeout` for it. The worker cannot interrupt a blocked source read: it
  // keeps running (and keeps this engine's stream state alive) until the
  // source produces data or closes, and its result is then discarded. Later
  // calls on this engine wait for that worker before reading.
  [[nodiscard]] MatchResult expect_timeout_regex_find_with_output(std::string_view pattern,
                                                                  std::chrono::milliseconds timeout);

  [[nodiscard]] LineRead read_line();
  [[nodiscard]] LineRead read_until(char delim);

  [[nodiscard]] Status send(std::string_view text);
  [[nodiscard]] Status send_line(std::string_view text);

  // Record everything consumed from now on; collect() returns and clears
  // the recording and stops capturing.
  void start_capture();
  [[nodiscard]] std::string collect();

  // Two detached loops: source lines -> receive, send -> sink. The receive
  // channel is closed when the source ends; the sink loop ends when the
  // caller closes send. Do not mix with matching calls on the same stream.
  [[nodiscard]] InteractChannels start_interactive_session();

  struct Shared;

private:
  std::shared_ptr<Shared> s_;
};

} // namespace tether::core
