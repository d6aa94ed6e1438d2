#include "core/Expecter.hpp"
#include "Shared.hpp"
#include "util/BoyerMoore.hpp"
#include "util/ThompsonNFA.hpp"
#include "util/Trace.hpp"

#include <future>
#include <thread>

namespace tether::core {

namespace {

Status compile_pattern(std::string_view pattern, std::shared_ptr<const util::ThompsonNFA>& out) {
  auto nfa = std::make_shared<const util::ThompsonNFA>(pattern);
  if (!nfa->valid()) return {ExpectError::PatternCompile, nfa->error()};
  out = std::move(nfa);
  return {};
}

// Containment of a literal in the window. Any new occurrence must end
// inside the newest code point, so only that tail is searched.
class LiteralMatcher {
public:
  explicit LiteralMatcher(std::string_view literal) : bm_(literal) {}

  bool feed(const std::string& window, size_t before, const RuneRead&) {
    const size_t m = bm_.length();
    size_t from = before + 1 > m ? before + 1 - m : 0;
    return bm_.search(window, from) != util::BoyerMooreSearch::npos;
  }
  bool finish() { return false; }

private:
  util::BoyerMooreSearch bm_;
};

class RegexMatcher {
public:
  explicit RegexMatcher(const util::ThompsonNFA& nfa) : vm_(nfa) {}

  bool feed(const std::string&, size_t, const RuneRead& r) {
    return vm_.feed(r.code_point, static_cast<size_t>(r.size));
  }
  bool finish() {
    vm_.finish();
    return vm_.matched();
  }
  [[nodiscard]] const std::vector<long>& captures() const { return vm_.captures(); }

private:
  util::NfaStream vm_;
};

// The shared primitive: read one code point at a time, append it to the
// window and hand it to the matcher until the matcher reports a result.
// Caller holds s.read_mu.
template <typename Matcher>
Status accumulate(Expecter::Shared& s, std::string& window, Matcher& m) {
  for (;;) {
    // Bytes given back by an earlier match are still served after a
    // terminal condition was recorded.
    RuneRead r;
    if (s.terminal && s.reader.buffered() == 0) {
      r.status = *s.terminal;
    } else {
      r = s.reader.read_rune();
    }
    if (!r.status.ok()) {
      if (r.status.error != ExpectError::EndOfStream && r.status.error != ExpectError::Io) {
        return r.status;
      }
      s.terminal = r.status;
      // A match that was only waiting to see what follows it still stands;
      // the terminal condition is reported by the next call.
      if (m.finish()) return {};
      return r.status;
    }
    size_t before = window.size();
    window.append(r.text());
    if (s.capturing) s.captured.append(r.text());
    if (m.feed(window, before, r)) return {};
  }
}

Status find_literal(Expecter::Shared& s, std::string_view literal) {
  std::lock_guard<std::mutex> lk(s.read_mu);
  LiteralMatcher m(literal);
  std::string window;
  auto st = accumulate(s, window, m);
  util::trace("expect \"%s\": %s after %zu bytes", util::escape_for_log(literal).c_str(),
              to_string(st.error), window.size());
  return st;
}

MatchResult find_regex(Expecter::Shared& s, const util::ThompsonNFA& nfa, std::string_view pattern,
                       bool want_output) {
  std::lock_guard<std::mutex> lk(s.read_mu);
  MatchResult res;
  std::string window;
  RegexMatcher m(nfa);
  res.status = accumulate(s, window, m);

  if (res.status.ok()) {
    const auto& caps = m.captures();
    res.groups.reserve(caps.size() / 2);
    for (size_t g = 0; g + 1 < caps.size(); g += 2) {
      if (caps[g] >= 0 && caps[g + 1] >= 0) {
        res.groups.emplace_back(window.substr(static_cast<size_t>(caps[g]),
                                              static_cast<size_t>(caps[g + 1] - caps[g])));
      } else {
        res.groups.emplace_back(std::nullopt);
      }
    }
    // Code points read only to decide the match go back to the stream
    auto end = static_cast<size_t>(caps[1]);
    if (end < window.size()) {
      std::string_view tail(window.data() + end, window.size() - end);
      s.reader.unread(tail);
      if (s.capturing) s.captured.resize(s.captured.size() - tail.size());
      window.resize(end);
    }
  }
  if (want_output) res.output = std::move(window);

  util::trace("expect /%s/: %s after %zu bytes", util::escape_for_log(pattern).c_str(),
              to_string(res.status.error),
              want_output ? res.output.size() : window.size());
  return res;
}

} // namespace

Status write_to_sink(Expecter::Shared& s, std::string_view text) {
  if (!s.sink) return {ExpectError::NoSink, {}};
  std::lock_guard<std::mutex> lk(s.write_mu);
  auto w = s.sink->write(text.data(), text.size());
  if (w.status != io::StreamStatus::Ok) return status_from_stream(w.status, w.err);
  return {};
}

LineRead read_until_locked(Expecter::Shared& s, char delim) {
  if (s.terminal && s.reader.buffered() == 0) return {{}, *s.terminal};
  LineRead lr = s.reader.read_until(delim);
  if (s.capturing) {
    s.captured += lr.line;
    if (lr.status.ok()) s.captured.push_back(delim);
  }
  if (lr.status.error == ExpectError::EndOfStream || lr.status.error == ExpectError::Io) {
    s.terminal = lr.status;
  }
  return lr;
}

Expecter::Expecter(std::shared_ptr<io::IByteSource> source, std::shared_ptr<io::IByteSink> sink)
    : s_(std::make_shared<Shared>(std::move(source), std::move(sink))) {}

Status Expecter::expect(std::string_view literal) {
  if (literal.empty()) return {ExpectError::EmptyPattern, {}};
  return find_literal(*s_, literal);
}

Status Expecter::expect_timeout(std::string_view literal, std::chrono::milliseconds timeout) {
  if (literal.empty()) return {ExpectError::EmptyPattern, {}};
  auto promise = std::make_shared<std::promise<Status>>();
  auto fut = promise->get_future();
  std::thread([s = s_, lit = std::string(literal), promise]() {
    promise->set_value(find_literal(*s, lit));
  }).detach();
  if (fut.wait_for(timeout) != std::future_status::ready) {
    util::trace("expect \"%s\": timeout after %lldms", util::escape_for_log(literal).c_str(),
                static_cast<long long>(timeout.count()));
    return {ExpectError::Timeout, {}};
  }
  return fut.get();
}

RegexHit Expecter::expect_regex(std::string_view pattern) {
  std::shared_ptr<const util::ThompsonNFA> nfa;
  auto st = compile_pattern(pattern, nfa);
  if (!st.ok()) return {false, st};
  auto res = find_regex(*s_, *nfa, pattern, false);
  return {res.ok(), std::move(res.status)};
}

MatchResult Expecter::expect_regex_find(std::string_view pattern) {
  std::shared_ptr<const util::ThompsonNFA> nfa;
  auto st = compile_pattern(pattern, nfa);
  if (!st.ok()) return {st, {}, {}};
  return find_regex(*s_, *nfa, pattern, false);
}

MatchResult Expecter::expect_regex_find_with_output(std::string_view pattern) {
  std::shared_ptr<const util::ThompsonNFA> nfa;
  auto st = compile_pattern(pattern, nfa);
  if (!st.ok()) return {st, {}, {}};
  return find_regex(*s_, *nfa, pattern, true);
}

MatchResult Expecter::expect_timeout_regex_find_with_output(std::string_view pattern,
                                                            std::chrono::milliseconds timeout) {
  std::shared_ptr<const util::ThompsonNFA> nfa;
  auto st = compile_pattern(pattern, nfa);
  if (!st.ok()) return {st, {}, {}};

  auto promise = std::make_shared<std::promise<MatchResult>>();
  auto fut = promise->get_future();
  std::thread([s = s_, nfa, pat = std::string(pattern), promise]() {
    promise->set_value(find_regex(*s, *nfa, pat, true));
  }).detach();

  if (fut.wait_for(timeout) != std::future_status::ready) {
    util::trace("expect /%s/: timeout after %lldms", util::escape_for_log(pattern).c_str(),
                static_cast<long long>(timeout.count()));
    return {{ExpectError::Timeout, {}}, {}, {}};
  }
  return fut.get();
}

LineRead Expecter::read_line() { return read_until('\n'); }

LineRead Expecter::read_until(char delim) {
  std::lock_guard<std::mutex> lk(s_->read_mu);
  return read_until_locked(*s_, delim);
}

Status Expecter::send(std::string_view text) {
  auto st = write_to_sink(*s_, text);
  util::trace("send \"%s\": %s", util::escape_for_log(text).c_str(), to_string(st.error));
  return st;
}

Status Expecter::send_line(std::string_view text) {
  std::string line(text);
  line.push_back('\n');
  return send(line);
}

void Expecter::start_capture() {
  std::lock_guard<std::mutex> lk(s_->read_mu);
  s_->capturing = true;
  s_->captured.clear();
}

std::string Expecter::collect() {
  std::lock_guard<std::mutex> lk(s_->read_mu);
  s_->capturing = false;
  std::string out;
  out.swap(s_->captured);
  return out;
}

} // namespace tether::core
