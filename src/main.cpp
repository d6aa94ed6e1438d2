#include "app/Config.hpp"
#include "app/TranscriptLog.hpp"
#include "core/Expecter.hpp"
#include "io/FdStream.hpp"
#include "util/Trace.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using namespace tether;

static void usage(std::ostream& os) {
  os << "Usage: tether [--literal] [--timeout-ms MS] [--groups] [--config PATH]\n"
        "              [--transcript-dir DIR] [--verbose] PATTERN...\n"
        "\n"
        "Reads standard input and waits for each PATTERN in order, printing the\n"
        "text consumed by every match. Exit status: 0 all matched, 1 a pattern\n"
        "was not found, 2 usage or configuration error.\n";
}

static bool parse_ms(const char* s, long long& out) {
  try {
    size_t used = 0;
    out = std::stoll(s, &used);
    return used == std::char_traits<char>::length(s) && out >= 0;
  } catch (const std::exception&) {
    return false;
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  std::optional<long long> cli_timeout;
  std::optional<std::string> cli_transcript_dir;
  bool cli_literal = false, cli_verbose = false, show_groups = false;
  std::vector<std::string> patterns;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--literal") cli_literal = true;
    else if (a == "--groups") show_groups = true;
    else if (a == "--verbose") cli_verbose = true;
    else if (a == "--timeout-ms" && i + 1 < argc) {
      long long ms = 0;
      if (!parse_ms(argv[++i], ms)) {
        std::fprintf(stderr, "tether: invalid --timeout-ms: %s\n", argv[i]);
        return 2;
      }
      cli_timeout = ms;
    }
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--transcript-dir" && i + 1 < argc) cli_transcript_dir = argv[++i];
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else if (a == "--") { for (++i; i < argc; ++i) patterns.emplace_back(argv[i]); }
    else if (a.size() > 1 && a[0] == '-') {
      std::fprintf(stderr, "tether: unknown option: %s\n", a.c_str());
      usage(std::cerr);
      return 2;
    }
    else patterns.push_back(std::move(a));
  }

  if (patterns.empty()) {
    usage(std::cerr);
    return 2;
  }

  app::ExpectConfig cfg;
  std::string err;
  if (!app::load_config(config_path, cfg, err)) {
    std::fprintf(stderr, "tether: %s\n", err.c_str());
    return 2;
  }
  if (cli_timeout) cfg.timeout = std::chrono::milliseconds(*cli_timeout);
  if (cli_transcript_dir) cfg.transcript_dir = *cli_transcript_dir;
  if (cli_literal) cfg.literal = true;
  if (cli_verbose) cfg.verbose = true;
  if (cfg.verbose) util::set_trace_enabled(true);
  if (!cfg.loaded_from.empty()) util::trace("config: loaded %s", cfg.loaded_from.c_str());

  std::unique_ptr<app::TranscriptLog> transcript;
  if (!cfg.transcript_dir.empty()) transcript = std::make_unique<app::TranscriptLog>(cfg.transcript_dir);

  core::Expecter exp(std::make_shared<io::FdSource>(STDIN_FILENO));
  const bool bounded = cfg.timeout.count() > 0;

  for (const auto& pat : patterns) {
    core::Status st;
    std::string output;
    core::Groups groups;

    if (cfg.literal) {
      exp.start_capture();
      st = bounded ? exp.expect_timeout(pat, cfg.timeout) : exp.expect(pat);
      // A timed-out worker may still be reading; its text is not reported
      if (st.error != core::ExpectError::Timeout) output = exp.collect();
    } else {
      auto res = bounded ? exp.expect_timeout_regex_find_with_output(pat, cfg.timeout)
                         : exp.expect_regex_find_with_output(pat);
      st = std::move(res.status);
      output = std::move(res.output);
      groups = std::move(res.groups);
    }

    if (transcript && !transcript->append(pat, st, output)) {
      std::fprintf(stderr, "tether: transcript disabled\n");
      transcript.reset();
    }
    std::fwrite(output.data(), 1, output.size(), stdout);
    if (show_groups && st.ok()) {
      for (size_t g = 0; g < groups.size(); ++g) {
        std::printf("\n[%zu] %s", g, groups[g] ? util::escape_for_log(*groups[g], 4096).c_str() : "(unset)");
      }
    }
    if (!output.empty() || (show_groups && st.ok())) std::fputc('\n', stdout);
    std::fflush(stdout);

    if (!st.ok()) {
      std::fprintf(stderr, "tether: pattern \"%s\": %s%s%s\n", pat.c_str(), core::to_string(st.error),
                   st.detail.empty() ? "" : ": ", st.detail.c_str());
      // An abandoned timeout worker may still be blocked on stdin
      if (st.error == core::ExpectError::Timeout) std::_Exit(1);
      return 1;
    }
  }
  return 0;
}
