#pragma once

#include <chrono>
#include <string>

namespace tether::app {

struct ExpectConfig {
  std::chrono::milliseconds timeout{0};  // 0 = wait for the stream
  bool literal{false};                   // patterns are literals, not regexes
  bool verbose{false};
  std::string transcript_dir;            // empty = no transcript files
  std::string loaded_from;               // config file actually read, if any
};

// $XDG_CONFIG_HOME/tether/config.toml, else ~/.config/tether/config.toml.
[[nodiscard]] std::string config_file_path();

// Resolve every setting TOML -> env -> compiled default.
// An explicit path that cannot be read is an error; a missing default file
// is not.
bool load_config(const std::string& explicit_path, ExpectConfig& out, std::string& err);

} // namespace tether::app
