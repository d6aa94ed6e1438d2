#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include "util/Trace.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace tether::app {

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tether/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tether/config.toml";
  return {};
}

static long long getenv_ll(const char* name, long long defv) {
  const char* v = util::getenv_compat(name);
  if (!v) return defv;
  try { return std::stoll(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = util::getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

bool load_config(const std::string& explicit_path, ExpectConfig& out, std::string& err) {
  util::TomlReader toml;
  bool have_toml = false;
  std::string path = explicit_path.empty() ? config_file_path() : explicit_path;

  if (!explicit_path.empty()) {
    if (!toml.load(path)) {
      err = "cannot read config file " + path;
      return false;
    }
    have_toml = true;
  } else if (!path.empty() && std::filesystem::exists(path)) {
    have_toml = toml.load(path);
  }
  if (have_toml) {
    out.loaded_from = path;
    for (const auto& w : toml.warnings())
      std::fprintf(stderr, "tether: config: %s: %s\n", path.c_str(), w.c_str());
  }

  auto resolve_int = [&](const char* section, const char* key, const char* env, long long def) {
    if (have_toml && toml.has(section, key)) return toml.get_int(section, key, def);
    return getenv_ll(env, def);
  };
  auto resolve_bool = [&](const char* section, const char* key, const char* env, bool def) {
    if (have_toml && toml.has(section, key)) return toml.get_bool(section, key, def);
    return env_flag(env, def);
  };

  long long ms = resolve_int("expect", "timeout_ms", "TETHER_TIMEOUT_MS", 0);
  if (ms < 0) ms = 0;
  out.timeout = std::chrono::milliseconds(ms);
  out.literal = resolve_bool("expect", "literal", "TETHER_LITERAL", false);
  out.verbose = resolve_bool("log", "verbose", "TETHER_VERBOSE", false);

  if (have_toml && toml.has("log", "transcript_dir")) {
    out.transcript_dir = toml.get_string("log", "transcript_dir");
  } else if (const char* d = util::getenv_compat("TETHER_TRANSCRIPT_DIR")) {
    out.transcript_dir = d;
  }
  return true;
}

} // namespace tether::app
