#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/Trace.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using tether::app::ExpectConfig;
using tether::app::load_config;

static std::filesystem::path test_dir(const char* suffix) {
  return std::filesystem::temp_directory_path() /
         ("tether_config_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static void clear_env() {
  ::unsetenv("TETHER_TIMEOUT_MS");
  ::unsetenv("tether_timeout_ms");
  ::unsetenv("TETHER_VERBOSE");
  ::unsetenv("TETHER_LITERAL");
  ::unsetenv("TETHER_TRANSCRIPT_DIR");
}

TEST(config_defaults_without_file) {
  clear_env();
  auto dir = test_dir("empty");
  std::filesystem::create_directories(dir);
  ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  ExpectConfig cfg;
  std::string err;
  ASSERT_TRUE(load_config("", cfg, err));
  ASSERT_EQ(cfg.timeout.count(), 0);
  ASSERT_TRUE(!cfg.literal);
  ASSERT_TRUE(cfg.transcript_dir.empty());
  ASSERT_TRUE(cfg.loaded_from.empty());
  std::filesystem::remove_all(dir);
}

TEST(config_env_overrides_default) {
  clear_env();
  auto dir = test_dir("env");
  std::filesystem::create_directories(dir);
  ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  ::setenv("tether_timeout_ms", "1500", 1);  // lowercase prefix accepted
  ::setenv("TETHER_TRANSCRIPT_DIR", "/tmp/tether_logs", 1);
  ExpectConfig cfg;
  std::string err;
  ASSERT_TRUE(load_config("", cfg, err));
  ASSERT_EQ(cfg.timeout.count(), 1500);
  ASSERT_EQ(cfg.transcript_dir, std::string("/tmp/tether_logs"));
  clear_env();
  std::filesystem::remove_all(dir);
}

TEST(config_toml_overrides_env) {
  clear_env();
  auto dir = test_dir("toml");
  std::filesystem::create_directories(dir / "tether");
  {
    std::ofstream f(dir / "tether" / "config.toml");
    f << "[expect]\ntimeout_ms = 250\nliteral = true\n[log]\nverbose = false\n";
  }
  ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  ::setenv("TETHER_TIMEOUT_MS", "9999", 1);
  ExpectConfig cfg;
  std::string err;
  ASSERT_TRUE(load_config("", cfg, err));
  ASSERT_EQ(cfg.timeout.count(), 250);
  ASSERT_TRUE(cfg.literal);
  ASSERT_TRUE(!cfg.verbose);
  ASSERT_EQ(cfg.loaded_from, (dir / "tether" / "config.toml").string());
  clear_env();
  std::filesystem::remove_all(dir);
}

TEST(config_explicit_missing_file_is_error) {
  clear_env();
  ExpectConfig cfg;
  std::string err;
  ASSERT_TRUE(!load_config("/nonexistent/tether.toml", cfg, err));
  ASSERT_TRUE(err.find("/nonexistent/tether.toml") != std::string::npos);
}

TEST(config_negative_timeout_clamped) {
  clear_env();
  auto dir = test_dir("neg");
  std::filesystem::create_directories(dir);
  auto path = dir / "c.toml";
  {
    std::ofstream f(path);
    f << "[expect]\ntimeout_ms = -5\n";
  }
  ExpectConfig cfg;
  std::string err;
  ASSERT_TRUE(load_config(path.string(), cfg, err));
  ASSERT_EQ(cfg.timeout.count(), 0);
  std::filesystem::remove_all(dir);
}

TEST(getenv_compat_maps_both_spellings) {
  clear_env();
  ::setenv("tether_timeout_ms", "42", 1);
  const char* v = tether::util::getenv_compat("TETHER_TIMEOUT_MS");
  ASSERT_TRUE(v != nullptr);
  ASSERT_STREQ(std::string(v), std::string("42"));
  ::unsetenv("tether_timeout_ms");

  ::setenv("TETHER_TIMEOUT_MS", "7", 1);
  v = tether::util::getenv_compat("tether_timeout_ms");
  ASSERT_TRUE(v != nullptr);
  ASSERT_STREQ(std::string(v), std::string("7"));
  ::unsetenv("TETHER_TIMEOUT_MS");

  // Only the prefix spelling is tried, not a mixed-case suffix
  ::setenv("tether_TIMEOUT_MS", "9", 1);
  ASSERT_TRUE(tether::util::getenv_compat("TETHER_TIMEOUT_MS") == nullptr);
  ::unsetenv("tether_TIMEOUT_MS");
}
