#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::util {

// Minimal TOML subset reader: [section] headers, key = value pairs,
// "quoted" or bare values, full-line and trailing # comments.
class TomlReader {
public:
  // False when the file cannot be opened. Malformed lines are skipped and
  // reported through warnings().
  bool load(const std::string& path);
  bool parse(std::string_view text);

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const;
  [[nodiscard]] long long get_int(std::string_view section, std::string_view key, long long def = 0) const;
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const;
  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

  [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

private:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  [[nodiscard]] const Entry* find(std::string_view section, std::string_view key) const;
  void set(const std::string& section, std::string key, std::string value);

  std::vector<Entry> entries_;
  std::vector<std::string> warnings_;
};

} // namespace tether::util
