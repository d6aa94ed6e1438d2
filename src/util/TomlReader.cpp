#include "util/TomlReader.hpp"
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace tether::util {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Value text up to an unquoted '#', with surrounding quotes removed.
static std::string parse_value(std::string_view raw) {
  raw = trim(raw);
  if (!raw.empty() && raw.front() == '"') {
    std::string out;
    for (size_t i = 1; i < raw.size(); ++i) {
      char c = raw[i];
      if (c == '"') return out;
      if (c == '\\' && i + 1 < raw.size()) {
        char e = raw[++i];
        if (e == 'n') out.push_back('\n');
        else if (e == 't') out.push_back('\t');
        else out.push_back(e);
        continue;
      }
      out.push_back(c);
    }
    return out;  // unterminated: take the rest
  }
  auto hash = raw.find('#');
  if (hash != std::string_view::npos) raw = trim(raw.substr(0, hash));
  return std::string(raw);
}

bool TomlReader::load(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}

bool TomlReader::parse(std::string_view text) {
  entries_.clear();
  warnings_.clear();
  std::string section;
  int lineno = 0;
  while (!text.empty()) {
    auto nl = text.find('\n');
    auto line = text.substr(0, nl);
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    ++lineno;

    auto sv = trim(line);
    if (sv.empty() || sv[0] == '#') continue;
    if (sv.front() == '[') {
      auto close = sv.find(']');
      if (close == std::string_view::npos) {
        warnings_.push_back("line " + std::to_string(lineno) + ": unterminated section header");
        continue;
      }
      section = std::string(trim(sv.substr(1, close - 1)));
      continue;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) {
      warnings_.push_back("line " + std::to_string(lineno) + ": expected key = value");
      continue;
    }
    std::string key(trim(sv.substr(0, eq)));
    if (key.empty()) {
      warnings_.push_back("line " + std::to_string(lineno) + ": empty key");
      continue;
    }
    set(section, std::move(key), parse_value(sv.substr(eq + 1)));
  }
  return true;
}

const TomlReader::Entry* TomlReader::find(std::string_view section, std::string_view key) const {
  for (const auto& e : entries_)
    if (e.section == section && e.key == key) return &e;
  return nullptr;
}

void TomlReader::set(const std::string& section, std::string key, std::string value) {
  for (auto& e : entries_) {
    if (e.section == section && e.key == key) { e.value = std::move(value); return; }
  }
  entries_.push_back({section, std::move(key), std::move(value)});
}

std::string TomlReader::get_string(std::string_view section, std::string_view key,
                                   const std::string& def) const {
  const auto* e = find(section, key);
  return e ? e->value : def;
}

long long TomlReader::get_int(std::string_view section, std::string_view key, long long def) const {
  const auto* e = find(section, key);
  if (!e || e->value.empty()) return def;
  long long v = 0;
  const char* first = e->value.data();
  const char* last = first + e->value.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return def;
  return v;
}

bool TomlReader::get_bool(std::string_view section, std::string_view key, bool def) const {
  const auto* e = find(section, key);
  if (!e) return def;
  const auto& val = e->value;
  if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
  if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
  return def;
}

bool TomlReader::has(std::string_view section, std::string_view key) const {
  return find(section, key) != nullptr;
}

} // namespace tether::util
