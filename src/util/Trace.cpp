#include "util/Trace.hpp"
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tether::util {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  // TETHER_TIMEOUT_MS <-> tether_timeout_ms
  if (n.rfind("TETHER_", 0) == 0) {
    alt = std::string("tether_") + n.substr(7);
    for (auto& c : alt) c = (char)std::tolower((unsigned char)c);
  } else if (n.rfind("tether_", 0) == 0) {
    alt = std::string("TETHER_") + n.substr(7);
    for (auto& c : alt) c = (char)std::toupper((unsigned char)c);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static int env_trace_default() {
  const char* v = getenv_compat("TETHER_VERBOSE");
  if (!v) return 0;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return 0;
  return 1;
}

// -1 = not yet resolved from the environment
static std::atomic<int> g_trace{-1};

bool trace_enabled() {
  int v = g_trace.load(std::memory_order_relaxed);
  if (v < 0) {
    v = env_trace_default();
    int expected = -1;
    g_trace.compare_exchange_strong(expected, v);
    v = g_trace.load(std::memory_order_relaxed);
  }
  return v == 1;
}

void set_trace_enabled(bool on) { g_trace.store(on ? 1 : 0); }

void trace(const char* fmt, ...) {
  if (!trace_enabled()) return;
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "tether: %s\n", buf);
}

std::string escape_for_log(std::string_view s, size_t max_len) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (out.size() >= max_len) { out += "..."; break; }
    if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (c < 0x20 || c == 0x7F) {
      char hex[8];
      std::snprintf(hex, sizeof(hex), "\\x%02x", c);
      out += hex;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

} // namespace tether::util
