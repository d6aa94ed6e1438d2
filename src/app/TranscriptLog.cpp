#include "app/TranscriptLog.hpp"
#include "util/Trace.hpp"
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace tether::app {

TranscriptLog::TranscriptLog(std::filesystem::path log_dir)
    : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "tether: TranscriptLog: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

bool TranscriptLog::append(std::string_view pattern, const core::Status& status,
                           std::string_view output) {
  auto required_path = chunk_path();

  // Rotate on hour boundary
  if (required_path != current_path_ || !file_.is_open()) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.open(required_path, std::ios::app | std::ios::binary);
    if (!file_) {
      std::fprintf(stderr, "tether: TranscriptLog: failed to open %s: %s\n",
                   required_path.c_str(), std::strerror(errno));
      current_path_.clear();
      return false;
    }
    current_path_ = required_path;
  }

  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);

  file_ << "# tether_call " << util::escape_for_log(pattern, 512)
        << " status=" << core::to_string(status.error) << " ts_ms=";
  file_.write(ts_buf, ptr - ts_buf);
  file_.put('\n');
  file_.write(output.data(), static_cast<std::streamsize>(output.size()));
  if (output.empty() || output.back() != '\n') file_.put('\n');
  file_.flush();
  return static_cast<bool>(file_);
}

std::filesystem::path TranscriptLog::chunk_path() const {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "tether_%04d-%02d-%02d_%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace tether::app
