#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>
#include "core/Status.hpp"

namespace tether::app {

// Appends each matching call's transcript to hourly files
// (tether_YYYY-MM-DD_HH.log) under a log directory.
class TranscriptLog {
public:
  explicit TranscriptLog(std::filesystem::path log_dir);
  TranscriptLog(const TranscriptLog&) = delete;
  TranscriptLog& operator=(const TranscriptLog&) = delete;

  // False when the current chunk file cannot be opened or written.
  bool append(std::string_view pattern, const core::Status& status, std::string_view output);

  [[nodiscard]] std::filesystem::path chunk_path() const;

private:
  std::filesystem::path log_dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
};

} // namespace tether::app
