#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "core/Status.hpp"
#include "io/ByteStream.hpp"
#include "util/Utf8.hpp"

namespace tether::core {

struct RuneRead {
  uint32_t code_point{0};
  int size{0};                                   // encoded length in bytes
  std::array<char, util::kUtf8Max> bytes{};      // the encoded bytes, size() valid
  Status status;

  [[nodiscard]] std::string_view text() const { return {bytes.data(), static_cast<size_t>(size)}; }
};

struct LineRead {
  std::string line;
  Status status;
};

// Rune-safe reader over a byte source.
// Pulls one byte per source read, so the source is never consumed beyond
// the code point (or line) currently being assembled. Bytes that are pulled
// but do not yet form a code point stay staged for the next call.
class RuneReader {
public:
  explicit RuneReader(std::shared_ptr<io::IByteSource> source);

  // Next code point. On MalformedEncoding the first offending byte is
  // dropped so the stream can resynchronize; on Eof/Io the partial
  // sequence stays staged.
  [[nodiscard]] RuneRead read_rune();

  // Next raw byte, staged bytes first.
  [[nodiscard]] Status read_byte(char& out);

  // Bytes up to (excluding) delim. A partial line is returned together with
  // the terminal status when the stream ends first.
  [[nodiscard]] LineRead read_until(char delim);
  [[nodiscard]] LineRead read_line() { return read_until('\n'); }

  // Push bytes back in front of the staging area.
  void unread(std::string_view bytes);

  [[nodiscard]] size_t buffered() const { return staging_.size(); }
  [[nodiscard]] const std::string& staged() const { return staging_; }

private:
  [[nodiscard]] Status pull_one();

  std::shared_ptr<io::IByteSource> source_;
  std::string staging_;
};

} // namespace tether::core
