#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include "io/ByteStream.hpp"

namespace tether::io {

// In-memory byte buffer that is both source and sink.
// Reads drain from the front and report Eof as soon as the buffer is empty,
// so a prepared transcript behaves like the output of a finished process.
class BufferStream : public IByteSource, public IByteSink {
public:
  BufferStream() = default;
  explicit BufferStream(std::string_view initial) : data_(initial.begin(), initial.end()) {}
  BufferStream(const BufferStream&) = delete;
  BufferStream& operator=(const BufferStream&) = delete;

  [[nodiscard]] ReadResult read(char* buf, size_t n) override;
  [[nodiscard]] WriteResult write(const char* buf, size_t n) override;
  [[nodiscard]] const char* name() const override { return "buffer"; }

  [[nodiscard]] size_t size() const;
  [[nodiscard]] std::string contents() const;

private:
  mutable std::mutex mu_;
  std::deque<char> data_;
};

// Blocking in-memory pipe. Reads wait for data until close_write(); after
// that the remaining bytes drain and then every read reports Eof.
class Pipe : public IByteSource, public IByteSink {
public:
  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  [[nodiscard]] ReadResult read(char* buf, size_t n) override;
  [[nodiscard]] WriteResult write(const char* buf, size_t n) override;
  [[nodiscard]] const char* name() const override { return "pipe"; }

  [[nodiscard]] WriteResult write(std::string_view s) { return write(s.data(), s.size()); }
  void close_write();
  [[nodiscard]] bool write_closed() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<char> data_;
  bool closed_{false};
};

} // namespace tether::io
