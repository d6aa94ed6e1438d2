#pragma once

#include "io/ByteStream.hpp"

namespace tether::io {

// POSIX file descriptor endpoints (pipes, ptys, sockets, files).
// Reads are exactly what read(2) returns; no buffering is added so the
// descriptor is never drained past what the caller asked for.
class FdSource : public IByteSource {
public:
  explicit FdSource(int fd, bool owns = false) : fd_(fd), owns_(owns) {}
  ~FdSource() override;
  FdSource(const FdSource&) = delete;
  FdSource& operator=(const FdSource&) = delete;

  [[nodiscard]] ReadResult read(char* buf, size_t n) override;
  [[nodiscard]] const char* name() const override { return "fd"; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_;
  bool owns_;
};

class FdSink : public IByteSink {
public:
  explicit FdSink(int fd, bool owns = false) : fd_(fd), owns_(owns) {}
  ~FdSink() override;
  FdSink(const FdSink&) = delete;
  FdSink& operator=(const FdSink&) = delete;

  [[nodiscard]] WriteResult write(const char* buf, size_t n) override;
  [[nodiscard]] const char* name() const override { return "fd"; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_;
  bool owns_;
};

} // namespace tether::io
