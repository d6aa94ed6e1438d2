#pragma once

#include <cstddef>

namespace tether::io {

enum class StreamStatus { Ok, Eof, Error };

struct ReadResult {
  size_t count{0};
  StreamStatus status{StreamStatus::Ok};
  int err{0};  // errno when status == Error
};

struct WriteResult {
  size_t count{0};
  StreamStatus status{StreamStatus::Ok};
  int err{0};
};

// Blocking byte source. read() returns at least one byte with status Ok,
// or zero bytes with Eof/Error. Implementations are not required to be
// safe for concurrent readers.
class IByteSource {
public:
  virtual ~IByteSource() = default;

  [[nodiscard]] virtual ReadResult read(char* buf, size_t n) = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

// Blocking byte sink. write() either writes all n bytes or reports Error.
class IByteSink {
public:
  virtual ~IByteSink() = default;

  [[nodiscard]] virtual WriteResult write(const char* buf, size_t n) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace tether::io
