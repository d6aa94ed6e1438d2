#pragma once

#include <string>
#include "io/ByteStream.hpp"

namespace tether::core {

enum class ExpectError {
  None,
  EmptyPattern,       // literal search with ""
  PatternCompile,     // malformed regular expression
  MalformedEncoding,  // bytes that cannot form a UTF-8 code point
  EndOfStream,
  Io,                 // source or sink reported an errno
  Timeout,
  NoSink,             // write requested on a read-only engine
};

[[nodiscard]] const char* to_string(ExpectError e);

// Error code plus optional human-readable detail (regex message, strerror).
struct Status {
  ExpectError error{ExpectError::None};
  std::string detail;

  [[nodiscard]] bool ok() const { return error == ExpectError::None; }
  explicit operator bool() const { return ok(); }
  bool operator==(ExpectError e) const { return error == e; }
};

// Map a stream status (Eof/Error + errno) onto the error taxonomy.
[[nodiscard]] Status status_from_stream(io::StreamStatus st, int err);

} // namespace tether::core
