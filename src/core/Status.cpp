#include "core/Status.hpp"
#include <cstring>

namespace tether::core {

const char* to_string(ExpectError e) {
  switch (e) {
    case ExpectError::None:              return "ok";
    case ExpectError::EmptyPattern:      return "empty search string";
    case ExpectError::PatternCompile:    return "pattern compile error";
    case ExpectError::MalformedEncoding: return "malformed UTF-8";
    case ExpectError::EndOfStream:       return "end of stream";
    case ExpectError::Io:                return "i/o error";
    case ExpectError::Timeout:           return "timeout";
    case ExpectError::NoSink:            return "no sink";
  }
  return "unknown";
}

Status status_from_stream(io::StreamStatus st, int err) {
  switch (st) {
    case io::StreamStatus::Ok:  return {};
    case io::StreamStatus::Eof: return {ExpectError::EndOfStream, {}};
    case io::StreamStatus::Error:
      return {ExpectError::Io, err ? std::string(std::strerror(err)) : std::string()};
  }
  return {ExpectError::Io, {}};
}

} // namespace tether::core
