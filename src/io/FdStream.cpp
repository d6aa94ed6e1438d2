#include "io/FdStream.hpp"
#include <unistd.h>
#include <poll.h>
#include <cerrno>

namespace tether::io {

FdSource::~FdSource() {
  if (owns_ && fd_ >= 0) ::close(fd_);
}

ReadResult FdSource::read(char* buf, size_t n) {
  if (n == 0) return {};
  for (;;) {
    ssize_t r = ::read(fd_, buf, n);
    if (r > 0) return {static_cast<size_t>(r), StreamStatus::Ok, 0};
    if (r == 0) return {0, StreamStatus::Eof, 0};
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      // Non-blocking descriptor: wait for readiness instead of spinning
      struct pollfd pfd{.fd=fd_,.events=POLLIN,.revents=0};
      if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) return {0, StreamStatus::Error, errno};
      continue;
    }
    // A pty master reports EIO once the slave side is gone; that is end of stream
    if (errno == EIO) return {0, StreamStatus::Eof, 0};
    return {0, StreamStatus::Error, errno};
  }
}

FdSink::~FdSink() {
  if (owns_ && fd_ >= 0) ::close(fd_);
}

WriteResult FdSink::write(const char* buf, size_t n) {
  size_t done = 0;
  while (done < n) {
    ssize_t w = ::write(fd_, buf + done, n - done);
    if (w >= 0) { done += static_cast<size_t>(w); continue; }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      struct pollfd pfd{.fd=fd_,.events=POLLOUT,.revents=0};
      if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) return {done, StreamStatus::Error, errno};
      continue;
    }
    return {done, StreamStatus::Error, errno};
  }
  return {done, StreamStatus::Ok, 0};
}

} // namespace tether::io
