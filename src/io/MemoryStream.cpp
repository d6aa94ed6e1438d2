#include "io/MemoryStream.hpp"
#include <algorithm>
#include <cerrno>

namespace tether::io {

ReadResult BufferStream::read(char* buf, size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  if (n == 0) return {};
  if (data_.empty()) return {0, StreamStatus::Eof, 0};
  size_t k = std::min(n, data_.size());
  std::copy_n(data_.begin(), k, buf);
  data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(k));
  return {k, StreamStatus::Ok, 0};
}

WriteResult BufferStream::write(const char* buf, size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  data_.insert(data_.end(), buf, buf + n);
  return {n, StreamStatus::Ok, 0};
}

size_t BufferStream::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return data_.size();
}

std::string BufferStream::contents() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::string(data_.begin(), data_.end());
}

ReadResult Pipe::read(char* buf, size_t n) {
  if (n == 0) return {};
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this]{ return !data_.empty() || closed_; });
  if (data_.empty()) return {0, StreamStatus::Eof, 0};
  size_t k = std::min(n, data_.size());
  std::copy_n(data_.begin(), k, buf);
  data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(k));
  return {k, StreamStatus::Ok, 0};
}

WriteResult Pipe::write(const char* buf, size_t n) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return {0, StreamStatus::Error, EPIPE};
    data_.insert(data_.end(), buf, buf + n);
  }
  cv_.notify_all();
  return {n, StreamStatus::Ok, 0};
}

void Pipe::close_write() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Pipe::write_closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

} // namespace tether::io
