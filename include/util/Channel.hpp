#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tether::util {

// Unbounded blocking FIFO with close semantics.
// After close(), send() fails and receive() drains what is left, then
// returns nullopt so consumers observe closure as end of stream.
template <typename T>
class Channel {
public:
  Channel() = default;
  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool send(T value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return false;
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  [[nodiscard]] std::optional<T> receive() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this]{ return !q_.empty() || closed_; });
    return pop_locked();
  }

  [[nodiscard]] std::optional<T> try_receive() {
    std::lock_guard<std::mutex> lk(mu_);
    return pop_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

private:
  std::optional<T> pop_locked() {
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_{false};
};

} // namespace tether::util
