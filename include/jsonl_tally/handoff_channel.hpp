#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace jt {

// Unbounded multi-producer, single-consumer queue. Values are moved in and
// moved out; the sender keeps nothing.
template <typename T>
class HandoffChannel {
public:
  void send(T&& value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  // Blocks until a value is available.
  T receive() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> queue_;
};

}
