#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Multi-producer, multi-consumer job queue. Once closed it accepts nothing
// new, while consumers still drain what is left.
template <typename T> class ThreadSafeQueue {
public:
  // false if the queue was already closed
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      items_.push_back(std::move(value));
    }
    cond_.notify_one();
    return true;
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_front_locked();
  }

  // Blocks until an item arrives; nullopt once closed and drained
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !items_.empty() || closed_; });
    return pop_front_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cond_.notify_all();
  }

  // Drops pending items and returns how many were dropped
  size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = items_.size();
    items_.clear();
    return dropped;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  std::optional<T> pop_front_locked() {
    if (items_.empty())
      return std::nullopt;
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable cond_;
  std::deque<T> items_;
  bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
