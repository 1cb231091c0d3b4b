#ifndef BENCHTREND_CHANNEL_HPP
#define BENCHTREND_CHANNEL_HPP
/**
 * @file Channel.hpp
 * @brief Unbounded multi-producer, single-consumer message queue.
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace benchtrend {
namespace trend {

/* -------------------------------- Channel -------------------------------- */

/**
 * @brief FIFO queue; push() never blocks, pop() waits for a message.
 * @note NOT RT-safe (mutex locking, heap allocation).
 */
template <class T>
class Channel {
public:
  void push(T msg) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
  }

  T pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    T msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> queue_;
};

} // namespace trend
} // namespace benchtrend

#endif // BENCHTREND_CHANNEL_HPP
