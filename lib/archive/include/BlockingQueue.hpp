/**
 * @file BlockingQueue.hpp
 * @brief Bounded multi-producer / single-consumer queue
 */

#ifndef UPIFINDER_ARCHIVE_BLOCKING_QUEUE_HPP
#define UPIFINDER_ARCHIVE_BLOCKING_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace UPIFINDER {
namespace Archive {

/**
 * @brief Thread-safe bounded queue with close semantics
 *
 * Producers block in Push() while the queue is full. Pop() blocks until an
 * item is available and returns nullopt once the queue is closed and
 * drained.
 */
template <typename T>
class BlockingQueue {
public:
  static constexpr size_t kDefaultCapacity = 10000;

  explicit BlockingQueue(size_t capacity = kDefaultCapacity)
      : fCapacity(capacity == 0 ? 1 : capacity) {}

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;

  /**
   * @return false if the queue was closed, the item is dropped
   */
  bool Push(T item) {
    {
      std::unique_lock<std::mutex> lock(fMutex);
      fNotFull.wait(lock,
                    [this] { return fQueue.size() < fCapacity || fClosed; });
      if (fClosed) {
        return false;
      }
      fQueue.push(std::move(item));
    }
    fNotEmpty.notify_one();
    return true;
  }

  std::optional<T> Pop() {
    std::optional<T> item;
    {
      std::unique_lock<std::mutex> lock(fMutex);
      fNotEmpty.wait(lock, [this] { return !fQueue.empty() || fClosed; });
      if (fQueue.empty()) {
        return std::nullopt;
      }
      item = std::move(fQueue.front());
      fQueue.pop();
    }
    fNotFull.notify_one();
    return item;
  }

  /**
   * @brief No more pushes; pending items can still be popped
   */
  void Close() {
    {
      std::lock_guard<std::mutex> lock(fMutex);
      fClosed = true;
    }
    fNotEmpty.notify_all();
    fNotFull.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(fMutex);
    return fClosed;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(fMutex);
    return fQueue.size();
  }

  size_t Capacity() const { return fCapacity; }

private:
  const size_t fCapacity;
  std::queue<T> fQueue;
  bool fClosed = false;
  mutable std::mutex fMutex;
  std::condition_variable fNotEmpty;
  std::condition_variable fNotFull;
};

}  // namespace Archive
}  // namespace UPIFINDER

#endif  // UPIFINDER_ARCHIVE_BLOCKING_QUEUE_HPP
