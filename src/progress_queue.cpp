/**
 * @file progress_queue.cpp
 * @brief Progress event queue implementation
 */

#include "voicesync/progress_queue.hpp"

#include <utility>

namespace voicesync {

void ProgressQueue::push(ProgressEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return;
    events_.push(std::move(event));
  }
  cv_.notify_one();
}

bool ProgressQueue::pop(ProgressEvent &event) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !events_.empty() || done_.load(); });

  if (events_.empty())
    return false;

  event = std::move(events_.front());
  events_.pop();
  return true;
}

void ProgressQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace voicesync
