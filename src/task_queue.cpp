/**
 * @file task_queue.cpp
 * @brief Idea queue and result collection implementation
 */

#include "voicesync/task_queue.hpp"

#include <utility>

namespace voicesync {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(size_t idea_index) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(idea_index);
  cv.notify_one();
}

bool TaskQueue::pop(size_t &idea_index) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  idea_index = tasks.front();
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ResultCollector Implementation -----**

ResultCollector::ResultCollector(size_t idea_count) : outcomes(idea_count) {}

void ResultCollector::store(size_t idea_index, IdeaOutcome &&outcome) {
  std::lock_guard<std::mutex> lock(mutex);
  if (idea_index < outcomes.size())
    outcomes[idea_index] = std::move(outcome);
}

std::vector<IdeaOutcome> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(outcomes);
}

} // namespace voicesync
