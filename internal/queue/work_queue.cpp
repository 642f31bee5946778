#include "work_queue.hpp"

namespace releasectl::queue {

void WorkQueue::Add(const std::string& key) {
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) return;
    if (!dirty_.insert(key).second) return;
    if (processing_.contains(key)) return;
    queue_.push_back(key);
  }
  cv_.notify_one();
}

std::optional<std::string> WorkQueue::Get() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutting_down_ || !queue_.empty(); });

  if (shutting_down_) return std::nullopt;

  std::string key = std::move(queue_.front());
  queue_.pop_front();
  processing_.insert(key);
  dirty_.erase(key);
  return key;
}

void WorkQueue::Done(const std::string& key) {
  {
    std::lock_guard lock(mutex_);
    processing_.erase(key);
    if (!dirty_.contains(key)) return;
    queue_.push_back(key);
  }
  cv_.notify_one();
}

std::size_t WorkQueue::Len() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void WorkQueue::ShutDown() {
  {
    std::lock_guard lock(mutex_);
    shutting_down_ = true;
  }
  cv_.notify_all();
}

bool WorkQueue::ShuttingDown() const {
  std::lock_guard lock(mutex_);
  return shutting_down_;
}

} // namespace releasectl::queue
