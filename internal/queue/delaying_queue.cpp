#include "delaying_queue.hpp"

namespace releasectl::queue {

DelayingQueue::DelayingQueue() {
  waiter_ = std::thread(&DelayingQueue::WaitLoop, this);
}

DelayingQueue::~DelayingQueue() {
  DelayingQueue::ShutDown();
}

void DelayingQueue::AddAfter(const std::string& key, SteadyClock::duration delay) {
  if (ShuttingDown()) return;

  if (delay <= SteadyClock::duration::zero()) {
    Add(key);
    return;
  }

  const auto ready_at = SteadyClock::now() + delay;
  {
    std::lock_guard lock(waiting_mutex_);
    auto it = ready_at_.find(key);
    if (it != ready_at_.end() && it->second <= ready_at) return;

    ready_at_[key] = ready_at;
    heap_.push(Entry{ready_at, next_seq_++, key});
  }
  waiting_cv_.notify_one();
}

std::size_t DelayingQueue::Waiting() const {
  std::lock_guard lock(waiting_mutex_);
  return ready_at_.size();
}

void DelayingQueue::ShutDown() {
  WorkQueue::ShutDown();
  {
    std::lock_guard lock(waiting_mutex_);
    stopping_ = true;
  }
  waiting_cv_.notify_all();
  if (waiter_.joinable() && waiter_.get_id() != std::this_thread::get_id()) waiter_.join();
}

void DelayingQueue::WaitLoop() {
  std::unique_lock lock(waiting_mutex_);

  while (!stopping_) {
    if (heap_.empty()) {
      waiting_cv_.wait(lock, [&] { return stopping_ || !heap_.empty(); });
      continue;
    }

    const auto now = SteadyClock::now();
    const auto top = heap_.top();
    if (top.ready_at > now) {
      waiting_cv_.wait_until(lock, top.ready_at);
      continue;
    }

    heap_.pop();

    // Superseded by an earlier AddAfter of the same key.
    auto it = ready_at_.find(top.key);
    if (it == ready_at_.end() || it->second != top.ready_at) continue;
    ready_at_.erase(it);

    Add(top.key);
  }
}

} // namespace releasectl::queue
