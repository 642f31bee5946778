#include "rate_limiting_queue.hpp"

#include <utility>

namespace releasectl::queue {

RateLimitingQueue::RateLimitingQueue(std::shared_ptr<RateLimiter> limiter) : limiter_(std::move(limiter)) {
}

void RateLimitingQueue::AddRateLimited(const std::string& key) {
  AddAfter(key, limiter_->When(key));
}

void RateLimitingQueue::Forget(const std::string& key) {
  limiter_->Forget(key);
}

int RateLimitingQueue::NumRequeues(const std::string& key) {
  return limiter_->NumRequeues(key);
}

} // namespace releasectl::queue
