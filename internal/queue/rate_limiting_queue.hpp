#pragma once

#include <memory>
#include <string>

#include "delaying_queue.hpp"
#include "rate_limiter.hpp"

namespace releasectl::queue {

/*
  DelayingQueue whose retry delays come from a RateLimiter.
*/
class RateLimitingQueue final : public DelayingQueue {
 public:
  explicit RateLimitingQueue(std::shared_ptr<RateLimiter> limiter);

  // Re-adds key once the limiter allows it.
  void AddRateLimited(const std::string& key);

  // Stops tracking key's failures. Call after a successful reconcile.
  void Forget(const std::string& key);

  int NumRequeues(const std::string& key);

 private:
  std::shared_ptr<RateLimiter> limiter_;
};

} // namespace releasectl::queue
