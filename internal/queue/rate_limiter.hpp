#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace releasectl::queue {

using Duration = std::chrono::steady_clock::duration;

/*
  Decides how long a key waits before it is re-added after a failure.
*/
class RateLimiter {
 public:
  virtual ~RateLimiter() = default;

  // Delay for the next retry of key. Records one more failure.
  virtual Duration When(const std::string& key) = 0;

  // Clears the failure history of key.
  virtual void Forget(const std::string& key) = 0;

  virtual int NumRequeues(const std::string& key) = 0;
};

/*
  base * 2^failures, capped at max_delay.
*/
class ItemExponentialFailureRateLimiter final : public RateLimiter {
 public:
  ItemExponentialFailureRateLimiter(Duration base_delay, Duration max_delay);

  Duration When(const std::string& key) override;
  void     Forget(const std::string& key) override;
  int      NumRequeues(const std::string& key) override;

 private:
  std::mutex                           mutex_;
  std::unordered_map<std::string, int> failures_;
  Duration                             base_delay_;
  Duration                             max_delay_;
};

/*
  Overall token bucket: qps tokens per second, at most burst stored.
  Keys share the bucket; no per-key history is kept.
*/
class BucketRateLimiter final : public RateLimiter {
 public:
  using NowFn = std::function<std::chrono::steady_clock::time_point()>;

  BucketRateLimiter(double qps, std::uint32_t burst, NowFn now = std::chrono::steady_clock::now);

  Duration When(const std::string& key) override;
  void     Forget(const std::string& key) override;
  int      NumRequeues(const std::string& key) override;

 private:
  std::mutex                            mutex_;
  double                                qps_;
  double                                burst_;
  double                                tokens_;
  NowFn                                 now_;
  std::chrono::steady_clock::time_point last_;
};

/*
  Longest delay of all children.
*/
class MaxOfRateLimiter final : public RateLimiter {
 public:
  explicit MaxOfRateLimiter(std::vector<std::shared_ptr<RateLimiter>> limiters);

  Duration When(const std::string& key) override;
  void     Forget(const std::string& key) override;
  int      NumRequeues(const std::string& key) override;

 private:
  std::vector<std::shared_ptr<RateLimiter>> limiters_;
};

struct RateLimiterOptions {
  Duration      base_delay = std::chrono::milliseconds(5);
  Duration      max_delay  = std::chrono::seconds(1000);
  double        qps        = 10.0;
  std::uint32_t burst      = 100;
};

// Per-item exponential backoff combined with an overall bucket.
std::shared_ptr<RateLimiter> DefaultControllerRateLimiter(const RateLimiterOptions& options = {});

} // namespace releasectl::queue
