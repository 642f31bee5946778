#include "rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace releasectl::queue {

// ------------------------------------------------------------
// ItemExponentialFailureRateLimiter
// ------------------------------------------------------------

ItemExponentialFailureRateLimiter::ItemExponentialFailureRateLimiter(Duration base_delay, Duration max_delay)
    : base_delay_(base_delay), max_delay_(max_delay) {
}

Duration ItemExponentialFailureRateLimiter::When(const std::string& key) {
  std::lock_guard lock(mutex_);

  const int exp = failures_[key]++;

  // Computed in floating point so large exponents saturate instead of wrapping.
  const double backoff = static_cast<double>(base_delay_.count()) * std::pow(2.0, exp);
  if (backoff >= static_cast<double>(max_delay_.count())) {
    return max_delay_;
  }
  return Duration(static_cast<Duration::rep>(backoff));
}

void ItemExponentialFailureRateLimiter::Forget(const std::string& key) {
  std::lock_guard lock(mutex_);
  failures_.erase(key);
}

int ItemExponentialFailureRateLimiter::NumRequeues(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto it = failures_.find(key);
  return it == failures_.end() ? 0 : it->second;
}

// ------------------------------------------------------------
// BucketRateLimiter
// ------------------------------------------------------------

BucketRateLimiter::BucketRateLimiter(double qps, std::uint32_t burst, NowFn now)
    : qps_(qps), burst_(static_cast<double>(burst)), tokens_(static_cast<double>(burst)), now_(std::move(now)), last_(now_()) {
}

Duration BucketRateLimiter::When(const std::string&) {
  std::lock_guard lock(mutex_);

  if (qps_ <= 0.0) return Duration::zero();

  const auto now     = now_();
  const auto elapsed = std::chrono::duration<double>(now - last_).count();
  if (elapsed > 0.0) {
    tokens_ = std::min(burst_, tokens_ + elapsed * qps_);
    last_   = now;
  }

  // Reserve a token; a negative balance is paid back by waiting.
  tokens_ -= 1.0;
  if (tokens_ >= 0.0) return Duration::zero();

  return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(-tokens_ / qps_));
}

void BucketRateLimiter::Forget(const std::string&) {
}

int BucketRateLimiter::NumRequeues(const std::string&) {
  return 0;
}

// ------------------------------------------------------------
// MaxOfRateLimiter
// ------------------------------------------------------------

MaxOfRateLimiter::MaxOfRateLimiter(std::vector<std::shared_ptr<RateLimiter>> limiters) : limiters_(std::move(limiters)) {
}

Duration MaxOfRateLimiter::When(const std::string& key) {
  Duration longest = Duration::zero();
  for (const auto& limiter : limiters_) {
    longest = std::max(longest, limiter->When(key));
  }
  return longest;
}

void MaxOfRateLimiter::Forget(const std::string& key) {
  for (const auto& limiter : limiters_) {
    limiter->Forget(key);
  }
}

int MaxOfRateLimiter::NumRequeues(const std::string& key) {
  int most = 0;
  for (const auto& limiter : limiters_) {
    most = std::max(most, limiter->NumRequeues(key));
  }
  return most;
}

std::shared_ptr<RateLimiter> DefaultControllerRateLimiter(const RateLimiterOptions& options) {
  std::vector<std::shared_ptr<RateLimiter>> limiters;
  limiters.push_back(std::make_shared<ItemExponentialFailureRateLimiter>(options.base_delay, options.max_delay));
  limiters.push_back(std::make_shared<BucketRateLimiter>(options.qps, options.burst));
  return std::make_shared<MaxOfRateLimiter>(std::move(limiters));
}

} // namespace releasectl::queue
