#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace releasectl::runtime {

/*
  Process-wide cancellation. Fired once; every waiter observes it.
*/
class StopSignal {
 public:
  void Stop() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  bool Stopped() const {
    std::lock_guard lock(mutex_);
    return stopped_;
  }

  void Wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return stopped_; });
  }

  // Returns true if the signal fired within timeout.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return stopped_; });
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopped_ = false;
};

/*
  Runs fn every period until stop fires. fn runs at least once unless the
  signal has already fired.
*/
template <typename Fn, typename Rep, typename Period>
void Until(Fn&& fn, std::chrono::duration<Rep, Period> period, StopSignal& stop) {
  while (!stop.Stopped()) {
    fn();
    if (stop.WaitFor(period)) return;
  }
}

} // namespace releasectl::runtime
