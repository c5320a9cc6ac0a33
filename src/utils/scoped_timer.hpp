#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <prometheus/histogram.h>

// Observes the lifetime of the enclosing scope, in seconds, on destruction
class ScopedTimer {
public:
  explicit ScopedTimer(prometheus::Histogram &histogram_metric)
      : metric_(histogram_metric), start_time_(Clock::now()) {}

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

  ~ScopedTimer() { metric_.Observe(elapsed_seconds()); }

  double elapsed_seconds() const {
    return std::chrono::duration<double>(Clock::now() - start_time_).count();
  }

private:
  using Clock = std::chrono::steady_clock;

  prometheus::Histogram &metric_;
  Clock::time_point start_time_;
};

#endif // SCOPED_TIMER_HPP
