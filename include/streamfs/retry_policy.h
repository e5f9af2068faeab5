#pragma once

#include <streamfs/clock.h>
#include <streamfs/errors.h>
#include <streamfs/log.h>

#include <chrono>
#include <string>

namespace streamfs {

struct RetryOptions {
  int max_attempts = 10;
  Duration min_delay = std::chrono::seconds(1);
  Duration max_delay = std::chrono::seconds(60);
  double backoff_factor = 2.0;
  Duration time_limit = std::chrono::minutes(5);
};

// Runs remote operations, retrying transient RemoteErrors with exponential
// backoff. Delays go through the injected clock, so they block only the
// calling thread.
class RetryPolicy {
public:
  RetryPolicy(Clock& clock, RetryOptions options = {}) : clock_(clock), options_(options) {}

  const RetryOptions& options() const { return options_; }

  // Delay to wait after the given (1-based) failed attempt
  Duration backoff(int attempt) const;

  template <typename F> auto run(const std::string& operation, F&& fn) -> decltype(fn()) {
    TimePoint started = clock_.now();
    for (int attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const RemoteError& e) {
        Duration delay = backoff(attempt);
        if (!should_retry(e, attempt, started, delay)) {
          throw;
        }
        log::warning("{} failed (attempt {}/{}): {}, retrying in {} ms", operation, attempt,
                     options_.max_attempts, e.what(),
                     std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
        clock_.sleep(delay);
      }
    }
  }

private:
  bool should_retry(const RemoteError& e, int attempt, TimePoint started, Duration delay) const;

  Clock& clock_;
  RetryOptions options_;
};

}  // namespace streamfs
