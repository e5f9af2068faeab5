#include <streamfs/retry_policy.h>

#include <cmath>

namespace streamfs {

Duration RetryPolicy::backoff(int attempt) const {
  double delay = static_cast<double>(options_.min_delay.count())
                 * std::pow(options_.backoff_factor, attempt > 0 ? attempt - 1 : 0);
  double max_delay = static_cast<double>(options_.max_delay.count());
  if (!(delay < max_delay)) {
    return options_.max_delay;
  }
  return Duration(static_cast<Duration::rep>(delay));
}

bool RetryPolicy::should_retry(const RemoteError& e, int attempt, TimePoint started,
                               Duration delay) const {
  if (!e.transient()) {
    return false;
  }
  if (attempt >= options_.max_attempts) {
    log::error("giving up after {} attempts: {}", attempt, e.what());
    return false;
  }
  if (clock_.now() + delay - started > options_.time_limit) {
    log::error("giving up, retry time limit exceeded: {}", e.what());
    return false;
  }
  return true;
}

}  // namespace streamfs
