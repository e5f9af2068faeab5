#pragma once

#include <chrono>

namespace streamfs {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::nanoseconds;

// Source of time and delays. Injected everywhere time matters so tests can
// run retry loops and attribute expiry without real waiting.
class Clock {
public:
  virtual ~Clock() = default;

  virtual TimePoint now() const = 0;
  virtual void sleep(Duration delay) = 0;
};

class SystemClock final : public Clock {
public:
  TimePoint now() const override;
  void sleep(Duration delay) override;
};

}  // namespace streamfs
