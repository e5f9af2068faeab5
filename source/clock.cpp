#include <streamfs/clock.h>

#include <thread>

namespace streamfs {

TimePoint SystemClock::now() const { return std::chrono::system_clock::now(); }

void SystemClock::sleep(Duration delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

}  // namespace streamfs
