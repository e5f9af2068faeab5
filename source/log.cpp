#include <streamfs/log.h>

#include <mutex>

namespace streamfs::log {

std::atomic<Level> g_level{Level::Warning};

static std::mutex g_log_mutex;

void write(Level level, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  switch (level) {
    case Level::Debug:
      std::cout << "[debug] " << message << std::endl;
      break;
    case Level::Info:
      std::cout << message << std::endl;
      break;
    case Level::Warning:
      std::cerr << "Warning: " << message << std::endl;
      break;
    case Level::Error:
      std::cerr << "Error: " << message << std::endl;
      break;
  }
}

}  // namespace streamfs::log
