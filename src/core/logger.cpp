#include "attest/core/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace attest::core {
  namespace {
    void setGlobalPattern(spdlog::logger& logger) {
      logger.set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
    }
  }

  Logger createLogger(const std::string& tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      // stdout belongs to command output
      logger = spdlog::stderr_color_mt(tag);
      setGlobalPattern(*logger);
    }
    return logger;
  }

  bool set_log_level(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && level_name != "off") return false;
    spdlog::set_level(level);
    return true;
  }
}
