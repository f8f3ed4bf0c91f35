#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace attest::core {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger writing to stderr, shared by every caller using the same tag
   */
  Logger createLogger(const std::string& tag);

  /**
   * Parse a level name (trace, debug, info, warn, error, critical, off) and
   * apply it to every registered and future logger.
   * Returns false and leaves the level untouched if the name is unknown.
   */
  bool set_log_level(const std::string& level_name);
}
