#include "pipesplit/diag/logging.hpp"
#include "pipesplit/diag/unreachable.hpp"

namespace pipesplit::diag {

static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
  switch (level) {
  case LogLevel::Error:
    return spdlog::level::err;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Trace:
    return spdlog::level::trace;
  }
  unreachable();
}

void set_log_level(LogLevel level) {
  spdlog::logger &logger = pipesplit_logger();
  logger.set_level(to_spdlog_level(level));
  logger.flush_on(to_spdlog_level(level));
}

} // namespace pipesplit::diag
