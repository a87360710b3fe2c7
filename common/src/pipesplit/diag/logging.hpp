#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pipesplit::diag {

enum class LogLevel {
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::logger &pipesplit_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("pipesplit");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("pipesplit", sink);
      lg->set_level(spdlog::level::warn);
      lg->set_pattern("[%^%-5l%$ %n] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

void set_log_level(LogLevel level);

#define PIPESPLIT_TRACE(...)                                                   \
  ::pipesplit::diag::pipesplit_logger().trace(__VA_ARGS__)
#define PIPESPLIT_DEBUG(...)                                                   \
  ::pipesplit::diag::pipesplit_logger().debug(__VA_ARGS__)
#define PIPESPLIT_INFO(...)                                                    \
  ::pipesplit::diag::pipesplit_logger().info(__VA_ARGS__)
#define PIPESPLIT_WARN(...)                                                    \
  ::pipesplit::diag::pipesplit_logger().warn(__VA_ARGS__)
#define PIPESPLIT_ERROR(...)                                                   \
  ::pipesplit::diag::pipesplit_logger().error(__VA_ARGS__)

} // namespace pipesplit::diag
