#pragma once

#include <fmt/format.h>
#include <string_view>

namespace pipesplit::pipeline {

enum class StageKind {
  Generic,
  // Sharding round-robin dispatcher. Everything upstream of it runs in a
  // single dispatching process.
  RoundRobinDispatch,
  // Stands in for the queue that connects a worker to the dispatching
  // process.
  Placeholder,
};

} // namespace pipesplit::pipeline

template <>
struct fmt::formatter<pipesplit::pipeline::StageKind>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(pipesplit::pipeline::StageKind kind, FormatContext &ctx) const {
    std::string_view name;
    switch (kind) {
    case pipesplit::pipeline::StageKind::Generic:
      name = "generic";
      break;
    case pipesplit::pipeline::StageKind::RoundRobinDispatch:
      name = "round_robin_dispatch";
      break;
    case pipesplit::pipeline::StageKind::Placeholder:
      name = "placeholder";
      break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
