#pragma once

#include "pipesplit/graph/StageId.hpp"
#include "pipesplit/memory/container/optional.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include <fmt/format.h>

namespace pipesplit::analysis {

struct DispatchPlan {
  // Lowest common ancestor of all non-replicable stages.
  memory::optional<graph::StageId> cutPoint;
  // Roots of the maximal replicable subgraphs.
  memory::vector<graph::StageId> replicableBranches;
};

} // namespace pipesplit::analysis

template <> struct fmt::formatter<pipesplit::analysis::DispatchPlan> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const pipesplit::analysis::DispatchPlan &plan,
              FormatContext &ctx) const {
    auto out = ctx.out();
    if (plan.cutPoint) {
      fmt::format_to(out, "Cut point: {}\n", *plan.cutPoint);
    } else {
      fmt::format_to(out, "Cut point: none\n");
    }
    fmt::format_to(out, "Replicable branches: [");
    bool first = true;
    for (const auto &id : plan.replicableBranches) {
      if (!first)
        fmt::format_to(out, ", ");
      first = false;
      fmt::format_to(out, "{}", id);
    }
    fmt::format_to(out, "]");
    return out;
  }
};
