#include "pipesplit/analysis/analyze.hpp"
#include "pipesplit/analysis/lowest_common_ancestor.hpp"
#include "pipesplit/analysis/replicable_branches.hpp"
#include "pipesplit/diag/logging.hpp"

namespace pipesplit::analysis {

DispatchPlan analyze(const graph::StageGraph &graph,
                     const AnalysisOptions &options) {
  PIPESPLIT_TRACE("analyze:\n{}", graph);

  DispatchPlan plan{
      .cutPoint = compute_cut_point(graph, options),
      .replicableBranches = compute_replicable_branches(graph, options),
  };

  if (options.verbose) {
    PIPESPLIT_INFO("dispatch plan for {} stage(s)\n{}", graph.stageCount(),
                   plan);
  } else {
    PIPESPLIT_DEBUG("dispatch plan for {} stage(s)\n{}", graph.stageCount(),
                    plan);
  }
  return plan;
}

} // namespace pipesplit::analysis
