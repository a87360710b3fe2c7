#pragma once

#include "pipesplit/analysis/DispatchPlan.hpp"
#include "pipesplit/analysis/Options.hpp"
#include "pipesplit/graph/StageGraph.hpp"

namespace pipesplit::analysis {

/// Runs compute_cut_point and compute_replicable_branches on the same
/// snapshot. Each keeps its own memo tables.
DispatchPlan analyze(const graph::StageGraph &graph,
                     const AnalysisOptions &options = {});

} // namespace pipesplit::analysis
