#pragma once

#include "pipesplit/analysis/NonReplicableSet.hpp"
#include "pipesplit/analysis/StageClassifier.hpp"
#include "pipesplit/graph/StageGraph.hpp"

namespace pipesplit::analysis {

/// Collects every non-replicable marker of the graph together with all of
/// its transitive predecessors.
///
/// Throws diag::InvalidGraphShape if the graph does not have exactly one
/// output stage.
NonReplicableSet mark_non_replicable(const graph::StageGraph &graph,
                                     const StageClassifier &classifier);

} // namespace pipesplit::analysis
