#pragma once

#include "pipesplit/analysis/Options.hpp"
#include "pipesplit/graph/StageGraph.hpp"
#include "pipesplit/memory/container/vector.hpp"

namespace pipesplit::analysis {

/// Roots of the maximal subgraphs that contain no placeholder stage.
///
/// Returns exactly the output stage if nothing upstream of it is a
/// placeholder, and an empty list if no branch can be replicated.
/// Placeholders themselves are never listed, every stage is listed at most
/// once.
///
/// Throws diag::InvalidGraphShape if the graph does not have exactly one
/// output stage.
memory::vector<graph::StageId>
compute_replicable_branches(const graph::StageGraph &graph,
                            const AnalysisOptions &options = {});

} // namespace pipesplit::analysis
