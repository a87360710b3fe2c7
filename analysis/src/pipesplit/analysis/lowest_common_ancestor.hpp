#pragma once

#include "pipesplit/analysis/NonReplicableSet.hpp"
#include "pipesplit/analysis/Options.hpp"
#include "pipesplit/graph/StageGraph.hpp"
#include "pipesplit/memory/container/optional.hpp"

namespace pipesplit::analysis {

/// Reduces the non-replicable stages of the graph to their lowest common
/// ancestor, as seen from the output stage.
///
/// Returns nullopt if no non-replicable stage is reachable. Stages on a
/// reference cycle that lead back to a stage still being reduced contribute
/// nothing for that stage.
memory::optional<graph::StageId>
lowest_common_ancestor(const graph::StageGraph &graph,
                       const NonReplicableSet &nonReplicable,
                       const AnalysisOptions &options = {});

/// The stage below which replication has to stop: mark_non_replicable
/// followed by lowest_common_ancestor. nullopt if the whole pipeline can
/// be replicated.
memory::optional<graph::StageId>
compute_cut_point(const graph::StageGraph &graph,
                  const AnalysisOptions &options = {});

} // namespace pipesplit::analysis
