#include "pipesplit/analysis/mark_non_replicable.hpp"
#include "pipesplit/diag/logging.hpp"
#include "pipesplit/graph/flatten.hpp"

namespace pipesplit::analysis {

NonReplicableSet mark_non_replicable(const graph::StageGraph &graph,
                                     const StageClassifier &classifier) {
  const graph::StageId root = graph.root();
  NonReplicableSet nonReplicable(graph.stageCount());

  for (graph::StageId marker :
       graph::find_stages(graph.rootedAt(root),
                          classifier.isNonReplicableMarker)) {
    // Upstream of a marker that was already recorded, its closure is a
    // subset of what is in the set.
    if (nonReplicable.contains(marker)) {
      continue;
    }
    std::size_t added = 0;
    for (graph::StageId id : graph::flatten(graph.rootedAt(marker))) {
      if (nonReplicable.insert(id)) {
        ++added;
      }
    }
    PIPESPLIT_TRACE("mark_non_replicable: {} {} adds {} stage(s)", marker,
                    graph.stage(marker), added);
  }
  return nonReplicable;
}

} // namespace pipesplit::analysis
