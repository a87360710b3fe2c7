#include "pipesplit/analysis/lowest_common_ancestor.hpp"
#include "pipesplit/analysis/mark_non_replicable.hpp"
#include "pipesplit/diag/depth_exceeded.hpp"
#include "pipesplit/diag/logging.hpp"
#include "pipesplit/memory/container/dynamic_bitset.hpp"
#include "pipesplit/memory/container/span.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include <algorithm>

namespace pipesplit::analysis {

namespace {

struct Frame {
  graph::StageId stage;
  std::size_t next;
  // Non-empty results of the predecessors reduced so far.
  memory::vector<graph::StageId> found;
};

memory::optional<graph::StageId>
merge(graph::StageId stage, const memory::vector<graph::StageId> &found) {
  if (found.empty()) {
    return memory::nullopt;
  }
  const graph::StageId first = found.front();
  if (std::ranges::all_of(found,
                          [&](graph::StageId id) { return id == first; })) {
    return first;
  }
  // Distinct non-replicable chains converge here.
  return stage;
}

} // namespace

memory::optional<graph::StageId>
lowest_common_ancestor(const graph::StageGraph &graph,
                       const NonReplicableSet &nonReplicable,
                       const AnalysisOptions &options) {
  const graph::StageId root = graph.root();
  const std::size_t N = graph.stageCount();

  memory::dynamic_bitset visited(N, false);
  memory::vector<memory::optional<graph::StageId>> lca(N, memory::nullopt);
  memory::vector<Frame> stack;

  // Writes the memo entry of a stage reached for the first time. Returns
  // true if its predecessors still have to be reduced.
  auto enter = [&](graph::StageId id) -> bool {
    visited[*id] = true;
    if (options.onReduce) {
      options.onReduce(graph.stage(id));
    }
    if (nonReplicable.contains(id)) {
      lca[*id] = id;
      return false;
    }
    // Provisional entry, a cycle leading back to this stage observes
    // "no result" instead of descending again.
    lca[*id] = memory::nullopt;
    return true;
  };

  auto push = [&](graph::StageId id) {
    if (stack.size() >= options.maxDepth) {
      diag::depth_exceeded("lowest_common_ancestor", options.maxDepth);
    }
    stack.push_back(Frame{id, 0, {}});
  };

  if (enter(root)) {
    push(root);
  }

  while (!stack.empty()) {
    Frame &frame = stack.back();
    memory::span<const graph::StageId> preds = graph.predecessors(frame.stage);
    if (frame.next < preds.size()) {
      const graph::StageId pred = preds[frame.next++];
      if (!visited[*pred] && enter(pred)) {
        push(pred);
        continue;
      }
      if (lca[*pred]) {
        frame.found.push_back(*lca[*pred]);
      }
      continue;
    }

    const graph::StageId stage = frame.stage;
    lca[*stage] = merge(stage, frame.found);
    if (lca[*stage]) {
      PIPESPLIT_TRACE("lowest_common_ancestor: {} -> {}", stage, *lca[*stage]);
    }
    stack.pop_back();
    if (!stack.empty() && lca[*stage]) {
      stack.back().found.push_back(*lca[*stage]);
    }
  }

  return lca[*root];
}

memory::optional<graph::StageId>
compute_cut_point(const graph::StageGraph &graph,
                  const AnalysisOptions &options) {
  const NonReplicableSet nonReplicable =
      mark_non_replicable(graph, options.classifier);
  memory::optional<graph::StageId> cutPoint =
      lowest_common_ancestor(graph, nonReplicable, options);
  if (cutPoint) {
    PIPESPLIT_DEBUG("cut point: {} {} ({} non-replicable stage(s))",
                    *cutPoint, graph.stage(*cutPoint), nonReplicable.size());
  } else {
    PIPESPLIT_DEBUG("cut point: none, the pipeline is fully replicable");
  }
  return cutPoint;
}

} // namespace pipesplit::analysis
