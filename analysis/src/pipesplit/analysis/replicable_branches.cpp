#include "pipesplit/analysis/replicable_branches.hpp"
#include "pipesplit/diag/depth_exceeded.hpp"
#include "pipesplit/diag/logging.hpp"
#include "pipesplit/memory/container/dynamic_bitset.hpp"
#include "pipesplit/memory/container/optional.hpp"
#include "pipesplit/memory/container/span.hpp"

namespace pipesplit::analysis {

memory::vector<graph::StageId>
compute_replicable_branches(const graph::StageGraph &graph,
                            const AnalysisOptions &options) {
  const graph::StageId root = graph.root();
  const std::size_t N = graph.stageCount();

  struct Frame {
    graph::StageId stage;
    std::size_t next;
  };

  // Whether the full closure of a stage is replicable. Written before the
  // predecessors are visited, so cycles and shared subgraphs terminate on
  // the memo.
  memory::vector<memory::optional<bool>> replicable(N, memory::nullopt);
  memory::dynamic_bitset listed(N, false);
  memory::vector<graph::StageId> branches;
  memory::vector<Frame> stack;

  auto enter = [&](graph::StageId id) -> bool {
    const pipeline::Stage &stage = graph.stage(id);
    if (options.onReduce) {
      options.onReduce(stage);
    }
    if (options.classifier.isPlaceholder(stage)) {
      replicable[*id] = false;
      return false;
    }
    replicable[*id] = true;
    return true;
  };

  auto push = [&](graph::StageId id) {
    if (stack.size() >= options.maxDepth) {
      diag::depth_exceeded("compute_replicable_branches", options.maxDepth);
    }
    stack.push_back(Frame{id, 0});
  };

  auto list = [&](graph::StageId id) {
    if (!listed[*id]) {
      listed[*id] = true;
      branches.push_back(id);
    }
  };

  if (enter(root)) {
    push(root);
  }

  while (!stack.empty()) {
    Frame &frame = stack.back();
    memory::span<const graph::StageId> preds = graph.predecessors(frame.stage);
    if (frame.next < preds.size()) {
      const graph::StageId pred = preds[frame.next++];
      if (!replicable[*pred].has_value() && enter(pred)) {
        push(pred);
        continue;
      }
      // No early exit, every predecessor has to carry a memo entry once
      // this stage is finished.
      if (!*replicable[*pred]) {
        replicable[*frame.stage] = false;
      }
      continue;
    }

    const graph::StageId stage = frame.stage;
    stack.pop_back();
    if (*replicable[*stage]) {
      continue;
    }
    // Non-replicability starts here, every replicable direct predecessor
    // is the root of a maximal replicable branch.
    for (graph::StageId pred : preds) {
      if (*replicable[*pred]) {
        PIPESPLIT_TRACE("compute_replicable_branches: {} {} below {}", pred,
                        graph.stage(pred), stage);
        list(pred);
      }
    }
    if (!stack.empty()) {
      replicable[*stack.back().stage] = false;
    }
  }

  if (*replicable[*root]) {
    list(root);
  }
  PIPESPLIT_DEBUG("replicable branches: {}", branches.size());
  return branches;
}

} // namespace pipesplit::analysis
