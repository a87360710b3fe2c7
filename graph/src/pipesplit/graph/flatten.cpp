#include "pipesplit/graph/flatten.hpp"
#include "pipesplit/memory/container/deque.hpp"
#include "pipesplit/memory/container/dynamic_bitset.hpp"

namespace pipesplit::graph {

memory::vector<StageId> flatten(const SubGraph &subgraph) {
  const StageGraph &graph = subgraph.graph();

  memory::dynamic_bitset visited(graph.stageCount());
  memory::deque<StageId> queue(subgraph.roots().begin(),
                               subgraph.roots().end());
  memory::vector<StageId> stages;

  while (!queue.empty()) {
    StageId id = queue.front();
    queue.pop_front();
    if (visited[*id]) {
      continue;
    }
    visited[*id] = true;
    stages.push_back(id);
    for (StageId pred : graph.predecessors(id)) {
      if (!visited[*pred]) {
        queue.push_back(pred);
      }
    }
  }
  return stages;
}

memory::vector<StageId>
find_stages(const SubGraph &subgraph,
            const memory::function<bool(const pipeline::Stage &)> &predicate) {
  const StageGraph &graph = subgraph.graph();
  memory::vector<StageId> matches;
  for (StageId id : flatten(subgraph)) {
    if (predicate(graph.stage(id))) {
      matches.push_back(id);
    }
  }
  return matches;
}

} // namespace pipesplit::graph
