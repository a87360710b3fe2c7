#include "pipesplit/graph/traverse.hpp"
#include "pipesplit/diag/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace pipesplit::graph {

StageGraph traverse(memory::span<const pipeline::Stage *const> outputs) {
  StageGraph graph;

  for (const pipeline::Stage *output : outputs) {
    if (output == nullptr) {
      throw std::invalid_argument("pipesplit: null output stage");
    }
    StageId id = graph.intern(output);
    if (std::ranges::find(graph.m_roots, id) == graph.m_roots.end()) {
      graph.m_roots.push_back(id);
    }
  }

  // Stages are expanded in the order they were discovered, which is also
  // the order of their ids, so predecessor lists can be laid out back to
  // back.
  graph.m_predOffsets.reserve(graph.m_stages.size() + 1);
  graph.m_predOffsets.push_back(0);
  for (std::size_t i = 0; i < graph.m_stages.size(); ++i) {
    const pipeline::Stage *stage = graph.m_stages[i];
    const std::size_t begin = graph.m_predecessors.size();
    for (const pipeline::Stage *src : stage->sources()) {
      StageId srcId = graph.intern(src);
      auto preds = memory::span<const StageId>(
          graph.m_predecessors.data() + begin,
          graph.m_predecessors.size() - begin);
      if (std::ranges::find(preds, srcId) == preds.end()) {
        graph.m_predecessors.push_back(srcId);
      }
    }
    graph.m_predOffsets.push_back(graph.m_predecessors.size());
  }

  PIPESPLIT_TRACE("traverse: {} stage(s) reachable from {} output(s)",
                  graph.m_stages.size(), graph.m_roots.size());
  return graph;
}

StageGraph traverse(const pipeline::Stage &output) {
  const pipeline::Stage *outputs[] = {&output};
  return traverse(memory::span<const pipeline::Stage *const>(outputs));
}

} // namespace pipesplit::graph
