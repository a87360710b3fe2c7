#include "pipesplit/graph/StageGraph.hpp"
#include "pipesplit/diag/invalid_graph_shape.hpp"
#include <stdexcept>

namespace pipesplit::graph {

StageId StageGraph::root() const {
  if (m_roots.size() != 1) {
    diag::invalid_graph_shape(m_roots.size());
  }
  return m_roots.front();
}

memory::optional<StageId>
StageGraph::find(const pipeline::Stage &stage) const {
  auto it = m_index.find(&stage);
  if (it == m_index.end()) {
    return memory::nullopt;
  }
  return it->second;
}

SubGraph StageGraph::rootedAt(StageId id) const {
  checkId(id);
  return SubGraph(*this, memory::vector<StageId>{id});
}

SubGraph StageGraph::predecessorGraph(StageId id) const {
  memory::span<const StageId> preds = predecessors(id);
  return SubGraph(*this, memory::vector<StageId>(preds.begin(), preds.end()));
}

StageId StageGraph::intern(const pipeline::Stage *stage) {
  auto [it, inserted] = m_index.try_emplace(stage, StageId{m_stages.size()});
  if (inserted) {
    m_stages.push_back(stage);
  }
  return it->second;
}

void StageGraph::checkId(StageId id) const {
  if (!id || *id >= m_stages.size()) {
    throw std::out_of_range(fmt::format(
        "pipesplit: stage {} is not part of this graph ({} stages)", id,
        m_stages.size()));
  }
}

} // namespace pipesplit::graph
