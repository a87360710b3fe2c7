#pragma once

#include "pipesplit/graph/StageId.hpp"
#include "pipesplit/memory/container/hashmap.hpp"
#include "pipesplit/memory/container/optional.hpp"
#include "pipesplit/memory/container/span.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include "pipesplit/pipeline/Stage.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <utility>

namespace pipesplit::graph {

class StageGraph;

/// Non-owning view of the part of a StageGraph reachable from a set of
/// roots.
class SubGraph {
public:
  SubGraph(const StageGraph &graph, memory::vector<StageId> roots)
      : m_graph(&graph), m_roots(std::move(roots)) {}

  const StageGraph &graph() const noexcept { return *m_graph; }
  memory::span<const StageId> roots() const noexcept { return m_roots; }

private:
  const StageGraph *m_graph;
  memory::vector<StageId> m_roots;
};

/// Snapshot of the stages reachable from the output stage(s) of a pipeline.
///
/// Every distinct stage object is assigned exactly one StageId, ids are
/// dense in [0, stageCount()). Predecessors of a stage are listed in source
/// order with repeated sources removed. The snapshot refers to the stages,
/// it does not own them; the pipeline must outlive it.
class StageGraph {
public:
  friend StageGraph traverse(memory::span<const pipeline::Stage *const>);

  StageGraph() = default;

  std::size_t stageCount() const noexcept { return m_stages.size(); }

  const pipeline::Stage &stage(StageId id) const {
    checkId(id);
    return *m_stages[*id];
  }

  memory::span<const StageId> predecessors(StageId id) const {
    checkId(id);
    return memory::span<const StageId>(m_predecessors.data() +
                                           m_predOffsets[*id],
                                       m_predecessors.data() +
                                           m_predOffsets[*id + 1]);
  }

  memory::span<const StageId> roots() const noexcept { return m_roots; }

  // The unique output stage. Throws diag::InvalidGraphShape otherwise.
  StageId root() const;

  memory::optional<StageId> find(const pipeline::Stage &stage) const;

  SubGraph view() const { return SubGraph(*this, m_roots); }

  // The stage together with everything it depends on.
  SubGraph rootedAt(StageId id) const;

  // Everything the stage depends on, rooted at its direct predecessors.
  SubGraph predecessorGraph(StageId id) const;

private:
  void checkId(StageId id) const;

  // Id of the stage, assigning the next free one on first sight.
  StageId intern(const pipeline::Stage *stage);

  memory::vector<const pipeline::Stage *> m_stages;
  memory::vector<std::size_t> m_predOffsets;
  memory::vector<StageId> m_predecessors;
  memory::vector<StageId> m_roots;
  memory::hash_map<const pipeline::Stage *, StageId> m_index;
};

} // namespace pipesplit::graph

template <> struct fmt::formatter<pipesplit::graph::StageGraph> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const pipesplit::graph::StageGraph &graph,
              FormatContext &ctx) const {
    auto out = ctx.out();

    fmt::format_to(out, "Roots: [");
    bool first = true;
    for (const auto &id : graph.roots()) {
      if (!first)
        fmt::format_to(out, ", ");
      first = false;
      fmt::format_to(out, "{}", id);
    }
    fmt::format_to(out, "]\n");

    for (std::size_t i = 0; i < graph.stageCount(); ++i) {
      pipesplit::graph::StageId id{i};
      fmt::format_to(out, "{} {} <- [", id, graph.stage(id));
      first = true;
      for (const auto &pred : graph.predecessors(id)) {
        if (!first)
          fmt::format_to(out, ", ");
        first = false;
        fmt::format_to(out, "{}", pred);
      }
      fmt::format_to(out, "]\n");
    }
    return out;
  }
};
