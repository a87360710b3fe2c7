#pragma once

#include "pipesplit/graph/StageGraph.hpp"
#include "pipesplit/memory/container/function.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include "pipesplit/pipeline/Stage.hpp"

namespace pipesplit::graph {

/// Lists every stage reachable from the roots of the subgraph, roots
/// included, each exactly once. Breadth-first, safe on reference cycles.
memory::vector<StageId> flatten(const SubGraph &subgraph);

/// The stages of flatten(subgraph) for which the predicate holds.
memory::vector<StageId>
find_stages(const SubGraph &subgraph,
            const memory::function<bool(const pipeline::Stage &)> &predicate);

} // namespace pipesplit::graph
