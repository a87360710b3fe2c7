#pragma once

#include "pipesplit/graph/StageGraph.hpp"
#include "pipesplit/memory/container/span.hpp"
#include "pipesplit/pipeline/Stage.hpp"

namespace pipesplit::graph {

/// Takes a snapshot of every stage reachable from the given outputs by
/// following source references. Safe on reference cycles.
///
/// More than one output is accepted, the analyses reject such snapshots
/// through StageGraph::root().
StageGraph traverse(memory::span<const pipeline::Stage *const> outputs);

StageGraph traverse(const pipeline::Stage &output);

} // namespace pipesplit::graph
