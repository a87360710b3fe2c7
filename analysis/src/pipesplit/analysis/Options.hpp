#pragma once

#include "pipesplit/analysis/StageClassifier.hpp"
#include "pipesplit/memory/container/function.hpp"
#include "pipesplit/pipeline/Stage.hpp"
#include <cstddef>
#include <limits>

namespace pipesplit::analysis {

struct AnalysisOptions {
  StageClassifier classifier;

  // Upper bound on the number of nested stages a fold keeps on its work
  // stack. Exceeding it throws diag::DepthExceeded.
  std::size_t maxDepth = std::numeric_limits<std::size_t>::max();

  // Log the dispatch plan at info level instead of debug.
  bool verbose = false;

  // Invoked once for every stage whose memo entry is written by a fold.
  memory::function<void(const pipeline::Stage &)> onReduce;
};

} // namespace pipesplit::analysis
