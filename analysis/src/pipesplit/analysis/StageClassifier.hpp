#pragma once

#include "pipesplit/memory/container/function.hpp"
#include "pipesplit/pipeline/Stage.hpp"
#include "pipesplit/pipeline/StageKind.hpp"

namespace pipesplit::analysis {

/// The only two questions the analyses ask about a stage.
struct StageClassifier {
  // Stages upstream of a non-replicable marker run exactly once.
  memory::function<bool(const pipeline::Stage &)> isNonReplicableMarker =
      [](const pipeline::Stage &stage) {
        return stage.kind() == pipeline::StageKind::RoundRobinDispatch;
      };

  // A placeholder marks a branch as non-replicable.
  memory::function<bool(const pipeline::Stage &)> isPlaceholder =
      [](const pipeline::Stage &stage) {
        return stage.kind() == pipeline::StageKind::Placeholder;
      };
};

} // namespace pipesplit::analysis
