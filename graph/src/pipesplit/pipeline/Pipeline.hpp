#pragma once

#include "pipesplit/memory/container/hashset.hpp"
#include "pipesplit/memory/container/string.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include "pipesplit/pipeline/Stage.hpp"
#include "pipesplit/pipeline/StageKind.hpp"
#include <cstddef>
#include <initializer_list>
#include <memory>

namespace pipesplit::pipeline {

/// Owns the stages of a pipeline.
///
/// Stages never move once created, so references returned by add() stay
/// valid for the lifetime of the pipeline.
class Pipeline {
public:
  Pipeline() = default;

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;
  Pipeline(Pipeline &&) = default;
  Pipeline &operator=(Pipeline &&) = default;

  Stage &add(StageKind kind, memory::string name,
             std::initializer_list<const Stage *> sources = {});

  Stage &add(memory::string name,
             std::initializer_list<const Stage *> sources = {}) {
    return add(StageKind::Generic, std::move(name), sources);
  }

  // Appends src to the sources of dst. May close a reference cycle.
  void connect(Stage &dst, const Stage &src);

  std::size_t size() const noexcept { return m_stages.size(); }

private:
  void requireOwned(const Stage &stage) const;

  memory::vector<std::unique_ptr<Stage>> m_stages;
  memory::hash_set<const Stage *> m_owned;
};

} // namespace pipesplit::pipeline
