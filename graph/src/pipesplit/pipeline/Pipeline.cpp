#include "pipesplit/pipeline/Pipeline.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace pipesplit::pipeline {

Stage &Pipeline::add(StageKind kind, memory::string name,
                     std::initializer_list<const Stage *> sources) {
  for (const Stage *src : sources) {
    if (src == nullptr) {
      throw std::invalid_argument(
          fmt::format("pipesplit: stage \"{}\" has a null source", name));
    }
    requireOwned(*src);
  }
  std::unique_ptr<Stage> stage(new Stage(kind, std::move(name)));
  stage->m_sources.assign(sources.begin(), sources.end());
  m_owned.insert(stage.get());
  m_stages.push_back(std::move(stage));
  return *m_stages.back();
}

void Pipeline::connect(Stage &dst, const Stage &src) {
  requireOwned(dst);
  requireOwned(src);
  dst.m_sources.push_back(&src);
}

void Pipeline::requireOwned(const Stage &stage) const {
  if (!m_owned.contains(&stage)) {
    throw std::invalid_argument(fmt::format(
        "pipesplit: stage \"{}\" does not belong to this pipeline",
        stage.name()));
  }
}

} // namespace pipesplit::pipeline
