#pragma once

#include "pipesplit/memory/container/span.hpp"
#include "pipesplit/memory/container/string.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include "pipesplit/pipeline/StageKind.hpp"
#include <fmt/format.h>
#include <string_view>
#include <utility>

namespace pipesplit::pipeline {

class Pipeline;

/// One stage of a data-processing pipeline.
///
/// A stage is identified by its address. Stages are owned by a Pipeline
/// and refer to the stages they read from through non-owning pointers, so
/// a stage may (indirectly) be one of its own sources.
class Stage {
public:
  friend Pipeline;

  Stage(const Stage &) = delete;
  Stage &operator=(const Stage &) = delete;
  Stage(Stage &&) = delete;
  Stage &operator=(Stage &&) = delete;

  ~Stage() = default;

  StageKind kind() const noexcept { return m_kind; }
  const memory::string &name() const noexcept { return m_name; }

  memory::span<const Stage *const> sources() const noexcept {
    return memory::span<const Stage *const>(m_sources.data(),
                                            m_sources.size());
  }

private:
  Stage(StageKind kind, memory::string name)
      : m_kind(kind), m_name(std::move(name)) {}

  StageKind m_kind;
  memory::string m_name;
  memory::vector<const Stage *> m_sources;
};

} // namespace pipesplit::pipeline

template <>
struct fmt::formatter<pipesplit::pipeline::Stage>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const pipesplit::pipeline::Stage &stage,
              FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}:{}", stage.name(), stage.kind());
  }
};
