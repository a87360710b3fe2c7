#pragma once

#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>

namespace pipesplit::diag {

/// A stage graph snapshot that does not have exactly one output stage.
class InvalidGraphShape : public std::invalid_argument {
public:
  explicit InvalidGraphShape(std::size_t rootCount)
      : std::invalid_argument(fmt::format(
            "pipesplit: invalid graph shape, expected exactly one output "
            "stage but found {}",
            rootCount)),
        m_rootCount(rootCount) {}

  std::size_t rootCount() const noexcept { return m_rootCount; }

private:
  std::size_t m_rootCount;
};

[[noreturn]] inline void invalid_graph_shape(std::size_t rootCount) {
  throw InvalidGraphShape(rootCount);
}

} // namespace pipesplit::diag
