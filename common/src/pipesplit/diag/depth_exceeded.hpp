#pragma once

#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>

namespace pipesplit::diag {

/// The work stack of a graph fold grew beyond the configured limit.
class DepthExceeded : public std::runtime_error {
public:
  DepthExceeded(const char *pass, std::size_t maxDepth)
      : std::runtime_error(fmt::format(
            "pipesplit: {} exceeded the maximum dependency depth of {}", pass,
            maxDepth)),
        m_maxDepth(maxDepth) {}

  std::size_t maxDepth() const noexcept { return m_maxDepth; }

private:
  std::size_t m_maxDepth;
};

[[noreturn]] inline void depth_exceeded(const char *pass,
                                        std::size_t maxDepth) {
  throw DepthExceeded(pass, maxDepth);
}

} // namespace pipesplit::diag
