#pragma once

#include "pipesplit/graph/StageId.hpp"
#include "pipesplit/memory/container/dynamic_bitset.hpp"
#include "pipesplit/memory/container/vector.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>

namespace pipesplit::analysis {

/// Identities of the stages of one StageGraph that must not be replicated.
class NonReplicableSet {
public:
  explicit NonReplicableSet(std::size_t stageCount)
      : m_members(stageCount, false) {}

  bool contains(graph::StageId id) const noexcept {
    return *id < m_members.size() && m_members[*id];
  }

  // Returns false if the stage was already a member.
  bool insert(graph::StageId id) {
    if (*id >= m_members.size()) {
      throw std::out_of_range(fmt::format(
          "pipesplit: stage {} is not part of this graph ({} stages)", id,
          m_members.size()));
    }
    if (m_members[*id]) {
      return false;
    }
    m_members[*id] = true;
    ++m_size;
    return true;
  }

  std::size_t size() const noexcept { return m_size; }
  bool empty() const noexcept { return m_size == 0; }

  // Members in ascending id order.
  memory::vector<graph::StageId> members() const {
    memory::vector<graph::StageId> ids;
    ids.reserve(m_size);
    for (std::size_t i = 0; i < m_members.size(); ++i) {
      if (m_members[i]) {
        ids.emplace_back(i);
      }
    }
    return ids;
  }

private:
  memory::dynamic_bitset m_members;
  std::size_t m_size = 0;
};

} // namespace pipesplit::analysis
