#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <limits>

namespace pipesplit::graph {

/// Identity of a stage within one StageGraph snapshot.
///
/// traverse hands out ids densely from 0 in discovery order, one per
/// distinct stage address, so ids index the per-call memo tables
/// directly. Ids of different snapshots are unrelated. A default
/// constructed id is null and is rejected by every StageGraph accessor.
struct StageId {
public:
  static constexpr std::uint64_t NullId{
      std::numeric_limits<std::uint64_t>::max()};

  explicit constexpr StageId() : m_id(NullId) {}
  explicit constexpr StageId(std::uint64_t id) : m_id(id) {}

  constexpr explicit operator std::uint64_t() const { return m_id; }

  constexpr explicit operator bool() const { return m_id != NullId; }

  constexpr std::uint64_t operator*() const { return m_id; }

  friend bool operator==(const StageId &lhs, const StageId &rhs) {
    return lhs.m_id == rhs.m_id;
  }

  friend bool operator!=(const StageId &lhs, const StageId &rhs) {
    return lhs.m_id != rhs.m_id;
  }

  friend bool operator<(const StageId &lhs, const StageId &rhs) {
    return lhs.m_id < rhs.m_id;
  }

private:
  std::uint64_t m_id;
};

} // namespace pipesplit::graph

template <> struct std::hash<pipesplit::graph::StageId> {
  std::size_t operator()(const pipesplit::graph::StageId &id) const noexcept {
    return std::hash<std::uint64_t>{}(*id);
  }
};

template <> struct fmt::formatter<pipesplit::graph::StageId> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const pipesplit::graph::StageId &sid, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "<{}>", static_cast<std::uint64_t>(sid));
  }
};
