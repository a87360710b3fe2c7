#pragma once

#include <optional>
#include <fmt/std.h>  //includes formatter

namespace pipesplit::memory {

template <typename T> using optional = std::optional<T>;
static constexpr std::nullopt_t nullopt = std::nullopt;

} // namespace pipesplit::memory
