#pragma once

#include <stdexcept>

namespace pipesplit::diag {

[[noreturn]] inline void unreachable() {
#ifndef NDEBUG
  throw std::logic_error("unreachable");
#else
#if defined(_MSC_VER) && !defined(__clang__) // MSVC
  __assume(false);
#else                                        // GCC, Clang
  __builtin_unreachable();
#endif
#endif
}

} // namespace pipesplit::diag
