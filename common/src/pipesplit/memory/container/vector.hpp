#pragma once

#include <vector>
namespace pipesplit::memory {

template <typename T, typename Allocator = std::allocator<T>>
using vector = std::vector<T, Allocator>;

}
