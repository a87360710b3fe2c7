#pragma once

#include <vector>
namespace pipesplit::memory {

/// Requirements:
/// - Initalized to false.
/// - Doesn't have to be resizable or growing like a vector.
using dynamic_bitset = std::vector<bool>;

}
