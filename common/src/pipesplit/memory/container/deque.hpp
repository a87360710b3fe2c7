#pragma once

#include <deque>
namespace pipesplit::memory {

template <typename T> using deque = std::deque<T>;

}
