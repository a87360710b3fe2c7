#pragma once

#include <functional>
namespace pipesplit::memory {

template <typename Signature> using function = std::function<Signature>;

}
