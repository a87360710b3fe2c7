#pragma once

#include <string>
namespace pipesplit::memory {

using string = std::string;

}
