#pragma once

#include <amc/vector.hpp>

namespace hsize {

template <class T>
using vector = amc::vector<T>;

}  // namespace hsize
