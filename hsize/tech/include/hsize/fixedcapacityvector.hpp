#pragma once

#include <amc/fixedcapacityvector.hpp>
#include <cstdint>

namespace hsize {

template <class T, std::uintmax_t N, class GrowingPolicy = amc::vec::ExceptionGrowingPolicy>
using FixedCapacityVector = amc::FixedCapacityVector<T, N, GrowingPolicy>;

}  // namespace hsize
