#pragma once

#include <amc/fixedcapacityvector.hpp>  // IWYU pragma: export

namespace httpver {

using amc::FixedCapacityVector;

}  // namespace httpver
