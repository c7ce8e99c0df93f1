#pragma once

#include "quantities/si.hpp"

namespace orrery {
namespace quantities {
namespace constants {

// In km³/(kg·day²).
constexpr double GravitationalConstant =
    6.6743e-11 * si::Metre * si::Metre * si::Metre /
    (si::Kilogram * si::Second * si::Second);

}  // namespace constants
}  // namespace quantities
}  // namespace orrery
