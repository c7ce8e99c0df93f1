#pragma once

namespace orrery {
namespace quantities {

constexpr double π = 3.1415926535897932384626433832795028841971693993751;

// The unit system of the simulation: lengths are in kilometres, times in days
// and masses in kilograms.  A quantity is a |double| expressed in these units;
// multiplying by a constant below converts from the named unit, dividing
// converts to it.
namespace si {

constexpr double Kilogram = 1;

constexpr double Kilometre = 1;
constexpr double Metre = 1e-3 * Kilometre;

constexpr double Day = 1;
constexpr double Hour = Day / 24;
constexpr double Second = Day / 86400;

constexpr double Radian = 1;
constexpr double Degree = π / 180 * Radian;

}  // namespace si
}  // namespace quantities
}  // namespace orrery
