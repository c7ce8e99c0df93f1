#pragma once

#include <ostream>
#include <string_view>

namespace orrery {
namespace physics {

// Ordered from the largest kind of body to the smallest.  The values match
// those of |serialization::BodyType|.
enum class BodyType {
  Star = 0,
  Planet = 1,
  DwarfPlanet = 2,
  Moon = 3,
  Asteroid = 4,
  Comet = 5,
};

inline std::string_view BodyTypeName(BodyType const type) {
  switch (type) {
    case BodyType::Star:
      return "Star";
    case BodyType::Planet:
      return "Planet";
    case BodyType::DwarfPlanet:
      return "DwarfPlanet";
    case BodyType::Moon:
      return "Moon";
    case BodyType::Asteroid:
      return "Asteroid";
    case BodyType::Comet:
      return "Comet";
  }
  return "Unknown";
}

inline std::ostream& operator<<(std::ostream& out, BodyType const type) {
  return out << BodyTypeName(type);
}

}  // namespace physics
}  // namespace orrery
