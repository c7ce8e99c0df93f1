#pragma once

#include <ostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "base/not_null.hpp"
#include "physics/body_type.hpp"
#include "serialization/catalog.pb.h"

namespace orrery {
namespace physics {
namespace internal_bodies_config {

using base::not_null;

// The filter that selects the bodies of a catalog which take part in a
// simulation.  The primary body is always selected, and a body is never
// selected if its parent isn't.
class BodiesConfig final {
 public:
  // Selects the bodies at least as large as |Planet|.
  BodiesConfig();

  // Selects the bodies whose type is at most |type| in the |BodyType| order.
  static BodiesConfig SmallestBodyType(BodyType type);
  // Selects the bodies whose ids are listed.
  static BodiesConfig Ids(std::vector<std::string> const& ids);

  // Whether a body with the given id and type passes the filter, ignoring the
  // constraints on the primary and on the parent.
  bool Selects(std::string const& id, BodyType type) const;

  void WriteToMessage(not_null<serialization::BodiesConfig*> message) const;
  static BodiesConfig ReadFromMessage(
      serialization::BodiesConfig const& message);

  friend bool operator==(BodiesConfig const& left, BodiesConfig const& right);
  friend bool operator!=(BodiesConfig const& left, BodiesConfig const& right);
  friend std::ostream& operator<<(std::ostream& out,
                                  BodiesConfig const& bodies_config);

 private:
  using Filter = std::variant<BodyType, std::set<std::string>>;

  explicit BodiesConfig(Filter filter);

  Filter filter_;
};

}  // namespace internal_bodies_config

using internal_bodies_config::BodiesConfig;

}  // namespace physics
}  // namespace orrery
