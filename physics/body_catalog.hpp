#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "base/not_null.hpp"
#include "physics/bodies_config.hpp"
#include "physics/body_type.hpp"
#include "physics/kepler_orbit.hpp"
#include "serialization/catalog.pb.h"

namespace orrery {
namespace physics {
namespace internal_body_catalog {

using base::not_null;

// Body and ship ids are at most this many bytes long.
constexpr std::int64_t max_id_length = 16;

// The static description of a celestial body.
struct BodyRecord final {
  std::string id;
  BodyType type = BodyType::Star;
  KeplerianElements elements;
  double mass = 0;  // kg.
  double radius = 0;  // km.
  // Absent for the primary body.
  std::optional<std::string> parent;
  // Filled by |BodyCatalog|, in catalog order.
  std::vector<std::string> children;

  void WriteToMessage(not_null<serialization::Body*> message) const;
  static BodyRecord ReadFromMessage(serialization::Body const& message);
};

// An immutable, validated set of bodies forming a tree rooted at the primary
// body.
class BodyCatalog final {
 public:
  // Validates the records and links the children to their parents.  Fails
  // with |InvalidArgumentError| if an id is empty, too long or duplicated, if
  // a mass, semimajor axis or period is negative, if an eccentricity is not in
  // [0, 1), if there is not exactly one primary body, if a parent doesn't
  // exist or has no mass, or if some body is not reachable from the primary
  // (which is the case for bodies on a cycle).
  static absl::StatusOr<BodyCatalog> Make(std::vector<BodyRecord> records);

  static absl::StatusOr<BodyCatalog> ReadFromMessage(
      serialization::BodyCatalog const& message);
  // Reads a catalog in protocol buffer text format.
  static absl::StatusOr<BodyCatalog> ReadFromFile(
      std::filesystem::path const& path);

  // Returns the subset of this catalog selected by |bodies_config|.
  BodyCatalog Filter(BodiesConfig const& bodies_config) const;

  // Parents come before their children.
  std::vector<BodyRecord> const& bodies() const;
  BodyRecord const& primary() const;
  // Returns null if there is no body with that id.
  BodyRecord const* Find(std::string_view id) const;

  void WriteToMessage(not_null<serialization::BodyCatalog*> message) const;

 private:
  // |bodies| must be sorted parent-first with the primary first, and
  // consistent.
  explicit BodyCatalog(std::vector<BodyRecord> bodies);

  std::vector<BodyRecord> bodies_;
  std::map<std::string, std::int64_t, std::less<>> index_;
};

}  // namespace internal_body_catalog

using internal_body_catalog::BodyCatalog;
using internal_body_catalog::BodyRecord;
using internal_body_catalog::max_id_length;

}  // namespace physics
}  // namespace orrery
