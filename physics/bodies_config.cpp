#include "physics/bodies_config.hpp"

#include <utility>

#include "absl/strings/str_join.h"
#include "glog/logging.h"

namespace orrery {
namespace physics {
namespace internal_bodies_config {

BodiesConfig::BodiesConfig() : BodiesConfig(BodyType::Planet) {}

BodiesConfig BodiesConfig::SmallestBodyType(BodyType const type) {
  return BodiesConfig(Filter(type));
}

BodiesConfig BodiesConfig::Ids(std::vector<std::string> const& ids) {
  return BodiesConfig(Filter(std::set<std::string>(ids.begin(), ids.end())));
}

bool BodiesConfig::Selects(std::string const& id, BodyType const type) const {
  if (auto const* const smallest = std::get_if<BodyType>(&filter_)) {
    return static_cast<int>(type) <= static_cast<int>(*smallest);
  }
  return std::get<std::set<std::string>>(filter_).contains(id);
}

void BodiesConfig::WriteToMessage(
    not_null<serialization::BodiesConfig*> const message) const {
  message->Clear();
  if (auto const* const smallest = std::get_if<BodyType>(&filter_)) {
    message->set_smallest_body_type(
        static_cast<serialization::BodyType>(*smallest));
  } else {
    auto* const ids = message->mutable_ids();
    for (auto const& id : std::get<std::set<std::string>>(filter_)) {
      ids->add_id(id);
    }
  }
}

BodiesConfig BodiesConfig::ReadFromMessage(
    serialization::BodiesConfig const& message) {
  switch (message.filter_case()) {
    case serialization::BodiesConfig::kSmallestBodyType:
      return SmallestBodyType(
          static_cast<BodyType>(message.smallest_body_type()));
    case serialization::BodiesConfig::kIds:
      return Ids({message.ids().id().begin(), message.ids().id().end()});
    case serialization::BodiesConfig::FILTER_NOT_SET:
      break;
  }
  return BodiesConfig();
}

BodiesConfig::BodiesConfig(Filter filter) : filter_(std::move(filter)) {}

bool operator==(BodiesConfig const& left, BodiesConfig const& right) {
  return left.filter_ == right.filter_;
}

bool operator!=(BodiesConfig const& left, BodiesConfig const& right) {
  return !(left == right);
}

std::ostream& operator<<(std::ostream& out,
                         BodiesConfig const& bodies_config) {
  if (auto const* const smallest =
          std::get_if<BodyType>(&bodies_config.filter_)) {
    return out << "SmallestBodyType(" << *smallest << ")";
  }
  return out << "Ids("
             << absl::StrJoin(
                    std::get<std::set<std::string>>(bodies_config.filter_),
                    ", ")
             << ")";
}

}  // namespace internal_bodies_config
}  // namespace physics
}  // namespace orrery
