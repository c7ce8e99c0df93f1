#include "physics/body_catalog.hpp"

#include <deque>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "base/status_utilities.hpp"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"

namespace orrery {
namespace physics {
namespace internal_body_catalog {

void BodyRecord::WriteToMessage(
    not_null<serialization::Body*> const message) const {
  message->set_id(id);
  message->set_type(static_cast<serialization::BodyType>(type));
  if (parent.has_value()) {
    message->set_parent(*parent);
  }
  message->set_mass(mass);
  message->set_radius(radius);
  elements.WriteToMessage(message->mutable_elements());
}

BodyRecord BodyRecord::ReadFromMessage(serialization::Body const& message) {
  BodyRecord record;
  record.id = message.id();
  record.type = static_cast<BodyType>(message.type());
  if (message.has_parent()) {
    record.parent = message.parent();
  }
  record.mass = message.mass();
  record.radius = message.radius();
  if (message.has_elements()) {
    record.elements = KeplerianElements::ReadFromMessage(message.elements());
  }
  return record;
}

namespace {

// The negated comparisons also reject NaNs.
absl::Status CheckPhysicalData(BodyRecord const& record) {
  auto const& elements = record.elements;
  if (!(record.mass >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Body '", record.id, "' has mass ", record.mass));
  }
  if (!(elements.eccentricity >= 0 && elements.eccentricity < 1)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Body '", record.id, "' has eccentricity ",
                     elements.eccentricity, ", not in [0, 1)"));
  }
  if (!(elements.semimajor_axis >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Body '", record.id, "' has semimajor axis ",
                     elements.semimajor_axis));
  }
  if (!(elements.revolution_period >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Body '", record.id, "' has revolution period ",
                     elements.revolution_period));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<BodyCatalog> BodyCatalog::Make(std::vector<BodyRecord> records) {
  std::map<std::string, std::int64_t, std::less<>> positions;
  std::optional<std::int64_t> primary;
  for (std::int64_t i = 0; i < records.size(); ++i) {
    auto& record = records[i];
    if (record.id.empty() || record.id.size() > max_id_length) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid body id '", record.id, "'"));
    }
    if (!positions.emplace(record.id, i).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate body id '", record.id, "'"));
    }
    RETURN_IF_ERROR(CheckPhysicalData(record));
    if (!record.parent.has_value()) {
      if (primary.has_value()) {
        return absl::InvalidArgumentError(
            absl::StrCat("More than one primary body: '",
                         records[*primary].id, "' and '", record.id, "'"));
      }
      primary = i;
    }
    record.children.clear();
  }
  if (!primary.has_value()) {
    return absl::InvalidArgumentError("No primary body");
  }

  for (auto const& record : records) {
    if (!record.parent.has_value()) {
      continue;
    }
    auto const it = positions.find(*record.parent);
    if (it == positions.end()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Body '", record.id, "' has unknown parent '",
                       *record.parent, "'"));
    }
    if (!(records[it->second].mass > 0)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Body '", record.id, "' has parent '", *record.parent,
                       "' whose mass is not positive"));
    }
    records[it->second].children.push_back(record.id);
  }

  // Breadth-first from the primary; the bodies on a cycle, and their
  // descendants, are never reached.
  std::vector<BodyRecord> sorted;
  sorted.reserve(records.size());
  std::deque<std::int64_t> queue = {*primary};
  while (!queue.empty()) {
    std::int64_t const i = queue.front();
    queue.pop_front();
    for (auto const& child : records[i].children) {
      queue.push_back(positions.find(child)->second);
    }
    sorted.push_back(std::move(records[i]));
  }
  if (sorted.size() != records.size()) {
    std::set<std::string> reached;
    for (auto const& record : sorted) {
      reached.insert(record.id);
    }
    std::vector<std::string> unreached;
    for (auto const& [id, _] : positions) {
      if (!reached.contains(id)) {
        unreached.push_back(id);
      }
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Bodies not reachable from the primary body: ",
                     absl::StrJoin(unreached, ", ")));
  }
  return BodyCatalog(std::move(sorted));
}

absl::StatusOr<BodyCatalog> BodyCatalog::ReadFromMessage(
    serialization::BodyCatalog const& message) {
  std::vector<BodyRecord> records;
  records.reserve(message.body_size());
  for (auto const& body : message.body()) {
    records.push_back(BodyRecord::ReadFromMessage(body));
  }
  return Make(std::move(records));
}

absl::StatusOr<BodyCatalog> BodyCatalog::ReadFromFile(
    std::filesystem::path const& path) {
  std::ifstream file(path);
  if (!file.good()) {
    return absl::NotFoundError(
        absl::StrCat("Cannot open catalog ", path.string()));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  serialization::BodyCatalog message;
  if (!google::protobuf::TextFormat::ParseFromString(contents.str(),
                                                     &message)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse catalog ", path.string()));
  }
  LOG(INFO) << "Read " << message.body_size() << " bodies from "
            << path.string();
  return ReadFromMessage(message);
}

BodyCatalog BodyCatalog::Filter(BodiesConfig const& bodies_config) const {
  std::set<std::string, std::less<>> selected;
  std::vector<BodyRecord> bodies;
  // Parents come first, so a body is examined after its parent.
  for (auto const& record : bodies_) {
    bool const is_primary = !record.parent.has_value();
    if (is_primary || (selected.contains(*record.parent) &&
                       bodies_config.Selects(record.id, record.type))) {
      selected.insert(record.id);
      bodies.push_back(record);
    }
  }
  for (auto& record : bodies) {
    std::erase_if(record.children, [&selected](std::string const& child) {
      return !selected.contains(child);
    });
  }
  VLOG(1) << "Filter " << bodies_config << " selected " << bodies.size()
          << " of " << bodies_.size() << " bodies";
  return BodyCatalog(std::move(bodies));
}

std::vector<BodyRecord> const& BodyCatalog::bodies() const {
  return bodies_;
}

BodyRecord const& BodyCatalog::primary() const {
  return bodies_.front();
}

BodyRecord const* BodyCatalog::Find(std::string_view const id) const {
  auto const it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &bodies_[it->second];
}

void BodyCatalog::WriteToMessage(
    not_null<serialization::BodyCatalog*> const message) const {
  message->Clear();
  for (auto const& record : bodies_) {
    record.WriteToMessage(message->add_body());
  }
}

BodyCatalog::BodyCatalog(std::vector<BodyRecord> bodies)
    : bodies_(std::move(bodies)) {
  CHECK(!bodies_.empty());
  CHECK(!bodies_.front().parent.has_value());
  for (std::int64_t i = 0; i < bodies_.size(); ++i) {
    index_.emplace(bodies_[i].id, i);
  }
}

}  // namespace internal_body_catalog
}  // namespace physics
}  // namespace orrery
