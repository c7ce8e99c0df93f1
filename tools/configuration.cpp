#include "tools/configuration.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"

namespace orrery {
namespace tools {
namespace internal_configuration {

absl::StatusOr<serialization::Configuration> ReadConfiguration(
    std::filesystem::path const& path) {
  serialization::Configuration configuration;
  if (path.empty()) {
    return configuration;
  }
  std::ifstream file(path);
  if (!file.good()) {
    return absl::NotFoundError(
        absl::StrCat("Cannot open configuration ", path.string()));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  if (!google::protobuf::TextFormat::ParseFromString(contents.str(),
                                                     &configuration)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse configuration ", path.string()));
  }
  if (configuration.step_size() == 0) {
    return absl::InvalidArgumentError("step_size must be positive");
  }
  if (configuration.ticks_per_second() <= 0 ||
      configuration.updates_per_second() <= 0) {
    return absl::InvalidArgumentError(
        "ticks_per_second and updates_per_second must be positive");
  }
  if (configuration.server_port() > std::numeric_limits<std::uint16_t>::max() ||
      configuration.client_port() > std::numeric_limits<std::uint16_t>::max()) {
    return absl::InvalidArgumentError("Port out of range");
  }
  if (configuration.worker_threads() < 0) {
    return absl::InvalidArgumentError("worker_threads must not be negative");
  }
  LOG(INFO) << "Configuration from " << path.string() << ": "
            << configuration.ShortDebugString();
  return configuration;
}

absl::StatusOr<BodyCatalog> ReadCatalog(
    serialization::Configuration const& configuration) {
  return BodyCatalog::ReadFromFile(configuration.catalog_path());
}

BodiesConfig GetBodiesConfig(
    serialization::Configuration const& configuration) {
  if (!configuration.has_bodies_config()) {
    return BodiesConfig();
  }
  return BodiesConfig::ReadFromMessage(configuration.bodies_config());
}

std::int64_t GetWorkerThreads(
    serialization::Configuration const& configuration) {
  if (configuration.worker_threads() > 0) {
    return configuration.worker_threads();
  }
  return std::max<std::int64_t>(1, std::thread::hardware_concurrency());
}

absl::Duration GetTickPeriod(
    serialization::Configuration const& configuration) {
  return absl::Seconds(1) / configuration.ticks_per_second();
}

absl::Duration GetUpdatePeriod(
    serialization::Configuration const& configuration) {
  return absl::Seconds(1) / configuration.updates_per_second();
}

}  // namespace internal_configuration
}  // namespace tools
}  // namespace orrery
