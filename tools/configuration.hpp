#pragma once

#include <cstdint>
#include <filesystem>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "physics/bodies_config.hpp"
#include "physics/body_catalog.hpp"
#include "serialization/configuration.pb.h"

namespace orrery {
namespace tools {
namespace internal_configuration {

using physics::BodiesConfig;
using physics::BodyCatalog;

// Reads a text-format |serialization::Configuration|.  An empty |path| yields
// the default configuration.  Fails with |NotFoundError| if the file cannot
// be read, with |InvalidArgumentError| if it cannot be parsed or has
// meaningless values.
absl::StatusOr<serialization::Configuration> ReadConfiguration(
    std::filesystem::path const& path);

// Reads the catalog named by |configuration|, relative to the working
// directory.
absl::StatusOr<BodyCatalog> ReadCatalog(
    serialization::Configuration const& configuration);

BodiesConfig GetBodiesConfig(serialization::Configuration const& configuration);
std::int64_t GetWorkerThreads(
    serialization::Configuration const& configuration);
absl::Duration GetTickPeriod(serialization::Configuration const& configuration);
absl::Duration GetUpdatePeriod(
    serialization::Configuration const& configuration);

}  // namespace internal_configuration

using internal_configuration::GetBodiesConfig;
using internal_configuration::GetTickPeriod;
using internal_configuration::GetUpdatePeriod;
using internal_configuration::GetWorkerThreads;
using internal_configuration::ReadCatalog;
using internal_configuration::ReadConfiguration;

}  // namespace tools
}  // namespace orrery
