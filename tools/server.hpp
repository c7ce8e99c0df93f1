#pragma once

#include "absl/status/status.h"
#include "serialization/configuration.pb.h"

namespace orrery {
namespace tools {

// Runs the authoritative simulation, serves it on the sockets named by
// |configuration|, and executes the console commands read from the standard
// input.  Only returns if the setup fails.
absl::Status RunServer(serialization::Configuration const& configuration);

}  // namespace tools
}  // namespace orrery
