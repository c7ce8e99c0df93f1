#pragma once

#include "absl/status/status.h"
#include "serialization/configuration.pb.h"
#include "simulation/game_state.hpp"

namespace orrery {
namespace tools {

// Runs a client in the given |mode|, which must be |Singleplayer|,
// |Multiplayer| or |Explorer|.  A multiplayer client connects to the server
// named by |configuration| and replicates its simulation; the other modes
// run a local simulation.  Only returns on failure, or when the server goes
// away.
absl::Status RunClient(simulation::ClientMode mode,
                       serialization::Configuration const& configuration);

}  // namespace tools
}  // namespace orrery
