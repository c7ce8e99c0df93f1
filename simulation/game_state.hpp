#pragma once

#include <ostream>

namespace orrery {
namespace simulation {

// The role of a running instance.
enum class ClientMode {
  None,
  Singleplayer,
  Multiplayer,
  Explorer,
  Server,
};

// Only exists while the instance is in game.
enum class GameStage {
  Preparation,
  Action,
};

// Whether a system of bodies is loaded.
bool IsLoaded(ClientMode mode);
// Whether the instance runs a game, as opposed to serving one or exploring.
bool IsInGame(ClientMode mode);
// Whether the state of the instance is the source of truth.
bool IsAuthoritative(ClientMode mode);

std::ostream& operator<<(std::ostream& out, ClientMode mode);
std::ostream& operator<<(std::ostream& out, GameStage stage);

}  // namespace simulation
}  // namespace orrery
