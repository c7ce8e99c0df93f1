#include "simulation/game_state.hpp"

namespace orrery {
namespace simulation {

bool IsLoaded(ClientMode const mode) {
  return mode != ClientMode::None;
}

bool IsInGame(ClientMode const mode) {
  return mode == ClientMode::Singleplayer || mode == ClientMode::Multiplayer;
}

bool IsAuthoritative(ClientMode const mode) {
  return mode == ClientMode::Singleplayer || mode == ClientMode::Server;
}

std::ostream& operator<<(std::ostream& out, ClientMode const mode) {
  switch (mode) {
    case ClientMode::None:
      return out << "None";
    case ClientMode::Singleplayer:
      return out << "Singleplayer";
    case ClientMode::Multiplayer:
      return out << "Multiplayer";
    case ClientMode::Explorer:
      return out << "Explorer";
    case ClientMode::Server:
      return out << "Server";
  }
  return out << "Unknown";
}

std::ostream& operator<<(std::ostream& out, GameStage const stage) {
  switch (stage) {
    case GameStage::Preparation:
      return out << "Preparation";
    case GameStage::Action:
      return out << "Action";
  }
  return out << "Unknown";
}

}  // namespace simulation
}  // namespace orrery
