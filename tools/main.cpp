#include <filesystem>
#include <iostream>
#include <string>

#include "base/status_utilities.hpp"
#include "glog/logging.h"
#include "simulation/game_state.hpp"
#include "tools/client.hpp"
#include "tools/configuration.hpp"
#include "tools/server.hpp"

namespace {

std::filesystem::path ConfigurationPath(int const argc,
                                        char const* const argv[],
                                        int const index) {
  return index < argc ? std::filesystem::path(argv[index])
                      : std::filesystem::path();
}

}  // namespace

int main(int argc, char const* argv[]) {
  google::InitGoogleLogging(argv[0]);
  google::LogToStderr();
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " command [arguments...]\n"
              << "  server [configuration]\n"
              << "  client singleplayer|multiplayer|explorer "
                 "[configuration]\n";
    return 1;
  }
  std::string const command = argv[1];
  if (command == "server") {
    auto const configuration =
        orrery::tools::ReadConfiguration(ConfigurationPath(argc, argv, 2));
    CHECK_OK(configuration.status());
    CHECK_OK(orrery::tools::RunServer(*configuration));
  } else if (command == "client") {
    if (argc < 3) {
      std::cerr << "Usage: " << argv[0]
                << " client singleplayer|multiplayer|explorer "
                   "[configuration]\n";
      return 1;
    }
    std::string const mode_name = argv[2];
    orrery::simulation::ClientMode mode;
    if (mode_name == "singleplayer") {
      mode = orrery::simulation::ClientMode::Singleplayer;
    } else if (mode_name == "multiplayer") {
      mode = orrery::simulation::ClientMode::Multiplayer;
    } else if (mode_name == "explorer") {
      mode = orrery::simulation::ClientMode::Explorer;
    } else {
      std::cerr << "Unknown client mode " << mode_name << "\n";
      return 1;
    }
    auto const configuration =
        orrery::tools::ReadConfiguration(ConfigurationPath(argc, argv, 3));
    CHECK_OK(configuration.status());
    absl::Status const status = orrery::tools::RunClient(mode, *configuration);
    LOG(ERROR) << status;
    return 1;
  } else {
    std::cerr << "Unknown command " << command << "\n";
    return 1;
  }
  return 0;
}
