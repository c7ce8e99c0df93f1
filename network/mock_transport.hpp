#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "network/transport.hpp"

namespace orrery {
namespace network {

class MockServerTransport : public ServerTransport {
 public:
  MockServerTransport() = default;

  MOCK_METHOD0(PollConnectionEvents, std::vector<ConnectionEvent>());
  MOCK_CONST_METHOD0(clients, std::vector<ClientId>());
  MOCK_METHOD3(Send,
               absl::Status(ClientId client,
                            Channel channel,
                            std::string const& bytes));
  MOCK_METHOD2(Broadcast, void(Channel channel, std::string const& bytes));
  MOCK_METHOD0(Receive, std::optional<ReceivedMessage>());
};

class MockClientTransport : public ClientTransport {
 public:
  MockClientTransport() = default;

  MOCK_CONST_METHOD0(connected, bool());
  MOCK_METHOD2(Send, absl::Status(Channel channel, std::string const& bytes));
  MOCK_METHOD0(Receive, std::optional<std::string>());
};

}  // namespace network
}  // namespace orrery
