#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"

namespace orrery {
namespace network {

using ClientId = std::uint64_t;

// The logical channels a transport provides.  Messages on |kReliable| are
// delivered once and in order; messages on |kUnreliable| may be lost,
// duplicated or reordered, and are never retried.
enum class Channel {
  kReliable,
  kUnreliable,
};

std::ostream& operator<<(std::ostream& out, Channel channel);

struct ConnectionEvent final {
  enum class Kind {
    kConnected,
    kDisconnected,
  };
  Kind kind;
  ClientId client;
};

struct ReceivedMessage final {
  ClientId client;
  std::string bytes;
};

// The server end of a transport.  None of the functions block.
class ServerTransport {
 public:
  virtual ~ServerTransport() = default;

  // Returns the connections and disconnections since the last call, each
  // exactly once, in the order in which they happened.
  virtual std::vector<ConnectionEvent> PollConnectionEvents() = 0;

  virtual std::vector<ClientId> clients() const = 0;

  virtual absl::Status Send(ClientId client,
                            Channel channel,
                            std::string const& bytes) = 0;
  // Sends to all the connected clients.
  virtual void Broadcast(Channel channel, std::string const& bytes) = 0;

  // Returns the next message received from any client, or nothing if none is
  // pending.
  virtual std::optional<ReceivedMessage> Receive() = 0;
};

// The client end of a transport.  None of the functions block.
class ClientTransport {
 public:
  virtual ~ClientTransport() = default;

  virtual bool connected() const = 0;

  virtual absl::Status Send(Channel channel, std::string const& bytes) = 0;

  // Returns the next message received from the server, or nothing if none is
  // pending.
  virtual std::optional<std::string> Receive() = 0;
};

}  // namespace network
}  // namespace orrery
