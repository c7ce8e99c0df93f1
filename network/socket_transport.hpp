#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "base/not_null.hpp"
#include "network/framing.hpp"
#include "network/transport.hpp"

namespace orrery {
namespace network {
namespace internal_socket_transport {

using base::not_null;

// Owns a file descriptor.
class UniqueSocket final {
 public:
  UniqueSocket();
  explicit UniqueSocket(int descriptor);
  UniqueSocket(UniqueSocket&& other);
  UniqueSocket& operator=(UniqueSocket&& other);
  ~UniqueSocket();

  int get() const;
  bool valid() const;
  void Close();

 private:
  int descriptor_;
};

// Fails with |InvalidArgumentError| if |address| is not a dotted IPv4
// address.
absl::StatusOr<sockaddr_in> MakeAddress(std::string const& address,
                                        std::uint16_t port);

// A transport over IPv4: the reliable channel is a TCP stream carrying
// length-prefixed frames, the unreliable channel is UDP datagrams prefixed
// with the client id.  Both sockets of the server use the same port.  The
// first frame on each stream is a |serialization::Welcome| giving the client
// its id; the client then announces its datagram address by sending empty
// datagrams until it hears from the server on the unreliable channel.
class SocketServerTransport final : public ServerTransport {
 public:
  // Fails with |UnavailableError| if the sockets cannot be bound.  A |port|
  // of 0 picks an ephemeral port.
  static absl::StatusOr<not_null<std::unique_ptr<SocketServerTransport>>>
  Listen(std::string const& address, std::uint16_t port);

  std::uint16_t port() const;

  std::vector<ConnectionEvent> PollConnectionEvents() override;
  std::vector<ClientId> clients() const override;
  absl::Status Send(ClientId client,
                    Channel channel,
                    std::string const& bytes) override;
  void Broadcast(Channel channel, std::string const& bytes) override;
  std::optional<ReceivedMessage> Receive() override;

 private:
  struct Connection final {
    UniqueSocket stream;
    FrameReader reader;
    std::string pending_output;
    std::optional<sockaddr_in> datagram_address;
  };

  SocketServerTransport(UniqueSocket listener,
                        UniqueSocket datagram_socket,
                        std::uint16_t port);

  // Accepts the pending connections and reads everything available.
  void Poll();
  void Accept();
  void ReadStreams();
  void ReadDatagrams();
  // Returns false if the connection failed.
  bool Flush(Connection& connection);
  void Disconnect(ClientId client, std::string const& reason);

  UniqueSocket const listener_;
  UniqueSocket const datagram_socket_;
  std::uint16_t const port_;

  ClientId next_client_ = 1;
  std::map<ClientId, Connection> connections_;
  std::vector<ConnectionEvent> events_;
  std::deque<ReceivedMessage> received_;
};

class SocketClientTransport final : public ClientTransport {
 public:
  // Fails with |UnavailableError| if the connection cannot be established or
  // the local datagram socket cannot be bound.
  static absl::StatusOr<not_null<std::unique_ptr<SocketClientTransport>>>
  Connect(std::string const& server_address,
          std::uint16_t server_port,
          std::string const& client_address,
          std::uint16_t client_port);

  // Known once the welcome has been received.
  std::optional<ClientId> id() const;

  bool connected() const override;
  absl::Status Send(Channel channel, std::string const& bytes) override;
  std::optional<std::string> Receive() override;

 private:
  SocketClientTransport(UniqueSocket stream, UniqueSocket datagram_socket);

  void Poll();
  void ReadStream();
  void ReadDatagrams();
  bool Flush();
  void Disconnect(std::string const& reason);

  UniqueSocket stream_;
  UniqueSocket const datagram_socket_;
  FrameReader reader_;
  std::string pending_output_;
  std::optional<ClientId> id_;
  bool heard_datagram_ = false;
  std::deque<std::string> received_;
};

}  // namespace internal_socket_transport

using internal_socket_transport::MakeAddress;
using internal_socket_transport::SocketClientTransport;
using internal_socket_transport::SocketServerTransport;

}  // namespace network
}  // namespace orrery
