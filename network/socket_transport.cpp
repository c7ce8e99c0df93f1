#include "network/socket_transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

#include "absl/strings/str_cat.h"
#include "base/status_utilities.hpp"
#include "glog/logging.h"
#include "serialization/network.pb.h"

namespace orrery {
namespace network {
namespace internal_socket_transport {

namespace {

constexpr int read_buffer_size = 1 << 16;

std::string ErrnoMessage(std::string_view const what) {
  return absl::StrCat(what, ": ", std::strerror(errno));
}

bool WouldBlock() {
  return errno == EAGAIN || errno == EWOULDBLOCK;
}

absl::Status Configure(int const descriptor, bool const stream) {
  int const flags = fcntl(descriptor, F_GETFL, 0);
  if (flags < 0 || fcntl(descriptor, F_SETFL, flags | O_NONBLOCK) < 0) {
    return absl::UnavailableError(ErrnoMessage("Cannot set O_NONBLOCK"));
  }
  if (stream) {
    int const one = 1;
    if (setsockopt(descriptor, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) <
        0) {
      return absl::UnavailableError(ErrnoMessage("Cannot set TCP_NODELAY"));
    }
  }
  return absl::OkStatus();
}

std::string DebugString(sockaddr_in const& address) {
  char buffer[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer));
  return absl::StrCat(buffer, ":", ntohs(address.sin_port));
}

}  // namespace

UniqueSocket::UniqueSocket() : descriptor_(-1) {}

UniqueSocket::UniqueSocket(int const descriptor) : descriptor_(descriptor) {}

UniqueSocket::UniqueSocket(UniqueSocket&& other)
    : descriptor_(std::exchange(other.descriptor_, -1)) {}

UniqueSocket& UniqueSocket::operator=(UniqueSocket&& other) {
  if (this != &other) {
    Close();
    descriptor_ = std::exchange(other.descriptor_, -1);
  }
  return *this;
}

UniqueSocket::~UniqueSocket() {
  Close();
}

int UniqueSocket::get() const {
  return descriptor_;
}

bool UniqueSocket::valid() const {
  return descriptor_ >= 0;
}

void UniqueSocket::Close() {
  if (valid()) {
    close(descriptor_);
    descriptor_ = -1;
  }
}

absl::StatusOr<sockaddr_in> MakeAddress(std::string const& address,
                                        std::uint16_t const port) {
  sockaddr_in result;
  std::memset(&result, 0, sizeof(result));
  result.sin_family = AF_INET;
  result.sin_port = htons(port);
  if (inet_pton(AF_INET, address.c_str(), &result.sin_addr) != 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not an IPv4 address: '", address, "'"));
  }
  return result;
}

absl::StatusOr<not_null<std::unique_ptr<SocketServerTransport>>>
SocketServerTransport::Listen(std::string const& address,
                              std::uint16_t const port) {
  absl::StatusOr<sockaddr_in> socket_address = MakeAddress(address, port);
  RETURN_IF_ERROR(socket_address.status());
  auto* const generic_address =
      reinterpret_cast<sockaddr*>(&socket_address.value());

  UniqueSocket listener(socket(AF_INET, SOCK_STREAM, 0));
  if (!listener.valid()) {
    return absl::UnavailableError(ErrnoMessage("Cannot create TCP socket"));
  }
  int const one = 1;
  if (setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) <
      0) {
    return absl::UnavailableError(ErrnoMessage("Cannot set SO_REUSEADDR"));
  }
  if (bind(listener.get(), generic_address, sizeof(sockaddr_in)) < 0) {
    return absl::UnavailableError(ErrnoMessage(
        absl::StrCat("Cannot bind TCP socket to ", address, ":", port)));
  }
  if (listen(listener.get(), SOMAXCONN) < 0) {
    return absl::UnavailableError(ErrnoMessage("Cannot listen"));
  }
  if (absl::Status const status = Configure(listener.get(), /*stream=*/false);
      !status.ok()) {
    return status;
  }

  // Use the same port for the datagrams, in case an ephemeral one was picked.
  socklen_t length = sizeof(sockaddr_in);
  if (getsockname(listener.get(), generic_address, &length) < 0) {
    return absl::UnavailableError(ErrnoMessage("Cannot get the bound port"));
  }
  std::uint16_t const bound_port = ntohs(socket_address->sin_port);

  UniqueSocket datagram_socket(socket(AF_INET, SOCK_DGRAM, 0));
  if (!datagram_socket.valid()) {
    return absl::UnavailableError(ErrnoMessage("Cannot create UDP socket"));
  }
  if (bind(datagram_socket.get(), generic_address, sizeof(sockaddr_in)) < 0) {
    return absl::UnavailableError(ErrnoMessage(
        absl::StrCat("Cannot bind UDP socket to ", address, ":", bound_port)));
  }
  if (absl::Status const status =
          Configure(datagram_socket.get(), /*stream=*/false);
      !status.ok()) {
    return status;
  }

  LOG(INFO) << "Listening on " << address << ":" << bound_port;
  return not_null<std::unique_ptr<SocketServerTransport>>(
      std::unique_ptr<SocketServerTransport>(new SocketServerTransport(
          std::move(listener), std::move(datagram_socket), bound_port)));
}

std::uint16_t SocketServerTransport::port() const {
  return port_;
}

std::vector<ConnectionEvent> SocketServerTransport::PollConnectionEvents() {
  Poll();
  std::vector<ConnectionEvent> events;
  events.swap(events_);
  return events;
}

std::vector<ClientId> SocketServerTransport::clients() const {
  std::vector<ClientId> clients;
  clients.reserve(connections_.size());
  for (auto const& [client, _] : connections_) {
    clients.push_back(client);
  }
  return clients;
}

absl::Status SocketServerTransport::Send(ClientId const client,
                                         Channel const channel,
                                         std::string const& bytes) {
  auto const it = connections_.find(client);
  if (it == connections_.end()) {
    return absl::NotFoundError(absl::StrCat("No client ", client));
  }
  Connection& connection = it->second;
  switch (channel) {
    case Channel::kReliable:
      AppendFrame(bytes, &connection.pending_output);
      if (!Flush(connection)) {
        Disconnect(client, ErrnoMessage("Send failed"));
        return absl::UnavailableError(
            absl::StrCat("Client ", client, " disconnected"));
      }
      return absl::OkStatus();
    case Channel::kUnreliable: {
      if (!connection.datagram_address.has_value()) {
        // The client hasn't announced its address yet; the message is lost.
        return absl::OkStatus();
      }
      std::string const datagram = MakeDatagram(client, bytes);
      if (sendto(datagram_socket_.get(),
                 datagram.data(),
                 datagram.size(),
                 /*flags=*/0,
                 reinterpret_cast<sockaddr const*>(
                     &*connection.datagram_address),
                 sizeof(sockaddr_in)) < 0 &&
          !WouldBlock()) {
        VLOG(1) << ErrnoMessage(absl::StrCat("Datagram to ", client));
      }
      return absl::OkStatus();
    }
  }
  return absl::InvalidArgumentError("Unknown channel");
}

void SocketServerTransport::Broadcast(Channel const channel,
                                      std::string const& bytes) {
  for (ClientId const client : clients()) {
    if (absl::Status const status = Send(client, channel, bytes);
        !status.ok()) {
      LOG(WARNING) << status;
    }
  }
}

std::optional<ReceivedMessage> SocketServerTransport::Receive() {
  if (received_.empty()) {
    Poll();
  }
  if (received_.empty()) {
    return std::nullopt;
  }
  ReceivedMessage message = std::move(received_.front());
  received_.pop_front();
  return message;
}

SocketServerTransport::SocketServerTransport(UniqueSocket listener,
                                             UniqueSocket datagram_socket,
                                             std::uint16_t const port)
    : listener_(std::move(listener)),
      datagram_socket_(std::move(datagram_socket)),
      port_(port) {}

void SocketServerTransport::Poll() {
  Accept();
  ReadStreams();
  ReadDatagrams();
}

void SocketServerTransport::Accept() {
  for (;;) {
    sockaddr_in peer;
    socklen_t length = sizeof(peer);
    UniqueSocket stream(accept(
        listener_.get(), reinterpret_cast<sockaddr*>(&peer), &length));
    if (!stream.valid()) {
      if (!WouldBlock() && errno != EINTR) {
        LOG(WARNING) << ErrnoMessage("Accept failed");
      }
      return;
    }
    if (absl::Status const status = Configure(stream.get(), /*stream=*/true);
        !status.ok()) {
      LOG(WARNING) << status;
      continue;
    }
    ClientId const client = next_client_++;
    Connection& connection = connections_[client];
    connection.stream = std::move(stream);
    serialization::Welcome welcome;
    welcome.set_client_id(client);
    AppendFrame(welcome.SerializeAsString(), &connection.pending_output);
    LOG(INFO) << "Client " << client << " connected from "
              << DebugString(peer);
    events_.push_back({ConnectionEvent::Kind::kConnected, client});
    if (!Flush(connection)) {
      Disconnect(client, ErrnoMessage("Welcome failed"));
    }
  }
}

void SocketServerTransport::ReadStreams() {
  std::vector<std::pair<ClientId, std::string>> failed;
  char buffer[read_buffer_size];
  for (auto& [client, connection] : connections_) {
    bool closed = false;
    for (;;) {
      ssize_t const size =
          recv(connection.stream.get(), buffer, sizeof(buffer), /*flags=*/0);
      if (size > 0) {
        connection.reader.Append(std::string_view(buffer, size));
      } else if (size == 0) {
        failed.emplace_back(client, "Connection closed by peer");
        closed = true;
        break;
      } else if (errno == EINTR) {
        continue;
      } else {
        if (!WouldBlock()) {
          failed.emplace_back(client, ErrnoMessage("Receive failed"));
          closed = true;
        }
        break;
      }
    }
    for (;;) {
      auto frame = connection.reader.Next();
      if (!frame.ok()) {
        if (!closed) {
          failed.emplace_back(client, frame.status().ToString());
          closed = true;
        }
        break;
      }
      if (!frame->has_value()) {
        break;
      }
      received_.push_back({client, std::move(**frame)});
    }
    if (!closed && !Flush(connection)) {
      failed.emplace_back(client, ErrnoMessage("Send failed"));
    }
  }
  for (auto const& [client, reason] : failed) {
    Disconnect(client, reason);
  }
}

void SocketServerTransport::ReadDatagrams() {
  char buffer[read_buffer_size];
  for (;;) {
    sockaddr_in from;
    socklen_t length = sizeof(from);
    ssize_t const size = recvfrom(datagram_socket_.get(),
                                  buffer,
                                  sizeof(buffer),
                                  /*flags=*/0,
                                  reinterpret_cast<sockaddr*>(&from),
                                  &length);
    if (size < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    auto datagram = ParseDatagram(std::string_view(buffer, size));
    if (!datagram.ok()) {
      LOG(WARNING) << "Datagram from " << DebugString(from) << ": "
                   << datagram.status();
      continue;
    }
    auto& [client, payload] = *datagram;
    auto const it = connections_.find(client);
    if (it == connections_.end()) {
      VLOG(1) << "Datagram from unknown client " << client;
      continue;
    }
    it->second.datagram_address = from;
    if (payload.empty()) {
      // An announcement; acknowledge it so that the client stops sending
      // them.
      std::string const acknowledgement = MakeDatagram(client, "");
      if (sendto(datagram_socket_.get(),
                 acknowledgement.data(),
                 acknowledgement.size(),
                 /*flags=*/0,
                 reinterpret_cast<sockaddr const*>(&from),
                 sizeof(from)) < 0 &&
          !WouldBlock()) {
        VLOG(1) << ErrnoMessage(absl::StrCat("Acknowledgement to ", client));
      }
      continue;
    }
    received_.push_back({client, std::move(payload)});
  }
}

bool SocketServerTransport::Flush(Connection& connection) {
  while (!connection.pending_output.empty()) {
    ssize_t const size = send(connection.stream.get(),
                              connection.pending_output.data(),
                              connection.pending_output.size(),
                              MSG_NOSIGNAL);
    if (size >= 0) {
      connection.pending_output.erase(0, size);
    } else if (errno == EINTR) {
      continue;
    } else {
      return WouldBlock();
    }
  }
  return true;
}

void SocketServerTransport::Disconnect(ClientId const client,
                                       std::string const& reason) {
  if (connections_.erase(client) == 0) {
    return;
  }
  LOG(INFO) << "Client " << client << " disconnected: " << reason;
  events_.push_back({ConnectionEvent::Kind::kDisconnected, client});
}

absl::StatusOr<not_null<std::unique_ptr<SocketClientTransport>>>
SocketClientTransport::Connect(std::string const& server_address,
                               std::uint16_t const server_port,
                               std::string const& client_address,
                               std::uint16_t const client_port) {
  absl::StatusOr<sockaddr_in> const server =
      MakeAddress(server_address, server_port);
  RETURN_IF_ERROR(server.status());
  absl::StatusOr<sockaddr_in> const local =
      MakeAddress(client_address, client_port);
  RETURN_IF_ERROR(local.status());

  UniqueSocket stream(socket(AF_INET, SOCK_STREAM, 0));
  if (!stream.valid()) {
    return absl::UnavailableError(ErrnoMessage("Cannot create TCP socket"));
  }
  if (connect(stream.get(),
              reinterpret_cast<sockaddr const*>(&*server),
              sizeof(sockaddr_in)) < 0) {
    return absl::UnavailableError(ErrnoMessage(absl::StrCat(
        "Cannot connect to ", server_address, ":", server_port)));
  }
  if (absl::Status const status = Configure(stream.get(), /*stream=*/true);
      !status.ok()) {
    return status;
  }

  UniqueSocket datagram_socket(socket(AF_INET, SOCK_DGRAM, 0));
  if (!datagram_socket.valid()) {
    return absl::UnavailableError(ErrnoMessage("Cannot create UDP socket"));
  }
  if (bind(datagram_socket.get(),
           reinterpret_cast<sockaddr const*>(&*local),
           sizeof(sockaddr_in)) < 0) {
    return absl::UnavailableError(ErrnoMessage(absl::StrCat(
        "Cannot bind UDP socket to ", client_address, ":", client_port)));
  }
  if (connect(datagram_socket.get(),
              reinterpret_cast<sockaddr const*>(&*server),
              sizeof(sockaddr_in)) < 0) {
    return absl::UnavailableError(ErrnoMessage("Cannot connect UDP socket"));
  }
  if (absl::Status const status =
          Configure(datagram_socket.get(), /*stream=*/false);
      !status.ok()) {
    return status;
  }

  LOG(INFO) << "Connected to " << server_address << ":" << server_port;
  return not_null<std::unique_ptr<SocketClientTransport>>(
      std::unique_ptr<SocketClientTransport>(new SocketClientTransport(
          std::move(stream), std::move(datagram_socket))));
}

std::optional<ClientId> SocketClientTransport::id() const {
  return id_;
}

bool SocketClientTransport::connected() const {
  return stream_.valid();
}

absl::Status SocketClientTransport::Send(Channel const channel,
                                         std::string const& bytes) {
  if (!connected()) {
    return absl::FailedPreconditionError("Not connected");
  }
  switch (channel) {
    case Channel::kReliable:
      AppendFrame(bytes, &pending_output_);
      if (!Flush()) {
        Disconnect(ErrnoMessage("Send failed"));
        return absl::UnavailableError("Disconnected from the server");
      }
      return absl::OkStatus();
    case Channel::kUnreliable: {
      if (!id_.has_value()) {
        return absl::FailedPreconditionError("No client id yet");
      }
      std::string const datagram = MakeDatagram(*id_, bytes);
      if (send(datagram_socket_.get(),
               datagram.data(),
               datagram.size(),
               /*flags=*/0) < 0 &&
          !WouldBlock()) {
        VLOG(1) << ErrnoMessage("Datagram to the server");
      }
      return absl::OkStatus();
    }
  }
  return absl::InvalidArgumentError("Unknown channel");
}

std::optional<std::string> SocketClientTransport::Receive() {
  if (received_.empty()) {
    Poll();
  }
  if (received_.empty()) {
    return std::nullopt;
  }
  std::string bytes = std::move(received_.front());
  received_.pop_front();
  return bytes;
}

SocketClientTransport::SocketClientTransport(UniqueSocket stream,
                                             UniqueSocket datagram_socket)
    : stream_(std::move(stream)),
      datagram_socket_(std::move(datagram_socket)) {}

void SocketClientTransport::Poll() {
  if (!connected()) {
    return;
  }
  ReadStream();
  if (!connected()) {
    return;
  }
  if (id_.has_value() && !heard_datagram_) {
    std::string const announcement = MakeDatagram(*id_, "");
    if (send(datagram_socket_.get(),
             announcement.data(),
             announcement.size(),
             /*flags=*/0) < 0 &&
        !WouldBlock()) {
      VLOG(1) << ErrnoMessage("Announcement to the server");
    }
  }
  ReadDatagrams();
}

void SocketClientTransport::ReadStream() {
  char buffer[read_buffer_size];
  for (;;) {
    ssize_t const size =
        recv(stream_.get(), buffer, sizeof(buffer), /*flags=*/0);
    if (size > 0) {
      reader_.Append(std::string_view(buffer, size));
    } else if (size == 0) {
      Disconnect("Connection closed by the server");
      break;
    } else if (errno == EINTR) {
      continue;
    } else {
      if (!WouldBlock()) {
        Disconnect(ErrnoMessage("Receive failed"));
      }
      break;
    }
  }
  // Frames received before a disconnection are still delivered.
  for (;;) {
    auto frame = reader_.Next();
    if (!frame.ok()) {
      Disconnect(frame.status().ToString());
      return;
    }
    if (!frame->has_value()) {
      break;
    }
    if (!id_.has_value()) {
      serialization::Welcome welcome;
      if (!welcome.ParseFromString(**frame)) {
        Disconnect("Malformed welcome");
        return;
      }
      id_ = welcome.client_id();
      LOG(INFO) << "Connected as client " << *id_;
      continue;
    }
    received_.push_back(std::move(**frame));
  }
  if (connected() && !Flush()) {
    Disconnect(ErrnoMessage("Send failed"));
  }
}

void SocketClientTransport::ReadDatagrams() {
  char buffer[read_buffer_size];
  for (;;) {
    ssize_t const size =
        recv(datagram_socket_.get(), buffer, sizeof(buffer), /*flags=*/0);
    if (size < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    auto datagram = ParseDatagram(std::string_view(buffer, size));
    if (!datagram.ok()) {
      LOG(WARNING) << datagram.status();
      continue;
    }
    auto& [client, payload] = *datagram;
    if (!id_.has_value() || client != *id_) {
      VLOG(1) << "Datagram for client " << client << " ignored";
      continue;
    }
    heard_datagram_ = true;
    if (!payload.empty()) {
      received_.push_back(std::move(payload));
    }
  }
}

bool SocketClientTransport::Flush() {
  while (!pending_output_.empty()) {
    ssize_t const size = send(stream_.get(),
                              pending_output_.data(),
                              pending_output_.size(),
                              MSG_NOSIGNAL);
    if (size >= 0) {
      pending_output_.erase(0, size);
    } else if (errno == EINTR) {
      continue;
    } else {
      return WouldBlock();
    }
  }
  return true;
}

void SocketClientTransport::Disconnect(std::string const& reason) {
  if (!connected()) {
    return;
  }
  LOG(WARNING) << "Disconnected from the server: " << reason;
  stream_.Close();
}

}  // namespace internal_socket_transport
}  // namespace network
}  // namespace orrery
