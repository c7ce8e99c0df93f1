#include "network/loopback_transport.hpp"

#include <utility>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace orrery {
namespace network {
namespace internal_loopback_transport {

LoopbackServerTransport::LoopbackServerTransport(
    std::function<bool()> drop_unreliable)
    : drop_unreliable_(std::move(drop_unreliable)) {}

not_null<std::unique_ptr<LoopbackClientTransport>>
LoopbackServerTransport::Connect() {
  ClientId id;
  {
    absl::MutexLock l(&lock_);
    id = next_client_++;
    to_client_[id];
    events_.push_back({ConnectionEvent::Kind::kConnected, id});
  }
  VLOG(1) << "Loopback client " << id << " connected";
  return std::unique_ptr<LoopbackClientTransport>(
      new LoopbackClientTransport(this, id));
}

std::vector<ConnectionEvent> LoopbackServerTransport::PollConnectionEvents() {
  absl::MutexLock l(&lock_);
  std::vector<ConnectionEvent> events;
  events.swap(events_);
  return events;
}

std::vector<ClientId> LoopbackServerTransport::clients() const {
  absl::MutexLock l(&lock_);
  std::vector<ClientId> clients;
  clients.reserve(to_client_.size());
  for (auto const& [client, _] : to_client_) {
    clients.push_back(client);
  }
  return clients;
}

absl::Status LoopbackServerTransport::Send(ClientId const client,
                                           Channel const channel,
                                           std::string const& bytes) {
  absl::MutexLock l(&lock_);
  return SendLocked(client, channel, bytes);
}

void LoopbackServerTransport::Broadcast(Channel const channel,
                                        std::string const& bytes) {
  absl::MutexLock l(&lock_);
  for (auto const& [client, _] : to_client_) {
    // The client is known to be connected.
    SendLocked(client, channel, bytes).IgnoreError();
  }
}

std::optional<ReceivedMessage> LoopbackServerTransport::Receive() {
  absl::MutexLock l(&lock_);
  if (to_server_.empty()) {
    return std::nullopt;
  }
  ReceivedMessage message = std::move(to_server_.front());
  to_server_.pop_front();
  return message;
}

std::int64_t LoopbackServerTransport::dropped_messages() const {
  absl::MutexLock l(&lock_);
  return dropped_messages_;
}

absl::Status LoopbackServerTransport::SendLocked(ClientId const client,
                                                 Channel const channel,
                                                 std::string const& bytes) {
  auto const it = to_client_.find(client);
  if (it == to_client_.end()) {
    return absl::NotFoundError(absl::StrCat("No client ", client));
  }
  if (!Drop(channel)) {
    it->second.push_back(bytes);
  }
  return absl::OkStatus();
}

bool LoopbackServerTransport::Drop(Channel const channel) {
  if (channel == Channel::kUnreliable && drop_unreliable_ != nullptr &&
      drop_unreliable_()) {
    ++dropped_messages_;
    return true;
  }
  return false;
}

absl::Status LoopbackServerTransport::SendToServer(ClientId const client,
                                                   Channel const channel,
                                                   std::string const& bytes) {
  absl::MutexLock l(&lock_);
  if (!to_client_.contains(client)) {
    return absl::FailedPreconditionError(
        absl::StrCat("Client ", client, " is disconnected"));
  }
  if (!Drop(channel)) {
    to_server_.push_back({client, bytes});
  }
  return absl::OkStatus();
}

std::optional<std::string> LoopbackServerTransport::ReceiveFromServer(
    ClientId const client) {
  absl::MutexLock l(&lock_);
  auto const it = to_client_.find(client);
  if (it == to_client_.end() || it->second.empty()) {
    return std::nullopt;
  }
  std::string bytes = std::move(it->second.front());
  it->second.pop_front();
  return bytes;
}

void LoopbackServerTransport::Disconnect(ClientId const client) {
  {
    absl::MutexLock l(&lock_);
    if (to_client_.erase(client) == 0) {
      return;
    }
    events_.push_back({ConnectionEvent::Kind::kDisconnected, client});
  }
  VLOG(1) << "Loopback client " << client << " disconnected";
}

bool LoopbackServerTransport::IsConnected(ClientId const client) const {
  absl::MutexLock l(&lock_);
  return to_client_.contains(client);
}

LoopbackClientTransport::~LoopbackClientTransport() {
  server_->Disconnect(id_);
}

ClientId LoopbackClientTransport::id() const {
  return id_;
}

bool LoopbackClientTransport::connected() const {
  return server_->IsConnected(id_);
}

absl::Status LoopbackClientTransport::Send(Channel const channel,
                                           std::string const& bytes) {
  return server_->SendToServer(id_, channel, bytes);
}

std::optional<std::string> LoopbackClientTransport::Receive() {
  return server_->ReceiveFromServer(id_);
}

LoopbackClientTransport::LoopbackClientTransport(
    not_null<LoopbackServerTransport*> const server,
    ClientId const id)
    : server_(server), id_(id) {}

}  // namespace internal_loopback_transport
}  // namespace network
}  // namespace orrery
