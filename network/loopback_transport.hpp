#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "base/not_null.hpp"
#include "network/transport.hpp"

namespace orrery {
namespace network {
namespace internal_loopback_transport {

using base::not_null;

class LoopbackClientTransport;

// An in-process transport.  Messages are delivered in the order in which they
// are sent, except that unreliable messages for which |drop_unreliable|
// returns true are lost.  The server must outlive its clients.  Thread-safe.
class LoopbackServerTransport final : public ServerTransport {
 public:
  explicit LoopbackServerTransport(
      std::function<bool()> drop_unreliable = nullptr);

  // Returns a new connected client.
  not_null<std::unique_ptr<LoopbackClientTransport>> Connect();

  std::vector<ConnectionEvent> PollConnectionEvents() override;
  std::vector<ClientId> clients() const override;
  absl::Status Send(ClientId client,
                    Channel channel,
                    std::string const& bytes) override;
  void Broadcast(Channel channel, std::string const& bytes) override;
  std::optional<ReceivedMessage> Receive() override;

  // The number of unreliable messages that were lost.
  std::int64_t dropped_messages() const;

 private:
  friend class LoopbackClientTransport;

  absl::Status SendLocked(ClientId client,
                          Channel channel,
                          std::string const& bytes)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(lock_);
  bool Drop(Channel channel) ABSL_EXCLUSIVE_LOCKS_REQUIRED(lock_);

  // Called by the clients.
  absl::Status SendToServer(ClientId client,
                            Channel channel,
                            std::string const& bytes);
  std::optional<std::string> ReceiveFromServer(ClientId client);
  void Disconnect(ClientId client);
  bool IsConnected(ClientId client) const;

  std::function<bool()> const drop_unreliable_;

  mutable absl::Mutex lock_;
  ClientId next_client_ ABSL_GUARDED_BY(lock_) = 1;
  std::map<ClientId, std::deque<std::string>> to_client_
      ABSL_GUARDED_BY(lock_);
  std::deque<ReceivedMessage> to_server_ ABSL_GUARDED_BY(lock_);
  std::vector<ConnectionEvent> events_ ABSL_GUARDED_BY(lock_);
  std::int64_t dropped_messages_ ABSL_GUARDED_BY(lock_) = 0;
};

class LoopbackClientTransport final : public ClientTransport {
 public:
  ~LoopbackClientTransport() override;

  ClientId id() const;

  bool connected() const override;
  absl::Status Send(Channel channel, std::string const& bytes) override;
  std::optional<std::string> Receive() override;

 private:
  LoopbackClientTransport(not_null<LoopbackServerTransport*> server,
                          ClientId id);

  not_null<LoopbackServerTransport*> const server_;
  ClientId const id_;

  friend class LoopbackServerTransport;
};

}  // namespace internal_loopback_transport

using internal_loopback_transport::LoopbackClientTransport;
using internal_loopback_transport::LoopbackServerTransport;

}  // namespace network
}  // namespace orrery
