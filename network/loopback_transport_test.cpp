#include "network/loopback_transport.hpp"

#include <memory>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace orrery {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Optional;

namespace network {

class LoopbackTransportTest : public ::testing::Test {
 protected:
  LoopbackServerTransport server_;
};

TEST_F(LoopbackTransportTest, ConnectAndDisconnect) {
  std::unique_ptr<LoopbackClientTransport> first = server_.Connect();
  auto const second = server_.Connect();
  EXPECT_EQ(1, first->id());
  EXPECT_EQ(2, second->id());
  EXPECT_TRUE(first->connected());
  EXPECT_THAT(server_.clients(), ElementsAre(1, 2));

  auto events = server_.PollConnectionEvents();
  ASSERT_EQ(2, events.size());
  EXPECT_EQ(ConnectionEvent::Kind::kConnected, events[0].kind);
  EXPECT_EQ(1, events[0].client);
  EXPECT_EQ(2, events[1].client);
  EXPECT_THAT(server_.PollConnectionEvents(), IsEmpty());

  first.reset();
  events = server_.PollConnectionEvents();
  ASSERT_EQ(1, events.size());
  EXPECT_EQ(ConnectionEvent::Kind::kDisconnected, events[0].kind);
  EXPECT_EQ(1, events[0].client);
  EXPECT_THAT(server_.clients(), ElementsAre(2));
  EXPECT_EQ(absl::StatusCode::kNotFound,
            server_.Send(1, Channel::kReliable, "x").code());
}

TEST_F(LoopbackTransportTest, Messages) {
  auto first = server_.Connect();
  auto second = server_.Connect();

  EXPECT_TRUE(server_.Send(2, Channel::kReliable, "to second").ok());
  server_.Broadcast(Channel::kUnreliable, "to all");
  EXPECT_THAT(first->Receive(), Optional(std::string("to all")));
  EXPECT_EQ(std::nullopt, first->Receive());
  EXPECT_THAT(second->Receive(), Optional(std::string("to second")));
  EXPECT_THAT(second->Receive(), Optional(std::string("to all")));

  EXPECT_TRUE(second->Send(Channel::kReliable, "b").ok());
  EXPECT_TRUE(first->Send(Channel::kUnreliable, "a").ok());
  auto received = server_.Receive();
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(2, received->client);
  EXPECT_EQ("b", received->bytes);
  received = server_.Receive();
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(1, received->client);
  EXPECT_EQ("a", received->bytes);
  EXPECT_EQ(std::nullopt, server_.Receive());
}

TEST_F(LoopbackTransportTest, DropUnreliable) {
  LoopbackServerTransport lossy([]() { return true; });
  auto client = lossy.Connect();
  EXPECT_TRUE(lossy.Send(client->id(), Channel::kUnreliable, "lost").ok());
  EXPECT_TRUE(lossy.Send(client->id(), Channel::kReliable, "kept").ok());
  EXPECT_TRUE(client->Send(Channel::kUnreliable, "lost").ok());
  EXPECT_THAT(client->Receive(), Optional(std::string("kept")));
  EXPECT_EQ(std::nullopt, client->Receive());
  EXPECT_EQ(std::nullopt, lossy.Receive());
  EXPECT_EQ(2, lossy.dropped_messages());
}

}  // namespace network
}  // namespace orrery
