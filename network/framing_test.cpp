#include "network/framing.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace orrery {

using ::testing::Optional;

namespace network {

class FramingTest : public ::testing::Test {
 protected:
  FrameReader reader_;
};

using FramingDeathTest = FramingTest;

TEST_F(FramingTest, ByteByByte) {
  std::string stream;
  AppendFrame("hello", &stream);
  AppendFrame("", &stream);
  AppendFrame(std::string(300, 'x'), &stream);
  // One byte of header for each of the first two frames, two for the last.
  EXPECT_EQ(1 + 5 + 1 + 0 + 2 + 300, stream.size());

  std::vector<std::string> frames;
  for (char const c : stream) {
    reader_.Append(std::string_view(&c, 1));
    for (;;) {
      auto frame = reader_.Next();
      ASSERT_TRUE(frame.ok()) << frame.status();
      if (!frame->has_value()) {
        break;
      }
      frames.push_back(**frame);
    }
  }
  ASSERT_EQ(3, frames.size());
  EXPECT_EQ("hello", frames[0]);
  EXPECT_EQ("", frames[1]);
  EXPECT_EQ(std::string(300, 'x'), frames[2]);
}

TEST_F(FramingTest, Batched) {
  std::string stream;
  AppendFrame("a", &stream);
  AppendFrame("bc", &stream);
  reader_.Append(stream);
  EXPECT_THAT(*reader_.Next(), Optional(std::string("a")));
  EXPECT_THAT(*reader_.Next(), Optional(std::string("bc")));
  EXPECT_EQ(std::nullopt, *reader_.Next());
}

TEST_F(FramingTest, Corrupted) {
  reader_.Append(std::string(4, '\xff'));
  EXPECT_EQ(std::nullopt, *reader_.Next());
  reader_.Append(std::string(1, '\xff'));
  EXPECT_EQ(absl::StatusCode::kDataLoss, reader_.Next().status().code());
}

TEST_F(FramingTest, TooLarge) {
  // The varint for 2²¹.
  reader_.Append(std::string("\x80\x80\x80\x01", 4));
  EXPECT_EQ(absl::StatusCode::kDataLoss, reader_.Next().status().code());
}

TEST_F(FramingTest, Datagrams) {
  std::string const datagram = MakeDatagram(0x0102030405060708, "abc");
  ASSERT_EQ(11, datagram.size());
  EXPECT_EQ('\x08', datagram[0]);
  EXPECT_EQ('\x01', datagram[7]);
  EXPECT_EQ("abc", datagram.substr(8));

  auto const parsed = ParseDatagram(datagram);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(0x0102030405060708, parsed->first);
  EXPECT_EQ("abc", parsed->second);

  auto const empty = ParseDatagram(MakeDatagram(7, ""));
  ASSERT_TRUE(empty.ok()) << empty.status();
  EXPECT_EQ(7, empty->first);
  EXPECT_EQ("", empty->second);

  EXPECT_EQ(absl::StatusCode::kDataLoss,
            ParseDatagram("short").status().code());
}

TEST_F(FramingDeathTest, FrameTooLarge) {
  EXPECT_DEATH({
    std::string stream;
    AppendFrame(std::string(max_frame_size + 1, ' '), &stream);
  }, "max_frame_size");
}

}  // namespace network
}  // namespace orrery
