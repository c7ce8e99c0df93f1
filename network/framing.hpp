#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/statusor.h"
#include "base/not_null.hpp"

namespace orrery {
namespace network {
namespace internal_framing {

using base::not_null;

// Frames larger than this are rejected.
constexpr std::int64_t max_frame_size = 1 << 20;

// Appends |payload| to |output|, preceded by its length as a varint.
void AppendFrame(std::string_view payload, not_null<std::string*> output);

// Splits a byte stream into the frames written by |AppendFrame|.
class FrameReader final {
 public:
  // Appends bytes received from the stream.
  void Append(std::string_view bytes);

  // Returns the next complete frame, or nothing if more bytes are needed.
  // Fails with |DataLossError| if the stream is corrupted; the reader is then
  // unusable.
  absl::StatusOr<std::optional<std::string>> Next();

 private:
  std::string buffer_;
};

// Datagrams carry a client id, 8 bytes little-endian, followed by the
// payload.
std::string MakeDatagram(std::uint64_t client_id, std::string_view payload);
// Fails with |DataLossError| if the datagram is too short.
absl::StatusOr<std::pair<std::uint64_t, std::string>> ParseDatagram(
    std::string_view datagram);

}  // namespace internal_framing

using internal_framing::AppendFrame;
using internal_framing::FrameReader;
using internal_framing::MakeDatagram;
using internal_framing::max_frame_size;
using internal_framing::ParseDatagram;

}  // namespace network
}  // namespace orrery
