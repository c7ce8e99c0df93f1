#include "network/framing.hpp"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/io/coded_stream.h"

namespace orrery {
namespace network {
namespace internal_framing {

using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;

namespace {

constexpr int max_varint32_bytes = 5;
constexpr int client_id_bytes = 8;

}  // namespace

void AppendFrame(std::string_view const payload,
                 not_null<std::string*> const output) {
  CHECK_LE(payload.size(), max_frame_size);
  std::uint8_t header[max_varint32_bytes];
  std::uint8_t const* const header_end =
      CodedOutputStream::WriteVarint32ToArray(payload.size(), header);
  output->append(reinterpret_cast<char const*>(header),
                 header_end - header);
  output->append(payload);
}

void FrameReader::Append(std::string_view const bytes) {
  buffer_.append(bytes);
}

absl::StatusOr<std::optional<std::string>> FrameReader::Next() {
  if (buffer_.empty()) {
    return std::nullopt;
  }
  CodedInputStream stream(reinterpret_cast<std::uint8_t const*>(buffer_.data()),
                          static_cast<int>(buffer_.size()));
  std::uint32_t size;
  if (!stream.ReadVarint32(&size)) {
    if (buffer_.size() >= max_varint32_bytes) {
      return absl::DataLossError("Malformed frame header");
    }
    return std::nullopt;
  }
  if (size > max_frame_size) {
    return absl::DataLossError(absl::StrCat("Frame too large: ", size));
  }
  std::int64_t const header_size = stream.CurrentPosition();
  if (buffer_.size() < header_size + size) {
    return std::nullopt;
  }
  std::string frame = buffer_.substr(header_size, size);
  buffer_.erase(0, header_size + size);
  return std::optional<std::string>(std::move(frame));
}

std::string MakeDatagram(std::uint64_t const client_id,
                         std::string_view const payload) {
  std::string datagram(client_id_bytes, '\0');
  CodedOutputStream::WriteLittleEndian64ToArray(
      client_id, reinterpret_cast<std::uint8_t*>(datagram.data()));
  datagram.append(payload);
  return datagram;
}

absl::StatusOr<std::pair<std::uint64_t, std::string>> ParseDatagram(
    std::string_view const datagram) {
  if (datagram.size() < client_id_bytes) {
    return absl::DataLossError(
        absl::StrCat("Datagram too short: ", datagram.size(), " bytes"));
  }
  std::uint64_t client_id;
  CodedInputStream::ReadLittleEndian64FromArray(
      reinterpret_cast<std::uint8_t const*>(datagram.data()), &client_id);
  return std::make_pair(client_id,
                        std::string(datagram.substr(client_id_bytes)));
}

}  // namespace internal_framing
}  // namespace network
}  // namespace orrery
