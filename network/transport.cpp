#include "network/transport.hpp"

namespace orrery {
namespace network {

std::ostream& operator<<(std::ostream& out, Channel const channel) {
  switch (channel) {
    case Channel::kReliable:
      return out << "reliable";
    case Channel::kUnreliable:
      return out << "unreliable";
  }
  return out << "unknown";
}

}  // namespace network
}  // namespace orrery
