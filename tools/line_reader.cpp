#include "tools/line_reader.hpp"

#include <thread>
#include <utility>

#include "glog/logging.h"

namespace orrery {
namespace tools {
namespace internal_line_reader {

LineReader::LineReader(std::istream& in)
    : queue_(std::make_shared<Queue>()) {
  std::thread([&in, queue = queue_]() {
    std::string line;
    while (std::getline(in, line)) {
      absl::MutexLock l(&queue->lock);
      queue->lines.push_back(std::move(line));
    }
    absl::MutexLock l(&queue->lock);
    queue->closed = true;
    VLOG(1) << "End of input";
  }).detach();
}

std::optional<std::string> LineReader::Next() {
  absl::MutexLock l(&queue_->lock);
  if (queue_->lines.empty()) {
    return std::nullopt;
  }
  std::string line = std::move(queue_->lines.front());
  queue_->lines.pop_front();
  return line;
}

bool LineReader::exhausted() const {
  absl::MutexLock l(&queue_->lock);
  return queue_->closed && queue_->lines.empty();
}

}  // namespace internal_line_reader
}  // namespace tools
}  // namespace orrery
