#pragma once

#include <deque>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace orrery {
namespace tools {
namespace internal_line_reader {

// Reads lines from a stream on a dedicated thread, so that the thread that
// consumes them never blocks.  The stream must outlive the process, as the
// reading thread cannot be interrupted; |std::cin| is the intended stream.
class LineReader final {
 public:
  explicit LineReader(std::istream& in);

  // Returns the next complete line, or nothing if none is available.
  std::optional<std::string> Next();

  // True once the stream has ended and all its lines have been returned.
  bool exhausted() const;

 private:
  // Shared with the reading thread, which may outlive the reader.
  struct Queue {
    mutable absl::Mutex lock;
    std::deque<std::string> lines ABSL_GUARDED_BY(lock);
    bool closed ABSL_GUARDED_BY(lock) = false;
  };

  std::shared_ptr<Queue> const queue_;
};

}  // namespace internal_line_reader

using internal_line_reader::LineReader;

}  // namespace tools
}  // namespace orrery
