#include "tools/line_reader.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace orrery {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace tools {

class LineReaderTest : public ::testing::Test {
 protected:
  // Reads all the lines of |in|, which must not be destroyed before the
  // reader is exhausted.
  static std::vector<std::string> ReadAll(std::istream& in) {
    LineReader reader(in);
    std::vector<std::string> lines;
    absl::Time const deadline = absl::Now() + absl::Seconds(10);
    while (!reader.exhausted() && absl::Now() < deadline) {
      while (auto line = reader.Next()) {
        lines.push_back(*line);
      }
      absl::SleepFor(absl::Milliseconds(1));
    }
    EXPECT_TRUE(reader.exhausted());
    EXPECT_EQ(std::nullopt, reader.Next());
    return lines;
  }
};

TEST_F(LineReaderTest, Lines) {
  std::istringstream in("toggle_time\ntime_scale 3\n\nlist_ships");
  EXPECT_THAT(ReadAll(in),
              ElementsAre("toggle_time", "time_scale 3", "", "list_ships"));
}

TEST_F(LineReaderTest, Empty) {
  std::istringstream in("");
  EXPECT_THAT(ReadAll(in), IsEmpty());
}

}  // namespace tools
}  // namespace orrery
