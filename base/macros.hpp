#pragma once

#include <cstdlib>

namespace orrery {
namespace base {

// Used after a |LOG(FATAL)| to tell the compiler that control does not reach
// the end of a non-void function.
[[noreturn]] inline void noreturn() { std::exit(0); }

}  // namespace base
}  // namespace orrery
