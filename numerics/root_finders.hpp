#pragma once

#include <cstdint>

namespace orrery {
namespace numerics {
namespace internal_root_finders {

template<typename Argument>
struct NewtonRaphsonResult {
  Argument root;
  // The number of corrections that were applied.
  std::int64_t iterations;
  // True if the last correction was within the tolerance.
  bool converged;
};

// Approximates a root of |f| starting from |x0|, applying at most
// |max_iterations| Newton corrections −f(x)/f'(x).  Stops as soon as the
// magnitude of a correction is less than or equal to |tolerance|.  When the
// iteration cap is reached the last estimate is returned and |converged| is
// false; no error is signalled.  |derivative| must not vanish on the iterates.
template<typename Argument, typename Function, typename Derivative>
NewtonRaphsonResult<Argument> NewtonRaphson(Function const& f,
                                            Derivative const& derivative,
                                            Argument const& x0,
                                            Argument const& tolerance,
                                            std::int64_t max_iterations);

}  // namespace internal_root_finders

using internal_root_finders::NewtonRaphson;
using internal_root_finders::NewtonRaphsonResult;

}  // namespace numerics
}  // namespace orrery

#include "numerics/root_finders_body.hpp"
