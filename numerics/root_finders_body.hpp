#pragma once

#include "numerics/root_finders.hpp"

#include <cmath>

#include "glog/logging.h"

namespace orrery {
namespace numerics {
namespace internal_root_finders {

template<typename Argument, typename Function, typename Derivative>
NewtonRaphsonResult<Argument> NewtonRaphson(Function const& f,
                                            Derivative const& derivative,
                                            Argument const& x0,
                                            Argument const& tolerance,
                                            std::int64_t const max_iterations) {
  CHECK_LT(0, max_iterations);
  Argument x = x0;
  for (std::int64_t i = 1; i <= max_iterations; ++i) {
    Argument const Δx = -f(x) / derivative(x);
    x += Δx;
    if (std::abs(Δx) <= tolerance) {
      return {x, i, /*converged=*/true};
    }
  }
  return {x, max_iterations, /*converged=*/false};
}

}  // namespace internal_root_finders
}  // namespace numerics
}  // namespace orrery
