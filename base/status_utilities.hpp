#pragma once

#include "absl/status/status.h"
#include "glog/logging.h"

// Fails a |CHECK| if |value| is not an OK |absl::Status|.
#define CHECK_OK(value) CHECK_EQ((value), ::absl::OkStatus())

// Returns the given |absl::Status| from the enclosing function if it is not
// OK.  The enclosing function may return |absl::Status| or
// |absl::StatusOr<T>|.
#define RETURN_IF_ERROR(expression)                     \
  do {                                                  \
    ::absl::Status const _orrery_status = (expression); \
    if (!_orrery_status.ok()) {                         \
      return _orrery_status;                            \
    }                                                   \
  } while (false)
