// Macros to help with error handling and status propagation.
//
// Modeled on the status macros found in the Google Protobuf libraries.

#ifndef UTIL_STATUS_STATUS_MACROS_HPP_
#define UTIL_STATUS_STATUS_MACROS_HPP_

#include <utility>

#define STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define STATUS_MACROS_CONCAT_(x, y) STATUS_MACROS_CONCAT_INNER_(x, y)

// Evaluates `expr`, which must produce an absl::Status, and returns it from
// the enclosing function if it is not OK.
#define RETURN_IF_ERROR(expr)           \
  do {                                  \
    auto _status_macro_status = (expr); \
    if (!_status_macro_status.ok())     \
      return _status_macro_status;      \
  } while (0)

#define ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr)        \
  auto statusor = (rexpr);                                 \
  if (!statusor.ok()) return std::move(statusor).status(); \
  lhs = std::move(statusor).value()

// Evaluates `rexpr`, which must produce an absl::StatusOr<T>. On success the
// value is moved into `lhs`, otherwise the status is returned.
#define ASSIGN_OR_RETURN(lhs, rexpr)                                       \
  ASSIGN_OR_RETURN_IMPL(STATUS_MACROS_CONCAT_(_status_or_value, __LINE__), \
                        lhs, rexpr)

#endif
