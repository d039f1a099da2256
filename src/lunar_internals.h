#ifndef SRC_LUNAR_INTERNALS_H_
#define SRC_LUNAR_INTERNALS_H_

#if defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#include "lunar_errors.h"
#include "lunar_global.h"
#include "util.h"

#define RETURN_STATUS_IF_FALSE(root, condition, status)                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return (root)->SetLastError((status));                                   \
    }                                                                          \
  } while (0)

#define CHECK_ARG(root, arg)                                                   \
  RETURN_STATUS_IF_FALSE((root), ((arg) != nullptr), ::lunar::Status::kInvalidArg)

// Every operation on an execution context revalidates its root first.
#define CHECK_OPEN(thread)                                                     \
  RETURN_STATUS_IF_FALSE(                                                      \
      (thread)->root(), !(thread)->IsClosed(), ::lunar::Status::kUseAfterClose)

#define STATUS_CALL(call)                                                      \
  do {                                                                         \
    ::lunar::Status status = (call);                                           \
    if (status != ::lunar::Status::kOk) return status;                         \
  } while (0)

#endif  // defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#endif  // SRC_LUNAR_INTERNALS_H_
