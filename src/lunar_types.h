#ifndef SRC_LUNAR_TYPES_H_
#define SRC_LUNAR_TYPES_H_

#include "lua.hpp"

#include <cstdint>
#include <string>

namespace lunar {

enum class Status {
  kOk,
  kInvalidArg,
  kFunctionExpected,
  kCompileError,
  kRuntimeError,
  kUnsupportedType,
  kMissingMetatable,
  kUseAfterClose,
  kPendingException,
  kWouldDeadlock,
  kGenericFailure,
};
// Note: when adding a new value to `Status`, please also update
//   * `kLastStatus` in lunar_errors.cc.
//   * `error_messages[]` in lunar_errors.cc with a brief message explaining
//     the error.

// Mirrors the VM's basic type tags.
enum class LuaType : int {
  kNone = LUA_TNONE,
  kNil = LUA_TNIL,
  kBoolean = LUA_TBOOLEAN,
  kLightUserdata = LUA_TLIGHTUSERDATA,
  kNumber = LUA_TNUMBER,
  kString = LUA_TSTRING,
  kTable = LUA_TTABLE,
  kFunction = LUA_TFUNCTION,
  kUserdata = LUA_TUSERDATA,
  kThread = LUA_TTHREAD,
};

enum class ResumeStatus {
  kOk,
  kYielded,
  kRuntimeError,
  kOther,
};

struct ResumeResult {
  ResumeStatus status = ResumeStatus::kOk;
  int result_count = 0;
};

// Per execution context state of the host await protocol.
enum class BridgeState {
  kRunning,
  kAwaitingHost,
  kResumed,
  kClosed,
};

typedef uint64_t ReferenceHandle;
typedef uint64_t CallableHandle;

// What a native callable asks its trampoline to do once all host frames
// have unwound. Only trivially destructible data may cross that boundary
// because the VM raises and yields with longjmp.
struct CallOutcome {
  enum Kind { kReturn, kRaise, kYield };

  Kind kind;
  int count;
  lua_KContext context;
  // Static message to raise with when kind == kRaise and nothing is pushed.
  const char* message;

  static CallOutcome Return(int count) {
    return CallOutcome{kReturn, count, 0, nullptr};
  }
  static CallOutcome Raise(const char* message = nullptr) {
    return CallOutcome{kRaise, 0, 0, message};
  }
  static CallOutcome Yield(int count, lua_KContext context) {
    return CallOutcome{kYield, count, context, nullptr};
  }
};

constexpr char kFunctionReferenceMetatable[] = "lunar_function_reference";
constexpr char kHostReferenceMetatable[] = "lunar_host_reference";
constexpr char kPromiseMetatable[] = "lunar_promise";
constexpr char kSuspensionMetatable[] = "lunar_suspension";
// Registry field of the weak-keyed table mapping coroutines to the
// sentinels of their suspensions.
constexpr char kSuspensionsKey[] = "lunar_suspensions";
constexpr char kProtectedMetatable[] = "protected metatable";
// The VM's own text for LUA_ERRMEM.
constexpr char kMemoryErrorMessage[] = "not enough memory";

struct ExtendedErrorInfo {
  std::string error_message;
  Status error_code = Status::kOk;
  // Raw VM status code (LUA_ERRRUN and friends) when one is known.
  int engine_error_code = 0;
};

}  // namespace lunar

#endif  // SRC_LUNAR_TYPES_H_
