#include "lunar_errors.h"
#include "util.h"

namespace lunar {

static const char* error_messages[] = {
    nullptr,
    "Invalid argument",
    "A function was expected",
    "Guest source failed to compile",
    "Guest code raised an error",
    "Value has no representation on the other side",
    "A built-in metatable is not installed",
    "The Lua state is closed",
    "A host callback raised an exception",
    "Awaited value can never settle, event loop is idle",
    "Unknown failure",
};

const char* StatusMessage(Status status) {
  // The value of the constant below must be updated to reference the last
  // message in the `Status` enum each time a new error message is added.
  constexpr int kLastStatus = static_cast<int>(Status::kGenericFailure);

  static_assert(arraysize(error_messages) == kLastStatus + 1,
                "Count of error messages must match count of error values");
  const int index = static_cast<int>(status);
  CHECK_LE(index, kLastStatus);
  return error_messages[index] != nullptr ? error_messages[index] : "";
}

const char* LuaStatusName(int lua_status) {
  switch (lua_status) {
    case LUA_OK: return "OK";
    case LUA_YIELD: return "YIELD";
    case LUA_ERRRUN: return "ERRRUN";
    case LUA_ERRSYNTAX: return "ERRSYNTAX";
    case LUA_ERRMEM: return "ERRMEM";
    case LUA_ERRERR: return "ERRERR";
    case LUA_ERRFILE: return "ERRFILE";
    default: return "UNKNOWN";
  }
}

}  // namespace lunar
