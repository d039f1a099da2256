#ifndef SRC_LUNAR_ERRORS_H_
#define SRC_LUNAR_ERRORS_H_

#include "lunar_types.h"

namespace lunar {

// Default human readable text for a status code.
const char* StatusMessage(Status status);

// Name of a raw VM status code, e.g. "ERRRUN" for LUA_ERRRUN.
const char* LuaStatusName(int lua_status);

}  // namespace lunar

#endif  // SRC_LUNAR_ERRORS_H_
