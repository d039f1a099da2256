#ifndef SRC_LUNAR_H_
#define SRC_LUNAR_H_

// Public interface: a Lua 5.4 VM embedded behind a host value model, with
// guest coroutines that suspend on host deferred results.

#include "lunar_deferred.h"
#include "lunar_errors.h"
#include "lunar_global.h"
#include "lunar_options.h"
#include "lunar_reference.h"
#include "lunar_thread.h"
#include "lunar_types.h"
#include "lunar_value.h"
#include "lunar_version.h"

#endif  // SRC_LUNAR_H_
