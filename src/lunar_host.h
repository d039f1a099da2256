#ifndef SRC_LUNAR_HOST_H_
#define SRC_LUNAR_HOST_H_

#include "lunar_global.h"
#include "lunar_options.h"
#include "uv.h"

namespace lunar {

// Globals the command line runner gives a script: the `lunar` table, an
// awaiting `sleep(ms)` backed by a timer on `loop`, and `arg`.
Status InstallHostLibrary(Global* global,
                          uv_loop_t* loop,
                          const CliOptions& options);

}  // namespace lunar

#endif  // SRC_LUNAR_HOST_H_
