#include "lunar_host.h"
#include "lunar_deferred.h"
#include "lunar_version.h"
#include "util-inl.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace lunar {

namespace {

// Longest sleep, in milliseconds. Anything above is clamped.
constexpr double kMaxSleepMilliseconds = 9007199254740991.0;  // 2^53 - 1

struct SleepRequest {
  uv_timer_t timer;
  std::shared_ptr<Deferred> deferred;
};

void OnSleepClosed(uv_handle_t* handle) {
  delete static_cast<SleepRequest*>(handle->data);
}

void OnSleepTimeout(uv_timer_t* timer) {
  auto* request = static_cast<SleepRequest*>(timer->data);
  std::shared_ptr<Deferred> deferred = std::move(request->deferred);
  uv_close(reinterpret_cast<uv_handle_t*>(timer), OnSleepClosed);
  deferred->Resolve(MultiReturn());
}

// sleep(ms): suspends the calling coroutine on a loop timer.
MultiReturn Sleep(uv_loop_t* loop, CallbackInfo& info) {
  if (!info[0].IsNumber()) {
    info.Throw(Value(SPrintF(
        "bad argument #1 to 'sleep' (number expected, got %s)",
        info[0].TypeName())));
    return MultiReturn();
  }
  const double milliseconds = info[0].AsNumber();
  if (!std::isfinite(milliseconds) || milliseconds < 0) {
    info.Throw(Value(SPrintF(
        "bad argument #1 to 'sleep' (non-negative finite number expected, "
        "got %s)",
        info[0].ToString())));
    return MultiReturn();
  }
  const uint64_t timeout =
      static_cast<uint64_t>(std::min(milliseconds, kMaxSleepMilliseconds));

  auto* request = new SleepRequest();
  request->deferred = Deferred::New();
  request->timer.data = request;
  CHECK_EQ(0, uv_timer_init(loop, &request->timer));
  CHECK_EQ(0, uv_timer_start(&request->timer, OnSleepTimeout, timeout, 0));
  return {Value(request->deferred)};
}

}  // anonymous namespace

Status InstallHostLibrary(Global* global,
                          uv_loop_t* loop,
                          const CliOptions& options) {
  FunctionOptions await_options;
  await_options.await = true;
  std::shared_ptr<Table> lunar = Table::New();
  lunar->Set("version", Value(LUNAR_VERSION));
  Status status = global->Set("lunar", Value(lunar));
  if (status != Status::kOk) return status;

  status = global->Set(
      "sleep",
      Value(Function::New(
          [loop](CallbackInfo& info) { return Sleep(loop, info); },
          await_options)));
  if (status != Status::kOk) return status;

  // arg[0] is the script, arg[1..n] its arguments.
  std::shared_ptr<Table> arg = Table::New();
  arg->Set(Value(0), Value(options.script));
  for (const std::string& script_arg : options.script_args)
    arg->Append(Value(script_arg));
  return global->Set("arg", Value(arg));
}

}  // namespace lunar
