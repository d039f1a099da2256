#include "lunar.h"
#include "debug_utils-inl.h"
#include "lunar_host.h"
#include "util-inl.h"
#include "uv.h"

#include <string>
#include <vector>

namespace lunar {

namespace {

ExitCode RunScript(Global* global, const CliOptions& options) {
  std::shared_ptr<Thread> thread = global->NewThread();
  if (!thread) return ExitCode::kGenericUserError;

  Status status = thread->LoadFile(options.script.c_str());
  if (status == Status::kOk) {
    for (const std::string& script_arg : options.script_args) {
      status = thread->PushValue(Value(script_arg));
      if (status != Status::kOk) break;
    }
  }
  if (status == Status::kOk) {
    status = thread->Run(static_cast<int>(options.script_args.size()));
  }
  if (status != Status::kOk) {
    FPrintF(stderr, "%s: %s\n",
            options.script, global->last_error().error_message);
    return ExitCode::kGenericUserError;
  }
  return ExitCode::kNoFailure;
}

int Start(int argc, char** argv) {
  argv = uv_setup_args(argc, argv);
  const std::vector<std::string> args(argv, argv + argc);
  const std::string program = args.empty() ? "lunar" : args[0];

  CliOptions options;
  std::vector<std::string> errors;
  if (!ParseCommandLine(args, &options, &errors)) {
    for (const std::string& error : errors)
      FPrintF(stderr, "%s: %s\n", program, error);
    FPrintF(stderr, "%s", UsageText(program));
    return static_cast<int>(ExitCode::kInvalidCommandLineArgument);
  }
  if (options.print_help) {
    FPrintF(stdout, "%s", UsageText(program));
    return static_cast<int>(ExitCode::kNoFailure);
  }
  if (options.print_version) {
    FPrintF(stdout, "%s\n", LUNAR_VERSION);
    return static_cast<int>(ExitCode::kNoFailure);
  }

  uv_loop_t* loop = uv_default_loop();
  options.global.event_loop = loop;
  std::shared_ptr<Global> global = Global::Create(options.global);
  if (!global) {
    FPrintF(stderr, "%s: cannot create the Lua state\n", program);
    return static_cast<int>(ExitCode::kGenericUserError);
  }

  ExitCode exit_code = ExitCode::kGenericUserError;
  if (InstallHostLibrary(global.get(), loop, options) != Status::kOk) {
    FPrintF(stderr, "%s: %s\n", program, global->last_error().error_message);
  } else {
    exit_code = RunScript(global.get(), options);
  }

  global->Close();
  global.reset();
  // Let timers nobody awaited fire and close.
  uv_run(loop, UV_RUN_DEFAULT);
  CheckedUvLoopClose(loop);
  uv_library_shutdown();
  return static_cast<int>(exit_code);
}

}  // anonymous namespace

}  // namespace lunar

int main(int argc, char* argv[]) {
  return lunar::Start(argc, argv);
}
