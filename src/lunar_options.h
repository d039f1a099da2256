#ifndef SRC_LUNAR_OPTIONS_H_
#define SRC_LUNAR_OPTIONS_H_

#include "uv.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lunar {

struct GlobalOptions {
  // Ceiling on the bytes the VM may hold at once. Unset means unbounded.
  std::optional<size_t> memory_max;
  bool open_standard_libs = true;
  // Loop driven while a synchronous call waits on a deferred result.
  // nullptr selects uv_default_loop().
  uv_loop_t* event_loop = nullptr;
  // Comma separated debug categories, added to LUNAR_DEBUG_NATIVE.
  std::string debug_categories;
};

#define EXIT_CODE_LIST(V)                                                      \
  V(NoFailure, 0)                                                              \
  /* The script failed to load or raised an error. */                          \
  V(GenericUserError, 1)                                                       \
  V(InvalidCommandLineArgument, 9)

enum class ExitCode : int {
#define V(Name, Code) k##Name = Code,
  EXIT_CODE_LIST(V)
#undef V
};

struct CliOptions {
  GlobalOptions global;
  std::string script;
  std::vector<std::string> script_args;
  bool print_help = false;
  bool print_version = false;
};

// Parses `lunar [options] <script> [args...]`. args[0] is the program name.
// Every problem found is appended to errors; returns errors->empty().
bool ParseCommandLine(const std::vector<std::string>& args,
                      CliOptions* options,
                      std::vector<std::string>* errors);

std::string UsageText(const std::string& program_name);

}  // namespace lunar

#endif  // SRC_LUNAR_OPTIONS_H_
