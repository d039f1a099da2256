#include "lunar_options.h"
#include "debug_utils-inl.h"
#include "util-inl.h"

#include <string_view>

namespace lunar {

namespace {

// Splits "--name=value" into its parts; value is empty without '='.
bool SplitOption(std::string_view arg,
                 std::string_view* name,
                 std::string_view* value,
                 bool* has_value) {
  if (arg.size() < 3 || arg.substr(0, 2) != "--") return false;
  std::string_view::size_type equals = arg.find('=');
  *has_value = equals != std::string_view::npos;
  *name = arg.substr(0, equals);
  *value = *has_value ? arg.substr(equals + 1) : std::string_view();
  return true;
}

}  // anonymous namespace

bool ParseCommandLine(const std::vector<std::string>& args,
                      CliOptions* options,
                      std::vector<std::string>* errors) {
  CHECK_NOT_NULL(options);
  CHECK_NOT_NULL(errors);

  size_t index = 1;
  for (; index < args.size(); index++) {
    const std::string& arg = args[index];
    if (arg == "--") {
      index++;
      break;
    }
    std::string_view name;
    std::string_view value;
    bool has_value = false;
    if (!SplitOption(arg, &name, &value, &has_value)) {
      if (arg == "-h") {
        options->print_help = true;
        continue;
      }
      if (arg == "-v") {
        options->print_version = true;
        continue;
      }
      if (arg.size() > 1 && arg[0] == '-') {
        errors->push_back(SPrintF("bad option: %s", arg));
        continue;
      }
      break;
    }

    if (name == "--help") {
      options->print_help = true;
    } else if (name == "--version") {
      options->print_version = true;
    } else if (name == "--no-stdlib") {
      options->global.open_standard_libs = false;
    } else if (name == "--max-memory") {
      size_t bytes = 0;
      if (!has_value || !ParseByteSize(value, &bytes)) {
        errors->push_back(
            SPrintF("--max-memory requires a byte count, got '%s'", value));
      } else {
        options->global.memory_max = bytes;
      }
    } else if (name == "--debug") {
      if (!has_value || value.empty()) {
        errors->push_back("--debug requires a list of categories");
      } else {
        options->global.debug_categories = std::string(value);
      }
    } else {
      errors->push_back(SPrintF("bad option: %s", arg));
    }
  }

  if (index < args.size()) {
    options->script = args[index++];
    options->script_args.assign(args.begin() + index, args.end());
  } else if (!options->print_help && !options->print_version) {
    errors->push_back("no script file given");
  }

  return errors->empty();
}

std::string UsageText(const std::string& program_name) {
  return SPrintF(
      "Usage: %s [options] <script.lua> [arguments]\n"
      "\n"
      "Options:\n"
      "  --max-memory=<bytes>   limit the VM heap, k/m/g suffixes allowed\n"
      "  --debug=<categories>   print native debug output, comma separated\n"
      "  --no-stdlib            do not open the standard libraries\n"
      "  -h, --help             print this message\n"
      "  -v, --version          print the version\n",
      program_name);
}

}  // namespace lunar
