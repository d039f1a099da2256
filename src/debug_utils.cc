#include "debug_utils-inl.h"  // NOLINT(build/include)
#include "lunar_options.h"
#include "util.h"

#if defined(__linux__) && !defined(__GLIBC__) || defined(__UCLIBC__)
#define HAVE_EXECINFO_H 0
#else
#define HAVE_EXECINFO_H 1
#endif

#if HAVE_EXECINFO_H
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace lunar {

void EnabledDebugList::Parse(const GlobalOptions& options) {
  char buffer[256];
  size_t size = sizeof(buffer);
  std::string cats;
  if (uv_os_getenv("LUNAR_DEBUG_NATIVE", buffer, &size) == 0)
    cats.assign(buffer, size);
  if (!options.debug_categories.empty()) {
    if (!cats.empty()) cats += ',';
    cats += options.debug_categories;
  }
  Parse(cats);
}

void EnabledDebugList::Parse(const std::string& cats) {
  std::string debug_categories = cats;
  while (!debug_categories.empty()) {
    std::string::size_type comma_pos = debug_categories.find(',');
    std::string wanted = ToLower(debug_categories.substr(0, comma_pos));

#define V(name)                                                                \
  {                                                                            \
    static const std::string available_category = ToLower(#name);              \
    if (!wanted.empty() &&                                                     \
        available_category.find(wanted) != std::string::npos)                  \
      set_enabled(DebugCategory::name);                                        \
  }

    DEBUG_CATEGORY_NAMES(V)
#undef V

    if (comma_pos == std::string::npos) break;
    // Use everything after the `,` as the list for the next iteration.
    debug_categories = debug_categories.substr(comma_pos + 1);
  }
}

void DumpNativeBacktrace(FILE* fp) {
#if HAVE_EXECINFO_H
  fprintf(fp, "----- Native stack trace -----\n\n");
  void* frames[256];
  const int size = backtrace(frames, arraysize(frames));
  for (int i = 1; i < size; i += 1) {
    void* frame = frames[i];
    Dl_info info;
    const char* name = nullptr;
    char* demangled = nullptr;
    if (dladdr(frame, &info) && info.dli_sname != nullptr) {
      demangled =
          abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, nullptr);
      name = demangled != nullptr ? demangled : info.dli_sname;
    }
    fprintf(fp, "%2d: %p %s\n", i, frame, name != nullptr ? name : "");
    free(demangled);
  }
#endif  // HAVE_EXECINFO_H
}

void CheckedUvLoopClose(uv_loop_t* loop) {
  if (uv_loop_close(loop) == 0) return;

  PrintLibuvHandleInformation(loop, stderr);

  fflush(stderr);
  // Finally, abort.
  UNREACHABLE("uv_loop_close() while having open handles");
}

void PrintLibuvHandleInformation(uv_loop_t* loop, FILE* stream) {
  struct Info {
    FILE* stream;
    size_t num_handles;
  };

  Info info { stream, 0 };

  fprintf(stream, "uv loop at [%p] has open handles:\n", loop);

  uv_walk(loop, [](uv_handle_t* handle, void* arg) {
    Info* info = static_cast<Info*>(arg);
    FILE* stream = info->stream;
    info->num_handles++;

    fprintf(stream, "[%p] %s%s\n", handle, uv_handle_type_name(handle->type),
            uv_is_active(handle) ? " (active)" : "");
    fprintf(stream, "\tData: %p\n", handle->data);
  }, &info);

  fprintf(stream, "uv loop at [%p] has %zu open handles in total\n",
          loop, info.num_handles);
}

void FWrite(FILE* file, const std::string& str) {
  // The return value is ignored because there's no good way to handle it.
  fwrite(str.data(), str.size(), 1, file);
}

}  // namespace lunar
