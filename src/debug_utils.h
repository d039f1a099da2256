#ifndef SRC_DEBUG_UTILS_H_
#define SRC_DEBUG_UTILS_H_

#if defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#include "util.h"

#include <string>
#include <string_view>

// Use FORCE_INLINE on functions that have a debug-category-enabled check first
// and then ideally only a single function call following it, to maintain
// performance for the common case (no debugging used).
#ifdef __GNUC__
#define FORCE_INLINE __attribute__((always_inline))
#define COLD_NOINLINE __attribute__((cold, noinline))
#else
#define FORCE_INLINE
#define COLD_NOINLINE
#endif

namespace lunar {
class Global;
struct GlobalOptions;

template <typename T>
inline std::string ToString(const T& value);

// C++-style variant of sprintf()/fprintf() that:
// - Returns an std::string
// - Handles \0 bytes correctly
// - Supports %p and %s. %d, %i and %u are aliases for %s.
// - Accepts any class that has a ToString() method for stringification.
template <typename... Args>
inline std::string SPrintF(std::string_view format, Args&&... args);
template <typename... Args>
inline void FPrintF(FILE* file, std::string_view format, Args&&... args);
void FWrite(FILE* file, const std::string& str);

#define DEBUG_CATEGORY_NAMES(V)                                                \
  V(GLOBAL)                                                                    \
  V(THREAD)                                                                    \
  V(CODEC)                                                                     \
  V(REFERENCES)                                                                \
  V(BRIDGE)                                                                    \
  V(MEMORY)

enum class DebugCategory : unsigned int {
#define V(name) name,
  DEBUG_CATEGORY_NAMES(V)
#undef V
};

#define V(name) +1
constexpr unsigned int kDebugCategoryCount = DEBUG_CATEGORY_NAMES(V);
#undef V

class EnabledDebugList {
 public:
  bool FORCE_INLINE enabled(DebugCategory category) const {
    DCHECK_LT(static_cast<unsigned int>(category), kDebugCategoryCount);
    return enabled_[static_cast<unsigned int>(category)];
  }

  // Uses LUNAR_DEBUG_NATIVE and options.debug_categories to initialize the
  // categories.
  void Parse(const GlobalOptions& options);

 private:
  // Enable all categories matching cats.
  void Parse(const std::string& cats);
  void set_enabled(DebugCategory category) {
    DCHECK_LT(static_cast<unsigned int>(category), kDebugCategoryCount);
    enabled_[static_cast<int>(category)] = true;
  }

  bool enabled_[kDebugCategoryCount] = {false};
};

template <typename... Args>
inline void FORCE_INLINE Debug(const EnabledDebugList* list,
                               DebugCategory cat,
                               const char* format,
                               Args&&... args);

inline void FORCE_INLINE Debug(const EnabledDebugList* list,
                               DebugCategory cat,
                               const char* message);

template <typename... Args>
inline void FORCE_INLINE
Debug(const Global* global, DebugCategory cat, const char* format,
      Args&&... args);

inline void FORCE_INLINE Debug(const Global* global,
                               DebugCategory cat,
                               const char* message);

// Variant of `uv_loop_close` that tries to be as helpful as possible
// about giving information on currently existing handles, if there are any,
// but still aborts the process.
void CheckedUvLoopClose(uv_loop_t* loop);
void PrintLibuvHandleInformation(uv_loop_t* loop, FILE* stream);

}  // namespace lunar

#endif  // defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#endif  // SRC_DEBUG_UTILS_H_
