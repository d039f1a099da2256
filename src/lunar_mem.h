#ifndef SRC_LUNAR_MEM_H_
#define SRC_LUNAR_MEM_H_

#if defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#include "lua.hpp"

#include <cstddef>

namespace lunar {
namespace mem {

// Adapts a tracking class to the VM's lua_Alloc contract.

template <typename Class>
class LuaMemoryManager {
 public:
  // Class needs to provide these methods:
  // bool CheckAllocatedSize(size_t previous_size, size_t new_size);
  // void IncreaseAllocatedSize(size_t size);
  // void DecreaseAllocatedSize(size_t size);

  lua_Alloc allocator() const { return ReallocImpl; }
  void* allocator_data() { return static_cast<Class*>(this); }

 private:
  static void* ReallocImpl(void* user_data,
                           void* ptr,
                           size_t original_size,
                           size_t size);
};

}  // namespace mem
}  // namespace lunar

#endif  // defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#endif  // SRC_LUNAR_MEM_H_
