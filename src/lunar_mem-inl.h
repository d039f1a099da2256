#ifndef SRC_LUNAR_MEM_INL_H_
#define SRC_LUNAR_MEM_INL_H_

#if defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#include "lunar_mem.h"
#include "util-inl.h"

namespace lunar {
namespace mem {

template <typename Class>
void* LuaMemoryManager<Class>::ReallocImpl(void* user_data,
                                           void* ptr,
                                           size_t original_size,
                                           size_t size) {
  Class* manager = static_cast<Class*>(user_data);

  // When ptr is NULL the VM passes the kind of object being allocated in
  // original_size instead of a size.
  const size_t previous_size = ptr != nullptr ? original_size : 0;

  if (size == 0) {
    free(ptr);
    manager->DecreaseAllocatedSize(previous_size);
    return nullptr;
  }

  if (size > previous_size &&
      !manager->CheckAllocatedSize(previous_size, size)) {
    return nullptr;
  }

  char* mem = UncheckedRealloc(static_cast<char*>(ptr), size);

  if (mem == nullptr) {
    // The VM assumes that shrinking never fails.
    return size <= previous_size ? ptr : nullptr;
  }

  if (size > previous_size) {
    manager->IncreaseAllocatedSize(size - previous_size);
  } else {
    manager->DecreaseAllocatedSize(previous_size - size);
  }
  return mem;
}

}  // namespace mem
}  // namespace lunar

#endif  // defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#endif  // SRC_LUNAR_MEM_INL_H_
