#ifndef SRC_LUNAR_REFERENCE_H_
#define SRC_LUNAR_REFERENCE_H_

#include "lunar_types.h"
#include "lunar_value.h"

#include <functional>
#include <unordered_map>

namespace lunar {

// Host values handed to the guest by reference. Every Ref() mints a new
// handle, even for a value that is already registered, so each guest side
// container owns exactly one entry and releases it from its finalizer.
class ReferenceRegistry {
 public:
  ReferenceRegistry() = default;
  ReferenceRegistry(const ReferenceRegistry&) = delete;
  ReferenceRegistry& operator=(const ReferenceRegistry&) = delete;

  ReferenceHandle Ref(Value value);
  // Returns false when the handle is unknown or was already released.
  bool Unref(ReferenceHandle handle);
  // Undefined for unknown handles.
  Value Get(ReferenceHandle handle) const;
  bool Has(ReferenceHandle handle) const;

  size_t size() const { return entries_.size(); }
  void Clear();

 private:
  ReferenceHandle next_handle_ = 1;
  std::unordered_map<ReferenceHandle, Value> entries_;
};

// Native callables reachable from the VM: host functions pushed as function
// references and the one-shot continuations of suspended calls.
class NativeCallableTable {
 public:
  using Callable = std::function<CallOutcome(lua_State* L)>;

  NativeCallableTable() = default;
  NativeCallableTable(const NativeCallableTable&) = delete;
  NativeCallableTable& operator=(const NativeCallableTable&) = delete;

  CallableHandle Add(Callable callable);
  bool Remove(CallableHandle handle);
  // Copies the callable out, leaving it registered.
  bool Lookup(CallableHandle handle, Callable* callable) const;
  // Removes the callable and hands it to the caller.
  bool Take(CallableHandle handle, Callable* callable);
  bool Contains(CallableHandle handle) const;

  size_t size() const { return callables_.size(); }
  void Clear();

 private:
  CallableHandle next_handle_ = 1;
  std::unordered_map<CallableHandle, Callable> callables_;
};

}  // namespace lunar

#endif  // SRC_LUNAR_REFERENCE_H_
