#include "lunar_reference.h"
#include "util.h"

namespace lunar {

ReferenceHandle ReferenceRegistry::Ref(Value value) {
  ReferenceHandle handle = next_handle_++;
  auto inserted = entries_.emplace(handle, std::move(value));
  CHECK(inserted.second);
  return handle;
}

bool ReferenceRegistry::Unref(ReferenceHandle handle) {
  auto it = entries_.find(handle);
  if (it == entries_.end()) return false;
  // Destroying the value may run host destructors that touch the registry.
  Value released = std::move(it->second);
  entries_.erase(it);
  return true;
}

Value ReferenceRegistry::Get(ReferenceHandle handle) const {
  auto it = entries_.find(handle);
  if (it == entries_.end()) return Value();
  return it->second;
}

bool ReferenceRegistry::Has(ReferenceHandle handle) const {
  return entries_.count(handle) > 0;
}

void ReferenceRegistry::Clear() {
  std::unordered_map<ReferenceHandle, Value> entries;
  entries.swap(entries_);
}

CallableHandle NativeCallableTable::Add(Callable callable) {
  CHECK(callable);
  CallableHandle handle = next_handle_++;
  auto inserted = callables_.emplace(handle, std::move(callable));
  CHECK(inserted.second);
  return handle;
}

bool NativeCallableTable::Remove(CallableHandle handle) {
  Callable released;
  return Take(handle, &released);
}

bool NativeCallableTable::Lookup(CallableHandle handle,
                                 Callable* callable) const {
  auto it = callables_.find(handle);
  if (it == callables_.end()) return false;
  *callable = it->second;
  return true;
}

bool NativeCallableTable::Take(CallableHandle handle, Callable* callable) {
  auto it = callables_.find(handle);
  if (it == callables_.end()) return false;
  *callable = std::move(it->second);
  callables_.erase(it);
  return true;
}

bool NativeCallableTable::Contains(CallableHandle handle) const {
  return callables_.count(handle) > 0;
}

void NativeCallableTable::Clear() {
  std::unordered_map<CallableHandle, Callable> callables;
  callables.swap(callables_);
}

}  // namespace lunar
