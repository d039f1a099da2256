#ifndef SRC_LUNAR_BRIDGE_H_
#define SRC_LUNAR_BRIDGE_H_

#if defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#include "lua.hpp"
#include "lunar_types.h"
#include "lunar_value.h"

#include <memory>

namespace lunar {

class Deferred;
class Global;
class Thread;

namespace bridge {

// C entry points registered with the VM. They only hold trivially
// destructible locals because the VM leaves them through longjmp; all host
// work happens in functions that have returned before that.
int FunctionTrampoline(lua_State* L);
int ContinuationTrampoline(lua_State* L, int status, lua_KContext context);
int FunctionReferenceGc(lua_State* L);
int HostReferenceGc(lua_State* L);
int PromiseGc(lua_State* L);
int SuspensionGc(lua_State* L);
int OnPanic(lua_State* L);

// Userdata stored against a suspended coroutine in a weak-keyed registry
// table. Its finalizer runs once the coroutine itself is collected.
struct SuspensionSentinel {
  lua_State* coroutine;
  CallableHandle continuation;
};

// Converts the arguments, runs the host function and decides between
// returning, raising and suspending the calling coroutine.
CallOutcome InvokeHostFunction(Global* root,
                               lua_State* L,
                               const std::shared_ptr<Function>& function);

// A child coroutine of `parent`, anchored in the VM registry instead of on
// the parent's stack so that interleaved calls never remove each other's
// slot. Released when the scope is destroyed.
class ChildThreadScope {
 public:
  // Spawns and anchors the child. Fails with the root's last error when
  // the VM runs out of memory.
  static Status Create(std::shared_ptr<Thread> parent,
                       std::shared_ptr<ChildThreadScope>* scope);

  ChildThreadScope(std::shared_ptr<Thread> parent,
                   std::shared_ptr<Thread> child,
                   int ref);
  ~ChildThreadScope();

  ChildThreadScope(const ChildThreadScope&) = delete;
  ChildThreadScope& operator=(const ChildThreadScope&) = delete;

  const std::shared_ptr<Thread>& parent() const { return parent_; }
  const std::shared_ptr<Thread>& child() const { return child_; }

 private:
  std::shared_ptr<Thread> parent_;
  std::shared_ptr<Thread> child_;
  int ref_;
};

// Pushes args onto the scope's child, whose callee is already on its stack,
// runs it to completion and moves the results back through the parent's
// stack. Resolves with the results.
std::shared_ptr<Deferred> RunChildCall(std::shared_ptr<ChildThreadScope> scope,
                                       MultiReturn args);

// Registry slot of a guest function handed to the host. The slot is
// released when the last host wrapper goes away, unless the root has
// closed first.
class GuestFunctionSlot {
 public:
  GuestFunctionSlot(std::weak_ptr<Thread> root, int ref)
      : root_(std::move(root)), ref_(ref) {}
  ~GuestFunctionSlot();

  GuestFunctionSlot(const GuestFunctionSlot&) = delete;
  GuestFunctionSlot& operator=(const GuestFunctionSlot&) = delete;

  // nullptr once the root is gone.
  std::shared_ptr<Global> root() const;
  int ref() const { return ref_; }

 private:
  std::weak_ptr<Thread> root_;
  int ref_;
};

// Drives one coroutine to completion: resumes it, and whenever it yields a
// deferred, waits for that deferred before resuming again.
class ThreadRunner : public std::enable_shared_from_this<ThreadRunner> {
 public:
  ThreadRunner(std::shared_ptr<Thread> thread,
               std::shared_ptr<Deferred> result);

  void Start(int argc);

 private:
  void Step(int argc);

  std::shared_ptr<Thread> thread_;
  std::shared_ptr<Deferred> result_;
};

}  // namespace bridge
}  // namespace lunar

#endif  // defined(LUNAR_WANT_INTERNALS) && LUNAR_WANT_INTERNALS

#endif  // SRC_LUNAR_BRIDGE_H_
