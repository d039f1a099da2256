#ifndef SRC_LUNAR_GLOBAL_H_
#define SRC_LUNAR_GLOBAL_H_

#include "lunar_options.h"
#include "lunar_reference.h"
#include "lunar_thread.h"
#include "lunar_types.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace lunar {

class Deferred;
class EnabledDebugList;
class GlobalAllocator;

// A guest call suspended on a host result.
struct Suspension {
  BridgeState state = BridgeState::kRunning;
  // One-shot continuation in the callable table, 0 once consumed.
  CallableHandle continuation = 0;
  std::shared_ptr<Deferred> deferred;
};

// The root execution context. Owns the VM state and everything shared by
// the contexts spawned from it: the allocator, the reference registry, the
// callable table and the per-coroutine suspension state.
class Global final : public Thread {
 public:
  // Returns nullptr when the VM state cannot be created, for instance when
  // the memory ceiling is too small for the initial allocations.
  static std::shared_ptr<Global> Create(const GlobalOptions& options = {});
  ~Global() override;

  // The root that owns L, recovered from the VM's extra space.
  static Global* From(lua_State* L);

  // Tears down the VM state and releases every native callable and
  // reference regardless of what is still pending. Safe to call repeatedly.
  void Close();
  bool closed() const { return closed_; }

  size_t memory_used() const;
  std::optional<size_t> memory_max() const;
  void set_memory_max(std::optional<size_t> memory_max);

  // Brackets host side work that allocates on the VM outside a protected
  // call, where a VM memory error would unwind through host frames. The
  // memory ceiling is lifted inside the bracket and Check() enforces it
  // once the work is done.
  class AllocationScope {
   public:
    AllocationScope(Global* root, lua_State* L);
    ~AllocationScope();

    AllocationScope(const AllocationScope&) = delete;
    AllocationScope& operator=(const AllocationScope&) = delete;

    // kOk unless an allocation went past the ceiling and a full collection
    // does not bring the VM back under it. Then everything pushed on L since
    // the scope began is dropped and kRuntimeError is returned with engine
    // code LUA_ERRMEM.
    Status Check();

   private:
    Global* root_;
    lua_State* L_;
    int top_;
    bool outer_overrun_;
  };

  uv_loop_t* event_loop() const { return event_loop_; }

  // Spins the event loop until the deferred settles. Returns kWouldDeadlock
  // when the loop runs out of work first, or when called from inside a loop
  // iteration that another Await() started, and kRuntimeError with the
  // rejection reason when it rejects.
  Status Await(const std::shared_ptr<Deferred>& deferred,
               MultiReturn* values = nullptr);

  const ExtendedErrorInfo& last_error() const { return last_error_; }
  // Records the status with `message`, or with the default text for the
  // status when message is empty, and returns the status.
  Status SetLastError(Status status,
                      std::string message = std::string(),
                      int engine_error_code = 0);
  void ClearLastError();

  ReferenceRegistry* references() { return &references_; }
  NativeCallableTable* callables() { return &callables_; }
  const EnabledDebugList* enabled_debug_list() const {
    return enabled_debug_list_.get();
  }

  // Calls the guest function stored at registry slot `ref` on a fresh child
  // of the root.
  std::shared_ptr<Deferred> CallReferenceAsync(int ref, MultiReturn args);

  BridgeState GetBridgeState(lua_State* L) const;
  // Installs the continuation of a call about to yield on L, releasing any
  // continuation L still held. The entry is dropped again when the collector
  // frees L without it having resumed.
  Status Suspend(lua_State* L,
                 CallableHandle continuation,
                 std::shared_ptr<Deferred> deferred);
  void MarkResumed(lua_State* L);
  // Drops the suspension entry of L, releasing an unconsumed continuation.
  void ReleaseSuspension(lua_State* L);
  // Called by the sentinel of a collected coroutine. Ignored when L has
  // suspended again since, on a new continuation.
  void ForgetSuspension(lua_State* L, CallableHandle continuation);
  size_t suspension_count() const { return suspensions_.size(); }

  // Bracket every host function invoked from the VM. A Close() requested
  // inside that bracket only marks the root closed; the VM state is torn
  // down once control is back in the host.
  void EnterHostCall() { host_call_depth_++; }
  void LeaveHostCall();

 private:
  explicit Global(const GlobalOptions& options);

  Status Initialize(const GlobalOptions& options);
  Status InstallMetatable(const char* name, lua_CFunction gc);
  Status InstallPromiseLibrary();
  void InstallSuspensionTable();

  bool closed_ = false;
  int host_call_depth_ = 0;
  // Await() calls currently inside uv_run().
  int loop_depth_ = 0;
  uv_loop_t* event_loop_;
  std::unique_ptr<GlobalAllocator> allocator_;
  std::unique_ptr<EnabledDebugList> enabled_debug_list_;
  ReferenceRegistry references_;
  NativeCallableTable callables_;
  std::unordered_map<lua_State*, Suspension> suspensions_;
  ExtendedErrorInfo last_error_;
};

}  // namespace lunar

#endif  // SRC_LUNAR_GLOBAL_H_
