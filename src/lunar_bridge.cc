#include "lunar_bridge.h"
#include "debug_utils-inl.h"
#include "lunar_deferred.h"
#include "lunar_errors.h"
#include "lunar_global.h"
#include "lunar_internals.h"
#include "lunar_thread.h"
#include "util-inl.h"

namespace lunar {
namespace bridge {

namespace {

// The message pushed by the caller, or the text of a memory error when the
// pushes went past the ceiling.
CallOutcome RaisePushed(Global::AllocationScope* allocation) {
  if (allocation->Check() != Status::kOk)
    return CallOutcome::Raise(kMemoryErrorMessage);
  return CallOutcome::Raise();
}

CallOutcome RaiseMessage(Global* root,
                         lua_State* L,
                         const std::string& message) {
  Global::AllocationScope allocation(root, L);
  lua_pushlstring(L, message.data(), message.size());
  return RaisePushed(&allocation);
}

// Raises a host error value, or its string form when the value itself
// cannot cross.
CallOutcome RaiseValue(Thread* thread, const Value& error) {
  Global::AllocationScope allocation(thread->root(), thread->state());
  if (thread->PushValue(error) != Status::kOk) {
    const std::string message = error.ToString();
    lua_pushlstring(thread->state(), message.data(), message.size());
  }
  return RaisePushed(&allocation);
}

CallOutcome RaiseLastError(Global* root, lua_State* L) {
  return RaiseMessage(root, L, root->last_error().error_message);
}

// Pushes every value, or raises with the first failure.
CallOutcome ReturnValues(Thread* thread, const MultiReturn& values) {
  Global* root = thread->root();
  lua_State* L = thread->state();
  if (!lua_checkstack(L, static_cast<int>(values.size())))
    return CallOutcome::Raise("too many results to return");
  Global::AllocationScope allocation(root, L);
  for (const Value& value : values) {
    if (thread->PushValue(value) != Status::kOk)
      return RaiseLastError(root, L);
  }
  if (allocation.Check() != Status::kOk)
    return CallOutcome::Raise(kMemoryErrorMessage);
  return CallOutcome::Return(static_cast<int>(values.size()));
}

// Keeps Global::Close() from tearing the VM down underneath a host call.
class HostCallScope {
 public:
  explicit HostCallScope(Global* root) : root_(root) { root_->EnterHostCall(); }
  ~HostCallScope() { root_->LeaveHostCall(); }

  HostCallScope(const HostCallScope&) = delete;
  HostCallScope& operator=(const HostCallScope&) = delete;

 private:
  Global* root_;
};

CallOutcome ResumeWithResult(Global* root,
                             lua_State* L,
                             const std::shared_ptr<Deferred>& deferred) {
  root->ReleaseSuspension(L);
  if (root->closed())
    return CallOutcome::Raise("the Lua state was closed while awaiting");

  std::shared_ptr<Thread> thread = root->StateToThread(L);
  if (deferred->pending()) {
    return CallOutcome::Raise(
        "coroutine resumed before the awaited value settled");
  }
  if (deferred->rejected()) return RaiseValue(thread.get(), deferred->reason());

  const MultiReturn& values = deferred->values();
  Debug(root, DebugCategory::BRIDGE,
        "coroutine %p resumed with %d values\n", L, values.size());
  return ReturnValues(thread.get(), values);
}

CallOutcome SuspendOnDeferred(Global* root,
                              Thread* thread,
                              const std::shared_ptr<Deferred>& deferred) {
  lua_State* L = thread->state();
  if (!lua_isyieldable(L)) {
    return CallOutcome::Raise(
        "attempt to await a host result outside a coroutine");
  }

  CallableHandle continuation = root->callables()->Add(
      [root, deferred](lua_State* resumed) {
        return ResumeWithResult(root, resumed, deferred);
      });
  if (root->Suspend(L, continuation, deferred) != Status::kOk)
    return RaiseLastError(root, L);

  if (thread->PushValue(Value(deferred)) != Status::kOk) {
    root->ReleaseSuspension(L);
    return RaiseLastError(root, L);
  }
  Debug(root, DebugCategory::BRIDGE,
        "coroutine %p awaits deferred %p, continuation %d\n",
        L, deferred.get(), continuation);
  return CallOutcome::Yield(1, static_cast<lua_KContext>(continuation));
}

CallOutcome DispatchFunctionReference(lua_State* L) {
  Global* root = Global::From(L);
  auto* handle = static_cast<CallableHandle*>(luaL_testudata(
      L, lua_upvalueindex(1), kFunctionReferenceMetatable));
  if (handle == nullptr)
    return CallOutcome::Raise("function reference without its metatable");

  NativeCallableTable::Callable callable;
  if (!root->callables()->Lookup(*handle, &callable))
    return CallOutcome::Raise("function reference was already released");
  return callable(L);
}

CallOutcome DispatchContinuation(lua_State* L, lua_KContext context) {
  Global* root = Global::From(L);
  NativeCallableTable::Callable continuation;
  if (!root->callables()->Take(static_cast<CallableHandle>(context),
                               &continuation)) {
    return CallOutcome::Raise(
        "continuation was released before the coroutine resumed");
  }
  return continuation(L);
}

int Conclude(lua_State* L, const CallOutcome& outcome) {
  switch (outcome.kind) {
    case CallOutcome::kReturn:
      return outcome.count;
    case CallOutcome::kRaise:
      if (outcome.message != nullptr) lua_pushstring(L, outcome.message);
      return lua_error(L);
    case CallOutcome::kYield:
      return lua_yieldk(
          L, outcome.count, outcome.context, ContinuationTrampoline);
  }
  UNREACHABLE();
}

void ReleaseReference(lua_State* L, const char* metatable) {
  auto* handle =
      static_cast<ReferenceHandle*>(luaL_testudata(L, 1, metatable));
  if (handle == nullptr) return;
  Global* root = Global::From(L);
  const bool released = root->references()->Unref(*handle);
  Debug(root, DebugCategory::REFERENCES, "%s %d finalized%s\n",
        metatable, *handle, released ? "" : " (already released)");
}

}  // anonymous namespace

int FunctionTrampoline(lua_State* L) {
  return Conclude(L, DispatchFunctionReference(L));
}

int ContinuationTrampoline(lua_State* L, int status, lua_KContext context) {
  return Conclude(L, DispatchContinuation(L, context));
}

int FunctionReferenceGc(lua_State* L) {
  auto* handle = static_cast<CallableHandle*>(
      luaL_testudata(L, 1, kFunctionReferenceMetatable));
  if (handle == nullptr) return 0;
  Global* root = Global::From(L);
  const bool released = root->callables()->Remove(*handle);
  Debug(root, DebugCategory::REFERENCES,
        "function reference %d finalized%s\n",
        *handle, released ? "" : " (already released)");
  return 0;
}

int HostReferenceGc(lua_State* L) {
  ReleaseReference(L, kHostReferenceMetatable);
  return 0;
}

int PromiseGc(lua_State* L) {
  ReleaseReference(L, kPromiseMetatable);
  return 0;
}

int SuspensionGc(lua_State* L) {
  auto* sentinel = static_cast<SuspensionSentinel*>(
      luaL_testudata(L, 1, kSuspensionMetatable));
  if (sentinel == nullptr) return 0;
  Global::From(L)->ForgetSuspension(sentinel->coroutine,
                                    sentinel->continuation);
  return 0;
}

int OnPanic(lua_State* L) {
  const char* message = lua_tostring(L, -1);
  OnFatalError("lua_atpanic",
               message != nullptr ? message : "error object is not a string");
}

CallOutcome InvokeHostFunction(Global* root,
                               lua_State* L,
                               const std::shared_ptr<Function>& function) {
  if (root->closed())
    return CallOutcome::Raise("the Lua state is closed");

  HostCallScope host_call(root);
  std::shared_ptr<Thread> thread = root->StateToThread(L);

  GetOptions options;
  options.raw = function->options().raw_arguments;
  const int argc = lua_gettop(L);
  MultiReturn args;
  args.reserve(argc);
  for (int index = 1; index <= argc; index++) {
    Value arg;
    if (thread->GetValue(index, &arg, options) != Status::kOk)
      return RaiseLastError(root, L);
    args.push_back(std::move(arg));
  }

  CallbackInfo info(thread, std::move(args));
  MultiReturn results = function->Invoke(info);

  if (root->closed())
    return CallOutcome::Raise("the Lua state was closed by a host call");
  if (info.HasCaught()) return RaiseValue(thread.get(), info.exception());

  if (function->options().await && results.size() == 1 &&
      results[0].IsDeferred()) {
    return SuspendOnDeferred(root, thread.get(), results[0].AsDeferred());
  }
  return ReturnValues(thread.get(), results);
}

Status ChildThreadScope::Create(std::shared_ptr<Thread> parent,
                                std::shared_ptr<ChildThreadScope>* scope) {
  CHECK(!parent->IsClosed());
  Global* root = parent->root();
  lua_State* L = parent->state();
  Global::AllocationScope allocation(root, L);
  std::shared_ptr<Thread> child = parent->NewThread();
  if (!child) return root->last_error().error_code;
  const int ref = luaL_ref(L, LUA_REGISTRYINDEX);
  Status status = allocation.Check();
  if (status != Status::kOk) {
    luaL_unref(L, LUA_REGISTRYINDEX, ref);
    return status;
  }
  *scope = std::make_shared<ChildThreadScope>(
      std::move(parent), std::move(child), ref);
  return Status::kOk;
}

ChildThreadScope::ChildThreadScope(std::shared_ptr<Thread> parent,
                                   std::shared_ptr<Thread> child,
                                   int ref)
    : parent_(std::move(parent)), child_(std::move(child)), ref_(ref) {}

ChildThreadScope::~ChildThreadScope() {
  Global* root = parent_->root();
  if (root->closed()) return;
  luaL_unref(root->state(), LUA_REGISTRYINDEX, ref_);
}

std::shared_ptr<Deferred> RunChildCall(std::shared_ptr<ChildThreadScope> scope,
                                       MultiReturn args) {
  const std::shared_ptr<Thread>& child = scope->child();
  Global* root = child->root();
  if (!lua_checkstack(child->state(), static_cast<int>(args.size())))
    return Deferred::Rejected(Value("too many arguments"));
  for (const Value& arg : args) {
    if (child->PushValue(arg) != Status::kOk)
      return Deferred::Rejected(Value(root->last_error().error_message));
  }

  std::shared_ptr<Deferred> result = Deferred::New();
  child->RunAsync(static_cast<int>(args.size()))
      ->OnSettled([scope, result](const Deferred& run) {
        if (run.rejected()) {
          result->Reject(run.reason());
          return;
        }
        const std::shared_ptr<Thread>& parent = scope->parent();
        if (parent->IsClosed()) {
          result->Resolve(MultiReturn());
          return;
        }
        CHECK_EQ(run.values().size(), 1);
        const int count = static_cast<int>(run.values()[0].AsInteger());
        lua_State* to = parent->state();
        if (!lua_checkstack(to, count)) {
          result->Reject(Value("too many results to return"));
          return;
        }
        lua_xmove(scope->child()->state(), to, count);
        MultiReturn values;
        Status status = parent->GetValues(count, &values);
        parent->Pop(count);
        if (status != Status::kOk) {
          result->Reject(Value(parent->root()->last_error().error_message));
          return;
        }
        result->Resolve(std::move(values));
      });
  return result;
}

GuestFunctionSlot::~GuestFunctionSlot() {
  std::shared_ptr<Global> root = this->root();
  if (!root || root->closed()) return;
  luaL_unref(root->state(), LUA_REGISTRYINDEX, ref_);
  Debug(root.get(), DebugCategory::REFERENCES,
        "guest function slot %d released by its host wrapper\n", ref_);
}

std::shared_ptr<Global> GuestFunctionSlot::root() const {
  return std::static_pointer_cast<Global>(root_.lock());
}

ThreadRunner::ThreadRunner(std::shared_ptr<Thread> thread,
                           std::shared_ptr<Deferred> result)
    : thread_(std::move(thread)), result_(std::move(result)) {}

void ThreadRunner::Start(int argc) {
  Step(argc);
}

void ThreadRunner::Step(int argc) {
  Global* root = thread_->root();
  for (;;) {
    if (thread_->IsClosed()) {
      result_->Reject(Value(StatusMessage(Status::kUseAfterClose)));
      return;
    }

    ResumeResult resumed;
    if (thread_->Resume(argc, &resumed) != Status::kOk) {
      result_->Reject(Value(root->last_error().error_message));
      return;
    }
    if (thread_->IsClosed()) {
      result_->Reject(Value(StatusMessage(Status::kUseAfterClose)));
      return;
    }
    if (resumed.status != ResumeStatus::kYielded) {
      result_->Resolve(
          MultiReturn{Value(static_cast<int64_t>(resumed.result_count))});
      return;
    }

    lua_State* L = thread_->state();
    std::shared_ptr<Deferred> awaited;
    if (resumed.result_count > 0) {
      auto* handle = static_cast<ReferenceHandle*>(
          luaL_testudata(L, -1, kPromiseMetatable));
      if (handle != nullptr) {
        Value value = root->references()->Get(*handle);
        if (value.IsDeferred()) awaited = value.AsDeferred();
      }
    }
    thread_->Pop(resumed.result_count);
    argc = 0;

    if (!awaited) {
      Debug(root, DebugCategory::BRIDGE,
            "coroutine %p yielded without a deferred, resuming\n", L);
      continue;
    }
    if (!awaited->pending()) {
      root->MarkResumed(L);
      continue;
    }

    std::shared_ptr<ThreadRunner> self = shared_from_this();
    awaited->OnSettled([self, L](const Deferred&) {
      Global* root = self->thread_->root();
      if (!root->closed()) root->MarkResumed(L);
      self->Step(0);
    });
    return;
  }
}

}  // namespace bridge
}  // namespace lunar
