#include "lunar_global.h"
#include "debug_utils-inl.h"
#include "lunar_bridge.h"
#include "lunar_deferred.h"
#include "lunar_errors.h"
#include "lunar_internals.h"
#include "lunar_mem-inl.h"
#include "util-inl.h"

#include <utility>

namespace lunar {

// Byte accounting behind the VM allocator, with the optional ceiling.
class GlobalAllocator : public mem::LuaMemoryManager<GlobalAllocator> {
 public:
  explicit GlobalAllocator(Global* global) : global_(global) {}

  bool CheckAllocatedSize(size_t previous_size, size_t new_size) {
    if (!memory_max_.has_value()) return true;
    const size_t growth = new_size - previous_size;
    if (memory_used_ <= *memory_max_ && growth <= *memory_max_ - memory_used_)
      return true;
    if (lifted_ > 0) {
      // Reported by the AllocationScope once the host side work is done.
      overrun_ = true;
      return true;
    }
    Debug(global_, DebugCategory::MEMORY,
          "refused %zu more bytes, %zu of %zu in use\n",
          growth, memory_used_, *memory_max_);
    return false;
  }

  // Returns whether an enclosing scope had already gone past the ceiling.
  bool Lift() {
    lifted_++;
    return std::exchange(overrun_, false);
  }
  void Restore(bool outer_overrun) {
    CHECK_GT(lifted_, 0);
    lifted_--;
    overrun_ = overrun_ || outer_overrun;
  }
  bool overrun() const { return overrun_; }
  void clear_overrun() { overrun_ = false; }
  bool within_ceiling() const {
    return !memory_max_.has_value() || memory_used_ <= *memory_max_;
  }

  void IncreaseAllocatedSize(size_t size) { memory_used_ += size; }

  void DecreaseAllocatedSize(size_t size) {
    CHECK_GE(memory_used_, size);
    memory_used_ -= size;
  }

  size_t memory_used() const { return memory_used_; }
  const std::optional<size_t>& memory_max() const { return memory_max_; }
  void set_memory_max(std::optional<size_t> memory_max) {
    memory_max_ = memory_max;
  }

 private:
  Global* global_;
  size_t memory_used_ = 0;
  std::optional<size_t> memory_max_;
  int lifted_ = 0;
  bool overrun_ = false;
};

namespace {

int OpenStandardLibraries(lua_State* L) {
  luaL_openlibs(L);
  return 0;
}

bool ToDeferred(CallbackInfo& info,
                const char* method,
                std::shared_ptr<Deferred>* deferred) {
  if (!info[0].IsDeferred()) {
    info.Throw(Value(SPrintF("bad argument #1 to '%s' (promise expected, got %s)",
                             method,
                             info[0].TypeName())));
    return false;
  }
  *deferred = info[0].AsDeferred();
  return true;
}

// Wraps the guest function at info[index] as a reaction. A missing handler
// leaves *handler empty.
bool ToHandler(CallbackInfo& info,
               size_t index,
               const char* method,
               Deferred::Handler* handler) {
  const Value& value = info[index];
  if (value.IsNullish()) return true;
  if (!value.IsFunction()) {
    info.Throw(Value(SPrintF("bad argument #%d to '%s' (function expected, got %s)",
                             index + 1,
                             method,
                             value.TypeName())));
    return false;
  }
  std::shared_ptr<Function> function = value.AsFunction();
  *handler = [function](const MultiReturn& values) -> MultiReturn {
    MultiReturn results;
    Value exception;
    if (function->Call(values, &results, &exception) != Status::kOk)
      return {Value(Deferred::Rejected(std::move(exception)))};
    return results;
  };
  return true;
}

MultiReturn PromiseNext(CallbackInfo& info) {
  std::shared_ptr<Deferred> self;
  Deferred::Handler on_fulfilled;
  Deferred::Handler on_rejected;
  if (!ToDeferred(info, "next", &self) ||
      !ToHandler(info, 1, "next", &on_fulfilled) ||
      !ToHandler(info, 2, "next", &on_rejected)) {
    return MultiReturn();
  }
  return {Value(self->Then(std::move(on_fulfilled), std::move(on_rejected)))};
}

MultiReturn PromiseCatch(CallbackInfo& info) {
  std::shared_ptr<Deferred> self;
  Deferred::Handler on_rejected;
  if (!ToDeferred(info, "catch", &self) ||
      !ToHandler(info, 1, "catch", &on_rejected)) {
    return MultiReturn();
  }
  return {Value(self->Catch(std::move(on_rejected)))};
}

MultiReturn PromiseFinally(CallbackInfo& info) {
  std::shared_ptr<Deferred> self;
  Deferred::Handler on_settled;
  if (!ToDeferred(info, "finally", &self) ||
      !ToHandler(info, 1, "finally", &on_settled)) {
    return MultiReturn();
  }
  return {Value(self->Finally(std::move(on_settled)))};
}

// Registered with FunctionOptions::await, so handing the deferred back
// suspends the caller until it settles.
MultiReturn PromiseAwait(CallbackInfo& info) {
  std::shared_ptr<Deferred> self;
  if (!ToDeferred(info, "await", &self)) return MultiReturn();
  return {Value(self)};
}

// Promise.create(function(resolve, reject) ... end)
MultiReturn PromiseCreate(CallbackInfo& info) {
  if (!info[0].IsFunction()) {
    info.Throw(Value(SPrintF("bad argument #1 to 'create' (function expected, got %s)",
                             info[0].TypeName())));
    return MultiReturn();
  }
  std::shared_ptr<Deferred> deferred = Deferred::New();
  std::shared_ptr<Function> resolve =
      Function::New([deferred](CallbackInfo& call) {
        deferred->Resolve(call.args());
        return MultiReturn();
      });
  std::shared_ptr<Function> reject =
      Function::New([deferred](CallbackInfo& call) {
        deferred->Reject(call[0]);
        return MultiReturn();
      });

  MultiReturn results;
  Value exception;
  if (info[0].AsFunction()->Call(
          {Value(resolve), Value(reject)}, &results, &exception) !=
      Status::kOk) {
    deferred->Reject(std::move(exception));
  } else if (results.size() == 1 && results[0].IsDeferred()) {
    // The executor runs on a coroutine of its own; an error there rejects.
    results[0].AsDeferred()->OnSettled([deferred](const Deferred& run) {
      if (run.rejected()) deferred->Reject(run.reason());
    });
  }
  return {Value(deferred)};
}

}  // anonymous namespace

Global::Global(const GlobalOptions& options)
    : Thread(nullptr, this, nullptr),
      event_loop_(options.event_loop != nullptr ? options.event_loop
                                                : uv_default_loop()),
      allocator_(std::make_unique<GlobalAllocator>(this)),
      enabled_debug_list_(std::make_unique<EnabledDebugList>()) {
  enabled_debug_list_->Parse(options);
  allocator_->set_memory_max(options.memory_max);
  state_ = lua_newstate(allocator_->allocator(), allocator_->allocator_data());
  if (state_ != nullptr)
    *static_cast<Global**>(lua_getextraspace(state_)) = this;
}

Global::~Global() {
  CHECK_EQ(host_call_depth_, 0);
  Close();
}

std::shared_ptr<Global> Global::Create(const GlobalOptions& options) {
  std::shared_ptr<Global> global(new Global(options));
  if (global->state_ == nullptr) {
    Debug(global.get(), DebugCategory::GLOBAL,
          "the allocator refused the initial VM state\n");
    return nullptr;
  }
  if (global->Initialize(options) != Status::kOk) {
    Debug(global.get(), DebugCategory::GLOBAL, "initialization failed: %s\n",
          global->last_error().error_message);
    global->Close();
    return nullptr;
  }
  Debug(global.get(), DebugCategory::GLOBAL, "created Lua state %p, %zu bytes\n",
        global->state_, global->memory_used());
  return global;
}

Global* Global::From(lua_State* L) {
  return *static_cast<Global**>(lua_getextraspace(L));
}

Status Global::Initialize(const GlobalOptions& options) {
  lua_atpanic(state_, bridge::OnPanic);
  if (options.open_standard_libs) {
    lua_pushcfunction(state_, OpenStandardLibraries);
    const int status = lua_pcall(state_, 0, 0, 0);
    if (status != LUA_OK) {
      std::string message = lua_type(state_, -1) == LUA_TSTRING
                                ? std::string(lua_tostring(state_, -1))
                                : std::string(LuaStatusName(status));
      lua_pop(state_, 1);
      return SetLastError(Status::kGenericFailure,
                          "cannot open the standard libraries: " + message,
                          status);
    }
  }
  AllocationScope allocation(this, state_);
  STATUS_CALL(
      InstallMetatable(kFunctionReferenceMetatable, bridge::FunctionReferenceGc));
  STATUS_CALL(InstallMetatable(kHostReferenceMetatable, bridge::HostReferenceGc));
  STATUS_CALL(InstallMetatable(kPromiseMetatable, bridge::PromiseGc));
  STATUS_CALL(InstallMetatable(kSuspensionMetatable, bridge::SuspensionGc));
  InstallSuspensionTable();
  STATUS_CALL(InstallPromiseLibrary());
  return allocation.Check();
}

Status Global::InstallMetatable(const char* name, lua_CFunction gc) {
  if (luaL_newmetatable(state_, name) == 0) {
    lua_pop(state_, 1);
    return SetLastError(Status::kGenericFailure,
                        SPrintF("metatable '%s' is already installed", name));
  }
  lua_pushcfunction(state_, gc);
  lua_setfield(state_, -2, "__gc");
  lua_pushstring(state_, kProtectedMetatable);
  lua_setfield(state_, -2, "__metatable");
  lua_pop(state_, 1);
  return Status::kOk;
}

void Global::InstallSuspensionTable() {
  lua_newtable(state_);
  lua_createtable(state_, 0, 1);
  lua_pushliteral(state_, "k");
  lua_setfield(state_, -2, "__mode");
  lua_setmetatable(state_, -2);
  lua_setfield(state_, LUA_REGISTRYINDEX, kSuspensionsKey);
}

Status Global::InstallPromiseLibrary() {
  FunctionOptions await_options;
  await_options.await = true;

  std::shared_ptr<Table> methods = Table::New();
  methods->Set("next", Function::New(PromiseNext));
  methods->Set("catch", Function::New(PromiseCatch));
  methods->Set("finally", Function::New(PromiseFinally));
  methods->Set("await", Function::New(PromiseAwait, await_options));

  if (luaL_getmetatable(state_, kPromiseMetatable) != LUA_TTABLE) {
    lua_pop(state_, 1);
    return SetLastError(Status::kMissingMetatable,
                        SPrintF("metatable '%s' is not installed",
                                kPromiseMetatable));
  }
  Status status = PushValue(Value(methods));
  if (status != Status::kOk) {
    lua_pop(state_, 1);
    return status;
  }
  lua_setfield(state_, -2, "__index");
  lua_pop(state_, 1);

  std::shared_ptr<Table> promise = Table::New();
  promise->Set("create", Function::New(PromiseCreate));
  return Set("Promise", Value(promise));
}

void Global::Close() {
  if (state_ == nullptr) return;
  // Dropping the callables below may release the last owner of this root.
  std::shared_ptr<Thread> self = weak_from_this().lock();

  if (!closed_) {
    closed_ = true;
    Debug(this, DebugCategory::GLOBAL, "closing Lua state %p\n", state_);
  }
  if (host_call_depth_ > 0) {
    Debug(this, DebugCategory::GLOBAL,
          "Lua state %p is inside a host call, teardown deferred\n", state_);
    return;
  }

  lua_close(state_);
  state_ = nullptr;

  std::unordered_map<lua_State*, Suspension> suspensions;
  suspensions.swap(suspensions_);
  callables_.Clear();
  references_.Clear();
}

void Global::LeaveHostCall() {
  CHECK_GT(host_call_depth_, 0);
  host_call_depth_--;
}

Global::AllocationScope::AllocationScope(Global* root, lua_State* L)
    : root_(root),
      L_(L),
      top_(lua_gettop(L)),
      outer_overrun_(root->allocator_->Lift()) {}

Global::AllocationScope::~AllocationScope() {
  root_->allocator_->Restore(outer_overrun_);
}

Status Global::AllocationScope::Check() {
  GlobalAllocator* allocator = root_->allocator_.get();
  if (!allocator->overrun() || root_->state_ == nullptr) return Status::kOk;
  allocator->clear_overrun();

  lua_gc(root_->state_, LUA_GCCOLLECT);
  if (allocator->within_ceiling()) return Status::kOk;
  lua_settop(L_, top_);
  lua_gc(root_->state_, LUA_GCCOLLECT);
  Debug(root_, DebugCategory::MEMORY,
        "host side allocation on %p went past the ceiling, %zu bytes in use\n",
        L_, allocator->memory_used());
  return root_->SetLastError(
      Status::kRuntimeError, kMemoryErrorMessage, LUA_ERRMEM);
}

size_t Global::memory_used() const {
  return allocator_->memory_used();
}

std::optional<size_t> Global::memory_max() const {
  return allocator_->memory_max();
}

void Global::set_memory_max(std::optional<size_t> memory_max) {
  allocator_->set_memory_max(memory_max);
}

Status Global::Await(const std::shared_ptr<Deferred>& deferred,
                     MultiReturn* values) {
  CHECK_ARG(this, deferred);
  while (deferred->pending()) {
    if (loop_depth_ > 0) {
      return SetLastError(
          Status::kWouldDeadlock,
          "cannot wait for a pending result from inside the event loop");
    }
    loop_depth_++;
    const int alive = uv_run(event_loop_, UV_RUN_ONCE);
    loop_depth_--;
    if (alive == 0 && deferred->pending())
      return SetLastError(Status::kWouldDeadlock);
  }
  if (deferred->rejected()) {
    std::string message = deferred->reason().ToString();
    // A rejection carrying the last engine error keeps its engine code.
    const int engine_error_code = message == last_error_.error_message
                                      ? last_error_.engine_error_code
                                      : 0;
    return SetLastError(
        Status::kRuntimeError, std::move(message), engine_error_code);
  }
  if (values != nullptr) *values = deferred->values();
  return Status::kOk;
}

Status Global::SetLastError(Status status,
                            std::string message,
                            int engine_error_code) {
  last_error_.error_code = status;
  last_error_.engine_error_code = engine_error_code;
  last_error_.error_message =
      message.empty() ? std::string(StatusMessage(status)) : std::move(message);
  return status;
}

void Global::ClearLastError() {
  last_error_ = ExtendedErrorInfo();
}

std::shared_ptr<Deferred> Global::CallReferenceAsync(int ref,
                                                     MultiReturn args) {
  if (closed_) return Deferred::Resolved(MultiReturn());
  std::shared_ptr<bridge::ChildThreadScope> scope;
  if (bridge::ChildThreadScope::Create(shared_from_this(), &scope) !=
      Status::kOk) {
    return Deferred::Rejected(Value(last_error_.error_message));
  }
  lua_rawgeti(scope->child()->state(), LUA_REGISTRYINDEX, ref);
  return bridge::RunChildCall(std::move(scope), std::move(args));
}

BridgeState Global::GetBridgeState(lua_State* L) const {
  if (closed_) return BridgeState::kClosed;
  auto it = suspensions_.find(L);
  return it == suspensions_.end() ? BridgeState::kRunning : it->second.state;
}

Status Global::Suspend(lua_State* L,
                       CallableHandle continuation,
                       std::shared_ptr<Deferred> deferred) {
  {
    AllocationScope allocation(this, L);
    if (!lua_checkstack(L, 3)) {
      callables_.Remove(continuation);
      return SetLastError(Status::kGenericFailure,
                          "stack overflow while suspending a coroutine");
    }
    // registry[kSuspensionsKey][L] = sentinel, collected together with L.
    lua_getfield(L, LUA_REGISTRYINDEX, kSuspensionsKey);
    lua_pushthread(L);
    auto* sentinel = static_cast<bridge::SuspensionSentinel*>(
        lua_newuserdatauv(L, sizeof(bridge::SuspensionSentinel), 0));
    sentinel->coroutine = L;
    sentinel->continuation = continuation;
    luaL_setmetatable(L, kSuspensionMetatable);
    lua_rawset(L, -3);
    lua_pop(L, 1);
    Status status = allocation.Check();
    if (status != Status::kOk) {
      callables_.Remove(continuation);
      return status;
    }
  }

  Suspension& suspension = suspensions_[L];
  if (suspension.continuation != 0 &&
      callables_.Remove(suspension.continuation)) {
    Debug(this, DebugCategory::BRIDGE,
          "released stale continuation %d of coroutine %p\n",
          suspension.continuation, L);
  }
  suspension.state = BridgeState::kAwaitingHost;
  suspension.continuation = continuation;
  suspension.deferred = std::move(deferred);
  return Status::kOk;
}

void Global::MarkResumed(lua_State* L) {
  auto it = suspensions_.find(L);
  if (it != suspensions_.end()) it->second.state = BridgeState::kResumed;
}

void Global::ReleaseSuspension(lua_State* L) {
  auto it = suspensions_.find(L);
  if (it == suspensions_.end()) return;
  Suspension suspension = std::move(it->second);
  suspensions_.erase(it);
  if (suspension.continuation != 0) callables_.Remove(suspension.continuation);
}

void Global::ForgetSuspension(lua_State* L, CallableHandle continuation) {
  auto it = suspensions_.find(L);
  if (it == suspensions_.end() || it->second.continuation != continuation)
    return;
  Debug(this, DebugCategory::BRIDGE,
        "coroutine %p was collected while awaiting, continuation %d\n",
        L, continuation);
  ReleaseSuspension(L);
}

}  // namespace lunar
