#include "lunar_thread.h"
#include "debug_utils-inl.h"
#include "lunar_bridge.h"
#include "lunar_deferred.h"
#include "lunar_errors.h"
#include "lunar_global.h"
#include "lunar_internals.h"
#include "util-inl.h"

#include <string>

namespace lunar {

using AllocationScope = Global::AllocationScope;

namespace {

// Describes an error object without running any of its metamethods.
std::string DescribeError(Global* root, lua_State* L, int index) {
  const int type = lua_type(L, index);
  if (type == LUA_TSTRING || type == LUA_TNUMBER) {
    // Numbers are converted in place.
    AllocationScope allocation(root, L);
    size_t length = 0;
    const char* message = lua_tolstring(L, index, &length);
    return std::string(message, length);
  }
  return SPrintF("(error object is a %s value)", luaL_typename(L, index));
}

Status ConcludeLoad(Global* root, lua_State* L, int status) {
  if (status == LUA_OK) return Status::kOk;
  std::string message = DescribeError(root, L, -1);
  lua_pop(L, 1);
  Debug(root, DebugCategory::THREAD, "load failed with %s: %s\n",
        LuaStatusName(status), message);
  const Status error = status == LUA_ERRSYNTAX || status == LUA_ERRFILE
                           ? Status::kCompileError
                           : Status::kRuntimeError;
  return root->SetLastError(error, std::move(message), status);
}

}  // anonymous namespace

Thread::Thread(lua_State* state, Global* root, std::shared_ptr<Thread> parent)
    : state_(state), root_(root), parent_(std::move(parent)) {}

std::shared_ptr<Thread> Thread::NewThread() {
  if (IsClosed()) {
    root_->SetLastError(Status::kUseAfterClose);
    return nullptr;
  }
  AllocationScope allocation(root_, state_);
  lua_State* state = lua_newthread(state_);
  if (allocation.Check() != Status::kOk) return nullptr;
  Debug(root_, DebugCategory::THREAD,
        "spawned coroutine %p on %p\n", state, state_);
  return std::shared_ptr<Thread>(new Thread(state, root_, shared_from_this()));
}

Status Thread::ResetThread() {
  CHECK_OPEN(this);
  root_->ReleaseSuspension(state_);
#if LUA_VERSION_RELEASE_NUM >= 50406
  const int status = lua_closethread(state_, nullptr);
#else
  const int status = lua_resetthread(state_);
#endif
  if (status != LUA_OK) {
    // Either the error that killed the coroutine or one raised by a
    // to-be-closed variable. Neither stops the coroutine from being reused.
    Debug(root_, DebugCategory::THREAD, "reset of %p reported %s: %s\n",
          state_, LuaStatusName(status), DescribeError(root_, state_, -1));
  }
  lua_settop(state_, 0);
  return Status::kOk;
}

Status Thread::LoadString(std::string_view source, const char* chunk_name) {
  CHECK_OPEN(this);
  const std::string name =
      chunk_name != nullptr ? std::string(chunk_name) : std::string(source);
  return ConcludeLoad(root_, state_,
                      luaL_loadbufferx(state_, source.data(), source.size(),
                                       name.c_str(), nullptr));
}

Status Thread::LoadFile(const char* filename) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, filename);
  return ConcludeLoad(root_, state_,
                      luaL_loadfilex(state_, filename, nullptr));
}

Status Thread::Resume(int argc, ResumeResult* result) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, result);

  int result_count = 0;
  const int status = lua_resume(state_, nullptr, argc, &result_count);
  result->result_count = result_count;

  Status outcome = Status::kOk;
  switch (status) {
    case LUA_OK:
      result->status = ResumeStatus::kOk;
      break;
    case LUA_YIELD:
      result->status = ResumeStatus::kYielded;
      break;
    default: {
      result->status = status == LUA_ERRRUN ? ResumeStatus::kRuntimeError
                                            : ResumeStatus::kOther;
      result->result_count = 0;
      std::string message = SPrintF("Lua Error(%s/%d): %s",
                                    LuaStatusName(status),
                                    status,
                                    DescribeError(root_, state_, -1));
      lua_pop(state_, 1);
      outcome =
          root_->SetLastError(Status::kRuntimeError, std::move(message), status);
      break;
    }
  }

  // Finish a Close() that a host function requested while the VM ran.
  if (root_->closed()) root_->Close();
  return outcome;
}

Status Thread::Run(int argc, ResumeResult* result) {
  CHECK_OPEN(this);
  MultiReturn values;
  Status status = root_->Await(RunAsync(argc), &values);
  if (status != Status::kOk) {
    if (IsClosed()) return root_->SetLastError(Status::kUseAfterClose);
    return status;
  }
  if (result != nullptr) {
    result->status = ResumeStatus::kOk;
    result->result_count =
        values.empty() ? 0 : static_cast<int>(values[0].AsInteger());
  }
  return Status::kOk;
}

std::shared_ptr<Deferred> Thread::RunAsync(int argc) {
  std::shared_ptr<Deferred> result = Deferred::New();
  std::make_shared<bridge::ThreadRunner>(shared_from_this(), result)
      ->Start(argc);
  return result;
}

Status Thread::PrepareCall(std::string_view name,
                           std::shared_ptr<bridge::ChildThreadScope>* scope) {
  CHECK_OPEN(this);
  std::shared_ptr<bridge::ChildThreadScope> child_scope;
  STATUS_CALL(
      bridge::ChildThreadScope::Create(shared_from_this(), &child_scope));
  lua_State* child = child_scope->child()->state();

  AllocationScope allocation(root_, child);
  const std::string global_name(name);
  const int type = lua_getglobal(child, global_name.c_str());
  bool callable = type == LUA_TFUNCTION;
  if (!callable && luaL_getmetafield(child, -1, "__call") != LUA_TNIL) {
    lua_pop(child, 1);
    callable = true;
  }
  STATUS_CALL(allocation.Check());
  if (!callable) {
    lua_pop(child, 1);
    return root_->SetLastError(
        Status::kFunctionExpected,
        SPrintF("attempt to call global '%s' (a %s value)",
                global_name,
                lua_typename(child, type)));
  }
  *scope = std::move(child_scope);
  return Status::kOk;
}

Status Thread::Call(std::string_view name,
                    const MultiReturn& args,
                    MultiReturn* results) {
  std::shared_ptr<bridge::ChildThreadScope> scope;
  STATUS_CALL(PrepareCall(name, &scope));
  MultiReturn values;
  STATUS_CALL(
      root_->Await(bridge::RunChildCall(std::move(scope), args), &values));
  if (results != nullptr) *results = std::move(values);
  return Status::kOk;
}

std::shared_ptr<Deferred> Thread::CallAsync(std::string_view name,
                                            MultiReturn args) {
  std::shared_ptr<bridge::ChildThreadScope> scope;
  if (PrepareCall(name, &scope) != Status::kOk)
    return Deferred::Rejected(Value(root_->last_error().error_message));
  return bridge::RunChildCall(std::move(scope), std::move(args));
}

Status Thread::Get(std::string_view name, Value* result) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, result);
  AllocationScope allocation(root_, state_);
  const std::string global_name(name);
  const int type = lua_getglobal(state_, global_name.c_str());
  Value value;
  Status status = GetValue(-1, static_cast<LuaType>(type), &value);
  lua_pop(state_, 1);
  STATUS_CALL(status);
  STATUS_CALL(allocation.Check());
  *result = std::move(value);
  return Status::kOk;
}

Status Thread::Set(std::string_view name, const Value& value) {
  CHECK_OPEN(this);
  AllocationScope allocation(root_, state_);
  STATUS_CALL(PushValue(value));
  const std::string global_name(name);
  lua_setglobal(state_, global_name.c_str());
  return allocation.Check();
}

void Thread::Pop(int count) {
  if (IsClosed()) return;
  lua_pop(state_, count);
}

int Thread::GetTop() const {
  if (IsClosed()) return 0;
  return lua_gettop(state_);
}

void Thread::Remove(int index) {
  if (IsClosed()) return;
  lua_remove(state_, index);
}

bool Thread::IsClosed() const {
  return root_->closed();
}

std::shared_ptr<Thread> Thread::StateToThread(lua_State* L) {
  for (Thread* candidate = this; candidate != nullptr;
       candidate = candidate->parent_.get()) {
    if (candidate->state_ == L) return candidate->shared_from_this();
  }
  return std::shared_ptr<Thread>(new Thread(L, root_, shared_from_this()));
}

BridgeState Thread::bridge_state() const {
  if (IsClosed()) return BridgeState::kClosed;
  return root_->GetBridgeState(state_);
}

void Thread::DumpStack(FILE* file) {
  if (IsClosed()) {
    FPrintF(file, "(closed)\n");
    return;
  }
  GetOptions options;
  options.raw = true;
  const int top = lua_gettop(state_);
  for (int index = 1; index <= top; index++) {
    Value value;
    std::string text = GetValue(index, &value, options) == Status::kOk
                           ? value.ToString()
                           : std::string("?");
    FPrintF(file, "%d %s %s\n", index, luaL_typename(state_, index), text);
  }
}

}  // namespace lunar
