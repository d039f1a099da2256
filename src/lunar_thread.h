#ifndef SRC_LUNAR_THREAD_H_
#define SRC_LUNAR_THREAD_H_

#include "lua.hpp"
#include "lunar_types.h"
#include "lunar_value.h"

#include <cstdio>
#include <memory>
#include <string_view>
#include <unordered_map>

namespace lunar {

class Deferred;
class Global;

namespace bridge {
class ChildThreadScope;
}  // namespace bridge

struct PushOptions {
  // Push any value as an opaque host reference.
  bool reference = false;
};

struct GetOptions {
  // Tables, functions and threads come back as pointers, without
  // materializing anything.
  bool raw = false;
};

// One guest call stack (a Lua coroutine) plus the stack level operations
// and value conversions that act on it. Every context belongs to exactly
// one Global and becomes unusable once that Global is closed.
class Thread : public std::enable_shared_from_this<Thread> {
 public:
  virtual ~Thread() = default;

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  lua_State* state() const { return state_; }
  Global* root() const { return root_; }
  const std::shared_ptr<Thread>& parent() const { return parent_; }

  // Spawns a coroutine attached to the same root. The new thread value stays
  // on this context's stack.
  std::shared_ptr<Thread> NewThread();
  // Closes pending to-be-closed variables and drops any continuation left by
  // a suspended host call, making the coroutine reusable.
  Status ResetThread();

  // Compile onto the top of the stack. Syntax errors and unreadable files
  // return kCompileError carrying the VM diagnostic.
  Status LoadString(std::string_view source, const char* chunk_name = nullptr);
  Status LoadFile(const char* filename);

  // One resume step. Non ok/yield outcomes pop the error object and return
  // kRuntimeError with "Lua Error(<NAME>/<code>): <message>".
  Status Resume(int argc, ResumeResult* result);
  // Resumes until the coroutine finishes, awaiting host results in between.
  // Run() drives the root's event loop while it waits; RunAsync() returns at
  // the first suspension and resolves with the result count.
  Status Run(int argc = 0, ResumeResult* result = nullptr);
  std::shared_ptr<Deferred> RunAsync(int argc = 0);

  // Calls the global function `name` on a child context and returns its
  // results. The child context is released on every path.
  Status Call(std::string_view name,
              const MultiReturn& args,
              MultiReturn* results);
  std::shared_ptr<Deferred> CallAsync(std::string_view name, MultiReturn args);

  Status Get(std::string_view name, Value* result);
  Status Set(std::string_view name, const Value& value);

  Status PushValue(const Value& value, const PushOptions& options = {});
  Status GetValue(int index, Value* result, const GetOptions& options = {});
  // Skips the type lookup when the caller already knows the slot's type.
  Status GetValue(int index,
                  LuaType type,
                  Value* result,
                  const GetOptions& options = {});
  // Converts the top `count` slots, bottom first.
  Status GetValues(int count, MultiReturn* values,
                   const GetOptions& options = {});

  void Pop(int count = 1);
  int GetTop() const;
  void Remove(int index);

  bool IsClosed() const;

  // Host wrapper for a state of the same root. Reuses this context or one of
  // its ancestors when the state matches.
  std::shared_ptr<Thread> StateToThread(lua_State* L);

  BridgeState bridge_state() const;

  // One line per slot: index, type name and raw value.
  void DumpStack(FILE* file = stderr);

 protected:
  Thread(lua_State* state, Global* root, std::shared_ptr<Thread> parent);

  lua_State* state_;
  Global* root_;
  std::shared_ptr<Thread> parent_;

 private:
  struct PushCache {
    // Stack slot of a scratch table holding every table created so far,
    // 0 until the first one.
    int scratch = 0;
    // Host table identity -> its key in the scratch table.
    std::unordered_map<const void*, lua_Integer> ids;
  };
  // Guest table identity -> the host table built for it.
  using TableCache = std::unordered_map<const void*, std::shared_ptr<Table>>;

  Status PushValueImpl(const Value& value,
                       const PushOptions& options,
                       PushCache* cache);
  Status PushTable(const std::shared_ptr<Table>& table,
                   const PushOptions& options,
                   PushCache* cache);
  Status PushFunction(const std::shared_ptr<Function>& function);
  Status PushThread(const std::shared_ptr<Thread>& thread);
  Status PushReference(const Value& value, const char* metatable);

  Status GetValueImpl(int index,
                      LuaType type,
                      const GetOptions& options,
                      TableCache* cache,
                      Value* result);
  Status GetTable(int index,
                  const GetOptions& options,
                  TableCache* cache,
                  Value* result);
  Status GetFunction(int index, Value* result);
  Status GetUserdata(int index, Value* result);

  Status PrepareCall(std::string_view name,
                     std::shared_ptr<bridge::ChildThreadScope>* scope);
};

}  // namespace lunar

#endif  // SRC_LUNAR_THREAD_H_
