// Value conversion between the host and the VM stack of a Thread.

#include "debug_utils-inl.h"
#include "lunar_bridge.h"
#include "lunar_deferred.h"
#include "lunar_global.h"
#include "lunar_internals.h"
#include "lunar_thread.h"
#include "util-inl.h"

#include <climits>
#include <cmath>
#include <string>

namespace lunar {

namespace {

int SizeHint(size_t size) {
  return size > INT_MAX ? INT_MAX : static_cast<int>(size);
}

bool IsInvalidKey(const Value& key) {
  return key.IsNullish() ||
         (key.kind() == Value::Kind::kNumber && std::isnan(key.AsNumber()));
}

}  // anonymous namespace

Status Thread::PushValue(const Value& value, const PushOptions& options) {
  CHECK_OPEN(this);
  const int top = lua_gettop(state_);
  Global::AllocationScope allocation(root_, state_);
  PushCache cache;
  Status status = PushValueImpl(value, options, &cache);
  if (status != Status::kOk) {
    lua_settop(state_, top);
    return status;
  }
  if (cache.scratch != 0) lua_remove(state_, cache.scratch);
  return allocation.Check();
}

Status Thread::PushValueImpl(const Value& value,
                             const PushOptions& options,
                             PushCache* cache) {
  if (!lua_checkstack(state_, 4)) {
    return root_->SetLastError(Status::kGenericFailure,
                               "stack overflow while pushing a value");
  }
  if (options.reference && !value.IsNullish())
    return PushReference(value, kHostReferenceMetatable);

  switch (value.kind()) {
    case Value::Kind::kUndefined:
    case Value::Kind::kNil:
      lua_pushnil(state_);
      return Status::kOk;
    case Value::Kind::kBoolean:
      lua_pushboolean(state_, value.AsBoolean() ? 1 : 0);
      return Status::kOk;
    case Value::Kind::kInteger:
      lua_pushinteger(state_, static_cast<lua_Integer>(value.AsInteger()));
      return Status::kOk;
    case Value::Kind::kNumber: {
      const double number = value.AsNumber();
      lua_Integer integer = 0;
      if (std::floor(number) == number &&
          lua_numbertointeger(number, &integer)) {
        lua_pushinteger(state_, integer);
      } else {
        lua_pushnumber(state_, static_cast<lua_Number>(number));
      }
      return Status::kOk;
    }
    case Value::Kind::kString: {
      const std::string& string = value.AsString();
      lua_pushlstring(state_, string.data(), string.size());
      return Status::kOk;
    }
    case Value::Kind::kTable:
      return PushTable(value.AsTable(), options, cache);
    case Value::Kind::kFunction:
      return PushFunction(value.AsFunction());
    case Value::Kind::kThread:
      return PushThread(value.AsThread());
    case Value::Kind::kExternal:
      return PushReference(value, kHostReferenceMetatable);
    case Value::Kind::kDeferred:
      return PushReference(value, kPromiseMetatable);
    case Value::Kind::kPointer:
      break;
  }
  return root_->SetLastError(
      Status::kUnsupportedType,
      SPrintF("a %s value cannot be pushed to Lua", value.TypeName()));
}

Status Thread::PushTable(const std::shared_ptr<Table>& table,
                         const PushOptions& options,
                         PushCache* cache) {
  if (cache->scratch == 0) {
    lua_newtable(state_);
    cache->scratch = lua_gettop(state_);
  }
  auto cached = cache->ids.find(table.get());
  if (cached != cache->ids.end()) {
    lua_rawgeti(state_, cache->scratch, cached->second);
    return Status::kOk;
  }

  lua_createtable(state_,
                  SizeHint(table->array().size()),
                  SizeHint(table->fields().size()));
  const int slot = lua_gettop(state_);
  // Registered before the contents so that cycles resolve to this table.
  const lua_Integer id = static_cast<lua_Integer>(cache->ids.size()) + 1;
  lua_pushvalue(state_, slot);
  lua_rawseti(state_, cache->scratch, id);
  cache->ids.emplace(table.get(), id);

  lua_Integer index = 1;
  for (const Value& item : table->array()) {
    STATUS_CALL(PushValueImpl(item, options, cache));
    lua_rawseti(state_, slot, index++);
  }
  for (const Table::Field& field : table->fields()) {
    if (IsInvalidKey(field.first)) {
      return root_->SetLastError(Status::kInvalidArg,
                                 "table keys cannot be nil or NaN");
    }
    STATUS_CALL(PushValueImpl(field.first, options, cache));
    STATUS_CALL(PushValueImpl(field.second, options, cache));
    lua_rawset(state_, slot);
  }
  if (table->metatable()) {
    STATUS_CALL(PushValueImpl(Value(table->metatable()), options, cache));
    lua_setmetatable(state_, slot);
  }
  return Status::kOk;
}

Status Thread::PushFunction(const std::shared_ptr<Function>& function) {
  auto* handle = static_cast<CallableHandle*>(
      lua_newuserdatauv(state_, sizeof(CallableHandle), 0));
  *handle = 0;
  if (luaL_getmetatable(state_, kFunctionReferenceMetatable) != LUA_TTABLE) {
    lua_pop(state_, 2);
    return root_->SetLastError(
        Status::kMissingMetatable,
        SPrintF("metatable '%s' is not installed",
                kFunctionReferenceMetatable));
  }
  Global* root = root_;
  *handle = root_->callables()->Add([root, function](lua_State* L) {
    return bridge::InvokeHostFunction(root, L, function);
  });
  lua_setmetatable(state_, -2);
  Debug(root_, DebugCategory::REFERENCES,
        "pushed function reference %d\n", *handle);
  lua_pushcclosure(state_, bridge::FunctionTrampoline, 1);
  return Status::kOk;
}

Status Thread::PushThread(const std::shared_ptr<Thread>& thread) {
  if (thread->root_ != root_) {
    return root_->SetLastError(Status::kInvalidArg,
                               "a thread of another Lua state was pushed");
  }
  if (thread->state_ == state_) {
    lua_pushthread(state_);
    return Status::kOk;
  }
  if (!lua_checkstack(thread->state_, 1)) {
    return root_->SetLastError(Status::kGenericFailure,
                               "stack overflow while pushing a thread");
  }
  lua_pushthread(thread->state_);
  lua_xmove(thread->state_, state_, 1);
  return Status::kOk;
}

Status Thread::PushReference(const Value& value, const char* metatable) {
  auto* handle = static_cast<ReferenceHandle*>(
      lua_newuserdatauv(state_, sizeof(ReferenceHandle), 0));
  *handle = 0;
  if (luaL_getmetatable(state_, metatable) != LUA_TTABLE) {
    lua_pop(state_, 2);
    return root_->SetLastError(
        Status::kMissingMetatable,
        SPrintF("metatable '%s' is not installed", metatable));
  }
  *handle = root_->references()->Ref(value);
  lua_setmetatable(state_, -2);
  Debug(root_, DebugCategory::REFERENCES, "pushed %s %d for a %s value\n",
        metatable, *handle, value.TypeName());
  return Status::kOk;
}

Status Thread::GetValue(int index, Value* result, const GetOptions& options) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, result);
  RETURN_STATUS_IF_FALSE(root_, index != 0, Status::kInvalidArg);
  return GetValue(index,
                  static_cast<LuaType>(lua_type(state_, index)),
                  result,
                  options);
}

Status Thread::GetValue(int index,
                        LuaType type,
                        Value* result,
                        const GetOptions& options) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, result);
  RETURN_STATUS_IF_FALSE(root_, index != 0, Status::kInvalidArg);
  Global::AllocationScope allocation(root_, state_);
  TableCache cache;
  Value value;
  STATUS_CALL(GetValueImpl(
      lua_absindex(state_, index), type, options, &cache, &value));
  STATUS_CALL(allocation.Check());
  *result = std::move(value);
  return Status::kOk;
}

Status Thread::GetValues(int count,
                         MultiReturn* values,
                         const GetOptions& options) {
  CHECK_OPEN(this);
  CHECK_ARG(root_, values);
  const int top = lua_gettop(state_);
  RETURN_STATUS_IF_FALSE(
      root_, count >= 0 && count <= top, Status::kInvalidArg);

  Global::AllocationScope allocation(root_, state_);
  TableCache cache;
  MultiReturn converted;
  converted.reserve(count);
  for (int index = top - count + 1; index <= top; index++) {
    Value value;
    STATUS_CALL(GetValueImpl(index,
                             static_cast<LuaType>(lua_type(state_, index)),
                             options,
                             &cache,
                             &value));
    converted.push_back(std::move(value));
  }
  STATUS_CALL(allocation.Check());
  *values = std::move(converted);
  return Status::kOk;
}

Status Thread::GetValueImpl(int index,
                            LuaType type,
                            const GetOptions& options,
                            TableCache* cache,
                            Value* result) {
  switch (type) {
    case LuaType::kNone:
      *result = Value();
      return Status::kOk;
    case LuaType::kNil:
      *result = Value::Nil();
      return Status::kOk;
    case LuaType::kBoolean:
      *result = Value(lua_toboolean(state_, index) != 0);
      return Status::kOk;
    case LuaType::kNumber:
      if (lua_isinteger(state_, index)) {
        *result = Value(static_cast<int64_t>(lua_tointeger(state_, index)));
      } else {
        *result = Value(static_cast<double>(lua_tonumber(state_, index)));
      }
      return Status::kOk;
    case LuaType::kString: {
      size_t length = 0;
      const char* string = lua_tolstring(state_, index, &length);
      *result = Value(std::string(string, length));
      return Status::kOk;
    }
    case LuaType::kTable:
      if (options.raw) {
        *result = Value::Pointer(lua_topointer(state_, index));
        return Status::kOk;
      }
      return GetTable(index, options, cache, result);
    case LuaType::kFunction:
      if (options.raw) {
        *result = Value::Pointer(lua_topointer(state_, index));
        return Status::kOk;
      }
      return GetFunction(index, result);
    case LuaType::kThread:
      if (options.raw) {
        *result = Value::Pointer(lua_topointer(state_, index));
      } else {
        *result = Value(StateToThread(lua_tothread(state_, index)));
      }
      return Status::kOk;
    case LuaType::kUserdata:
      return GetUserdata(index, result);
    case LuaType::kLightUserdata:
      *result = Value::Pointer(lua_touserdata(state_, index));
      return Status::kOk;
  }
  UNREACHABLE();
}

Status Thread::GetTable(int index,
                        const GetOptions& options,
                        TableCache* cache,
                        Value* result) {
  const void* identity = lua_topointer(state_, index);
  auto cached = cache->find(identity);
  if (cached != cache->end()) {
    *result = Value(cached->second);
    return Status::kOk;
  }
  if (!lua_checkstack(state_, 4)) {
    return root_->SetLastError(Status::kGenericFailure,
                               "stack overflow while reading a table");
  }

  std::shared_ptr<Table> table = Table::New();
  cache->emplace(identity, table);

  // Array part: keys 1..n up to the first nil.
  lua_Integer length = 0;
  for (;;) {
    const int type = lua_rawgeti(state_, index, length + 1);
    if (type == LUA_TNIL) {
      lua_pop(state_, 1);
      break;
    }
    Value item;
    Status status = GetValueImpl(lua_gettop(state_),
                                 static_cast<LuaType>(type),
                                 options,
                                 cache,
                                 &item);
    lua_pop(state_, 1);
    if (status != Status::kOk) return status;
    table->Append(std::move(item));
    length++;
  }

  lua_pushnil(state_);
  while (lua_next(state_, index) != 0) {
    const int key_slot = lua_gettop(state_) - 1;
    if (lua_isinteger(state_, key_slot)) {
      const lua_Integer key = lua_tointeger(state_, key_slot);
      if (key >= 1 && key <= length) {
        lua_pop(state_, 1);
        continue;
      }
    }
    Value key;
    Value item;
    Status status =
        GetValueImpl(key_slot,
                     static_cast<LuaType>(lua_type(state_, key_slot)),
                     options,
                     cache,
                     &key);
    if (status == Status::kOk) {
      status = GetValueImpl(key_slot + 1,
                            static_cast<LuaType>(lua_type(state_, -1)),
                            options,
                            cache,
                            &item);
    }
    if (status != Status::kOk) {
      lua_pop(state_, 2);
      return status;
    }
    table->fields().emplace_back(std::move(key), std::move(item));
    lua_pop(state_, 1);
  }

  *result = Value(table);
  return Status::kOk;
}

Status Thread::GetFunction(int index, Value* result) {
  lua_pushvalue(state_, index);
  const int ref = luaL_ref(state_, LUA_REGISTRYINDEX);
  auto slot = std::make_shared<bridge::GuestFunctionSlot>(
      root_->weak_from_this(), ref);
  Debug(root_, DebugCategory::REFERENCES,
        "guest function %p held in registry slot %d\n",
        lua_topointer(state_, index), ref);

  *result = Value(Function::New([slot](CallbackInfo& info) -> MultiReturn {
    std::shared_ptr<Global> root = slot->root();
    if (!root || root->closed())
      return {Value(Deferred::Resolved(MultiReturn()))};
    return {Value(root->CallReferenceAsync(slot->ref(), info.args()))};
  }));
  return Status::kOk;
}

Status Thread::GetUserdata(int index, Value* result) {
  static const char* const kReferenceMetatables[] = {
      kHostReferenceMetatable,
      kPromiseMetatable,
  };
  for (const char* metatable : kReferenceMetatables) {
    auto* handle =
        static_cast<ReferenceHandle*>(luaL_testudata(state_, index, metatable));
    if (handle != nullptr) {
      *result = root_->references()->Get(*handle);
      return Status::kOk;
    }
  }

  std::string description;
  if (luaL_getmetafield(state_, index, "__tostring") != LUA_TNIL) {
    lua_pop(state_, 1);
    description = SPrintF("%s: %p",
                          luaL_typename(state_, index),
                          lua_topointer(state_, index));
  } else {
    size_t length = 0;
    const char* text = luaL_tolstring(state_, index, &length);
    description.assign(text, length);
    lua_pop(state_, 1);
  }
  Debug(root_, DebugCategory::CODEC,
        "unsupported userdata %s read as a pointer\n", description);
  *result = Value::Pointer(lua_topointer(state_, index));
  return Status::kOk;
}

}  // namespace lunar
