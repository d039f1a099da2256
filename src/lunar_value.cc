#include "lunar_value.h"
#include "debug_utils-inl.h"
#include "util.h"

#include <cmath>

namespace lunar {

Value::Value(bool value) : kind_(Kind::kBoolean), storage_(value) {}

Value::Value(int value)
    : kind_(Kind::kInteger), storage_(static_cast<int64_t>(value)) {}

Value::Value(int64_t value) : kind_(Kind::kInteger), storage_(value) {}

Value::Value(double value) : kind_(Kind::kNumber), storage_(value) {}

Value::Value(const char* value)
    : kind_(Kind::kString), storage_(std::string(value)) {}

Value::Value(std::string value)
    : kind_(Kind::kString), storage_(std::move(value)) {}

Value::Value(std::string_view value)
    : kind_(Kind::kString), storage_(std::string(value)) {}

Value::Value(std::shared_ptr<Table> value)
    : kind_(value ? Kind::kTable : Kind::kNil), storage_(std::move(value)) {}

Value::Value(std::shared_ptr<Function> value)
    : kind_(value ? Kind::kFunction : Kind::kNil),
      storage_(std::move(value)) {}

Value::Value(std::shared_ptr<Thread> value)
    : kind_(value ? Kind::kThread : Kind::kNil), storage_(std::move(value)) {}

Value::Value(std::shared_ptr<Deferred> value)
    : kind_(value ? Kind::kDeferred : Kind::kNil),
      storage_(std::move(value)) {}

Value Value::Nil() {
  return Value(Kind::kNil, std::monostate());
}

Value Value::External(std::shared_ptr<void> value) {
  if (!value) return Nil();
  return Value(Kind::kExternal, std::move(value));
}

Value Value::Pointer(const void* address) {
  return Value(Kind::kPointer, address);
}

const char* Value::TypeName() const {
  switch (kind_) {
    case Kind::kUndefined: return "undefined";
    case Kind::kNil: return "nil";
    case Kind::kBoolean: return "boolean";
    case Kind::kInteger: return "integer";
    case Kind::kNumber: return "number";
    case Kind::kString: return "string";
    case Kind::kTable: return "table";
    case Kind::kFunction: return "function";
    case Kind::kThread: return "thread";
    case Kind::kExternal: return "external";
    case Kind::kDeferred: return "deferred";
    case Kind::kPointer: return "pointer";
  }
  UNREACHABLE();
}

bool Value::AsBoolean() const {
  CHECK(IsBoolean());
  return std::get<bool>(storage_);
}

int64_t Value::AsInteger() const {
  CHECK(IsInteger());
  return std::get<int64_t>(storage_);
}

double Value::AsNumber() const {
  CHECK(IsNumber());
  if (kind_ == Kind::kInteger)
    return static_cast<double>(std::get<int64_t>(storage_));
  return std::get<double>(storage_);
}

const std::string& Value::AsString() const {
  CHECK(IsString());
  return std::get<std::string>(storage_);
}

const std::shared_ptr<Table>& Value::AsTable() const {
  CHECK(IsTable());
  return std::get<std::shared_ptr<Table>>(storage_);
}

const std::shared_ptr<Function>& Value::AsFunction() const {
  CHECK(IsFunction());
  return std::get<std::shared_ptr<Function>>(storage_);
}

const std::shared_ptr<Thread>& Value::AsThread() const {
  CHECK(IsThread());
  return std::get<std::shared_ptr<Thread>>(storage_);
}

const std::shared_ptr<void>& Value::AsExternal() const {
  CHECK(IsExternal());
  return std::get<std::shared_ptr<void>>(storage_);
}

const std::shared_ptr<Deferred>& Value::AsDeferred() const {
  CHECK(IsDeferred());
  return std::get<std::shared_ptr<Deferred>>(storage_);
}

const void* Value::AsPointer() const {
  CHECK(IsPointer());
  return std::get<const void*>(storage_);
}

const void* Value::identity() const {
  switch (kind_) {
    case Kind::kTable: return AsTable().get();
    case Kind::kFunction: return AsFunction().get();
    case Kind::kThread: return AsThread().get();
    case Kind::kExternal: return AsExternal().get();
    case Kind::kDeferred: return AsDeferred().get();
    case Kind::kPointer: return AsPointer();
    default: return nullptr;
  }
}

std::string Value::ToString() const {
  switch (kind_) {
    case Kind::kUndefined:
    case Kind::kNil:
      return TypeName();
    case Kind::kBoolean:
      return AsBoolean() ? "true" : "false";
    case Kind::kInteger:
      return std::to_string(AsInteger());
    case Kind::kNumber: {
      char buffer[32];
      snprintf(buffer, sizeof(buffer), "%.14g", AsNumber());
      return buffer;
    }
    case Kind::kString:
      return AsString();
    default:
      return SPrintF("%s: %p", TypeName(), identity());
  }
}

bool Value::operator==(const Value& other) const {
  if (IsNumber() && other.IsNumber()) {
    if (IsInteger() && other.IsInteger())
      return AsInteger() == other.AsInteger();
    return AsNumber() == other.AsNumber();
  }
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kUndefined:
    case Kind::kNil:
      return true;
    case Kind::kBoolean:
      return AsBoolean() == other.AsBoolean();
    case Kind::kString:
      return AsString() == other.AsString();
    default:
      return identity() == other.identity();
  }
}

std::shared_ptr<Table> Table::New() {
  return std::make_shared<Table>();
}

std::shared_ptr<Table> Table::FromArray(MultiReturn values) {
  std::shared_ptr<Table> table = New();
  table->array_ = std::move(values);
  return table;
}

void Table::Append(Value value) {
  array_.push_back(std::move(value));
}

void Table::Set(Value key, Value value) {
  if (key.IsInteger() && key.AsInteger() >= 1 &&
      static_cast<uint64_t>(key.AsInteger()) <= array_.size()) {
    array_[key.AsInteger() - 1] = std::move(value);
    return;
  }
  if (key.IsInteger() &&
      static_cast<uint64_t>(key.AsInteger()) == array_.size() + 1) {
    array_.push_back(std::move(value));
    return;
  }
  for (Field& field : fields_) {
    if (field.first == key) {
      field.second = std::move(value);
      return;
    }
  }
  fields_.emplace_back(std::move(key), std::move(value));
}

Value Table::Get(const Value& key) const {
  if (key.IsInteger() && key.AsInteger() >= 1 &&
      static_cast<uint64_t>(key.AsInteger()) <= array_.size()) {
    return array_[key.AsInteger() - 1];
  }
  for (const Field& field : fields_) {
    if (field.first == key) return field.second;
  }
  return Value();
}

Value Table::Get(const char* key) const {
  return Get(Value(key));
}

const Value& CallbackInfo::operator[](size_t index) const {
  static const Value undefined;
  return index < args_.size() ? args_[index] : undefined;
}

void CallbackInfo::Throw(Value error) {
  has_caught_ = true;
  exception_ = std::move(error);
}

std::shared_ptr<Function> Function::New(Callback callback,
                                        FunctionOptions options) {
  return std::make_shared<Function>(std::move(callback), options);
}

Status Function::Call(const MultiReturn& args,
                      MultiReturn* results,
                      Value* exception) const {
  CallbackInfo info(nullptr, args);
  MultiReturn values = Invoke(info);
  if (info.HasCaught()) {
    if (exception != nullptr) *exception = info.exception();
    return Status::kPendingException;
  }
  if (results != nullptr) *results = std::move(values);
  return Status::kOk;
}

}  // namespace lunar
