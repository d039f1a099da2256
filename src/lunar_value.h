#ifndef SRC_LUNAR_VALUE_H_
#define SRC_LUNAR_VALUE_H_

#include "lunar_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lunar {

class Deferred;
class Function;
class Table;
class Thread;

// A host side value exchanged with the guest VM.
class Value {
 public:
  enum class Kind {
    kUndefined,  // no value at all, e.g. an absent stack slot
    kNil,
    kBoolean,
    kInteger,
    kNumber,
    kString,
    kTable,
    kFunction,
    kThread,
    kExternal,  // opaque host object, only ever passed by reference
    kDeferred,
    kPointer,   // raw native address, used for introspection
  };

  Value() = default;
  Value(bool value);  // NOLINT(runtime/explicit)
  Value(int value);  // NOLINT(runtime/explicit)
  Value(int64_t value);  // NOLINT(runtime/explicit)
  Value(double value);  // NOLINT(runtime/explicit)
  Value(const char* value);  // NOLINT(runtime/explicit)
  Value(std::string value);  // NOLINT(runtime/explicit)
  Value(std::string_view value);  // NOLINT(runtime/explicit)
  Value(std::shared_ptr<Table> value);  // NOLINT(runtime/explicit)
  Value(std::shared_ptr<Function> value);  // NOLINT(runtime/explicit)
  Value(std::shared_ptr<Thread> value);  // NOLINT(runtime/explicit)
  Value(std::shared_ptr<Deferred> value);  // NOLINT(runtime/explicit)

  static Value Nil();
  static Value External(std::shared_ptr<void> value);
  static Value Pointer(const void* address);

  Kind kind() const { return kind_; }
  const char* TypeName() const;

  bool IsUndefined() const { return kind_ == Kind::kUndefined; }
  bool IsNil() const { return kind_ == Kind::kNil; }
  bool IsNullish() const { return IsUndefined() || IsNil(); }
  bool IsBoolean() const { return kind_ == Kind::kBoolean; }
  bool IsInteger() const { return kind_ == Kind::kInteger; }
  bool IsNumber() const {
    return kind_ == Kind::kNumber || kind_ == Kind::kInteger;
  }
  bool IsString() const { return kind_ == Kind::kString; }
  bool IsTable() const { return kind_ == Kind::kTable; }
  bool IsFunction() const { return kind_ == Kind::kFunction; }
  bool IsThread() const { return kind_ == Kind::kThread; }
  bool IsExternal() const { return kind_ == Kind::kExternal; }
  bool IsDeferred() const { return kind_ == Kind::kDeferred; }
  bool IsPointer() const { return kind_ == Kind::kPointer; }

  // The accessors below CHECK the kind.
  bool AsBoolean() const;
  int64_t AsInteger() const;
  double AsNumber() const;  // integers widen
  const std::string& AsString() const;
  const std::shared_ptr<Table>& AsTable() const;
  const std::shared_ptr<Function>& AsFunction() const;
  const std::shared_ptr<Thread>& AsThread() const;
  const std::shared_ptr<void>& AsExternal() const;
  const std::shared_ptr<Deferred>& AsDeferred() const;
  const void* AsPointer() const;

  // Address that identifies a reference value, nullptr for primitives.
  const void* identity() const;

  std::string ToString() const;

  // Integers and numbers compare numerically; reference kinds compare by
  // identity.
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  using Storage = std::variant<std::monostate,
                               bool,
                               int64_t,
                               double,
                               std::string,
                               std::shared_ptr<Table>,
                               std::shared_ptr<Function>,
                               std::shared_ptr<Thread>,
                               std::shared_ptr<void>,
                               std::shared_ptr<Deferred>,
                               const void*>;

  Value(Kind kind, Storage storage)
      : kind_(kind), storage_(std::move(storage)) {}

  Kind kind_ = Kind::kUndefined;
  Storage storage_;
};

// Every call across the boundary produces zero or more values.
typedef std::vector<Value> MultiReturn;

// A host table. Keys 1..n live in the array part, every other key in the
// ordered field list. Tables are reference types so that shared and cyclic
// structures keep their shape when crossing the boundary.
class Table {
 public:
  using Field = std::pair<Value, Value>;

  static std::shared_ptr<Table> New();
  static std::shared_ptr<Table> FromArray(MultiReturn values);

  std::vector<Value>& array() { return array_; }
  const std::vector<Value>& array() const { return array_; }
  std::vector<Field>& fields() { return fields_; }
  const std::vector<Field>& fields() const { return fields_; }

  size_t length() const { return array_.size(); }

  void Append(Value value);
  // Replaces an existing entry with an equal key.
  void Set(Value key, Value value);
  Value Get(const Value& key) const;
  Value Get(const char* key) const;

  const std::shared_ptr<Table>& metatable() const { return metatable_; }
  void set_metatable(std::shared_ptr<Table> metatable) {
    metatable_ = std::move(metatable);
  }

 private:
  std::vector<Value> array_;
  std::vector<Field> fields_;
  std::shared_ptr<Table> metatable_;
};

// Arguments of a host function invocation, plus the slot a host function
// uses to report an error back into the VM.
class CallbackInfo {
 public:
  CallbackInfo(std::shared_ptr<Thread> thread, MultiReturn args)
      : thread_(std::move(thread)), args_(std::move(args)) {}

  // The execution context the call came from, nullptr for host side calls.
  const std::shared_ptr<Thread>& thread() const { return thread_; }
  const MultiReturn& args() const { return args_; }
  size_t length() const { return args_.size(); }
  // Missing arguments read as undefined.
  const Value& operator[](size_t index) const;

  void Throw(Value error);
  bool HasCaught() const { return has_caught_; }
  const Value& exception() const { return exception_; }

 private:
  std::shared_ptr<Thread> thread_;
  MultiReturn args_;
  bool has_caught_ = false;
  Value exception_;
};

struct FunctionOptions {
  // A single Deferred result suspends the calling guest coroutine until it
  // settles instead of being handed to the guest as a promise.
  bool await = false;
  // Arguments are converted in raw mode.
  bool raw_arguments = false;
};

class Function {
 public:
  using Callback = std::function<MultiReturn(CallbackInfo& info)>;

  Function(Callback callback, FunctionOptions options)
      : callback_(std::move(callback)), options_(options) {}

  static std::shared_ptr<Function> New(Callback callback,
                                       FunctionOptions options = {});

  const FunctionOptions& options() const { return options_; }

  MultiReturn Invoke(CallbackInfo& info) const { return callback_(info); }

  // Host side call. Returns kPendingException when the callback threw; the
  // thrown value is stored in `exception` when it is not null.
  Status Call(const MultiReturn& args,
              MultiReturn* results,
              Value* exception = nullptr) const;

 private:
  Callback callback_;
  FunctionOptions options_;
};

}  // namespace lunar

#endif  // SRC_LUNAR_VALUE_H_
