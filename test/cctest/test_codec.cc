#include "lunar_test_fixture.h"

#include <limits>

using lunar::CallbackInfo;
using lunar::Function;
using lunar::GetOptions;
using lunar::LuaType;
using lunar::MultiReturn;
using lunar::PushOptions;
using lunar::Status;
using lunar::Table;
using lunar::Thread;
using lunar::Value;

class CodecTest : public LunarTestFixture {
 protected:
  // Pushes value and reads it straight back.
  Value RoundTrip(const Value& value) {
    const int top = global_->GetTop();
    EXPECT_EQ(global_->PushValue(value), Status::kOk);
    Value result;
    EXPECT_EQ(global_->GetValue(-1, &result), Status::kOk);
    global_->Pop();
    EXPECT_EQ(global_->GetTop(), top);
    return result;
  }
};

TEST_F(CodecTest, Primitives) {
  EXPECT_TRUE(RoundTrip(Value()).IsNil());
  EXPECT_TRUE(RoundTrip(Value::Nil()).IsNil());
  EXPECT_EQ(RoundTrip(Value(true)), Value(true));
  EXPECT_EQ(RoundTrip(Value(false)), Value(false));
  EXPECT_EQ(RoundTrip(Value(-7)), Value(-7));
  EXPECT_EQ(RoundTrip(Value(std::numeric_limits<int64_t>::max())),
            Value(std::numeric_limits<int64_t>::max()));

  Value fraction = RoundTrip(Value(0.125));
  ASSERT_FALSE(fraction.IsInteger());
  EXPECT_EQ(fraction.AsNumber(), 0.125);

  const std::string binary = std::string("a\0b", 3);
  EXPECT_EQ(RoundTrip(Value(binary)), Value(binary));
}

TEST_F(CodecTest, IntegralDoublesBecomeIntegers) {
  Value integral = RoundTrip(Value(42.0));
  EXPECT_TRUE(integral.IsInteger());
  EXPECT_EQ(integral.AsInteger(), 42);

  // Outside the integer range the value stays a float.
  Value huge = RoundTrip(Value(1e300));
  EXPECT_FALSE(huge.IsInteger());
}

TEST_F(CodecTest, GuestNumbersKeepTheirSubtype) {
  MultiReturn results;
  ASSERT_EQ(RunString("return 3, 3.5, 2^53, math.maxinteger", &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_TRUE(results[0].IsInteger());
  EXPECT_FALSE(results[1].IsInteger());
  EXPECT_FALSE(results[2].IsInteger());
  EXPECT_EQ(results[3], Value(std::numeric_limits<int64_t>::max()));
}

TEST_F(CodecTest, TablesCrossInBothDirections) {
  std::shared_ptr<Table> config = Table::FromArray({Value("a"), Value("b")});
  config->Set("name", Value("demo"));
  config->Set("nested", Value(Table::FromArray({Value(1), Value(2)})));
  ASSERT_EQ(global_->Set("config", Value(config)), Status::kOk);

  MultiReturn results;
  ASSERT_EQ(RunString("return #config, config[2], config.name, "
                      "config.nested[1] + config.nested[2]",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0], Value(2));
  EXPECT_EQ(results[1], Value("b"));
  EXPECT_EQ(results[2], Value("demo"));
  EXPECT_EQ(results[3], Value(3));

  Value table = Eval("return { 10, 20, 30, [5] = 50, x = 'y' }");
  ASSERT_TRUE(table.IsTable());
  EXPECT_EQ(table.AsTable()->length(), 3u);
  EXPECT_EQ(table.AsTable()->Get(Value(5)), Value(50));
  EXPECT_EQ(table.AsTable()->Get("x"), Value("y"));
}

TEST_F(CodecTest, HostCyclesArrive) {
  std::shared_ptr<Table> node = Table::New();
  node->Set("self", Value(node));
  ASSERT_EQ(global_->Set("node", Value(node)), Status::kOk);
  EXPECT_EQ(Eval("return node.self == node and node.self.self == node"),
            Value(true));
}

TEST_F(CodecTest, HostSharedSubtablesStayShared) {
  std::shared_ptr<Table> shared = Table::New();
  std::shared_ptr<Table> outer = Table::New();
  outer->Set("left", Value(shared));
  outer->Set("right", Value(shared));
  outer->Append(Value(shared));
  ASSERT_EQ(global_->Set("outer", Value(outer)), Status::kOk);
  EXPECT_EQ(Eval("return outer.left == outer.right and outer[1] == outer.left"),
            Value(true));
}

TEST_F(CodecTest, HostCycleComesBackAsACycle) {
  std::shared_ptr<Table> node = Table::New();
  node->Set("self", Value(node));
  node->Set("name", Value("loop"));
  ASSERT_EQ(global_->Set("node", Value(node)), Status::kOk);

  Value back;
  ASSERT_EQ(global_->Get("node", &back), Status::kOk);
  ASSERT_TRUE(back.IsTable());
  EXPECT_NE(back.AsTable(), node);
  EXPECT_EQ(back.AsTable()->Get("self"), back);
  EXPECT_EQ(back.AsTable()->Get("name"), Value("loop"));

  node->fields().clear();
  back.AsTable()->fields().clear();
}

TEST_F(CodecTest, HostSharingComesBackShared) {
  std::shared_ptr<Table> shared = Table::FromArray({Value(1)});
  std::shared_ptr<Table> outer = Table::New();
  outer->Set("left", Value(shared));
  outer->Set("right", Value(shared));
  outer->Append(Value(shared));

  Value back = RoundTrip(Value(outer));
  ASSERT_TRUE(back.IsTable());
  const std::shared_ptr<Table>& table = back.AsTable();
  Value left = table->Get("left");
  ASSERT_TRUE(left.IsTable());
  EXPECT_EQ(table->Get("right"), left);
  ASSERT_EQ(table->length(), 1u);
  EXPECT_EQ(table->array()[0], left);
  EXPECT_EQ(left.AsTable()->Get(Value(1)), Value(1));
}

TEST_F(CodecTest, GuestCyclesAndSharingArrive) {
  Value cyclic = Eval("local t = {} t.me = t return t");
  ASSERT_TRUE(cyclic.IsTable());
  EXPECT_EQ(cyclic.AsTable()->Get("me"), cyclic);

  Value shared = Eval("local s = { 1 } return { s, s, other = s }");
  ASSERT_TRUE(shared.IsTable());
  const std::shared_ptr<Table>& outer = shared.AsTable();
  ASSERT_EQ(outer->length(), 2u);
  EXPECT_EQ(outer->array()[0], outer->array()[1]);
  EXPECT_EQ(outer->Get("other"), outer->array()[0]);
}

TEST_F(CodecTest, ArrayPartStopsAtFirstHole) {
  Value table = Eval("return { 1, 2, nil, 4 }");
  ASSERT_TRUE(table.IsTable());
  EXPECT_EQ(table.AsTable()->length(), 2u);
  EXPECT_EQ(table.AsTable()->Get(Value(4)), Value(4));
}

TEST_F(CodecTest, HostMetatablesAreApplied) {
  std::shared_ptr<Table> defaults = Table::New();
  defaults->Set("color", Value("blue"));
  std::shared_ptr<Table> meta = Table::New();
  meta->Set("__index", Value(defaults));
  std::shared_ptr<Table> object = Table::New();
  object->set_metatable(meta);
  ASSERT_EQ(global_->Set("object", Value(object)), Status::kOk);
  EXPECT_EQ(Eval("return object.color"), Value("blue"));
}

TEST_F(CodecTest, RawModeReturnsAddresses) {
  ASSERT_EQ(RunString("shape = { 1 } function area() end"), Status::kOk);
  GetOptions raw;
  raw.raw = true;

  lua_State* L = global_->state();
  lua_getglobal(L, "shape");
  Value table;
  ASSERT_EQ(global_->GetValue(-1, &table, raw), Status::kOk);
  EXPECT_TRUE(table.IsPointer());
  EXPECT_EQ(table.AsPointer(), lua_topointer(L, -1));
  global_->Pop();

  lua_getglobal(L, "area");
  Value function;
  ASSERT_EQ(global_->GetValue(-1, LuaType::kFunction, &function, raw),
            Status::kOk);
  EXPECT_TRUE(function.IsPointer());
  global_->Pop();
}

TEST_F(CodecTest, UnsupportedValues) {
  const int top = global_->GetTop();
  int local = 0;
  EXPECT_EQ(global_->PushValue(Value::Pointer(&local)),
            Status::kUnsupportedType);
  EXPECT_EQ(global_->GetTop(), top);

  // A failure deep inside a table leaves the stack untouched.
  std::shared_ptr<Table> table = Table::New();
  table->Set("inner", Value(Table::FromArray({Value::Pointer(&local)})));
  EXPECT_EQ(global_->PushValue(Value(table)), Status::kUnsupportedType);
  EXPECT_EQ(global_->GetTop(), top);

  std::shared_ptr<Table> bad_key = Table::New();
  bad_key->fields().emplace_back(Value::Nil(), Value(1));
  EXPECT_EQ(global_->PushValue(Value(bad_key)), Status::kInvalidArg);
  EXPECT_EQ(global_->GetTop(), top);

  Value result;
  EXPECT_EQ(global_->GetValue(0, &result), Status::kInvalidArg);
}

TEST_F(CodecTest, ForeignUserdataBecomesPointer) {
  Value file = Eval("return io.stdout");
  EXPECT_TRUE(file.IsPointer());
}

TEST_F(CodecTest, ExternalsAndReferencesKeepIdentity) {
  auto payload = std::make_shared<int>(5);
  Value external = Value::External(payload);
  Value back = RoundTrip(external);
  ASSERT_TRUE(back.IsExternal());
  EXPECT_EQ(back.AsExternal().get(), payload.get());

  std::shared_ptr<Table> table = Table::New();
  PushOptions by_reference;
  by_reference.reference = true;
  ASSERT_EQ(global_->PushValue(Value(table), by_reference), Status::kOk);
  lua_setglobal(global_->state(), "opaque");
  EXPECT_EQ(Eval("return type(opaque)"), Value("userdata"));
  EXPECT_EQ(Eval("return getmetatable(opaque)"), Value("protected metatable"));

  Value opaque;
  ASSERT_EQ(global_->Get("opaque", &opaque), Status::kOk);
  EXPECT_EQ(opaque, Value(table));
}

TEST_F(CodecTest, ThreadsMapToContexts) {
  std::shared_ptr<Thread> thread = global_->NewThread();
  ASSERT_NE(thread, nullptr);
  Value value;
  ASSERT_EQ(global_->GetValue(-1, &value), Status::kOk);
  ASSERT_TRUE(value.IsThread());
  EXPECT_EQ(value.AsThread()->state(), thread->state());
  global_->Pop();

  ASSERT_EQ(thread->PushValue(Value(thread)), Status::kOk);
  EXPECT_EQ(lua_tothread(thread->state(), -1), thread->state());
  thread->Pop();

  std::shared_ptr<lunar::Global> other =
      lunar::Global::Create(DefaultOptions());
  ASSERT_NE(other, nullptr);
  EXPECT_EQ(other->PushValue(Value(thread)), Status::kInvalidArg);
  other->Close();
}

TEST_F(CodecTest, HostFunctionsAreCallable) {
  std::shared_ptr<Function> add = Function::New([](CallbackInfo& info) {
    return MultiReturn{Value(info[0].AsInteger() + info[1].AsInteger())};
  });
  ASSERT_EQ(global_->Set("add", Value(add)), Status::kOk);
  EXPECT_EQ(Eval("return add(2, 3)"), Value(5));
  EXPECT_EQ(Eval("return getmetatable(add)"), Value::Nil());

  std::shared_ptr<Function> fail = Function::New([](CallbackInfo& info) {
    info.Throw(Value("host says no"));
    return MultiReturn();
  });
  ASSERT_EQ(global_->Set("fail", Value(fail)), Status::kOk);
  MultiReturn results;
  ASSERT_EQ(RunString("return pcall(fail)", &results), Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_EQ(results[1], Value("host says no"));
}

TEST_F(CodecTest, RawArgumentsSkipMaterializing) {
  lunar::FunctionOptions options;
  options.raw_arguments = true;
  Value seen;
  ASSERT_EQ(global_->Set("inspect",
                         Value(Function::New(
                             [&seen](CallbackInfo& info) {
                               seen = info[0];
                               return MultiReturn();
                             },
                             options))),
            Status::kOk);
  ASSERT_EQ(RunString("inspect({ 1, 2, 3 })"), Status::kOk);
  EXPECT_TRUE(seen.IsPointer());
}

TEST_F(CodecTest, GuestFunctionsReturnDeferredResults) {
  Value function = Eval("return function(a, b) return a * b, 'done' end");
  ASSERT_TRUE(function.IsFunction());

  MultiReturn results;
  ASSERT_EQ(function.AsFunction()->Call({Value(6), Value(7)}, &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].IsDeferred());

  MultiReturn values;
  ASSERT_EQ(global_->Await(results[0].AsDeferred(), &values), Status::kOk);
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0], Value(42));
  EXPECT_EQ(values[1], Value("done"));
}

TEST_F(CodecTest, GuestFunctionAfterCloseResolvesEmpty) {
  Value function = Eval("return function() return 1 end");
  ASSERT_TRUE(function.IsFunction());
  global_->Close();

  MultiReturn results;
  ASSERT_EQ(function.AsFunction()->Call({}, &results), Status::kOk);
  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].IsDeferred());
  EXPECT_TRUE(results[0].AsDeferred()->fulfilled());
  EXPECT_TRUE(results[0].AsDeferred()->values().empty());
}

TEST_F(CodecTest, DumpStack) {
  ASSERT_EQ(global_->PushValue(Value(12)), Status::kOk);
  ASSERT_EQ(global_->PushValue(Value("text")), Status::kOk);

  FILE* file = tmpfile();
  ASSERT_NE(file, nullptr);
  global_->DumpStack(file);
  rewind(file);
  char line[128];
  ASSERT_NE(fgets(line, sizeof(line), file), nullptr);
  EXPECT_STREQ(line, "1 number 12\n");
  ASSERT_NE(fgets(line, sizeof(line), file), nullptr);
  EXPECT_STREQ(line, "2 string text\n");
  fclose(file);
  global_->Pop(2);
}
