#include "lunar_test_fixture.h"

#include <functional>
#include <string>
#include <vector>

using lunar::BridgeState;
using lunar::CallableHandle;
using lunar::CallbackInfo;
using lunar::CallOutcome;
using lunar::Deferred;
using lunar::Function;
using lunar::FunctionOptions;
using lunar::MultiReturn;
using lunar::Status;
using lunar::Thread;
using lunar::Value;

class BridgeTest : public LunarTestFixture {
 protected:
  // Installs `name` as a host function whose single result is the deferred
  // produced by `make`. With await set the guest receives the settled
  // values instead of a promise.
  void SetAsync(const std::string& name,
                std::function<std::shared_ptr<Deferred>(CallbackInfo&)> make,
                bool await = true) {
    FunctionOptions options;
    options.await = await;
    ASSERT_EQ(global_->Set(name,
                           Value(Function::New(
                               [make](CallbackInfo& info) {
                                 return MultiReturn{Value(make(info))};
                               },
                               options))),
              Status::kOk);
  }

  // Drives the loop until the deferred settles or the loop runs dry.
  void Drain(const std::shared_ptr<Deferred>& deferred) {
    while (deferred->pending() && uv_run(&current_loop, UV_RUN_ONCE) != 0) {
    }
  }
};

TEST_F(BridgeTest, AwaitResumesWithSettledValues) {
  SetAsync("fetch", [](CallbackInfo&) {
    return ResolveLater(5, {Value(42), Value("x")});
  });

  MultiReturn results;
  ASSERT_EQ(RunString("local a, b = fetch() return a + 1, b", &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(43));
  EXPECT_EQ(results[1], Value("x"));
  EXPECT_EQ(global_->suspension_count(), 0u);
}

TEST_F(BridgeTest, AlreadySettledResultsResumeWithoutTheLoop) {
  SetAsync("ready",
           [](CallbackInfo&) { return Deferred::Resolved({Value("now")}); });
  EXPECT_EQ(Eval("return ready() .. ready()"), Value("nownow"));
}

TEST_F(BridgeTest, RejectionRaisesAtTheAwaitPoint) {
  SetAsync("fetch",
           [](CallbackInfo&) { return RejectLater(5, Value("boom")); });

  MultiReturn results;
  ASSERT_EQ(RunString("local ok, err = pcall(fetch) return ok, err, 'after'",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_EQ(results[1], Value("boom"));
  EXPECT_EQ(results[2], Value("after"));

  EXPECT_EQ(RunString("fetch()"), Status::kRuntimeError);
  EXPECT_NE(global_->last_error().error_message.find("boom"),
            std::string::npos);
}

TEST_F(BridgeTest, AwaitOutsideAYieldableFrameRaises) {
  SetAsync("fetch", [](CallbackInfo&) { return ResolveLater(1, {}); });

  MultiReturn results;
  ASSERT_EQ(RunString("return pcall(table.sort, { 3, 1, 2 }, "
                      "function(a, b) fetch() return a < b end)",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_NE(results[1].AsString().find("outside a coroutine"),
            std::string::npos);
  EXPECT_EQ(global_->suspension_count(), 0u);
}

TEST_F(BridgeTest, CoroutinesInterleaveByCompletionOrder) {
  std::vector<std::string> order;
  ASSERT_EQ(global_->Set("record",
                         Value(Function::New([&order](CallbackInfo& info) {
                           order.push_back(info[0].AsString());
                           return MultiReturn();
                         }))),
            Status::kOk);
  SetAsync("wait", [](CallbackInfo& info) {
    return ResolveLater(static_cast<uint64_t>(info[0].AsInteger()), {});
  });

  std::shared_ptr<Thread> slow = global_->NewThread();
  std::shared_ptr<Thread> fast = global_->NewThread();
  ASSERT_EQ(slow->LoadString("record('slow start') wait(30) record('slow end')"),
            Status::kOk);
  ASSERT_EQ(fast->LoadString("record('fast start') wait(5) record('fast end')"),
            Status::kOk);

  std::shared_ptr<Deferred> slow_run = slow->RunAsync();
  std::shared_ptr<Deferred> fast_run = fast->RunAsync();
  EXPECT_EQ(slow->bridge_state(), BridgeState::kAwaitingHost);
  EXPECT_EQ(global_->suspension_count(), 2u);

  ASSERT_EQ(global_->Await(slow_run), Status::kOk);
  EXPECT_TRUE(fast_run->fulfilled());
  EXPECT_EQ(order,
            (std::vector<std::string>{
                "slow start", "fast start", "fast end", "slow end"}));
  EXPECT_EQ(slow->bridge_state(), BridgeState::kRunning);
  global_->Pop(2);
}

TEST_F(BridgeTest, HostSeesTheCallingContext) {
  BridgeState during = BridgeState::kClosed;
  lua_State* caller = nullptr;
  ASSERT_EQ(global_->Set("inspect",
                         Value(Function::New([&](CallbackInfo& info) {
                           during = info.thread()->bridge_state();
                           caller = info.thread()->state();
                           return MultiReturn();
                         }))),
            Status::kOk);

  std::shared_ptr<Thread> thread = global_->NewThread();
  ASSERT_EQ(thread->LoadString("inspect()"), Status::kOk);
  ASSERT_EQ(thread->Run(), Status::kOk);
  EXPECT_EQ(during, BridgeState::kRunning);
  EXPECT_EQ(caller, thread->state());
  global_->Pop();
}

TEST_F(BridgeTest, NonAwaitingFunctionsHandOutPromises) {
  SetAsync(
      "fetch",
      [](CallbackInfo& info) { return ResolveLater(5, {info[0]}); },
      false);

  EXPECT_EQ(Eval("return type(fetch(1))"), Value("userdata"));
  EXPECT_EQ(Eval("return fetch(20):await() + 1"), Value(21));
  EXPECT_EQ(Eval("return fetch(20):next(function(v) return v * 2 end)"
                 ":await()"),
            Value(40));
  EXPECT_EQ(Eval("return fetch(1):next(function(v) return fetch(v + 1) end)"
                 ":await()"),
            Value(2));
}

TEST_F(BridgeTest, PromiseRejectionMethods) {
  SetAsync(
      "fail",
      [](CallbackInfo&) { return RejectLater(5, Value("bad")); },
      false);

  EXPECT_EQ(Eval("return fail():catch(function(e) return 'caught ' .. e end)"
                 ":await()"),
            Value("caught bad"));
  EXPECT_EQ(Eval("local cleaned = false "
                 "local ok, err = pcall(function() "
                 "  return fail():finally(function() cleaned = true end)"
                 "  :await() "
                 "end) "
                 "return tostring(ok) .. ' ' .. err .. ' ' .. "
                 "tostring(cleaned)"),
            Value("false bad true"));
  EXPECT_EQ(Eval("return fail():next(nil, function(e) return e .. '!' end)"
                 ":await()"),
            Value("bad!"));

  MultiReturn results;
  ASSERT_EQ(RunString("return pcall(function() return fail():next(1) end)",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_NE(results[1].AsString().find("function expected"),
            std::string::npos);
}

TEST_F(BridgeTest, PromiseCreate) {
  EXPECT_EQ(Eval("return Promise.create(function(resolve) resolve(7) end)"
                 ":await()"),
            Value(7));
  EXPECT_EQ(Eval("local p = Promise.create(function(_, reject) "
                 "  reject('no') "
                 "end) "
                 "local ok, err = pcall(p.await, p) "
                 "return err"),
            Value("no"));

  MultiReturn results;
  ASSERT_EQ(RunString("return pcall(function() "
                      "  return Promise.create(function() error('bad', 0) end)"
                      "  :await() "
                      "end)",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_NE(results[1].AsString().find("bad"), std::string::npos);

  // Settling twice keeps the first outcome.
  EXPECT_EQ(Eval("return Promise.create(function(resolve, reject) "
                 "  resolve('first') reject('second') "
                 "end):await()"),
            Value("first"));
}

TEST_F(BridgeTest, PromiseCreateAcrossTheLoop) {
  SetAsync("wait", [](CallbackInfo&) { return ResolveLater(5, {}); }, false);
  EXPECT_EQ(Eval("return Promise.create(function(resolve) "
                 "  wait():next(function() resolve('later') end) "
                 "end):await()"),
            Value("later"));
}

TEST_F(BridgeTest, EarlyGuestResumeRaises) {
  SetAsync("fetch", [](CallbackInfo&) { return ResolveLater(5, {}); });

  MultiReturn results;
  ASSERT_EQ(RunString("local co = coroutine.create(function() "
                      "  return fetch() "
                      "end) "
                      "local ok1, p = coroutine.resume(co) "
                      "local ok2, err = coroutine.resume(co) "
                      "return ok1, type(p), ok2, err",
                      &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0], Value(true));
  EXPECT_EQ(results[1], Value("userdata"));
  EXPECT_EQ(results[2], Value(false));
  EXPECT_NE(results[3].AsString().find("before the awaited value settled"),
            std::string::npos);
  EXPECT_EQ(global_->suspension_count(), 0u);
}

TEST_F(BridgeTest, GuestDrivenResumeAfterSettling) {
  SetAsync("ready",
           [](CallbackInfo&) { return Deferred::Resolved({Value("value")}); });
  EXPECT_EQ(Eval("local step = coroutine.wrap(function() return ready() end) "
                 "local promise = step() "
                 "return step()"),
            Value("value"));
}

TEST_F(BridgeTest, SuspendReplacesTheStaleContinuation) {
  lua_State* L = global_->state();
  CallableHandle first = global_->callables()->Add(
      [](lua_State*) { return CallOutcome::Return(0); });
  CallableHandle second = global_->callables()->Add(
      [](lua_State*) { return CallOutcome::Return(0); });

  ASSERT_EQ(global_->Suspend(L, first, Deferred::New()), Status::kOk);
  EXPECT_EQ(global_->GetBridgeState(L), BridgeState::kAwaitingHost);
  ASSERT_EQ(global_->Suspend(L, second, Deferred::New()), Status::kOk);
  EXPECT_FALSE(global_->callables()->Contains(first));
  EXPECT_TRUE(global_->callables()->Contains(second));
  EXPECT_EQ(global_->suspension_count(), 1u);

  global_->MarkResumed(L);
  EXPECT_EQ(global_->GetBridgeState(L), BridgeState::kResumed);
  global_->ReleaseSuspension(L);
  EXPECT_FALSE(global_->callables()->Contains(second));
  EXPECT_EQ(global_->GetBridgeState(L), BridgeState::kRunning);
  EXPECT_EQ(global_->suspension_count(), 0u);
}

TEST_F(BridgeTest, ResetThreadDropsThePendingContinuation) {
  SetAsync("fetch", [](CallbackInfo&) { return Deferred::New(); });
  std::shared_ptr<Thread> thread = global_->NewThread();
  ASSERT_EQ(thread->LoadString("fetch()"), Status::kOk);
  std::shared_ptr<Deferred> run = thread->RunAsync();
  EXPECT_TRUE(run->pending());
  EXPECT_EQ(global_->suspension_count(), 1u);

  const size_t callables = global_->callables()->size();
  ASSERT_EQ(thread->ResetThread(), Status::kOk);
  EXPECT_EQ(global_->suspension_count(), 0u);
  EXPECT_EQ(global_->callables()->size(), callables - 1);

  ASSERT_EQ(thread->LoadString("return 'reused'"), Status::kOk);
  lunar::ResumeResult result;
  ASSERT_EQ(thread->Run(0, &result), Status::kOk);
  ASSERT_EQ(result.result_count, 1);
  Value value;
  ASSERT_EQ(thread->GetValue(-1, &value), Status::kOk);
  EXPECT_EQ(value, Value("reused"));
  global_->Pop();
}

TEST_F(BridgeTest, CollectedAwaitingCoroutineDropsItsSuspension) {
  SetAsync("fetch", [](CallbackInfo&) { return Deferred::New(); });
  const size_t callables = global_->callables()->size();

  // The wrapped coroutine awaits a result that never settles and is dropped.
  ASSERT_EQ(RunString("local step = coroutine.wrap(function() "
                      "  return fetch() "
                      "end) "
                      "step()"),
            Status::kOk);
  EXPECT_EQ(global_->suspension_count(), 1u);
  EXPECT_EQ(global_->callables()->size(), callables + 1);

  ASSERT_EQ(RunString("collectgarbage() collectgarbage()"), Status::kOk);
  EXPECT_EQ(global_->suspension_count(), 0u);
  EXPECT_EQ(global_->callables()->size(), callables);
}

TEST_F(BridgeTest, ResuspendingKeepsTheLiveEntry) {
  std::vector<std::shared_ptr<Deferred>> pending;
  SetAsync("fetch", [&pending](CallbackInfo&) {
    pending.push_back(Deferred::New());
    return pending.back();
  });
  std::shared_ptr<Thread> thread = global_->NewThread();
  ASSERT_EQ(thread->LoadString("fetch() fetch()"), Status::kOk);
  std::shared_ptr<Deferred> run = thread->RunAsync();
  ASSERT_EQ(pending.size(), 1u);

  // The first suspension's sentinel is replaced and collected while the
  // coroutine is still alive and waiting again.
  pending[0]->Resolve({});
  ASSERT_EQ(pending.size(), 2u);
  ASSERT_EQ(RunString("collectgarbage() collectgarbage()"), Status::kOk);
  EXPECT_EQ(thread->bridge_state(), BridgeState::kAwaitingHost);
  EXPECT_EQ(global_->suspension_count(), 1u);

  pending[1]->Resolve({});
  EXPECT_TRUE(run->fulfilled());
  EXPECT_EQ(global_->suspension_count(), 0u);
  global_->Pop();
}

TEST_F(BridgeTest, HostResultPastTheCeilingRaises) {
  const std::string big(1 << 20, 'x');
  ASSERT_EQ(global_->Set("big",
                         Value(Function::New([big](CallbackInfo&) {
                           return MultiReturn{Value(big)};
                         }))),
            Status::kOk);
  global_->set_memory_max(global_->memory_used() + 64 * 1024);

  MultiReturn results;
  ASSERT_EQ(RunString("return pcall(big)", &results), Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_EQ(results[1], Value("not enough memory"));
  EXPECT_LE(global_->memory_used(), global_->memory_max().value_or(0));

  EXPECT_EQ(RunString("big()"), Status::kRuntimeError);
  EXPECT_NE(global_->last_error().error_message.find("not enough memory"),
            std::string::npos);

  // The host call bracket was left normally, so teardown is not deferred.
  global_->Close();
  EXPECT_EQ(global_->state(), nullptr);
  global_.reset();
}

TEST_F(BridgeTest, ResumeValuePastTheCeilingRaises) {
  SetAsync("fetch", [](CallbackInfo&) {
    return ResolveLater(5, {Value(std::string(1 << 20, 'x'))});
  });
  global_->set_memory_max(global_->memory_used() + 64 * 1024);

  MultiReturn results;
  ASSERT_EQ(RunString("local ok, err = pcall(fetch) return ok, err", &results),
            Status::kOk);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0], Value(false));
  EXPECT_EQ(results[1], Value("not enough memory"));
  EXPECT_EQ(global_->suspension_count(), 0u);
}

TEST_F(BridgeTest, CloseWhileAwaiting) {
  SetAsync("fetch", [](CallbackInfo&) { return ResolveLater(5, {}); });
  std::shared_ptr<Thread> thread = global_->NewThread();
  ASSERT_EQ(thread->LoadString("fetch() return 1"), Status::kOk);
  std::shared_ptr<Deferred> run = thread->RunAsync();
  ASSERT_TRUE(run->pending());

  global_->Close();
  EXPECT_EQ(thread->bridge_state(), BridgeState::kClosed);
  Drain(run);
  ASSERT_TRUE(run->rejected());
  EXPECT_EQ(run->reason(),
            Value(lunar::StatusMessage(Status::kUseAfterClose)));
}

TEST_F(BridgeTest, CloseFromInsideAHostCall) {
  ASSERT_EQ(global_->Set("shutdown",
                         Value(Function::New([](CallbackInfo& info) {
                           info.thread()->root()->Close();
                           return MultiReturn();
                         }))),
            Status::kOk);
  EXPECT_EQ(RunString("shutdown() return 'unreachable'"),
            Status::kUseAfterClose);
  EXPECT_TRUE(global_->closed());
  EXPECT_EQ(global_->state(), nullptr);
}

TEST_F(BridgeTest, FinalizersReleaseHostEntries) {
  const size_t callables = global_->callables()->size();
  const size_t references = global_->references()->size();

  ASSERT_EQ(global_->Set("temporary",
                         Value(Function::New(
                             [](CallbackInfo&) { return MultiReturn(); }))),
            Status::kOk);
  ASSERT_EQ(global_->Set("handle",
                         Value::External(std::make_shared<std::string>("x"))),
            Status::kOk);
  EXPECT_EQ(global_->callables()->size(), callables + 1);
  EXPECT_EQ(global_->references()->size(), references + 1);

  ASSERT_EQ(RunString("temporary = nil handle = nil "
                      "collectgarbage() collectgarbage()"),
            Status::kOk);
  EXPECT_EQ(global_->callables()->size(), callables);
  EXPECT_EQ(global_->references()->size(), references);
}

TEST_F(BridgeTest, CloseReleasesEverything) {
  ASSERT_EQ(global_->Set("handle",
                         Value::External(std::make_shared<std::string>("x"))),
            Status::kOk);
  global_->Close();
  EXPECT_EQ(global_->callables()->size(), 0u);
  EXPECT_EQ(global_->references()->size(), 0u);
  EXPECT_EQ(global_->suspension_count(), 0u);
}
