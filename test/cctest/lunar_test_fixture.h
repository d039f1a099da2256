#ifndef TEST_CCTEST_LUNAR_TEST_FIXTURE_H_
#define TEST_CCTEST_LUNAR_TEST_FIXTURE_H_

#include <memory>
#include <string>
#include "gtest/gtest.h"
#include "lunar.h"
#include "util-inl.h"
#include "uv.h"

class LunarZeroStateTestFixture : public ::testing::Test {
 protected:
  static uv_loop_t current_loop;

  static void SetUpTestCase() {
    uv_os_unsetenv("LUNAR_DEBUG_NATIVE");
    CHECK_EQ(0, uv_loop_init(&current_loop));
  }

  static void TearDownTestCase() {
    while (uv_loop_alive(&current_loop)) {
      uv_run(&current_loop, UV_RUN_ONCE);
    }
    CHECK_EQ(0, uv_loop_close(&current_loop));
  }

  static lunar::GlobalOptions DefaultOptions() {
    lunar::GlobalOptions options;
    options.event_loop = &current_loop;
    return options;
  }

  // A deferred settled by a loop timer after `timeout` milliseconds.
  static std::shared_ptr<lunar::Deferred> ResolveLater(
      uint64_t timeout, lunar::MultiReturn values);
  static std::shared_ptr<lunar::Deferred> RejectLater(uint64_t timeout,
                                                      lunar::Value reason);
};


class LunarTestFixture : public LunarZeroStateTestFixture {
 protected:
  std::shared_ptr<lunar::Global> global_;

  void SetUp() override {
    global_ = lunar::Global::Create(DefaultOptions());
    ASSERT_NE(global_, nullptr);
  }

  void TearDown() override {
    if (global_) global_->Close();
    global_.reset();
  }

  // Compiles `source` on a fresh coroutine and runs it to completion,
  // converting whatever the chunk returns.
  lunar::Status RunString(const std::string& source,
                          lunar::MultiReturn* results = nullptr);

  // Like RunString() for code expected to succeed with one result.
  lunar::Value Eval(const std::string& source);
};

#endif  // TEST_CCTEST_LUNAR_TEST_FIXTURE_H_
