/***
 * Name: test_state_pcall
 * Purpose: Protected calls: frames, results, error conversion, re-entrancy, depth limit.
 */
#include <gtest/gtest.h>

#include <new>

#include "stackbridge/config/Config.h"
#include "stackbridge/exceptions/decode_error.h"
#include "stackbridge/exceptions/raised_error.h"
#include "stackbridge/vm/State.h"

using namespace stackbridge::vm;
using stackbridge::config::Config;

TEST(VmPcall, ArgumentsAreFrameSlots) {
  State st{Config{}};
  st.push_string("below");
  st.push_function([](State& s) {
    EXPECT_EQ(s.get_top(), 2);
    s.push_integer(s.at(1).as_integer() + s.at(2).as_integer());
    return 1;
  });
  st.push_integer(2);
  st.push_integer(3);
  EXPECT_EQ(st.pcall(2), CallStatus::Ok);
  EXPECT_EQ(st.get_top(), 2);
  EXPECT_EQ(st.at(-1).as_integer(), 5);
  EXPECT_EQ(st.at(1).as_string(), "below");
}

TEST(VmPcall, ResultsReplaceFunctionAndArgs) {
  State st{Config{}};
  st.push_function([](State& s) {
    s.push_integer(1);
    s.push_integer(2);
    s.push_integer(3);
    return 2;
  });
  st.push_nil();
  EXPECT_EQ(st.pcall(1), CallStatus::Ok);
  ASSERT_EQ(st.get_top(), 2);
  EXPECT_EQ(st.at(1).as_integer(), 2);
  EXPECT_EQ(st.at(2).as_integer(), 3);
}

TEST(VmPcall, MarshalErrorBecomesErrorSlot) {
  State st{Config{}};
  st.push_integer(7);
  st.push_function([](State&) -> int { throw stackbridge::exceptions::DecodeError("bad value"); });
  st.push_integer(1);
  EXPECT_EQ(st.pcall(1), CallStatus::RuntimeError);
  ASSERT_EQ(st.get_top(), 2);
  ASSERT_EQ(st.type_at(-1), TypeTag::Error);
  EXPECT_EQ(st.at(-1).as_error().kind, "decode");
  EXPECT_EQ(st.at(-1).as_error().message, "bad value");
  EXPECT_EQ(st.call_depth(), 0u);
}

TEST(VmPcall, RaisedErrorKeepsItsObject) {
  State st{Config{}};
  st.push_function([](State&) -> int {
    throw stackbridge::exceptions::RaisedError(ErrorObject{"custom", "from callback"});
  });
  EXPECT_EQ(st.pcall(0), CallStatus::RuntimeError);
  EXPECT_EQ(st.at(-1).as_error(), (ErrorObject{"custom", "from callback"}));
}

TEST(VmPcall, CallingANonFunctionFails) {
  State st{Config{}};
  st.push_integer(3);
  st.push_nil();
  EXPECT_EQ(st.pcall(1), CallStatus::RuntimeError);
  ASSERT_EQ(st.get_top(), 1);
  EXPECT_EQ(st.at(-1).as_error().kind, "type_mismatch");
  EXPECT_EQ(st.at(-1).as_error().message, "attempt to call a integer value");
}

TEST(VmPcall, MissingFunctionSlotFails) {
  State st{Config{}};
  st.push_integer(1);
  EXPECT_EQ(st.pcall(1), CallStatus::RuntimeError);
  ASSERT_EQ(st.get_top(), 1);
  EXPECT_EQ(st.type_at(1), TypeTag::Error);
}

TEST(VmPcall, ReentrantCallsUseNestedFrames) {
  State st{Config{}};
  st.push_function([](State& outer) {
    outer.push_function([](State& inner) {
      EXPECT_EQ(inner.get_top(), 1);
      EXPECT_EQ(inner.call_depth(), 2u);
      inner.push_integer(inner.at(1).as_integer() * 10);
      return 1;
    });
    outer.push_integer(outer.at(1).as_integer() + 1);
    EXPECT_EQ(outer.pcall(1), CallStatus::Ok);
    EXPECT_EQ(outer.get_top(), 2);
    return 1;
  });
  st.push_integer(4);
  EXPECT_EQ(st.pcall(1), CallStatus::Ok);
  ASSERT_EQ(st.get_top(), 1);
  EXPECT_EQ(st.at(1).as_integer(), 50);
}

TEST(VmPcall, DepthLimitReportsStackOverflow) {
  Config cfg;
  cfg.maxCallDepth = 3;
  State st{cfg};
  NativeFunction recurse = [&recurse](State& s) {
    s.push_function(recurse);
    if (s.pcall(0) != CallStatus::Ok) {
      const ErrorObject err = s.at(-1).as_error();
      s.pop(1);
      throw stackbridge::exceptions::RaisedError(err);
    }
    return 0;
  };
  st.push_function(recurse);
  EXPECT_EQ(st.pcall(0), CallStatus::RuntimeError);
  EXPECT_EQ(st.at(-1).as_error().kind, "stack_overflow");
  EXPECT_EQ(st.call_depth(), 0u);
}

TEST(VmPcall, OutOfMemoryIsNotCaught) {
  State st{Config{}};
  st.push_function([](State&) -> int { throw std::bad_alloc(); });
  EXPECT_THROW(st.pcall(0), std::bad_alloc);
  EXPECT_EQ(st.call_depth(), 0u);
}
