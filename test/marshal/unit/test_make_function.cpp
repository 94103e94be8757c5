/***
 * Name: test_make_function
 * Purpose: Typed native callables exposed through marshal::make_function.
 */
#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "stackbridge/All.h"

using namespace stackbridge;
using marshal::make_function;
using marshal::pop;
using marshal::push;
using vm::CallStatus;
using vm::State;

static int add(int a, int b) { return a + b; }

TEST(MakeFunction, FreeFunctionWithTypedArgs) {
  State st{config::Config{}};
  push(make_function(&add), st);
  push(2, st);
  push(40, st);
  ASSERT_EQ(st.pcall(2), CallStatus::Ok);
  EXPECT_EQ(pop<int>(st), 42);
  EXPECT_EQ(st.get_top(), 0);
}

TEST(MakeFunction, LambdaWithContainersAndOptional) {
  State st{config::Config{}};
  push(make_function([](const std::vector<std::string>& words, std::optional<std::string> sep) {
         std::string out;
         for (const auto& w : words) {
           if (!out.empty()) { out += sep.value_or(" "); }
           out += w;
         }
         return out;
       }),
       st);
  push(std::vector<std::string>{"a", "b", "c"}, st);
  ASSERT_EQ(st.pcall(1), CallStatus::Ok);
  EXPECT_EQ(pop<std::string>(st), "a b c");
}

TEST(MakeFunction, ExtraArgumentsAreDropped) {
  State st{config::Config{}};
  push(make_function([](int x) { return x * 2; }), st);
  push(std::make_tuple(21, std::string("ignored"), true), st);
  ASSERT_EQ(st.pcall(3), CallStatus::Ok);
  ASSERT_EQ(st.get_top(), 1);
  EXPECT_EQ(pop<int>(st), 42);
}

TEST(MakeFunction, VoidCallableReturnsNothing) {
  State st{config::Config{}};
  int seen = 0;
  push(make_function(std::function<void(int)>([&seen](int v) { seen = v; })), st);
  push(7, st);
  ASSERT_EQ(st.pcall(1), CallStatus::Ok);
  EXPECT_EQ(seen, 7);
  EXPECT_EQ(st.get_top(), 0);
}

TEST(MakeFunction, ArgumentConversionFailureIsAnErrorObject) {
  State st{config::Config{}};
  push(make_function(&add), st);
  push(1, st);
  push(std::string("two"), st);
  ASSERT_EQ(st.pcall(2), CallStatus::RuntimeError);
  const auto err = pop<vm::ErrorObject>(st);
  EXPECT_EQ(err.kind, "type_mismatch");
  EXPECT_EQ(err.message, "expected integer, got string");
}

TEST(MakeFunction, ForeignExceptionsBecomeRuntimeErrors) {
  State st{config::Config{}};
  push(make_function([]() -> int { throw std::invalid_argument("nope"); }), st);
  ASSERT_EQ(st.pcall(0), CallStatus::RuntimeError);
  const auto err = pop<vm::ErrorObject>(st);
  EXPECT_EQ(err.kind, "runtime");
  EXPECT_EQ(err.message, "nope");
}

TEST(MakeFunction, RaiseErrorFromCallback) {
  State st{config::Config{}};
  push(make_function([](int v) {
         if (v < 0) { marshal::raise_error(vm::ErrorObject{"domain", "negative"}); }
         return v;
       }),
       st);
  push(-1, st);
  ASSERT_EQ(st.pcall(1), CallStatus::RuntimeError);
  EXPECT_EQ(pop<vm::ErrorObject>(st), (vm::ErrorObject{"domain", "negative"}));
}

TEST(MakeFunction, MapResult) {
  State st{config::Config{}};
  push(make_function([](std::string key, int value) { return std::map<std::string, int>{{key, value}}; }), st);
  push(std::string("k"), st);
  push(9, st);
  ASSERT_EQ(st.pcall(2), CallStatus::Ok);
  const auto m = pop<std::map<std::string, int>>(st);
  EXPECT_EQ(m.at("k"), 9);
}
