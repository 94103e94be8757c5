/***
 * Name: test_marshal_errors
 * Purpose: Error objects crossing between native code and the interpreter.
 */
#include <gtest/gtest.h>

#include <string>

#include "stackbridge/All.h"

using namespace stackbridge;
using vm::ErrorObject;

TEST(MarshalErrors, ToErrorObjectUsesKindTag) {
  const exceptions::DecodeError err("integer 300 out of range for the target type");
  const ErrorObject obj = marshal::to_error_object(err);
  EXPECT_EQ(obj.kind, "decode");
  EXPECT_EQ(obj.message, "integer 300 out of range for the target type");
  EXPECT_EQ(marshal::to_error_object(exceptions::TypeMismatchError("string", vm::TypeTag::Table)).message,
            "expected string, got table");
}

TEST(MarshalErrors, RaiseErrorThrowsRaisedError) {
  try {
    marshal::raise_error(ErrorObject{"runtime", "stop"});
    FAIL() << "expected RaisedError";
  } catch (const exceptions::RaisedError& e) {
    EXPECT_EQ(e.object().kind, "runtime");
    EXPECT_EQ(std::string(e.what()), "runtime: stop");
  }
}

TEST(MarshalErrors, ThrowNativeErrorMapsKinds) {
  EXPECT_THROW(marshal::throw_native_error(ErrorObject{"decode", "d"}), exceptions::DecodeError);
  EXPECT_THROW(marshal::throw_native_error(ErrorObject{"encode", "e"}), exceptions::EncodeError);
  EXPECT_THROW(marshal::throw_native_error(ErrorObject{"stack_overflow", "s"}), exceptions::StackOverflowError);
  EXPECT_THROW(marshal::throw_native_error(ErrorObject{"runtime", "r"}), exceptions::RuntimeError);
  try {
    marshal::throw_native_error(ErrorObject{"type_mismatch", "expected table, got nil"});
    FAIL() << "expected TypeMismatchError";
  } catch (const exceptions::TypeMismatchError& e) {
    EXPECT_EQ(std::string(e.what()), "expected table, got nil");
  }
  try {
    marshal::throw_native_error(ErrorObject{"invalid_encoding", "invalid text at byte offset 3"});
    FAIL() << "expected InvalidEncodingError";
  } catch (const exceptions::InvalidEncodingError& e) {
    EXPECT_EQ(e.offset(), 3u);
  }
}

TEST(MarshalErrors, UnknownKindsBecomeRuntimeErrors) {
  try {
    marshal::throw_native_error(ErrorObject{"custom", "x"});
    FAIL() << "expected RuntimeError";
  } catch (const exceptions::MarshalError& e) {
    EXPECT_EQ(e.kind(), exceptions::ErrorKind::Runtime);
    EXPECT_EQ(std::string(e.what()), "custom: x");
  }
}

TEST(MarshalErrors, PcallBridgesNativeFailures) {
  vm::State st{config::Config{}};
  st.push_function([](vm::State& s) {
    (void)marshal::pop<int>(s);
    return 0;
  });
  st.push_string("not a number");
  ASSERT_EQ(st.pcall(1), vm::CallStatus::RuntimeError);
  const ErrorObject err = marshal::pop<ErrorObject>(st);
  EXPECT_EQ(err.kind, "type_mismatch");
  EXPECT_THROW(marshal::throw_native_error(err), exceptions::TypeMismatchError);
  EXPECT_EQ(st.get_top(), 0);
}
