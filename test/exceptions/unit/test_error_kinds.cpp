/***
 * Name: test_error_kinds
 * Purpose: Error kind tags, exception messages and the hierarchy.
 */
#include <gtest/gtest.h>

#include <string>

#include "stackbridge/All.h"

using namespace stackbridge::exceptions;

TEST(ErrorKinds, TagsRoundTrip) {
  for (const ErrorKind kind : {ErrorKind::InvalidEncoding, ErrorKind::TypeMismatch, ErrorKind::Decode,
                               ErrorKind::Encode, ErrorKind::StackOverflow, ErrorKind::Runtime}) {
    const auto parsed = ParseErrorKind(ErrorKindName(kind));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, kind);
  }
  EXPECT_STREQ(ErrorKindName(ErrorKind::InvalidEncoding), "invalid_encoding");
  EXPECT_FALSE(ParseErrorKind("nope").has_value());
}

TEST(ErrorKinds, MessagesAndHierarchy) {
  const InvalidEncodingError bad(5);
  EXPECT_EQ(std::string(bad.what()), "invalid text at byte offset 5");
  EXPECT_EQ(bad.kind(), ErrorKind::InvalidEncoding);
  const TypeMismatchError tm("boolean", stackbridge::vm::TypeTag::None);
  EXPECT_EQ(std::string(tm.what()), "expected boolean, got none");
  const StackbridgeException& base = tm;
  EXPECT_EQ(std::string(base.what()), "expected boolean, got none");
  EXPECT_THROW(throw StackOverflowError("full"), MarshalError);
  EXPECT_THROW(throw ConfigError("cfg"), StackbridgeException);
}

TEST(ErrorKinds, IntoTextErrorIsAnInvalidEncodingError) {
  try {
    throw IntoTextError(1, stackbridge::buffer::OwnedBuffer("a\xFF"));
  } catch (const InvalidEncodingError& e) {
    EXPECT_EQ(e.offset(), 1u);
    EXPECT_EQ(e.kind(), ErrorKind::InvalidEncoding);
  }
}
