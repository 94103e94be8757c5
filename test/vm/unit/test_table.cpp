/***
 * Name: test_table
 * Purpose: Key normalization, border length and iteration order of vm::Table.
 */
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>

#include "stackbridge/exceptions/encode_error.h"
#include "stackbridge/vm/Table.h"

using namespace stackbridge::vm;

TEST(VmTable, IntegralNumberKeysAreIntegers) {
  Table t;
  t.set(Value::number(2.0), Value::string("two"));
  EXPECT_EQ(t.get(Value::integer(2)).as_string(), "two");
  t.set(Value::number(2.5), Value::boolean(true));
  EXPECT_TRUE(t.get(Value::number(2.5)).as_boolean());
  EXPECT_EQ(t.size(), 2u);
}

TEST(VmTable, NilAndNanKeysRejected) {
  Table t;
  EXPECT_THROW(t.set(Value(), Value::integer(1)), stackbridge::exceptions::EncodeError);
  EXPECT_THROW(t.set(Value::number(std::nan("")), Value::integer(1)), stackbridge::exceptions::EncodeError);
  EXPECT_TRUE(t.get(Value()).is_nil());
}

TEST(VmTable, NilValueErases) {
  Table t;
  t.set(Value::integer(1), Value::integer(5));
  t.set(Value::integer(1), Value());
  EXPECT_EQ(t.size(), 0u);
}

TEST(VmTable, BorderLength) {
  Table t;
  EXPECT_EQ(t.length(), 0);
  t.set(Value::integer(1), Value::integer(1));
  t.set(Value::integer(2), Value::integer(2));
  t.set(Value::integer(4), Value::integer(4));
  EXPECT_EQ(t.length(), 2);
}

TEST(VmTable, IterationIsOrderedIntegersFirst) {
  Table t;
  t.set(Value::string("k"), Value::integer(0));
  t.set(Value::integer(3), Value::integer(3));
  t.set(Value::integer(1), Value::integer(1));
  Value key;
  Value k;
  Value v;
  ASSERT_TRUE(t.next(key, k, v));
  EXPECT_EQ(k.as_integer(), 1);
  ASSERT_TRUE(t.next(k, key, v));
  EXPECT_EQ(key.as_integer(), 3);
  ASSERT_TRUE(t.next(key, k, v));
  EXPECT_EQ(k.as_string(), "k");
  EXPECT_FALSE(t.next(k, key, v));
}

TEST(VmValue, RawEquality) {
  EXPECT_EQ(Value::string("x"), Value::string("x"));
  EXPECT_NE(Value::integer(1), Value::number(1.0));
  const auto table = std::make_shared<Table>();
  EXPECT_EQ(Value::table(table), Value::table(table));
  EXPECT_NE(Value::table(table), Value::table(std::make_shared<Table>()));
  EXPECT_EQ(Value(), Value());
}
